#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace mcpguard::basics
{

/**
 * @brief Runs a cleanup callable when the scope is left, normally or by unwinding.
 *
 * The callable runs from a destructor, so it has to be noexcept. dismiss() cancels
 * it, invoke() runs it early; either way it runs at most once. Moving a guard hands
 * the cleanup over and leaves the source inactive.
 *
 * @code
 *  auto unlink_tmp = make_scope_guard([&]() noexcept { ::unlink(tmp.c_str()); });
 * @endcode
 */
template <typename Callable>
requires std::is_nothrow_invocable_v<Callable &>
class ScopeGuard
{
  public:
    explicit ScopeGuard(Callable fn) : m_cleanup(std::move(fn)) {}

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_cleanup(std::exchange(other.m_cleanup, std::nullopt))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() { invoke(); }

    [[nodiscard]] explicit operator bool() const noexcept { return m_cleanup.has_value(); }

    void dismiss() noexcept { m_cleanup.reset(); }

    void invoke() noexcept
    {
        if (!m_cleanup)
            return;
        auto fn = std::move(*m_cleanup);
        m_cleanup.reset();
        fn();
    }

  private:
    std::optional<Callable> m_cleanup;
};

/// Stores a decayed copy of @p f; anything it captures by reference must outlive the guard.
template <typename F> ScopeGuard<std::decay_t<F>> make_scope_guard(F &&f)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace mcpguard::basics
