#pragma once
/**
 * @file lifecycle.hpp
 * @brief Process-wide startup and shutdown of service modules.
 *
 * Each service (Logger, SupervisorConfig, SingletonLock) hands out a `ModuleDef`
 * from `GetLifecycleModule()`. Once the modules are registered, initialize() starts
 * them so that every module runs after the ones it depends on, and finalize() stops
 * them in the opposite order. Stopping a module is bounded by its declared timeout.
 *
 * @code
 *  mcpguard::utils::LifecycleGuard guard(mcpguard::utils::MakeModDefList(
 *      mcpguard::utils::Logger::GetLifecycleModule(),
 *      mcpguard::utils::SingletonLock::GetLifecycleModule()));
 * @endcode
 *
 * Misconfiguration (a cycle, a missing dependency, a startup callback that throws)
 * prints the module table and a stack trace, then aborts.
 */
#include "mcg_base.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

namespace mcpguard::utils
{

class LifecycleManagerImpl;

/// Moves each ModuleDef argument into a vector.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList only accepts ModuleDef values");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

class MCPGUARD_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// Panics when called after initialize().
    void register_module(ModuleDef &&module_def);

    /// Starts every registered module. Only the first call has an effect.
    void initialize(std::source_location loc);

    /// Stops the started modules. No-op before initialize() and on repeated calls.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @brief Scoped ownership of the application lifecycle.
 *
 * Only the first guard in a process does anything: it registers its modules,
 * initializes, and finalizes on destruction. Later guards drop their modules.
 */
class LifecycleGuard
{
  public:
    LifecycleGuard(std::source_location loc = std::source_location::current())
        : LifecycleGuard(std::vector<ModuleDef>{}, loc)
    {
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : LifecycleGuard(MakeModDefList(std::move(module)), loc)
    {
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc), m_is_owner(claim_ownership())
    {
        if (!m_is_owner)
        {
            MCG_DEBUG("[MCG_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                      "already exists; {} module(s) ignored ({}:{}).",
                      mcpguard::platform::get_executable_name(), mcpguard::platform::get_pid(),
                      modules.size(), mcpguard::format_tools::filename_only(m_loc.file_name()),
                      m_loc.line());
            return;
        }
        for (auto &m : modules)
            RegisterModule(std::move(m));
        InitializeApp(m_loc);
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
            FinalizeApp(m_loc);
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static bool claim_ownership() noexcept
    {
        static std::atomic_bool claimed{false};
        return !claimed.exchange(true, std::memory_order_acq_rel);
    }

    std::source_location m_loc;
    bool m_is_owner;
};

} // namespace mcpguard::utils
