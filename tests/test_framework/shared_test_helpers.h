// tests/test_framework/shared_test_helpers.h
#pragma once
/**
 * @file shared_test_helpers.h
 * @brief File, timing and worker-wrapping helpers used across the test suites.
 */
#include "mcg_service.hpp"
#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace mcpguard::tests::helper
{

/**
 * @brief Redirects a descriptor (normally stderr) into a pipe until GetOutput() or
 *        destruction. Only for output that fits in the pipe buffer.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd);
    ~StringCapture();

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    /// Restores the descriptor and returns everything written meanwhile.
    std::string GetOutput();

  private:
    void restore();

    int m_fd;
    int m_saved = -1;
    int m_read_end = -1;
};

bool read_file_contents(const std::string &path, std::string &out);

/// Lines of @p text containing @p must_include (if given) and not @p must_exclude.
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/// Polls @p pred every 10 ms; returns its final value.
template <typename Pred> bool wait_until(Pred pred, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return pred();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

/// @p small_value when MCPGUARD_TEST_SCALE=small (used on slow CI hosts).
int scaled_value(int original, int small_value);

/// A not-yet-existing path in the temp directory, unique per process and call.
fs::path unique_temp_path(const char *test_name);

/// Prints a "[WORKER FAILURE]" report for the in-flight exception and maps it to an exit code.
int report_worker_failure(const char *test_name, std::exception_ptr failure);

/**
 * @brief Runs worker logic with no lifecycle set up. For workers that drive the
 *        lifecycle themselves or test behaviour outside it.
 *
 * gtest assertions are turned into exceptions so that a failed ASSERT leaves the
 * lambda. Exit code: 0 success, 1 assertion, 2 std::exception, 3 anything else.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    GTEST_FLAG_SET(throw_on_failure, true);
    try
    {
        test_logic();
    }
    catch (...)
    {
        return report_worker_failure(test_name, std::current_exception());
    }
    return 0;
}

/// run_worker_bare() inside a LifecycleGuard owning @p mods.
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    mcpguard::utils::LifecycleGuard guard(
        mcpguard::utils::MakeModDefList(std::forward<Mods>(mods)...));
    return run_worker_bare(std::move(test_logic), test_name);
}

/**
 * @brief Starts N threads that spin until all are ready, then run together.
 * @code
 *   ThreadRacer racer(8);
 *   ASSERT_TRUE(racer.race([&](int i) { hammer(i); }));
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : m_n(n_threads) {}

    /// Runs fn(index) on every thread. False if any of them threw.
    template <typename F> bool race(F fn)
    {
        std::atomic<int> arrived{0};
        std::atomic<bool> go{false};
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(m_n));
        for (int i = 0; i < m_n; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    arrived.fetch_add(1);
                    while (!go.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (const std::exception &e)
                    {
                        fmt::print(stderr, "ThreadRacer: thread {} threw: {}\n", i, e.what());
                        failures.fetch_add(1);
                    }
                });
        }
        while (arrived.load() < m_n)
            std::this_thread::yield();
        go.store(true, std::memory_order_release);
        for (auto &t : threads)
            t.join();
        return failures.load() == 0;
    }

  private:
    int m_n;
};

} // namespace mcpguard::tests::helper
