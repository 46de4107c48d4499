/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for ids, clocks, version info and process inspection.
 */
#include "mcg_platform.hpp"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using namespace mcpguard::platform;
using namespace ::testing;
using namespace std::chrono_literals;

namespace
{
// Forks a child that sleeps in pause() until killed; the destructor reaps it.
class PausedChild
{
  public:
    PausedChild()
    {
        m_pid = ::fork();
        if (m_pid == 0)
        {
            ::pause();
            ::_exit(0);
        }
    }
    ~PausedChild() { reap(); }

    uint64_t pid() const { return static_cast<uint64_t>(m_pid); }
    bool started() const { return m_pid > 0; }

    void reap()
    {
        if (m_pid <= 0)
            return;
        ::kill(m_pid, SIGKILL);
        int status = 0;
        ::waitpid(m_pid, &status, 0);
        m_pid = -1;
    }

  private:
    pid_t m_pid = -1;
};

uint64_t reaped_pid()
{
    PausedChild child;
    const uint64_t pid = child.pid();
    child.reap();
    return pid;
}
} // namespace

TEST(PlatformCoreTest, PidMatchesGetpid)
{
    EXPECT_EQ(get_pid(), static_cast<uint64_t>(::getpid()));
}

TEST(PlatformCoreTest, ThreadIdsDifferAcrossThreads)
{
    const uint64_t here = get_native_thread_id();
    EXPECT_NE(here, 0u);

    std::atomic<uint64_t> there{0};
    std::thread([&]() { there = get_native_thread_id(); }).join();
    EXPECT_NE(here, there.load());
}

TEST(PlatformCoreTest, ElapsedTimeCoversSleep)
{
    const uint64_t start = monotonic_time_ns();
    std::this_thread::sleep_for(10ms);
    const uint64_t elapsed = elapsed_time_ns(start);
    EXPECT_GE(elapsed, 10'000'000u);
    EXPECT_LT(elapsed, 5'000'000'000u);
}

TEST(PlatformCoreTest, ElapsedTimeFromFutureStartIsZero)
{
    EXPECT_EQ(elapsed_time_ns(monotonic_time_ns() + 60'000'000'000u), 0u);
}

TEST(PlatformCoreTest, SelfIsAlive)
{
    EXPECT_TRUE(is_process_alive(get_pid()));
}

// 0 and values outside pid_t would signal process groups through kill(2).
TEST(PlatformCoreTest, PidsOutsidePidRangeAreNeverAlive)
{
    EXPECT_FALSE(is_process_alive(0));
    EXPECT_FALSE(is_process_alive(std::numeric_limits<uint64_t>::max()));
    EXPECT_FALSE(is_process_alive(uint64_t{1} << 40));
}

TEST(PlatformCoreTest, ChildIsAliveUntilReaped)
{
    PausedChild child;
    ASSERT_TRUE(child.started());
    const uint64_t pid = child.pid();
    EXPECT_TRUE(is_process_alive(pid));

    child.reap();
    EXPECT_FALSE(is_process_alive(pid));
}

// An exited child that has not been waited for still answers kill(pid, 0).
TEST(PlatformCoreTest, ZombieCountsAsDead)
{
    const pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0)
        ::_exit(0);

    siginfo_t info{};
    ASSERT_EQ(::waitid(P_PID, static_cast<id_t>(child), &info, WEXITED | WNOWAIT), 0);
    EXPECT_FALSE(is_process_alive(static_cast<uint64_t>(child)));

    int status = 0;
    ::waitpid(child, &status, 0);
}

TEST(PlatformCoreTest, OwnCmdlineIsSpaceJoined)
{
    const auto cmdline = process_cmdline(get_pid());
    ASSERT_TRUE(cmdline.has_value());
    EXPECT_THAT(*cmdline, HasSubstr("mcpguard_tests"));
    EXPECT_EQ(cmdline->find('\0'), std::string::npos);
    EXPECT_NE(cmdline->back(), ' ');
}

TEST(PlatformCoreTest, OwnArgvStartsWithProgram)
{
    const auto argv = process_argv(get_pid());
    ASSERT_TRUE(argv.has_value());
    ASSERT_FALSE(argv->empty());
    EXPECT_THAT(argv->front(), EndsWith("mcpguard_tests"));
    EXPECT_FALSE(argv->back().empty());
}

TEST(PlatformCoreTest, VanishedProcessHasNoCmdlineOrExecutable)
{
    const uint64_t pid = reaped_pid();
    ASSERT_NE(pid, 0u);
    EXPECT_FALSE(process_cmdline(pid).has_value());
    EXPECT_FALSE(process_argv(pid).has_value());
    EXPECT_FALSE(process_executable(pid).has_value());
}

TEST(PlatformCoreTest, ExecutableNameAndPath)
{
    const auto exe = process_executable(get_pid());
    ASSERT_TRUE(exe.has_value());
    EXPECT_EQ(*exe, get_executable_name(true));
    EXPECT_EQ(get_executable_name(), "mcpguard_tests");
}

TEST(PlatformCoreTest, VersionStringJoinsComponents)
{
    EXPECT_EQ(std::string(get_version_string()),
              fmt::format("{}.{}.{}", get_version_major(), get_version_minor(),
                          get_version_rolling()));
}
