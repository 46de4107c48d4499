/**
 * @file test_process_table.cpp
 * @brief Tests for ProcfsProcessTable against the live /proc of this machine.
 */
#include "mcg_service.hpp"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <csignal>
#include <limits>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

using namespace mcpguard::utils;
using namespace ::testing;

class ProcfsProcessTableTest : public mcpguard::tests::PureApiTest
{
  protected:
    ProcfsProcessTable table_;
};

TEST_F(ProcfsProcessTableTest, ListsCurrentProcess)
{
    const auto self = static_cast<uint64_t>(::getpid());
    const auto entries = table_.list_processes();
    ASSERT_FALSE(entries.empty());

    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const ProcessEntry &e) { return e.pid == self; });
    ASSERT_NE(it, entries.end());
    EXPECT_GT(it->rss_kb, 0u);
    ASSERT_FALSE(it->argv.empty());
    EXPECT_THAT(it->argv.front(), EndsWith("mcpguard_tests"));
    EXPECT_TRUE(matches_launch_signature(it->argv, "mcpguard_tests"));
}

TEST_F(ProcfsProcessTableTest, EntriesHaveNonZeroPids)
{
    for (const auto &e : table_.list_processes())
    {
        EXPECT_NE(e.pid, 0u);
    }
}

TEST_F(ProcfsProcessTableTest, SelfIsAlive)
{
    EXPECT_TRUE(table_.is_alive(static_cast<uint64_t>(::getpid())));
    EXPECT_FALSE(table_.is_alive(0));
}

TEST_F(ProcfsProcessTableTest, SignalToReapedChildReportsNoSuchProcess)
{
    pid_t child = ::fork();
    ASSERT_NE(child, -1);
    if (child == 0)
    {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);

    const auto ec = table_.send_signal(static_cast<uint64_t>(child), ProcessSignal::Terminate);
    EXPECT_EQ(ec, std::errc::no_such_process) << ec.message();
    EXPECT_FALSE(table_.is_alive(static_cast<uint64_t>(child)));
}

TEST_F(ProcfsProcessTableTest, RejectsPidsOutsidePidRange)
{
    EXPECT_EQ(table_.send_signal(0, ProcessSignal::Kill), std::errc::invalid_argument);
    EXPECT_EQ(table_.send_signal(std::numeric_limits<uint64_t>::max(), ProcessSignal::Kill),
              std::errc::invalid_argument);
}

TEST_F(ProcfsProcessTableTest, SigtermReachesChild)
{
    pid_t child = ::fork();
    ASSERT_NE(child, -1);
    if (child == 0)
    {
        ::pause();
        ::_exit(0);
    }
    EXPECT_FALSE(table_.send_signal(static_cast<uint64_t>(child), ProcessSignal::Terminate));
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
}

TEST(LaunchSignatureTest, ProgramItselfMatchesByPathOrName)
{
    EXPECT_TRUE(matches_launch_signature({"mcp-server", "--stdio"}, "mcp-server"));
    EXPECT_TRUE(matches_launch_signature({"/opt/bin/mcp-server"}, "mcp-server"));
    EXPECT_TRUE(matches_launch_signature({"/opt/bin/mcp-server"}, "/opt/bin/mcp-server"));
    EXPECT_FALSE(matches_launch_signature({"/opt/bin/mcp-server-extra"}, "mcp-server"));
    EXPECT_FALSE(matches_launch_signature({"my-mcp-server"}, "mcp-server"));
}

TEST(LaunchSignatureTest, InterpreterLaunchMatchesItsScript)
{
    EXPECT_TRUE(matches_launch_signature({"node", "/opt/app/mcp-server.js"}, "mcp-server"));
    EXPECT_TRUE(matches_launch_signature({"/usr/bin/node", "--max-old-space-size=512",
                                          "dist/mcp-server", "--stdio"},
                                         "mcp-server"));
    EXPECT_TRUE(matches_launch_signature({"python3.11", "mcp-server.py"}, "mcp-server"));
    // Only the script is compared, not the script's own arguments.
    EXPECT_FALSE(matches_launch_signature({"node", "app.js", "mcp-server"}, "mcp-server"));
}

TEST(LaunchSignatureTest, ArgumentsOfOtherProgramsNeverMatch)
{
    EXPECT_FALSE(matches_launch_signature({"tail", "-f", "/var/log/mcp-server.log"}, "mcp-server"));
    EXPECT_FALSE(matches_launch_signature({"vim", "mcp-server.js"}, "mcp-server"));
    EXPECT_FALSE(matches_launch_signature({"mcpguard", "run", "--signature", "mcp-server"},
                                          "mcp-server"));
    EXPECT_FALSE(matches_launch_signature({}, "mcp-server"));
    EXPECT_FALSE(matches_launch_signature({"mcp-server"}, ""));
}
