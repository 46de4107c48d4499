/**
 * @file test_logger.cpp
 * @brief Tests for the asynchronous Logger.
 *
 * The Logger is a lifecycle module, so every scenario that logs runs in a worker
 * (see logger_workers.cpp). Level name parsing is a static helper and runs in-process.
 */
#include "mcg_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <filesystem>
#include <string>

using namespace mcpguard::utils;
using namespace mcpguard::tests::helper;
using namespace ::testing;
namespace fs = std::filesystem;

class LoggerTest : public mcpguard::tests::IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        log_path_ = unique_temp_path("logger").string() + ".log";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    std::string log_path_;
};

TEST_F(LoggerTest, BasicLogging)
{
    auto proc = SpawnWorker("logger.test_basic_logging", {log_path_});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    auto proc = SpawnWorker("logger.test_log_level_filtering", {log_path_});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, BadFormatStringIsLoggedNotThrown)
{
    auto proc = SpawnWorker("logger.test_bad_format_string", {log_path_});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ConsoleIsDefaultSink)
{
    auto proc = SpawnWorker("logger.test_console_is_default_sink");
    ExpectWorkerOk(proc, {"[LOGGER] [INFO  ]", "console line 7"});
}

TEST_F(LoggerTest, FlushWaitsForQueue)
{
    auto proc = SpawnWorker("logger.test_flush_waits_for_queue", {log_path_});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, MultithreadLogging)
{
    const int threads = scaled_value(8, 4);
    const int per_thread = scaled_value(500, 100);
    auto proc = SpawnWorker("logger.test_multithread_logging",
                            {log_path_, std::to_string(threads), std::to_string(per_thread)});
    ExpectWorkerOk(proc);
}

/**
 * Several processes append to one flock-protected file; no line is lost or torn.
 */
TEST_F(LoggerTest, MultiprocessSharedLogFile)
{
    const int procs = scaled_value(4, 2);
    const int msgs = scaled_value(300, 50);

    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < procs; ++i)
        scenarios.push_back({"logger.stress_log", {log_path_, std::to_string(msgs)}});
    auto workers = SpawnWorkers(scenarios);
    ExpectAllWorkersOk(workers);

    std::string contents;
    ASSERT_TRUE(read_file_contents(log_path_, contents));
    EXPECT_EQ(count_lines(contents, "child-msg"), static_cast<size_t>(procs * msgs));
    // Every line is a complete record.
    EXPECT_EQ(count_lines(contents, std::nullopt, "[LOGGER]"), 0u);
}

TEST_F(LoggerTest, UnwritableLogfileReportsError)
{
    const auto bad_path = (unique_temp_path("no_such_dir") / "x.log").string();
    auto proc = SpawnWorker("logger.test_unwritable_logfile_reports_error", {bad_path});
    ExpectWorkerOk(proc, {"still on console"});
}

TEST_F(LoggerTest, SetterBeforeInitPanics)
{
    auto proc = SpawnWorker("logger.test_setter_before_init_panics");
    proc.wait_for_exit();
    EXPECT_NE(proc.term_signal(), 0);
    EXPECT_THAT(proc.get_stderr(),
                HasSubstr("Logger method 'Logger::set_level' was called before the Logger module "
                          "was initialized"));
}

TEST_F(LoggerTest, LoggingBeforeInitIsDropped)
{
    auto proc = SpawnWorker("logger.test_logging_before_init_is_dropped");
    ExpectWorkerOk(proc);
    EXPECT_THAT(proc.get_stderr(), Not(HasSubstr("dropped before init")));
}

TEST_F(LoggerTest, LoggingAfterShutdownIsSilent)
{
    auto proc = SpawnWorker("logger.test_logging_after_shutdown_is_silent", {log_path_});
    ExpectWorkerOk(proc);
}

// ============================================================================
// Level names
// ============================================================================

TEST(LoggerLevelTest, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(Logger::level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
}

TEST(LoggerLevelTest, RejectsUnknownNames)
{
    EXPECT_FALSE(Logger::level_from_string("").has_value());
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
    EXPECT_FALSE(Logger::level_from_string(" info").has_value());
}
