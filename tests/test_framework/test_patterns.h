#pragma once
/**
 * @file test_patterns.h
 * @brief Fixtures for in-process tests and for tests that run in worker processes.
 *
 * The lifecycle can be owned once per process, and a panic or finalize() would take
 * every later test in the process down with it. Anything that needs the Logger,
 * SupervisorConfig or SingletonLock module therefore runs in a worker spawned from
 * an IsolatedProcessTest; everything else is a PureApiTest.
 */
#include "test_entrypoint.h"
#include "test_process_utils.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace mcpguard::tests
{

/// In-process tests with no lifecycle. ProcessSupervisor log calls are dropped here.
class PureApiTest : public ::testing::Test
{
};

/**
 * @code
 *   auto workers = SpawnWorkers({{"singleton_lock.try_acquire_once", {path, dir}},
 *                                {"singleton_lock.try_acquire_once", {path, dir}}});
 *   ExpectAllWorkersOk(workers);
 * @endcode
 */
class IsolatedProcessTest : public ::testing::Test
{
  protected:
    using Workers = std::vector<helper::WorkerProcess>;

    void SetUp() override { ASSERT_FALSE(g_self_exe_path.empty()); }

    helper::WorkerProcess SpawnWorker(const std::string &scenario, const WorkerArgs &args = {})
    {
        return helper::WorkerProcess(g_self_exe_path, scenario, args);
    }

    /// All workers are started before any is waited for.
    Workers SpawnWorkers(const std::vector<std::pair<std::string, WorkerArgs>> &scenarios)
    {
        Workers workers;
        workers.reserve(scenarios.size());
        for (const auto &[name, args] : scenarios)
            workers.push_back(SpawnWorker(name, args));
        return workers;
    }

    void ExpectWorkerOk(helper::WorkerProcess &proc,
                        const std::vector<std::string> &expected_stderr = {},
                        bool allow_expected_logger_errors = false)
    {
        proc.wait_for_exit();
        helper::expect_worker_ok(proc, expected_stderr, allow_expected_logger_errors);
    }

    void ExpectAllWorkersOk(Workers &workers)
    {
        for (auto &w : workers)
            ExpectWorkerOk(w);
    }
};

} // namespace mcpguard::tests
