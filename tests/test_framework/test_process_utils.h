// tests/test_framework/test_process_utils.h
#pragma once
/**
 * @file test_process_utils.h
 * @brief Child processes running one worker scenario of the test binary.
 */
#include "mcg_base.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcpguard::tests::helper
{

/**
 * @brief `<exe> <scenario> args...` started with posix_spawn. stdout and stderr go
 *        to files in a private temp directory that is removed with the object.
 *
 * A worker still running when the object dies is waited for, never killed.
 */
class WorkerProcess
{
  public:
    WorkerProcess(const std::string &exe_path, const std::string &scenario,
                  const std::vector<std::string> &args);
    ~WorkerProcess();

    WorkerProcess(WorkerProcess &&other) noexcept;
    WorkerProcess &operator=(WorkerProcess &&) = delete;
    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    /// Reaps the worker once; later calls return the cached result.
    /// @return The exit status, or -1 when a signal ended it.
    int wait_for_exit();

    bool send_signal(int sig) const;

    bool valid() const { return m_child > 0 || m_reaped; }
    int exit_code() const { return m_exit_code; }
    int term_signal() const { return m_term_signal; }

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

  private:
    std::filesystem::path m_dir;
    pid_t m_child = -1;
    bool m_reaped = false;
    int m_exit_code = -1;
    int m_term_signal = 0;
    mutable std::string m_out;
    mutable std::string m_err;
};

/**
 * @brief gtest checks for a reaped worker: exit status 0, no signal, none of the
 *        FATAL / PANIC / "[WORKER FAILURE]" markers on stderr and each of
 *        @p expected_stderr present. "ERROR" is rejected too unless
 *        @p allow_expected_logger_errors.
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr = {},
                      bool allow_expected_logger_errors = false);

} // namespace mcpguard::tests::helper
