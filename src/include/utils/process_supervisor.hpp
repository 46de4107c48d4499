#pragma once
/**
 * @file process_supervisor.hpp
 * @brief Keeps supervised server processes within a count and memory ceiling.
 *
 * A process is *supervised* when its launch identity matches the configured launch
 * signature (see matches_launch_signature()) and it is not the supervisor itself. Every query enumerates the
 * ProcessTable afresh; nothing is cached between calls.
 *
 * Cleanup cycle:
 * @verbatim
 *   IDLE -> AUDITING -> NORMAL     -> IDLE
 *                    -> OVER_LIMIT -> EMERGENCY_CLEANUP -> IDLE
 * @endverbatim
 * Duplicate elimination always runs before memory-based emergency cleanup, and only
 * one cycle runs at a time: a cycle requested while another is in flight is skipped.
 *
 * The supervisor is an ordinary object. Construct one and pass it by reference to
 * whoever needs it:
 * @code
 *  ProcfsProcessTable table;
 *  ProcessSupervisor supervisor(table, SupervisorConfig::get_instance().limits());
 *  supervisor.start_periodic_cleanup();
 *  if (supervisor.can_spawn_server()) { ... }
 * @endcode
 */
#include "mcpguard_utils_export.h"
#include "utils/process_table.hpp"
#include "utils/supervisor_config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mcpguard::utils
{

/// @brief A supervised process as seen by one status query.
struct ManagedProcess
{
    uint64_t pid{0};
    std::string name;     ///< Command line, truncated for display.
    uint64_t memory_mb{0}; ///< Resident memory, rounded to whole MiB.
};

/// Counts and memory cover every supervised process, even past the listing cap.
struct SystemStatus
{
    std::size_t process_count{0};
    uint64_t memory_usage_mb{0};
    std::vector<ManagedProcess> processes; ///< Ascending pid order.
};

enum class HealthStatus
{
    Healthy,
    Warning,
    Critical
};

/// @brief "healthy", "warning" or "critical".
MCPGUARD_UTILS_EXPORT const char *to_string(HealthStatus status) noexcept;

enum class KillOutcome
{
    AlreadyGone, ///< The process no longer existed when signalled.
    Terminated,  ///< It exited after SIGTERM within the timeout.
    Killed,      ///< SIGKILL was delivered.
    Failed       ///< A signal could not be delivered (e.g. EPERM).
};

MCPGUARD_UTILS_EXPORT const char *to_string(KillOutcome outcome) noexcept;

class MCPGUARD_UTILS_EXPORT ProcessSupervisor
{
  public:
    /// Memory usage at this fraction of the ceiling is reported as a warning.
    static constexpr double kWarningRatio = 0.8;
    /// Usage at this multiple of a ceiling is severe: memory victims are killed without
    /// a grace period, and a process count this high is critical.
    static constexpr double kSevereMemoryRatio = 1.5;
    static constexpr std::chrono::milliseconds kKillAllGrace{2000};
    static constexpr std::chrono::milliseconds kKillPollInterval{100};
    static constexpr std::size_t kMaxReportedProcesses = 100;
    static constexpr std::size_t kMaxNameLength = 100;

    /**
     * @param table  Process table used for every query and signal. Must outlive the
     *               supervisor.
     * @param limits Ceilings and timing; see SupervisorConfig::limits().
     */
    ProcessSupervisor(ProcessTable &table, SupervisorLimits limits);

    /// Stops the periodic cleanup timer if it is running.
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    /** @brief True iff fewer than max_servers are running and memory is below the ceiling. */
    [[nodiscard]] bool can_spawn_server() const;

    /**
     * @brief Snapshot of the supervised processes. At most kMaxReportedProcesses are
     *        listed; the totals count all of them. An enumeration failure is logged
     *        and yields an empty snapshot.
     */
    [[nodiscard]] SystemStatus get_system_status() const;

    /**
     * @brief SIGTERM, then poll every kKillPollInterval until `timeout`; SIGKILL if the
     *        process is still alive.
     */
    KillOutcome graceful_kill(uint64_t pid, std::chrono::milliseconds timeout);
    /// Uses the configured graceful timeout.
    KillOutcome graceful_kill(uint64_t pid);

    /** @brief SIGKILL immediately. */
    KillOutcome force_kill(uint64_t pid);

    /**
     * @brief Keeps the supervised process with the lowest pid and gracefully kills the
     *        others.
     * @return Number of processes killed; 0 if another cleanup pass is in flight.
     */
    std::size_t kill_duplicates();

    /**
     * @brief When memory usage exceeds the ceiling, kills the largest supervised
     *        processes until the remaining total is at or under it. At
     *        kSevereMemoryRatio times the ceiling, victims are force-killed.
     * @return Number of processes killed; 0 if another cleanup pass is in flight.
     */
    std::size_t emergency_cleanup();

    /**
     * @brief One audit pass: kill_duplicates(), re-sample, then emergency_cleanup() if
     *        memory is over the ceiling.
     * @return false when cleanup is disabled or another pass is in flight.
     */
    bool cleanup();

    /** @brief Runs cleanup() every cleanup interval on a timer thread. Idempotent. */
    void start_periodic_cleanup();
    /** @brief Stops and joins the timer thread. A no-op when not running. */
    void stop_periodic_cleanup();

    /**
     * @brief Destructive: SIGTERM to every supervised process, wait `grace`, SIGKILL to
     *        survivors.
     * @return Number of processes that were terminated.
     */
    std::size_t kill_all(std::chrono::milliseconds grace = kKillAllGrace);

    /**
     * @brief Worst of two dimensions:
     *   - memory: usage >= ceiling is Critical, >= kWarningRatio of it is Warning;
     *   - count: more than max_servers is Warning, kSevereMemoryRatio times it Critical.
     */
    [[nodiscard]] HealthStatus get_health_status() const;

    /** @brief Multi-line human readable summary of counts, memory and health. */
    [[nodiscard]] std::string get_resource_summary() const;

    [[nodiscard]] bool is_cleaning_up() const noexcept;
    [[nodiscard]] bool is_periodic_cleanup_running() const noexcept;

    [[nodiscard]] const SupervisorLimits &limits() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpguard::utils
