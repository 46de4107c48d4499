/**
 * @file process_supervisor.cpp
 * @brief ProcessSupervisor: admission decisions, audits and termination primitives.
 */
#include "mcg_base.hpp"
#include "utils/logger.hpp"
#include "utils/process_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace mcpguard::utils
{

const char *to_string(HealthStatus status) noexcept
{
    switch (status)
    {
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Warning:
        return "warning";
    case HealthStatus::Critical:
        return "critical";
    }
    return "unknown";
}

const char *to_string(KillOutcome outcome) noexcept
{
    switch (outcome)
    {
    case KillOutcome::AlreadyGone:
        return "already-gone";
    case KillOutcome::Terminated:
        return "terminated";
    case KillOutcome::Killed:
        return "killed";
    case KillOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

namespace
{
uint64_t kb_to_mb_rounded(uint64_t kb) noexcept
{
    return (kb + 512) / 1024;
}

long percent_of(uint64_t value, uint64_t ceiling) noexcept
{
    if (ceiling == 0)
        return 0;
    return std::lround(static_cast<double>(value) * 100.0 / static_cast<double>(ceiling));
}

bool is_gone(std::error_code ec) noexcept
{
    return ec == std::errc::no_such_process;
}
} // namespace

struct ProcessSupervisor::Impl
{
    ProcessTable &table;
    SupervisorLimits limits;
    uint64_t self_pid;

    std::atomic<bool> cleaning_up{false};

    // Timer state. m_timer_ctl serializes start/stop; m_timer_mu guards m_timer_stop.
    std::mutex m_timer_ctl;
    std::mutex m_timer_mu;
    std::condition_variable m_timer_cv;
    bool m_timer_stop = false;
    std::thread m_timer;
    std::atomic<bool> m_timer_running{false};

    Impl(ProcessTable &t, SupervisorLimits l)
        : table(t), limits(std::move(l)), self_pid(platform::get_pid())
    {
    }

    // Totals cover every supervised process; only the first @p cap (lowest pids) are
    // listed in processes.
    SystemStatus sample(std::size_t cap) const
    {
        SystemStatus status;
        std::vector<ProcessEntry> entries;
        try
        {
            entries = table.list_processes();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("ProcessSupervisor: cannot enumerate processes: {}", e.what());
            return status;
        }

        std::sort(entries.begin(), entries.end(),
                  [](const ProcessEntry &a, const ProcessEntry &b) { return a.pid < b.pid; });

        for (const auto &entry : entries)
        {
            if (entry.pid == self_pid ||
                !matches_launch_signature(entry.argv, limits.launch_signature))
            {
                continue;
            }
            const uint64_t memory_mb = kb_to_mb_rounded(entry.rss_kb);
            ++status.process_count;
            status.memory_usage_mb += memory_mb;
            if (status.processes.size() < cap)
            {
                status.processes.push_back(ManagedProcess{
                    entry.pid,
                    format_tools::truncate_for_display(entry.command_line(), kMaxNameLength),
                    memory_mb});
            }
        }
        if (status.process_count > status.processes.size())
        {
            LOGGER_DEBUG("ProcessSupervisor: listing {} of {} supervised processes",
                         status.processes.size(), status.process_count);
        }
        return status;
    }

    SystemStatus sample_all() const { return sample(std::numeric_limits<std::size_t>::max()); }

    HealthStatus classify(const SystemStatus &status) const noexcept
    {
        HealthStatus memory_health = HealthStatus::Healthy;
        const double mem = static_cast<double>(status.memory_usage_mb);
        const double mem_max = static_cast<double>(limits.max_memory_mb);
        if (mem >= mem_max)
            memory_health = HealthStatus::Critical;
        else if (mem >= kWarningRatio * mem_max)
            memory_health = HealthStatus::Warning;

        // A pool exactly at max_servers is the admission ceiling, not an overload.
        HealthStatus count_health = HealthStatus::Healthy;
        const double count = static_cast<double>(status.process_count);
        const double count_max = static_cast<double>(limits.max_servers);
        if (count > count_max)
        {
            count_health = (count >= kSevereMemoryRatio * count_max) ? HealthStatus::Critical
                                                                     : HealthStatus::Warning;
        }
        return std::max(memory_health, count_health);
    }

    KillOutcome graceful_kill(uint64_t pid, std::chrono::milliseconds timeout)
    {
        std::error_code ec = table.send_signal(pid, ProcessSignal::Terminate);
        if (is_gone(ec))
        {
            LOGGER_DEBUG("ProcessSupervisor: pid {} already gone", pid);
            return KillOutcome::AlreadyGone;
        }
        if (ec)
        {
            LOGGER_ERROR("ProcessSupervisor: SIGTERM to pid {} failed: {}", pid, ec.message());
            return KillOutcome::Failed;
        }

        const uint64_t start = platform::monotonic_time_ns();
        const auto timeout_ns = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
        while (table.is_alive(pid))
        {
            const uint64_t elapsed = platform::elapsed_time_ns(start);
            if (elapsed >= timeout_ns)
            {
                break;
            }
            const auto remaining = std::chrono::nanoseconds(timeout_ns - elapsed);
            std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(remaining,
                                                                           kKillPollInterval));
        }
        if (!table.is_alive(pid))
        {
            LOGGER_INFO("ProcessSupervisor: gracefully stopped pid {}", pid);
            return KillOutcome::Terminated;
        }

        ec = table.send_signal(pid, ProcessSignal::Kill);
        if (is_gone(ec))
        {
            LOGGER_INFO("ProcessSupervisor: pid {} exited before SIGKILL", pid);
            return KillOutcome::Terminated;
        }
        if (ec)
        {
            LOGGER_ERROR("ProcessSupervisor: SIGKILL to pid {} failed: {}", pid, ec.message());
            return KillOutcome::Failed;
        }
        LOGGER_WARN("ProcessSupervisor: force killed pid {} after {} ms grace", pid,
                    timeout.count());
        return KillOutcome::Killed;
    }

    KillOutcome force_kill(uint64_t pid)
    {
        std::error_code ec = table.send_signal(pid, ProcessSignal::Kill);
        if (is_gone(ec))
        {
            return KillOutcome::AlreadyGone;
        }
        if (ec)
        {
            LOGGER_ERROR("ProcessSupervisor: SIGKILL to pid {} failed: {}", pid, ec.message());
            return KillOutcome::Failed;
        }
        LOGGER_WARN("ProcessSupervisor: force killed pid {}", pid);
        return KillOutcome::Killed;
    }

    // The two passes below assume the caller holds the cleaning_up guard.

    std::size_t kill_duplicates_pass()
    {
        const auto status = sample_all();
        if (status.process_count <= 1)
        {
            return 0;
        }
        // processes are in ascending pid order; the first one survives.
        LOGGER_INFO("ProcessSupervisor: {} supervised processes found; keeping pid {}",
                    status.process_count, status.processes.front().pid);
        std::size_t killed = 0;
        for (std::size_t i = 1; i < status.processes.size(); ++i)
        {
            const auto outcome = graceful_kill(status.processes[i].pid, limits.graceful_timeout);
            if (outcome == KillOutcome::Terminated || outcome == KillOutcome::Killed)
            {
                ++killed;
            }
        }
        return killed;
    }

    std::size_t emergency_pass()
    {
        const auto status = sample_all();
        if (status.memory_usage_mb <= limits.max_memory_mb)
        {
            return 0;
        }
        const bool severe = static_cast<double>(status.memory_usage_mb) >=
                            kSevereMemoryRatio * static_cast<double>(limits.max_memory_mb);
        LOGGER_WARN("ProcessSupervisor: memory {}MB over ceiling {}MB{}; emergency cleanup",
                    status.memory_usage_mb, limits.max_memory_mb,
                    severe ? " (severe)" : "");

        auto victims = status.processes;
        std::stable_sort(victims.begin(), victims.end(),
                         [](const ManagedProcess &a, const ManagedProcess &b)
                         { return a.memory_mb > b.memory_mb; });

        uint64_t remaining = status.memory_usage_mb;
        std::size_t killed = 0;
        for (const auto &victim : victims)
        {
            if (remaining <= limits.max_memory_mb)
            {
                break;
            }
            const auto outcome = severe ? force_kill(victim.pid)
                                        : graceful_kill(victim.pid, limits.graceful_timeout);
            if (outcome == KillOutcome::Failed)
            {
                continue;
            }
            remaining -= std::min(remaining, victim.memory_mb);
            if (outcome != KillOutcome::AlreadyGone)
            {
                ++killed;
            }
        }
        LOGGER_INFO("ProcessSupervisor: emergency cleanup killed {} processes, ~{}MB remain",
                    killed, remaining);
        return killed;
    }

    bool try_enter() noexcept
    {
        bool expected = false;
        return cleaning_up.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    void timer_loop(ProcessSupervisor *owner)
    {
        std::unique_lock lk(m_timer_mu);
        while (!m_timer_cv.wait_for(lk, limits.cleanup_interval, [this] { return m_timer_stop; }))
        {
            lk.unlock();
            try
            {
                owner->cleanup();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("ProcessSupervisor: periodic cleanup failed: {}", e.what());
            }
            lk.lock();
        }
    }
};

ProcessSupervisor::ProcessSupervisor(ProcessTable &table, SupervisorLimits limits)
    : pImpl(std::make_unique<Impl>(table, std::move(limits)))
{
    if (pImpl->limits.max_servers == 0 || pImpl->limits.max_memory_mb == 0)
    {
        throw std::invalid_argument("ProcessSupervisor: ceilings must be positive");
    }
    if (pImpl->limits.launch_signature.empty())
    {
        throw std::invalid_argument("ProcessSupervisor: launch signature must not be empty");
    }
}

ProcessSupervisor::~ProcessSupervisor()
{
    stop_periodic_cleanup();
}

bool ProcessSupervisor::can_spawn_server() const
{
    const auto status = pImpl->sample(0);
    const bool allowed = status.process_count < pImpl->limits.max_servers &&
                         status.memory_usage_mb < pImpl->limits.max_memory_mb;
    if (!allowed)
    {
        LOGGER_DEBUG("ProcessSupervisor: spawn refused ({}/{} processes, {}MB/{}MB)",
                     status.process_count, pImpl->limits.max_servers, status.memory_usage_mb,
                     pImpl->limits.max_memory_mb);
    }
    return allowed;
}

SystemStatus ProcessSupervisor::get_system_status() const
{
    return pImpl->sample(kMaxReportedProcesses);
}

KillOutcome ProcessSupervisor::graceful_kill(uint64_t pid, std::chrono::milliseconds timeout)
{
    return pImpl->graceful_kill(pid, timeout);
}

KillOutcome ProcessSupervisor::graceful_kill(uint64_t pid)
{
    return pImpl->graceful_kill(pid, pImpl->limits.graceful_timeout);
}

KillOutcome ProcessSupervisor::force_kill(uint64_t pid)
{
    return pImpl->force_kill(pid);
}

std::size_t ProcessSupervisor::kill_duplicates()
{
    if (!pImpl->try_enter())
    {
        LOGGER_WARN("ProcessSupervisor: cleanup already in progress; kill_duplicates skipped");
        return 0;
    }
    auto leave = basics::make_scope_guard([this]() noexcept { pImpl->cleaning_up.store(false); });
    return pImpl->kill_duplicates_pass();
}

std::size_t ProcessSupervisor::emergency_cleanup()
{
    if (!pImpl->try_enter())
    {
        LOGGER_WARN("ProcessSupervisor: cleanup already in progress; emergency cleanup skipped");
        return 0;
    }
    auto leave = basics::make_scope_guard([this]() noexcept { pImpl->cleaning_up.store(false); });
    return pImpl->emergency_pass();
}

bool ProcessSupervisor::cleanup()
{
    if (!pImpl->limits.cleanup_enabled)
    {
        LOGGER_DEBUG("ProcessSupervisor: cleanup disabled");
        return false;
    }
    if (!pImpl->try_enter())
    {
        LOGGER_WARN("ProcessSupervisor: cleanup already in progress; pass skipped");
        return false;
    }
    auto leave = basics::make_scope_guard([this]() noexcept { pImpl->cleaning_up.store(false); });

    const std::size_t duplicates = pImpl->kill_duplicates_pass();
    const auto status = pImpl->sample(0);
    std::size_t emergency = 0;
    if (status.memory_usage_mb > pImpl->limits.max_memory_mb)
    {
        emergency = pImpl->emergency_pass();
    }
    LOGGER_DEBUG("ProcessSupervisor: cleanup pass done ({} duplicates, {} emergency kills)",
                 duplicates, emergency);
    return true;
}

void ProcessSupervisor::start_periodic_cleanup()
{
    std::lock_guard ctl(pImpl->m_timer_ctl);
    if (pImpl->m_timer.joinable())
    {
        LOGGER_DEBUG("ProcessSupervisor: periodic cleanup already running");
        return;
    }
    if (!pImpl->limits.cleanup_enabled)
    {
        LOGGER_INFO("ProcessSupervisor: cleanup disabled; periodic cleanup not started");
        return;
    }
    {
        std::lock_guard lk(pImpl->m_timer_mu);
        pImpl->m_timer_stop = false;
    }
    pImpl->m_timer = std::thread(&Impl::timer_loop, pImpl.get(), this);
    pImpl->m_timer_running.store(true, std::memory_order_release);
    LOGGER_INFO("ProcessSupervisor: periodic cleanup every {} ms",
                pImpl->limits.cleanup_interval.count());
}

void ProcessSupervisor::stop_periodic_cleanup()
{
    std::lock_guard ctl(pImpl->m_timer_ctl);
    if (!pImpl->m_timer.joinable())
    {
        return;
    }
    {
        std::lock_guard lk(pImpl->m_timer_mu);
        pImpl->m_timer_stop = true;
    }
    pImpl->m_timer_cv.notify_all();
    pImpl->m_timer.join();
    pImpl->m_timer_running.store(false, std::memory_order_release);
    LOGGER_INFO("ProcessSupervisor: periodic cleanup stopped");
}

std::size_t ProcessSupervisor::kill_all(std::chrono::milliseconds grace)
{
    const auto status = pImpl->sample_all();
    if (status.processes.empty())
    {
        LOGGER_INFO("ProcessSupervisor: no supervised processes to kill");
        return 0;
    }
    LOGGER_WARN("ProcessSupervisor: killing all {} supervised processes", status.process_count);

    std::vector<uint64_t> signalled;
    for (const auto &proc : status.processes)
    {
        const auto ec = pImpl->table.send_signal(proc.pid, ProcessSignal::Terminate);
        if (!ec)
        {
            signalled.push_back(proc.pid);
        }
        else if (!is_gone(ec))
        {
            LOGGER_ERROR("ProcessSupervisor: SIGTERM to pid {} failed: {}", proc.pid,
                         ec.message());
        }
    }

    std::this_thread::sleep_for(grace);

    std::size_t terminated = 0;
    for (uint64_t pid : signalled)
    {
        if (!pImpl->table.is_alive(pid))
        {
            ++terminated;
            continue;
        }
        const auto outcome = pImpl->force_kill(pid);
        if (outcome != KillOutcome::Failed)
        {
            ++terminated;
        }
    }
    LOGGER_INFO("ProcessSupervisor: {} supervised processes terminated", terminated);
    return terminated;
}

HealthStatus ProcessSupervisor::get_health_status() const
{
    return pImpl->classify(pImpl->sample(0));
}

std::string ProcessSupervisor::get_resource_summary() const
{
    const auto status = pImpl->sample(0);
    const auto &l = pImpl->limits;
    return fmt::format("MCP Resources:\n"
                       "  Processes: {}/{} ({}%)\n"
                       "  Memory: {}MB/{}MB ({}%)\n"
                       "  Cleanup: {}\n"
                       "  Status: {}",
                       status.process_count, l.max_servers,
                       percent_of(status.process_count, l.max_servers), status.memory_usage_mb,
                       l.max_memory_mb, percent_of(status.memory_usage_mb, l.max_memory_mb),
                       l.cleanup_enabled ? "ENABLED" : "DISABLED",
                       to_string(pImpl->classify(status)));
}

bool ProcessSupervisor::is_cleaning_up() const noexcept
{
    return pImpl->cleaning_up.load(std::memory_order_acquire);
}

bool ProcessSupervisor::is_periodic_cleanup_running() const noexcept
{
    return pImpl->m_timer_running.load(std::memory_order_acquire);
}

const SupervisorLimits &ProcessSupervisor::limits() const noexcept
{
    return pImpl->limits;
}

} // namespace mcpguard::utils
