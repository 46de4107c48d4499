/**
 * @file mcpguard_main.cpp
 * @brief mcpguard: singleton admission and process-pool supervision for MCP servers.
 *
 * ## Usage
 *
 *     mcpguard [options] <command>
 *
 *     status            Table of supervised processes (pid, memory, command line)
 *     summary           Resource summary
 *     health            Prints health; exit 0 healthy, 1 warning, 2 critical
 *     can-spawn         Exit 0 if another server may be started, 1 otherwise
 *     run               Hold the singleton lock and run periodic cleanup until
 *                       SIGINT/SIGTERM; exit 3 if another instance holds the lock
 *     cleanup           One audit pass
 *     kill-duplicates   Keep the lowest pid, stop the others
 *     kill-all          Stop every supervised process (destructive)
 *     force-release     Delete the lock file regardless of owner (destructive)
 */

#include "mcg_service.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace mcpguard::utils;

// ---------------------------------------------------------------------------
// Global shutdown flag (set by SIGINT/SIGTERM in `run`)
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // double signal, fast exit
    g_shutdown.store(true, std::memory_order_relaxed);
}

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCritical = 2;
constexpr int kExitLockHeld = 3;
constexpr int kExitHardError = 4;

constexpr std::chrono::milliseconds kRunPollInterval{200};

struct CliArgs
{
    std::string command;
    std::string config_path;
    std::string lock_path;
    std::optional<std::string> signature;
    std::optional<uint64_t> max_servers;
    std::optional<uint64_t> max_memory_mb;
    std::optional<uint64_t> interval_ms;
    bool verbose{false};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options] <command>\n\n"
        << "Commands:\n"
        << "  status            List supervised processes\n"
        << "  summary           Print the resource summary\n"
        << "  health            Print health; exit 0 healthy, 1 warning, 2 critical\n"
        << "  can-spawn         Exit 0 if a new server may be started, 1 otherwise\n"
        << "  run               Hold the singleton lock and supervise until SIGINT/SIGTERM\n"
        << "  cleanup           Run one audit pass\n"
        << "  kill-duplicates   Keep the lowest pid, stop the others\n"
        << "  kill-all          Stop every supervised process (destructive)\n"
        << "  force-release     Delete the lock file regardless of owner (destructive)\n\n"
        << "Options:\n"
        << "  --config <file>       Configuration file (replaces config/mcpguard.*.json)\n"
        << "  --lock <path>         Lock file path\n"
        << "  --signature <s>       Program or script name that launches a supervised server\n"
        << "  --max-servers N       Server count ceiling\n"
        << "  --max-memory-mb N     Aggregate memory ceiling in MB\n"
        << "  --interval-ms N       Periodic cleanup interval\n"
        << "  --verbose             Debug logging\n"
        << "  --help                Show this message\n";
}

std::optional<uint64_t> parse_number(std::string_view text)
{
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty())
        return std::nullopt;
    return value;
}

[[noreturn]] void usage_error(const char *prog, std::string_view message)
{
    std::cerr << "Error: " << message << "\n\n";
    print_usage(prog);
    std::exit(kExitFailure);
}

CliArgs parse_args(int argc, char *argv[])
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        auto value = [&](std::string_view opt) -> std::string_view
        {
            if (i + 1 >= argc)
                usage_error(argv[0], fmt::format("{} requires a value", opt));
            return argv[++i];
        };
        auto number = [&](std::string_view opt) -> uint64_t
        {
            auto text = value(opt);
            auto n = parse_number(text);
            if (!n)
                usage_error(argv[0], fmt::format("{} expects a number, got '{}'", opt, text));
            return *n;
        };

        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(kExitOk);
        }
        if (arg == "--config")
            args.config_path = value(arg);
        else if (arg == "--lock")
            args.lock_path = value(arg);
        else if (arg == "--signature")
            args.signature = std::string(value(arg));
        else if (arg == "--max-servers")
            args.max_servers = number(arg);
        else if (arg == "--max-memory-mb")
            args.max_memory_mb = number(arg);
        else if (arg == "--interval-ms")
            args.interval_ms = number(arg);
        else if (arg == "--verbose" || arg == "-v")
            args.verbose = true;
        else if (!arg.empty() && arg.front() == '-')
            usage_error(argv[0], fmt::format("unknown option '{}'", arg));
        else if (args.command.empty())
            args.command = arg;
        else
            usage_error(argv[0], fmt::format("unexpected argument '{}'", arg));
    }
    if (args.command.empty())
    {
        usage_error(argv[0], "a command is required");
    }
    return args;
}

// Applies logging settings and command line overrides on top of the loaded config.
// Returns false if an override was rejected.
bool apply_overrides(const CliArgs &args, SupervisorConfig &config)
{
    auto &logger = Logger::instance();
    if (args.verbose)
    {
        logger.set_level(Logger::Level::L_DEBUG);
    }
    else if (auto lvl = Logger::level_from_string(config.log_level()))
    {
        logger.set_level(*lvl);
    }
    if (const auto log_file = config.log_file(); !log_file.empty())
    {
        if (!logger.set_logfile(log_file.string()))
        {
            std::cerr << "Warning: cannot open log file " << log_file << "; logging to console\n";
        }
    }

    bool ok = true;
    if (!args.lock_path.empty())
        config.set_lock_path(args.lock_path);
    if (args.signature)
        ok = config.set_launch_signature(*args.signature) && ok;
    if (args.max_servers)
        ok = (*args.max_servers <= UINT32_MAX &&
              config.set_max_servers(static_cast<uint32_t>(*args.max_servers))) &&
             ok;
    if (args.max_memory_mb)
        ok = config.set_max_memory_mb(*args.max_memory_mb) && ok;
    if (args.interval_ms)
        ok = config.set_cleanup_interval(std::chrono::milliseconds(*args.interval_ms)) && ok;
    return ok;
}

std::filesystem::path effective_lock_path(const SupervisorConfig &config)
{
    auto path = config.lock_path();
    return path.empty() ? SingletonLock::default_lock_path() : path;
}

void print_status(const SystemStatus &status)
{
    fmt::print("{:>8}  {:>8}  {}\n", "PID", "MEM(MB)", "COMMAND");
    for (const auto &proc : status.processes)
    {
        fmt::print("{:>8}  {:>8}  {}\n", proc.pid, proc.memory_mb, proc.name);
    }
    fmt::print("{} processes, {} MB total\n", status.process_count, status.memory_usage_mb);
}

int run_supervisor(ProcessSupervisor &supervisor, const SupervisorConfig &config)
{
    const auto lock_path = effective_lock_path(config);
    SingletonLock lock(lock_path, "mcpguard");
    try
    {
        if (!lock.acquire())
        {
            if (auto holder = read_lock_record(lock_path))
            {
                std::cerr << "another mcpguard instance is already running (pid " << holder->pid
                          << ")\n";
            }
            else
            {
                std::cerr << "another mcpguard instance is already running\n";
            }
            return kExitLockHeld;
        }
    }
    catch (const std::system_error &e)
    {
        LOGGER_ERROR("mcpguard: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return kExitHardError;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LOGGER_SYSTEM("mcpguard {} supervising '{}' (pid {}, lock {})",
                  mcpguard::platform::get_version_string(), supervisor.limits().launch_signature,
                  mcpguard::platform::get_pid(), lock_path.string());
    supervisor.start_periodic_cleanup();

    while (!g_shutdown.load(std::memory_order_relaxed))
    {
        std::this_thread::sleep_for(kRunPollInterval);
    }

    LOGGER_SYSTEM("mcpguard: shutdown requested");
    supervisor.stop_periodic_cleanup();
    lock.release();
    return kExitOk;
}

int dispatch(const CliArgs &args, const SupervisorConfig &config)
{
    ProcfsProcessTable table;
    ProcessSupervisor supervisor(table, config.limits());
    const std::string_view cmd = args.command;

    if (cmd == "status")
    {
        print_status(supervisor.get_system_status());
        return kExitOk;
    }
    if (cmd == "summary")
    {
        fmt::print("{}\n", supervisor.get_resource_summary());
        return kExitOk;
    }
    if (cmd == "health")
    {
        const auto health = supervisor.get_health_status();
        fmt::print("{}\n", to_string(health));
        switch (health)
        {
        case HealthStatus::Healthy:
            return kExitOk;
        case HealthStatus::Warning:
            return kExitFailure;
        case HealthStatus::Critical:
            return kExitCritical;
        }
        return kExitCritical;
    }
    if (cmd == "can-spawn")
    {
        const bool allowed = supervisor.can_spawn_server();
        fmt::print("{}\n", allowed ? "yes" : "no");
        return allowed ? kExitOk : kExitFailure;
    }
    if (cmd == "run")
    {
        return run_supervisor(supervisor, config);
    }
    if (cmd == "cleanup")
    {
        const bool ran = supervisor.cleanup();
        fmt::print("{}\n", ran ? "cleanup pass completed" : "cleanup skipped");
        return ran ? kExitOk : kExitFailure;
    }
    if (cmd == "kill-duplicates")
    {
        fmt::print("{} duplicate processes stopped\n", supervisor.kill_duplicates());
        return kExitOk;
    }
    if (cmd == "kill-all")
    {
        fmt::print("{} processes stopped\n", supervisor.kill_all());
        return kExitOk;
    }
    if (cmd == "force-release")
    {
        const auto lock_path = effective_lock_path(config);
        const bool removed = SingletonLock::force_release(lock_path);
        fmt::print("{}: {}\n", lock_path.string(), removed ? "removed" : "no lock file");
        return kExitOk;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return kExitFailure;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CliArgs args = parse_args(argc, argv);

    if (!args.config_path.empty())
    {
        SupervisorConfig::set_config_path(args.config_path);
    }

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            SupervisorConfig::GetLifecycleModule(),
                                            SingletonLock::GetLifecycleModule()));

    auto &config = SupervisorConfig::get_instance();
    if (!apply_overrides(args, config))
    {
        std::cerr << "Error: invalid command line value (see log)\n";
        return kExitFailure;
    }

    try
    {
        return dispatch(args, config);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("mcpguard: {} failed: {}", args.command, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return kExitHardError;
    }
}
