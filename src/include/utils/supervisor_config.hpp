#pragma once

/**
 * @file supervisor_config.hpp
 * @brief SupervisorConfig: process-wide supervisor configuration, a lifecycle module.
 *
 * Loads the supervisor ceilings, timing, launch signature, lock path and logging
 * settings once at startup and exposes them through typed getters.
 *
 * ## Lifecycle
 *
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       SupervisorConfig::GetLifecycleModule(),
 *       SingletonLock::GetLifecycleModule()));
 * @endcode
 *
 * Startup order: `Logger -> SupervisorConfig`.
 *
 * ## Config loading, layered (priority low -> high)
 *
 *  1. Built-in C++ defaults
 *  2. `config/mcpguard.default.json`, deep-merged with `config/mcpguard.user.json`
 *  3. An explicit file (`set_config_path()` or `MCPGUARD_CONFIG_FILE`); replaces layer 2
 *  4. Environment overrides:
 *     - `MCPGUARD_MAX_SERVERS` (alias `SNOW_MAX_MCP_SERVERS`)
 *     - `MCPGUARD_MEMORY_LIMIT_MB` (alias `SNOW_MCP_MEMORY_LIMIT`)
 *     - `MCPGUARD_CLEANUP_ENABLED`
 *     - `MCPGUARD_LOCK_PATH`
 *  5. Setters, used by the command line front end after startup
 *
 * The config directory is `<binary_dir>/../config/` or `<binary_dir>/config/`.
 * A layer whose JSON is malformed is logged and skipped. A value that is out of
 * range (e.g. a zero ceiling) is rejected with a warning and the previous value kept.
 *
 * Expected JSON shape:
 * @code{.json}
 *  {
 *    "supervisor": { "max_servers": 30, "max_memory_mb": 3000, "cleanup_enabled": true,
 *                    "cleanup_interval_ms": 60000, "graceful_timeout_ms": 5000,
 *                    "launch_signature": "mcp-server" },
 *    "lock":       { "path": "" },
 *    "logging":    { "level": "info", "file": "" }
 *  }
 * @endcode
 */

#include "utils/module_def.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace mcpguard::utils
{

/**
 * @struct SupervisorLimits
 * @brief Ceilings and timing for one ProcessSupervisor. A plain value type so that
 *        the supervisor can be constructed without the configuration module.
 */
struct SupervisorLimits
{
    uint32_t max_servers{30};
    uint64_t max_memory_mb{3000};
    bool cleanup_enabled{true};
    std::chrono::milliseconds cleanup_interval{60000};
    std::chrono::milliseconds graceful_timeout{5000};
    std::string launch_signature{"mcp-server"};
};

class MCPGUARD_UTILS_EXPORT SupervisorConfig
{
  public:
    /**
     * @brief Optional: call before the lifecycle module starts to load a specific file.
     *        Takes precedence over `MCPGUARD_CONFIG_FILE` and the config directory.
     */
    static void set_config_path(const std::filesystem::path &path);

    /** @brief ModuleDef for LifecycleGuard. Depends on the Logger. */
    static ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Returns the global SupervisorConfig instance.
     * @pre The lifecycle module is started (panics otherwise).
     */
    static SupervisorConfig &get_instance();

    /** @brief Snapshot of the supervisor settings. */
    SupervisorLimits limits() const;

    uint32_t max_servers() const;
    uint64_t max_memory_mb() const;
    bool cleanup_enabled() const;
    std::chrono::milliseconds cleanup_interval() const;
    std::chrono::milliseconds graceful_timeout() const;
    std::string launch_signature() const;

    /** @brief Configured lock path; empty means SingletonLock::default_lock_path(). */
    std::filesystem::path lock_path() const;

    std::string log_level() const;
    /** @brief Log file path; empty means the console sink. */
    std::filesystem::path log_file() const;

    /** @brief Directory the layered files were read from; empty if none was found. */
    std::filesystem::path config_dir() const;

    // Overrides applied after loading. Invalid values are rejected and return false.
    bool set_max_servers(uint32_t value);
    bool set_max_memory_mb(uint64_t value);
    bool set_cleanup_interval(std::chrono::milliseconds value);
    void set_cleanup_enabled(bool value);
    bool set_launch_signature(const std::string &value);
    void set_lock_path(const std::filesystem::path &value);

    SupervisorConfig(const SupervisorConfig &) = delete;
    SupervisorConfig &operator=(const SupervisorConfig &) = delete;
    SupervisorConfig(SupervisorConfig &&) = delete;
    SupervisorConfig &operator=(SupervisorConfig &&) = delete;

    /// @internal Called by the lifecycle startup function.
    void load_(const std::filesystem::path &override_path);

  private:
    SupervisorConfig();
    ~SupervisorConfig();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpguard::utils
