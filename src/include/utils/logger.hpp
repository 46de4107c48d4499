#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide asynchronous logger.
 *
 * `LOGGER_*` macros format on the caller's thread and hand the line to a queue.
 * One worker thread owns the sink (stderr by default, or an append-only file that
 * several processes may share under `flock`) and performs every write. Sink switches,
 * flushes and callback changes are queued with the messages and apply in order.
 *
 * The queue has a soft limit (default 10000) above which only WARN and higher are
 * kept, and a hard limit at twice that above which everything is dropped. The worker
 * logs how many messages it lost once it catches up.
 *
 * The Logger is a lifecycle module: configuring it before the module started is a
 * programming error and panics, while anything logged after shutdown is discarded.
 *
 * @code
 *  LOGGER_INFO("admitting server, {} of {} slots used", used, limits.max_servers);
 * @endcode
 */
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "mcpguard_utils_export.h"
#include "utils/module_def.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace mcpguard::utils
{

class MCPGUARD_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /**
     * @brief Lifecycle module for the Logger. Starting it spawns the worker thread;
     *        shutting it down drains the queue (bounded to 5 s).
     */
    static ModuleDef GetLifecycleModule();

    /** @brief True once the Logger module has been started (and until process exit). */
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Parses a level name ("trace", "debug", "info", "warn"/"warning", "error",
     *        "system"), case-insensitive.
     */
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Switch logging to a file opened for appending. The switch is queued
     *        behind pending messages; the call blocks until the worker applied it.
     * @param utf8_path Path to the log file; its directory must exist.
     * @param use_flock If true, each write holds an advisory `flock`, so several
     *                  processes can share one log file.
     * @return false if the file could not be opened; the previous sink stays active
     *         and the write error callback (if any) is informed.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock);
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Drains the queue and stops the worker thread. Called by the lifecycle
     *        module; after it returns, log calls are no-ops.
     */
    void shutdown();

    /** @brief Blocks until all messages queued before this call have been written. */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /** @brief Soft queue limit (default 10000); the hard limit is twice this value. */
    void set_max_queue_size(size_t max_size);

    /** @brief Messages dropped because of a full queue since the last sink switch. */
    size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Sets a callback invoked when a sink fails to open or a write fails.
     * @details Runs on the worker thread; it must not call back into the Logger.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /** @brief Enables or disables the "Switching log sink" notices written on a sink switch. */
    void set_log_sink_messages_enabled(bool enabled);

    // Used by the LOGGER_* macros.
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    bool should_log(Level lvl) const noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *arg);

    template <typename Format, typename... Args>
    void format_and_enqueue(Level lvl, Format fmt_str, Args &&...args) noexcept;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;
};

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // Levels below this are compiled out of log_fmt().
#endif

template <typename Format, typename... Args>
void Logger::format_and_enqueue(Level lvl, Format fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        fmt::memory_buffer line;
        line.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(line), fmt_str, std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(line));
    }
    catch (const std::exception &ex)
    {
        enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
        format_and_enqueue(lvl, fmt_str, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    format_and_enqueue(lvl, fmt::runtime(fmt_str), std::forward<Args>(args)...);
}

} // namespace mcpguard::utils

#define MCG_LOGGER_AT_(lvl, fmt, ...)                                                              \
    ::mcpguard::utils::Logger::instance().log_fmt<::mcpguard::utils::Logger::Level::lvl>(          \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define MCG_LOGGER_AT_RT_(lvl, fmt, ...)                                                           \
    ::mcpguard::utils::Logger::instance().log_fmt_runtime(::mcpguard::utils::Logger::Level::lvl,   \
                                                          fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) MCG_LOGGER_AT_(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) MCG_LOGGER_AT_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) MCG_LOGGER_AT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) MCG_LOGGER_AT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) MCG_LOGGER_AT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) MCG_LOGGER_AT_(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)

// Runtime format strings; a mismatch is logged as "[FORMAT ERROR] ...".
#define LOGGER_INFO_RT(fmt, ...) MCG_LOGGER_AT_RT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...) MCG_LOGGER_AT_RT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...) MCG_LOGGER_AT_RT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
