/**
 * @file debug_info.hpp
 * @brief Fatal-error and diagnostic helpers: MCG_PANIC, MCG_DEBUG and stack traces.
 *
 * MCG_DEBUG output is compiled in only with MCPGUARD_ENABLE_DEBUG_MESSAGES.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>

#include "utils/format_tools.hpp"

namespace mcpguard::debug
{

/// "file.cpp:42:function-signature"
inline std::string where(const std::source_location &loc)
{
    return fmt::format("{}:{}:{}", mcpguard::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

/**
 * @brief Prints the calling thread's stack to `stderr`, innermost frame first.
 * @warning Allocates; never call it from a signal handler.
 */
MCPGUARD_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Reports an unrecoverable programming error and aborts.
 *
 * Writes `[PANIC] <where> -- <message>` and a stack trace to stderr. Used for
 * contract violations such as touching a service before its lifecycle module has
 * started; recoverable failures are reported through exceptions or error codes.
 */
template <typename... Args>
[[noreturn]] void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args) noexcept
{
    std::string line;
    try
    {
        line = fmt::format("[PANIC] {} -- {}\n", where(loc),
                           fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        line = "[PANIC] (message could not be formatted: ";
        line += e.what();
        line += ")\n";
    }
    std::fputs(line.c_str(), stderr);
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/// Writes `[DBG]  <message>` to stderr. Formatting failures are reported in place.
template <typename... Args>
void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fputs("[DBG]  debug message could not be formatted: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
}

} // namespace mcpguard::debug

#ifndef MCG_PANIC
#define MCG_PANIC(fmt, ...)                                                                        \
    ::mcpguard::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef MCG_DEBUG
#if defined(MCPGUARD_ENABLE_DEBUG_MESSAGES)
#define MCG_DEBUG(fmt, ...) ::mcpguard::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define MCG_DEBUG(fmt, ...) ((void)0)
#endif
#endif
