#pragma once
/**
 * @file mcg_platform.hpp
 * @brief Layer 0: platform detection and the process/thread primitives everything
 *        else is built on.
 *
 * The build defines PLATFORM_LINUX (or PLATFORM_FREEBSD / PLATFORM_APPLE); compiler
 * macros are the fallback. Supervision needs POSIX signals, and process inspection
 * is implemented on top of Linux /proc.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#if defined(PLATFORM_LINUX) || (!defined(PLATFORM_FREEBSD) && !defined(PLATFORM_APPLE) &&         \
                                 defined(__linux__))
#define MCPGUARD_PLATFORM_LINUX 1
#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define MCPGUARD_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define MCPGUARD_PLATFORM_APPLE 1
#else
#error "mcpguard supervises processes through POSIX signals and requires a POSIX platform."
#endif

#define MCPGUARD_IS_POSIX 1

#if __cplusplus < 202002L
#error "mcpguard requires C++20 (-std=c++20)."
#endif

#include "mcpguard_utils_export.h"

namespace mcpguard::platform
{

MCPGUARD_UTILS_EXPORT uint64_t get_pid();

/// Kernel thread id (gettid on Linux); distinct across live threads of all processes.
MCPGUARD_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Name of the running executable, or its absolute path with @p include_path.
 * @return "unknown" when it cannot be determined.
 */
MCPGUARD_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

// Package version, fixed at configure time. The rolling part is the git commit count.
MCPGUARD_UTILS_EXPORT int get_version_major() noexcept;
MCPGUARD_UTILS_EXPORT int get_version_minor() noexcept;
MCPGUARD_UTILS_EXPORT int get_version_rolling() noexcept;
MCPGUARD_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief True if @p pid names a running process.
 *
 * Checks with kill(pid, 0). EPERM counts as alive (the process exists but belongs to
 * someone else). On Linux a zombie counts as dead. 0 and values outside the pid_t
 * range are never alive.
 */
MCPGUARD_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/// The argument vector of @p pid as read from /proc/<pid>/cmdline; nullopt when it
/// has none (kernel thread, zombie) or cannot be read.
MCPGUARD_UTILS_EXPORT std::optional<std::vector<std::string>> process_argv(uint64_t pid) noexcept;

/**
 * @brief The arguments of @p pid joined by single spaces.
 * @return nullopt for a vanished process, a kernel thread or an unreadable entry.
 */
MCPGUARD_UTILS_EXPORT std::optional<std::string> process_cmdline(uint64_t pid) noexcept;

/// Resolved executable path of @p pid; nullopt when not permitted or gone.
MCPGUARD_UTILS_EXPORT std::optional<std::string> process_executable(uint64_t pid) noexcept;

/// steady_clock in nanoseconds; only differences are meaningful.
MCPGUARD_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/// Nanoseconds since @p start_ns, clamped to 0 if @p start_ns lies in the future.
MCPGUARD_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace mcpguard::platform
