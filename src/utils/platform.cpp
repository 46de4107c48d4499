/**
 * @file platform.cpp
 * @brief POSIX process and thread primitives; process inspection reads Linux /proc.
 */
#include "mcg_base.hpp"
#include "mcpguard_version.h"

#include <cerrno>
#include <chrono>
#include <climits>
#include <fstream>
#include <limits>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/ranges.h>

#if defined(MCPGUARD_PLATFORM_APPLE)
#include <libproc.h>
#endif

namespace mcpguard::platform
{

namespace
{

bool fits_pid_t(uint64_t pid)
{
    return pid != 0 && pid <= static_cast<uint64_t>(std::numeric_limits<pid_t>::max());
}

std::string proc_entry(uint64_t pid, const char *leaf)
{
    return fmt::format("/proc/{}/{}", pid, leaf);
}

// readlink(2) into a growing buffer; nullopt on any error.
std::optional<std::string> read_link(const std::string &link)
{
    std::string target(PATH_MAX, '\0');
    for (int attempt = 0; attempt < 4; ++attempt)
    {
        const ssize_t n = ::readlink(link.c_str(), target.data(), target.size());
        if (n < 0)
            return std::nullopt;
        if (static_cast<size_t>(n) < target.size())
        {
            target.resize(static_cast<size_t>(n));
            return target;
        }
        target.resize(target.size() * 2);
    }
    return std::nullopt;
}

// The state field follows the parenthesised comm, which may itself contain ')'.
char proc_state(uint64_t pid)
{
    std::ifstream in(proc_entry(pid, "stat"));
    std::string line;
    if (!std::getline(in, line))
        return '?';
    const auto paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size())
        return '?';
    return line[paren + 2];
}

} // namespace

uint64_t get_pid()
{
    return static_cast<uint64_t>(::getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(MCPGUARD_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(MCPGUARD_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(::pthread_self()));
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        const auto path = process_executable(get_pid());
        if (!path)
            return "unknown";
        return include_path ? *path : std::filesystem::path(*path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
        return "unknown";
    }
}

int get_version_major() noexcept
{
    return MCPGUARD_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return MCPGUARD_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return MCPGUARD_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return MCPGUARD_VERSION_STRING;
}

bool is_process_alive(uint64_t pid) noexcept
{
    // Out-of-range values would address process groups in kill(2).
    if (!fits_pid_t(pid))
        return false;
    if (::kill(static_cast<pid_t>(pid), 0) != 0)
        return errno == EPERM;
#if defined(MCPGUARD_PLATFORM_LINUX)
    try
    {
        return proc_state(pid) != 'Z';
    }
    catch (const std::exception &)
    {
        return true; // kill() already proved it exists.
    }
#else
    return true;
#endif
}

std::optional<std::vector<std::string>> process_argv(uint64_t pid) noexcept
{
    try
    {
        std::ifstream in(proc_entry(pid, "cmdline"), std::ios::binary);
        if (!in)
            return std::nullopt;
        std::vector<std::string> argv;
        std::string arg;
        while (std::getline(in, arg, '\0'))
            argv.push_back(std::move(arg));
        // A process that rewrote its title may pad with NULs.
        while (!argv.empty() && argv.back().empty())
            argv.pop_back();
        // Kernel threads and zombies have an empty cmdline.
        if (argv.empty())
            return std::nullopt;
        return argv;
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
}

std::optional<std::string> process_cmdline(uint64_t pid) noexcept
{
    const auto argv = process_argv(pid);
    if (!argv)
        return std::nullopt;
    try
    {
        return fmt::format("{}", fmt::join(*argv, " "));
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
}

std::optional<std::string> process_executable(uint64_t pid) noexcept
{
#if defined(MCPGUARD_PLATFORM_APPLE)
    char buf[PROC_PIDPATHINFO_MAXSIZE];
    if (proc_pidpath(static_cast<int>(pid), buf, sizeof(buf)) > 0)
        return std::string(buf);
    return std::nullopt;
#else
    try
    {
        return read_link(proc_entry(pid, "exe"));
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    return now > start_ns ? now - start_ns : 0;
}

} // namespace mcpguard::platform
