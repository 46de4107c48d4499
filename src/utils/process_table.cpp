// process_table.cpp
#include "mcg_base.hpp"
#include "utils/process_table.hpp"

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>

#include <signal.h>
#include <sys/types.h>

namespace mcpguard::utils
{

namespace
{
namespace fs = std::filesystem;

std::optional<uint64_t> parse_pid(const std::string &name) noexcept
{
    uint64_t pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size() || pid == 0)
    {
        return std::nullopt;
    }
    return pid;
}

// Returns VmRSS in KiB. Kernel threads have no VmRSS line and report 0.
std::optional<uint64_t> read_rss_kb(uint64_t pid)
{
    std::ifstream in(fmt::format("/proc/{}/status", pid));
    if (!in)
    {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line))
    {
        if (line.rfind("VmRSS:", 0) != 0)
        {
            continue;
        }
        auto value = format_tools::trim_whitespace(std::string_view(line).substr(6));
        uint64_t kb = 0;
        std::from_chars(value.data(), value.data() + value.size(), kb);
        return kb;
    }
    return uint64_t{0};
}

constexpr std::string_view kInterpreters[] = {"node", "nodejs", "bun", "deno", "python",
                                              "ruby", "perl"};

std::string_view basename_of(std::string_view token) noexcept
{
    const auto slash = token.rfind('/');
    return slash == std::string_view::npos ? token : token.substr(slash + 1);
}

// "python3.11" and "node18" are still interpreters.
bool is_interpreter(std::string_view program) noexcept
{
    const auto name = basename_of(program);
    for (const auto interp : kInterpreters)
    {
        if (name.substr(0, interp.size()) != interp)
            continue;
        const auto rest = name.substr(interp.size());
        if (rest.find_first_not_of("0123456789.") == std::string_view::npos)
            return true;
    }
    return false;
}

bool token_matches(std::string_view token, std::string_view signature) noexcept
{
    if (token.empty())
        return false;
    if (token == signature)
        return true;
    const auto base = basename_of(token);
    if (base == signature)
        return true;
    const auto dot = base.rfind('.');
    return dot != std::string_view::npos && dot != 0 && base.substr(0, dot) == signature;
}
} // namespace

bool matches_launch_signature(const std::vector<std::string> &argv, std::string_view signature)
{
    if (argv.empty() || signature.empty())
        return false;
    if (token_matches(argv.front(), signature))
        return true;
    if (!is_interpreter(argv.front()))
        return false;
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        if (argv[i].empty() || argv[i].front() == '-')
            continue;
        return token_matches(argv[i], signature);
    }
    return false;
}

std::vector<ProcessEntry> ProcfsProcessTable::list_processes()
{
    std::vector<ProcessEntry> entries;
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec)
    {
        throw std::system_error(ec, "cannot enumerate /proc");
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec))
    {
        auto pid = parse_pid(it->path().filename().string());
        if (!pid)
        {
            continue;
        }
        // Kernel threads and processes that exited mid-scan have no cmdline.
        auto argv = platform::process_argv(*pid);
        if (!argv)
        {
            continue;
        }
        std::optional<uint64_t> rss;
        try
        {
            rss = read_rss_kb(*pid);
        }
        catch (const std::exception &e)
        {
            MCG_DEBUG("ProcfsProcessTable: reading status of pid {} failed: {}", *pid, e.what());
        }
        if (!rss)
        {
            continue;
        }
        entries.push_back(ProcessEntry{*pid, *rss, std::move(*argv)});
    }
    if (ec)
    {
        MCG_DEBUG("ProcfsProcessTable: /proc scan stopped early: {}", ec.message());
    }
    return entries;
}

std::error_code ProcfsProcessTable::send_signal(uint64_t pid, ProcessSignal sig)
{
    if (pid == 0 || pid > static_cast<uint64_t>(std::numeric_limits<pid_t>::max()))
    {
        return std::make_error_code(std::errc::invalid_argument);
    }
    const int signo = (sig == ProcessSignal::Kill) ? SIGKILL : SIGTERM;
    if (::kill(static_cast<pid_t>(pid), signo) != 0)
    {
        return {errno, std::generic_category()};
    }
    return {};
}

bool ProcfsProcessTable::is_alive(uint64_t pid)
{
    return platform::is_process_alive(pid);
}

} // namespace mcpguard::utils
