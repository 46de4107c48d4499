#pragma once
/**
 * @file process_table.hpp
 * @brief The supervisor's window onto the OS process list.
 *
 * ProcessSupervisor never talks to the OS directly: it enumerates processes and
 * sends signals through a ProcessTable. ProcfsProcessTable is the production
 * implementation; tests provide their own.
 */
#include "mcpguard_utils_export.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mcpguard::utils
{

/// @brief One row of the process table.
struct ProcessEntry
{
    uint64_t pid{0};
    uint64_t rss_kb{0};            ///< Resident set size (VmRSS) in KiB.
    std::vector<std::string> argv; ///< Never empty for a listed process.

    /// argv joined with single spaces, for display.
    std::string command_line() const
    {
        std::string line;
        for (const auto &arg : argv)
        {
            if (!line.empty())
                line += ' ';
            line += arg;
        }
        return line;
    }
};

/**
 * @brief True when @p argv is a launch of @p signature.
 *
 * Only the launch identity is compared: argv[0], or for an interpreter launch
 * (node, python, deno, ...) the first argument that is not an option. A token
 * matches when it equals @p signature as a whole, by basename, or by basename
 * without its extension. Arguments of other programs never match, so neither
 * `tail -f mcp-server.log` nor `vim mcp-server.js` is a launch of "mcp-server".
 */
MCPGUARD_UTILS_EXPORT bool matches_launch_signature(const std::vector<std::string> &argv,
                                                    std::string_view signature);

enum class ProcessSignal
{
    Terminate, ///< SIGTERM
    Kill       ///< SIGKILL
};

class MCPGUARD_UTILS_EXPORT ProcessTable
{
  public:
    virtual ~ProcessTable() = default;

    /**
     * @brief Lists the processes visible to the caller. Entries that vanish or cannot
     *        be read while listing are skipped.
     * @throws std::system_error if the table itself cannot be enumerated.
     */
    virtual std::vector<ProcessEntry> list_processes() = 0;

    /**
     * @brief Delivers `sig` to `pid`.
     * @return An empty error code on success; `std::errc::no_such_process` if the
     *         process is already gone; another code on failure.
     */
    virtual std::error_code send_signal(uint64_t pid, ProcessSignal sig) = 0;

    virtual bool is_alive(uint64_t pid) = 0;
};

/**
 * @class ProcfsProcessTable
 * @brief Reads `/proc/<pid>/cmdline` and `/proc/<pid>/status`; signals with kill(2).
 */
class MCPGUARD_UTILS_EXPORT ProcfsProcessTable final : public ProcessTable
{
  public:
    std::vector<ProcessEntry> list_processes() override;
    std::error_code send_signal(uint64_t pid, ProcessSignal sig) override;
    bool is_alive(uint64_t pid) override;
};

} // namespace mcpguard::utils
