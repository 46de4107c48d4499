#pragma once
// String and timestamp helpers shared by the logger, the lock record and the status table.
#include <chrono>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mcpguard_utils_export.h"

namespace mcpguard::format_tools
{

/// Local time as "YYYY-MM-DD HH:MM:SS.uuuuuu".
MCPGUARD_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// UTC as "YYYY-MM-DDTHH:MM:SS.mmmZ". Used for the acquired_at field of a lock record.
MCPGUARD_UTILS_EXPORT std::string
formatted_time_iso8601(std::chrono::system_clock::time_point timestamp);

MCPGUARD_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/// The first @p max_len characters of @p text.
MCPGUARD_UTILS_EXPORT std::string truncate_for_display(std::string_view text, std::size_t max_len);

/// Formats straight into a memory_buffer, for callers that queue the bytes.
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), fmt_str, std::forward<Args>(args)...);
    return out;
}

/// Last path component of a __FILE__ style path; usable in constant expressions.
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto slash = file_path.rfind('/');
    return slash == std::string_view::npos ? file_path : file_path.substr(slash + 1);
}

} // namespace mcpguard::format_tools
