#include "mcg_base.hpp"

#include <ctime>

namespace mcpguard::format_tools
{

namespace
{

// Splits a time point into whole seconds and a non-negative sub-second count of Unit.
template <typename Unit>
std::pair<std::chrono::sys_seconds, long long>
split_seconds(std::chrono::system_clock::time_point timestamp)
{
    const auto whole = std::chrono::floor<std::chrono::seconds>(timestamp);
    return {whole, std::chrono::duration_cast<Unit>(timestamp - whole).count()};
}

} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    const auto [secs, micros] = split_seconds<std::chrono::microseconds>(timestamp);
    const std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(secs));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", local, micros);
}

std::string formatted_time_iso8601(std::chrono::system_clock::time_point timestamp)
{
    const auto [secs, millis] = split_seconds<std::chrono::milliseconds>(timestamp);
    const std::tm utc = fmt::gmtime(std::chrono::system_clock::to_time_t(secs));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, millis);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view blanks = " \t\n\r\f\v";
    const auto first = str.find_first_not_of(blanks);
    if (first == std::string_view::npos)
        return {};
    return str.substr(first, str.find_last_not_of(blanks) - first + 1);
}

std::string truncate_for_display(std::string_view text, std::size_t max_len)
{
    return std::string(text.substr(0, max_len));
}

} // namespace mcpguard::format_tools
