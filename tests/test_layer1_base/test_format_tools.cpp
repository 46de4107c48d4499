// tests/test_layer1_base/test_format_tools.cpp
/**
 * @file test_format_tools.cpp
 * @brief Tests for the string and timestamp helpers in format_tools.
 */
#include "mcg_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

using namespace mcpguard::format_tools;
using namespace ::testing;

TEST(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(trim_whitespace("  abc \t\n"), "abc");
    EXPECT_EQ(trim_whitespace("abc"), "abc");
    EXPECT_EQ(trim_whitespace("a b"), "a b");
    EXPECT_EQ(trim_whitespace(" \r\n\t "), "");
    EXPECT_EQ(trim_whitespace(""), "");
}

TEST(FormatToolsTest, TruncateForDisplay)
{
    EXPECT_EQ(truncate_for_display("short", 100), "short");
    EXPECT_EQ(truncate_for_display("abcdef", 3), "abc");
    EXPECT_EQ(truncate_for_display("", 3), "");

    const std::string long_cmd(250, 'x');
    EXPECT_EQ(truncate_for_display(long_cmd, 100).size(), 100u);
}

TEST(FormatToolsTest, FilenameOnly)
{
    static_assert(filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("c.cpp"), "c.cpp");
    EXPECT_EQ(filename_only("dir/"), "");
}

TEST(FormatToolsTest, FormattedTime_HasMicroseconds)
{
    const auto s = formatted_time(std::chrono::system_clock::now());
    EXPECT_THAT(s, MatchesRegex(R"(^[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{6}$)"));
}

TEST(FormatToolsTest, Iso8601_Shape)
{
    const auto s = formatted_time_iso8601(std::chrono::system_clock::now());
    EXPECT_THAT(s, MatchesRegex(R"(^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{3}Z$)"));
}

/**
 * The ISO timestamp is UTC regardless of the local time zone.
 */
TEST(FormatToolsTest, Iso8601_KnownInstantIsUtc)
{
    // 2021-01-01T00:00:00Z plus 123 ms
    const std::chrono::system_clock::time_point tp{std::chrono::seconds(1609459200) +
                                                   std::chrono::milliseconds(123)};
    EXPECT_EQ(formatted_time_iso8601(tp), "2021-01-01T00:00:00.123Z");
}

TEST(FormatToolsTest, MakeBuffer)
{
    auto mb = make_buffer("{}-{}", 1, "two");
    EXPECT_EQ(fmt::to_string(mb), "1-two");
}
