// tests/test_format_tools.cpp

#include "test_preamble.h"

#include <regex>

using namespace elworkbench;

TEST(FormatToolsTest, FormattedTimeHasMicroseconds)
{
    const auto text = format_tools::formatted_time(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(text, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})"))) << text;
}

TEST(FormatToolsTest, FilenameTimestampParsesBack)
{
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    const auto stem = format_tools::filename_timestamp(now);
    EXPECT_TRUE(std::regex_match(stem, std::regex(R"(\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2})"))) << stem;

    const auto parsed = format_tools::parse_filename_timestamp(stem);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::time_point_cast<std::chrono::seconds>(*parsed), now);
}

TEST(FormatToolsTest, ParseRejectsOtherNames)
{
    EXPECT_FALSE(format_tools::parse_filename_timestamp("session").has_value());
    EXPECT_FALSE(format_tools::parse_filename_timestamp("2025-01-01").has_value());
    EXPECT_FALSE(format_tools::parse_filename_timestamp("2025-01-01 12:00:00").has_value());
}
