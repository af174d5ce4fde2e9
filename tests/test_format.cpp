#include <gtest/gtest.h>

#include "format.hpp"

#include <chrono>
#include <limits>

using namespace std::chrono_literals;

TEST(Format, DurationUnits)
{
    EXPECT_EQ(fmtDuration(850.0), "850 us");
    EXPECT_EQ(fmtDuration(1500.0), "1.500 ms");
    EXPECT_EQ(fmtDuration(12500.0), "12.5 ms");
    EXPECT_EQ(fmtDuration(250000.0), "250 ms");
    EXPECT_EQ(fmtDuration(2.5e6), "2.500 s");
    EXPECT_EQ(fmtDuration(62.25e6), "01:02.250");
    EXPECT_EQ(fmtDuration(3723e6), "01:02:03");
}

TEST(Format, DurationOfGarbage)
{
    EXPECT_EQ(fmtDuration(-5.0), "0 us");
    EXPECT_EQ(fmtDuration(std::numeric_limits<double>::quiet_NaN()), "0 us");
}

TEST(Format, RelativeTimestamps)
{
    const SysTime now = SysTime(std::chrono::hours(24 * 365 * 50));
    EXPECT_EQ(fmtTimestamp(now - 12s, TimeDisplayMode::Relative, now), "12s ago");
    EXPECT_EQ(fmtTimestamp(now - 5min, TimeDisplayMode::Relative, now), "5m ago");
    EXPECT_EQ(fmtTimestamp(now - 3h, TimeDisplayMode::Relative, now), "3h ago");
    EXPECT_EQ(fmtTimestamp(now - 72h, TimeDisplayMode::Relative, now), "3d ago");
    EXPECT_EQ(fmtTimestamp(SysTime{}, TimeDisplayMode::Clock, now), "-");
}

TEST(Format, IsoIsUtcWithMillis)
{
    const SysTime ts = SysTime(std::chrono::milliseconds(1700000000123LL));
    EXPECT_EQ(fmtIso(ts), "2023-11-14T22:13:20.123Z");
}

TEST(Format, TimeDisplayCycles)
{
    EXPECT_EQ(nextTimeDisplay(TimeDisplayMode::Clock), TimeDisplayMode::Relative);
    EXPECT_EQ(nextTimeDisplay(TimeDisplayMode::Relative), TimeDisplayMode::Full);
    EXPECT_EQ(nextTimeDisplay(TimeDisplayMode::Full), TimeDisplayMode::Clock);
}

TEST(Format, WrapLines)
{
    const auto lines = wrapLines("abcdefgh\n\nxy", 3);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[1], "def");
    EXPECT_EQ(lines[2], "gh");
    EXPECT_EQ(lines[3], "");
    EXPECT_EQ(lines[4], "xy");

    EXPECT_EQ(wrapLines("one line", 0).size(), 1u);
}

TEST(Format, UrlEncode)
{
    EXPECT_EQ(urlEncode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(urlEncode("logs-*"), "logs-%2A");
}

TEST(Format, Compact)
{
    EXPECT_EQ(fmtCompact(42), "42");
    EXPECT_EQ(fmtCompact(0.25), "0.25");
    EXPECT_EQ(fmtCompact(1234), "1.2k");
    EXPECT_EQ(fmtCompact(3.4e6), "3.4M");
}

TEST(Format, QueryOverlay)
{
    EXPECT_EQ(queryText("", QueryFormat::Esql, "logs-*"), "No query yet");
    EXPECT_EQ(queryText("FROM logs-*", QueryFormat::Esql, "logs-*"), "FROM logs-*");

    const std::string curl = queryText("FROM logs-*\n| LIMIT 10", QueryFormat::Curl, "logs-*");
    EXPECT_NE(curl.find("curl -X POST"), std::string::npos);
    EXPECT_NE(curl.find("FROM logs-* | LIMIT 10"), std::string::npos);
}

TEST(Format, PrettyJson)
{
    EXPECT_EQ(prettyJson(nlohmann::json()), "{}");
    EXPECT_EQ(prettyJson(nlohmann::json{ { "a", 1 } }), "{\n  \"a\": 1\n}");
}
