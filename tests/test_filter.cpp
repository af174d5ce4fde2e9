#include <gtest/gtest.h>

#include "filter.hpp"

TEST(Filter, GlobMatch)
{
    EXPECT_TRUE(glob_match("logs-*", "logs-default"));
    EXPECT_TRUE(glob_match("*", ""));
    EXPECT_TRUE(glob_match("tr?ces-*", "traces-apm"));
    EXPECT_TRUE(glob_match("*-default", "metrics-default"));
    EXPECT_FALSE(glob_match("logs-*", "traces-default"));
    EXPECT_FALSE(glob_match("logs", "logs-default"));
}

TEST(Filter, IndexPatternList)
{
    EXPECT_TRUE(index_pattern_match("logs-*,traces-*", "traces-default"));
    EXPECT_TRUE(index_pattern_match(" logs-* , metrics-* ", "metrics-default"));
    EXPECT_FALSE(index_pattern_match("logs-*,traces-*", "metrics-default"));
    EXPECT_FALSE(index_pattern_match("", "logs-default"));
    EXPECT_FALSE(index_pattern_match(",,", "logs-default"));
}

TEST(Filter, CaseInsensitiveHelpers)
{
    EXPECT_TRUE(contains_icase_ascii("Connection REFUSED by peer", "refused"));
    EXPECT_TRUE(contains_icase_ascii("anything", ""));
    EXPECT_FALSE(contains_icase_ascii("abc", "abcd"));
    EXPECT_TRUE(starts_with_icase_ascii("WARNING", "warn"));
    EXPECT_FALSE(starts_with_icase_ascii("INFO", "warn"));
}

TEST(Filter, PlainTextIsSubstring)
{
    CompiledFilter cf;
    ASSERT_TRUE(cf.compile("Timeout"));
    EXPECT_FALSE(cf.use_regex);
    EXPECT_TRUE(cf.match("upstream timeout after 30s"));
    EXPECT_FALSE(cf.match("upstream ok"));
}

TEST(Filter, SlashesMakeARegex)
{
    CompiledFilter cf;
    ASSERT_TRUE(cf.compile("/status=5\\d\\d/"));
    EXPECT_TRUE(cf.use_regex);
    EXPECT_TRUE(cf.match("GET /api status=503"));
    EXPECT_FALSE(cf.match("GET /api status=200"));
}

TEST(Filter, BadRegexReportsAnError)
{
    CompiledFilter cf;
    std::string err;
    EXPECT_FALSE(cf.compile("/([a-/", &err));
    EXPECT_NE(err.find("invalid search pattern"), std::string::npos);
}

TEST(Filter, EmptyPatternMatchesEverything)
{
    CompiledFilter cf;
    ASSERT_TRUE(cf.compile(""));
    EXPECT_TRUE(cf.empty());
    EXPECT_TRUE(cf.match("x"));
    EXPECT_TRUE(cf.matchAny({}));
}

TEST(Filter, MatchAny)
{
    CompiledFilter cf;
    ASSERT_TRUE(cf.compile("checkout"));
    EXPECT_TRUE(cf.matchAny({ "cart", "Checkout-Service" }));
    EXPECT_FALSE(cf.matchAny({ "cart", "payment" }));
}
