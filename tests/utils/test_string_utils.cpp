/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <uvci/utils/string_utils.h>

using namespace uvci::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toUpper / toLower tests
TEST_F(StringUtilsTest, ToUpper_Mixed) {
    EXPECT_EQ(toUpper("urn:uvci:01:se:ehm/v12982924yqmv#t"), "URN:UVCI:01:SE:EHM/V12982924YQMV#T");
}

TEST_F(StringUtilsTest, ToUpper_Empty) {
    EXPECT_EQ(toUpper(""), "");
}

TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("IsO7064"), "iso7064");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   URN:UVCI:01   "), "URN:UVCI:01");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\r\n"), "hello");
}

// split tests
TEST_F(StringUtilsTest, Split_CommaDelimiter) {
    auto result = split("2021-01-03,212112", ',');
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "2021-01-03");
    EXPECT_EQ(result[1], "212112");
}

TEST_F(StringUtilsTest, Split_EmptyString) {
    auto result = split("", ',');
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "");
}

TEST_F(StringUtilsTest, Split_TrailingDelimiter) {
    auto result = split("a,b,", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[2], "");
}

TEST_F(StringUtilsTest, Split_ConsecutiveDelimiters) {
    auto result = split("a,,c", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[1], "");
}

// startsWithIgnoreCase tests
TEST_F(StringUtilsTest, StartsWithIgnoreCase_Matches) {
    EXPECT_TRUE(startsWithIgnoreCase("urn:uvci:01:SE", "URN:UVCI:"));
    EXPECT_TRUE(startsWithIgnoreCase("URN:UVCI:", "URN:UVCI:"));
}

TEST_F(StringUtilsTest, StartsWithIgnoreCase_PrefixLonger) {
    EXPECT_FALSE(startsWithIgnoreCase("URN", "URN:UVCI:"));
}

TEST_F(StringUtilsTest, StartsWithIgnoreCase_Different) {
    EXPECT_FALSE(startsWithIgnoreCase("01:SE:EHM", "URN:UVCI:"));
}

// character class tests
TEST_F(StringUtilsTest, IsAllDigits) {
    EXPECT_TRUE(isAllDigits("0123456789"));
    EXPECT_FALSE(isAllDigits(""));
    EXPECT_FALSE(isAllDigits("12a"));
    EXPECT_FALSE(isAllDigits("-1"));
}

TEST_F(StringUtilsTest, IsAllUpperAlpha) {
    EXPECT_TRUE(isAllUpperAlpha("SE"));
    EXPECT_FALSE(isAllUpperAlpha("Se"));
    EXPECT_FALSE(isAllUpperAlpha("S1"));
    EXPECT_FALSE(isAllUpperAlpha(""));
}
