/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <brdocs/utils/string_utils.h>

using namespace brdocs::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToLower_KeepsNonAscii) {
    EXPECT_EQ(toLower("CNPJ\xC3\x89"), "cnpj\xC3\x89");
}

// toUpper tests
TEST_F(StringUtilsTest, ToUpper_Mixed) {
    EXPECT_EQ(toUpper("12.abc.345/01de-35"), "12.ABC.345/01DE-35");
}

TEST_F(StringUtilsTest, ToUpper_Empty) {
    EXPECT_EQ(toUpper(""), "");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\n\t"), "hello");
}

// isBlank tests
TEST_F(StringUtilsTest, IsBlank) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\r\n"));
    EXPECT_FALSE(isBlank(" 0 "));
}

// trimLeft tests
TEST_F(StringUtilsTest, TrimLeft_LeadingZeros) {
    EXPECT_EQ(trimLeft("00ELEKTO000140", '0'), "ELEKTO000140");
}

TEST_F(StringUtilsTest, TrimLeft_AllStripped) {
    EXPECT_EQ(trimLeft("0000", '0'), "");
}

TEST_F(StringUtilsTest, TrimLeft_NothingToStrip) {
    EXPECT_EQ(trimLeft("123", '0'), "123");
}

// padLeft tests
TEST_F(StringUtilsTest, PadLeft_Shorter) {
    EXPECT_EQ(padLeft("191", 11), "00000000191");
}

TEST_F(StringUtilsTest, PadLeft_CustomFill) {
    EXPECT_EQ(padLeft("7", 3, ' '), "  7");
}

TEST_F(StringUtilsTest, PadLeft_AlreadyWide) {
    EXPECT_EQ(padLeft("123456", 4), "123456");
}

// parseInteger tests
TEST_F(StringUtilsTest, ParseInteger_Valid) {
    EXPECT_EQ(parseInteger("100000"), 100000);
    EXPECT_EQ(parseInteger(" 42 "), 42);
    EXPECT_EQ(parseInteger("-7"), -7);
}

TEST_F(StringUtilsTest, ParseInteger_Malformed) {
    EXPECT_FALSE(parseInteger("").has_value());
    EXPECT_FALSE(parseInteger("abc").has_value());
    EXPECT_FALSE(parseInteger("12abc").has_value());
    EXPECT_FALSE(parseInteger("1.5").has_value());
    EXPECT_FALSE(parseInteger("99999999999999999999").has_value());
}

// parseDouble tests
TEST_F(StringUtilsTest, ParseDouble_Valid) {
    EXPECT_DOUBLE_EQ(*parseDouble("0.25"), 0.25);
    EXPECT_DOUBLE_EQ(*parseDouble("1"), 1.0);
}

TEST_F(StringUtilsTest, ParseDouble_Malformed) {
    EXPECT_FALSE(parseDouble("").has_value());
    EXPECT_FALSE(parseDouble("half").has_value());
    EXPECT_FALSE(parseDouble("0.5x").has_value());
}
