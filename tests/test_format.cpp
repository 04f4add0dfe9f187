/**
 * @file test_format.cpp
 * @brief Unit tests for printf-style Value formatting (GoogleTest)
 */

#include <gtest/gtest.h>
#include "patchwork/Format.hpp"
#include "patchwork/Errors.hpp"

using namespace patchwork;

TEST(FormatValues, StringsArePositional) {
    EXPECT_EQ(format_values("%s-%s", {"foo", "bar"}), "foo-bar");
    EXPECT_EQ(format_values("plain", {}), "plain");
}

TEST(FormatValues, VerbVRendersAnyKind) {
    EXPECT_EQ(format_values("%v|%v|%v|%v", {"x", 42, true, 2.5}), "x|42|true|2.5");
}

TEST(FormatValues, ContainersRenderAsCompactJson) {
    EXPECT_EQ(format_values("%v", {Value({{"a", 1}})}), "{\"a\":1}");
    EXPECT_EQ(format_values("%s", {Value::array({1, 2})}), "[1,2]");
}

TEST(FormatValues, WholeFloatsKeepNoFraction) {
    EXPECT_EQ(format_values("%v", {4.0}), "4");
    EXPECT_EQ(format_values("%v", {1e20}), "100000000000000000000");
}

TEST(FormatValues, IntegerDirectives) {
    EXPECT_EQ(format_values("%d", {42}), "42");
    EXPECT_EQ(format_values("%05d", {42}), "00042");
    EXPECT_EQ(format_values("%-4d|", {7}), "7   |");
    EXPECT_EQ(format_values("%+d", {7}), "+7");
    EXPECT_EQ(format_values("%x", {255}), "ff");
    EXPECT_EQ(format_values("%X", {-255}), "-FF");
    EXPECT_EQ(format_values("%#x", {255}), "0xff");
}

TEST(FormatValues, HexOfString) {
    EXPECT_EQ(format_values("%x", {"hi"}), "6869");
}

TEST(FormatValues, FloatDirectives) {
    EXPECT_EQ(format_values("%.2f", {3.14159}), "3.14");
    EXPECT_EQ(format_values("%05.1f", {3.14159}), "003.1");
    EXPECT_EQ(format_values("%f", {2}), "2.000000");
    EXPECT_EQ(format_values("%e", {1500.0}), "1.500000e+03");
}

TEST(FormatValues, QuotedAndBool) {
    EXPECT_EQ(format_values("%q", {"a\"b"}), "\"a\\\"b\"");
    EXPECT_EQ(format_values("%t", {false}), "false");
}

TEST(FormatValues, WidthAndPrecisionOnStrings) {
    EXPECT_EQ(format_values("[%6s]", {"abc"}), "[   abc]");
    EXPECT_EQ(format_values("[%-6s]", {"abc"}), "[abc   ]");
    EXPECT_EQ(format_values("[%.2s]", {"abc"}), "[ab]");
}

TEST(FormatValues, LiteralPercent) {
    EXPECT_EQ(format_values("%d%%", {50}), "50%");
    EXPECT_EQ(count_directives("100%% %s"), 1u);
}

TEST(FormatValues, CountMismatchThrows) {
    EXPECT_THROW(format_values("%s-%s", {"foo"}), FormatError);
    EXPECT_THROW(format_values("%s", {"foo", "bar"}), FormatError);
}

TEST(FormatValues, FormatErrorIsATransformError) {
    EXPECT_THROW(format_values("%s-%s", {"foo"}), TransformError);
}

TEST(FormatValues, WrongKindThrows) {
    EXPECT_THROW(format_values("%d", {"foo"}), FormatError);
    EXPECT_THROW(format_values("%d", {1.5}), FormatError);
    EXPECT_THROW(format_values("%t", {1}), FormatError);
    EXPECT_THROW(format_values("%f", {"1.5"}), FormatError);
}

TEST(FormatValues, MalformedTemplatesThrow) {
    EXPECT_THROW(format_values("%", {}), FormatError);
    EXPECT_THROW(format_values("%z", {1}), FormatError);
    EXPECT_THROW(count_directives("abc %5"), FormatError);
}

TEST(FormatValues, OversizedWidthOrPrecisionThrows) {
    EXPECT_THROW(format_values("%99999999999d", {1}), FormatError);
    EXPECT_THROW(format_values("%.5000s", {"a"}), FormatError);
    EXPECT_EQ(format_values("%4096d", {1}).size(), 4096u);
}
