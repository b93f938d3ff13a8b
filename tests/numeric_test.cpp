#include <string>

#include <gtest/gtest.h>
#include <utcnow/detail/numeric.hpp>

using namespace utcnow;
using namespace utcnow::detail;

// =============================================================================
// Classifier
// =============================================================================

TEST(NumericClassifierTest, AcceptsEpochNumbers) {
    EXPECT_TRUE(is_numeric("1234567890"));
    EXPECT_TRUE(is_numeric("-1.5"));
    EXPECT_TRUE(is_numeric("5."));
    EXPECT_TRUE(is_numeric(".5"));
    EXPECT_TRUE(is_numeric("-.456"));
    EXPECT_TRUE(is_numeric("-123."));
    EXPECT_TRUE(is_numeric("0"));
}

TEST(NumericClassifierTest, RejectsEverythingElse) {
    EXPECT_FALSE(is_numeric("2021-02-18"));
    EXPECT_FALSE(is_numeric("."));
    EXPECT_FALSE(is_numeric("-"));
    EXPECT_FALSE(is_numeric("-."));
    EXPECT_FALSE(is_numeric(""));
    EXPECT_FALSE(is_numeric("1.2.3"));
    EXPECT_FALSE(is_numeric("+1"));
    EXPECT_FALSE(is_numeric("--1"));
    EXPECT_FALSE(is_numeric("1e5"));
    EXPECT_FALSE(is_numeric(" 1"));
    EXPECT_FALSE(is_numeric("1 "));
    EXPECT_FALSE(is_numeric("0x10"));
}

TEST(NumericClassifierTest, TrimStripsAsciiWhitespace) {
    EXPECT_EQ(trim("  12 \t\n"), "12");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("   "), "");
}

// =============================================================================
// Exact decimal conversion
// =============================================================================

TEST(DecimalTest, ParseSplitsParts) {
    auto number = parse_decimal("-0012.0500");
    ASSERT_TRUE(number.has_value());
    EXPECT_TRUE(number->negative);
    EXPECT_EQ(number->integer, 12u);
    EXPECT_EQ(number->fraction, "0500");
}

TEST(DecimalTest, ParseRejectsHugeIntegerPart) {
    auto number = parse_decimal("1234567890123456789");
    ASSERT_FALSE(number.has_value());
    EXPECT_EQ(number.error().code, ErrorCode::out_of_range);

    // Leading zeros do not count
    EXPECT_TRUE(parse_decimal("0000000000000000000001").has_value());
}

TEST(DecimalTest, SecondsToMicros) {
    auto number = parse_decimal("1614300199.462145");
    ASSERT_TRUE(number.has_value());
    auto micros = decimal_to_micros(*number, 1, "");
    ASSERT_TRUE(micros.has_value());
    EXPECT_EQ(*micros, 1614300199462145);
}

TEST(DecimalTest, NegativeValue) {
    auto number = parse_decimal("-1.5");
    ASSERT_TRUE(number.has_value());
    auto micros = decimal_to_micros(*number, 1, "");
    ASSERT_TRUE(micros.has_value());
    EXPECT_EQ(*micros, -1'500'000);
}

TEST(DecimalTest, ExtraDigitsRoundHalfToEven) {
    auto round = [](const char* text) {
        auto number = parse_decimal(text);
        return *decimal_to_micros(*number, 1, text);
    };
    EXPECT_EQ(round("0.1234564"), 123456);
    EXPECT_EQ(round("0.1234566"), 123457);
    EXPECT_EQ(round("0.1234565"), 123456); // tie, even stays
    EXPECT_EQ(round("0.1234575"), 123458); // tie, odd rounds up
    EXPECT_EQ(round("0.12345650001"), 123457);
    EXPECT_EQ(round("0.9999995"), 1'000'000);
}

TEST(DecimalTest, UnitScalingIsExact) {
    auto number = parse_decimal("0.1");
    ASSERT_TRUE(number.has_value());
    // 0.1 week = 60480 seconds
    EXPECT_EQ(*decimal_to_micros(*number, 604800, ""), 60'480'000'000);

    auto third = parse_decimal("1.5");
    EXPECT_EQ(*decimal_to_micros(*third, 3600, ""), 5'400'000'000);
}

TEST(DecimalTest, OverflowIsOutOfRange) {
    auto number = parse_decimal("999999999999999999");
    ASSERT_TRUE(number.has_value());
    auto micros = decimal_to_micros(*number, 604800, "x");
    ASSERT_FALSE(micros.has_value());
    EXPECT_EQ(micros.error().code, ErrorCode::out_of_range);
    EXPECT_EQ(micros.error().input, "x");
}
