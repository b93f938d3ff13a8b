#include <limits>

#include <gtest/gtest.h>
#include <utcnow/modifier.hpp>

using namespace utcnow;

// =============================================================================
// Factories
// =============================================================================

TEST(ModifierTest, DefaultIsZero) {
    Modifier m;
    EXPECT_TRUE(m.is_zero());
    EXPECT_EQ(m, Modifier::zero());
    EXPECT_EQ(m.seconds(), 0.0);
}

TEST(ModifierTest, FromSeconds) {
    EXPECT_EQ(Modifier::from_seconds(3600).microseconds(), 3'600'000'000);
    EXPECT_EQ(Modifier::from_seconds(-1).microseconds(), -1'000'000);
}

TEST(ModifierTest, FromFractionalSeconds) {
    auto m = Modifier::from_fractional_seconds(-0.1);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->microseconds(), -100'000);

    auto half = Modifier::from_fractional_seconds(1.5);
    ASSERT_TRUE(half.has_value());
    EXPECT_EQ(half->microseconds(), 1'500'000);
    EXPECT_DOUBLE_EQ(half->seconds(), 1.5);
}

TEST(ModifierTest, FromFractionalSecondsRejectsNonFinite) {
    auto nan = Modifier::from_fractional_seconds(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, ErrorCode::invalid_modifier);

    auto huge = Modifier::from_fractional_seconds(1e300);
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code, ErrorCode::out_of_range);
}

// =============================================================================
// Expression parsing
// =============================================================================

TEST(ModifierTest, ParseUnits) {
    EXPECT_EQ(Modifier::parse("+10d")->microseconds(), 864'000'000'000);
    EXPECT_EQ(Modifier::parse("-1h")->microseconds(), -3'600'000'000);
    EXPECT_EQ(Modifier::parse("+15m")->microseconds(), 900'000'000);
    EXPECT_EQ(Modifier::parse("+0.5s")->microseconds(), 500'000);
    EXPECT_EQ(Modifier::parse("+7d")->microseconds(), 604'800'000'000);
    EXPECT_EQ(Modifier::parse("1w")->microseconds(), 604'800'000'000);
}

TEST(ModifierTest, ParseWithoutSignOrUnit) {
    EXPECT_EQ(Modifier::parse("10s")->microseconds(), 10'000'000);
    EXPECT_EQ(Modifier::parse(".4")->microseconds(), 400'000);
    EXPECT_EQ(Modifier::parse("-.4")->microseconds(), -400'000);
    EXPECT_EQ(Modifier::parse("86400")->microseconds(), 86'400'000'000);
    EXPECT_EQ(Modifier::parse("5.h")->microseconds(), 18'000'000'000);
}

TEST(ModifierTest, ParseIgnoresSurroundingWhitespace) {
    EXPECT_EQ(Modifier::parse("  +1h ")->microseconds(), 3'600'000'000);
}

TEST(ModifierTest, ParseFractionalUnitsExactly) {
    EXPECT_EQ(Modifier::parse("+0.1w")->microseconds(), 60'480'000'000);
    EXPECT_EQ(Modifier::parse("-1.25d")->microseconds(), -108'000'000'000);
}

TEST(ModifierTest, ParseRejectsMalformed) {
    const char* bad[] = {"", "+", "-", "d", "+d", "++1d", "--1d", "+1x", "+1D", "1.2.3s",
                         "+1 d", "+.s", "1e3", "abc", "+1dd"};
    for (const char* text : bad) {
        auto m = Modifier::parse(text);
        ASSERT_FALSE(m.has_value()) << text;
        EXPECT_EQ(m.error().code, ErrorCode::invalid_modifier) << text;
        EXPECT_EQ(m.error().input, text);
    }
}

TEST(ModifierTest, ParseOverflowIsOutOfRange) {
    auto m = Modifier::parse("+999999999999999999w");
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::out_of_range);
}

TEST(ModifierTest, LooksLikeExpression) {
    EXPECT_TRUE(Modifier::looks_like_expression("+1h"));
    EXPECT_TRUE(Modifier::looks_like_expression("-10s"));
    EXPECT_TRUE(Modifier::looks_like_expression(" +2w "));
    EXPECT_FALSE(Modifier::looks_like_expression("10s"));
    EXPECT_FALSE(Modifier::looks_like_expression("-1.5"));
    EXPECT_FALSE(Modifier::looks_like_expression("+"));
    EXPECT_FALSE(Modifier::looks_like_expression("2021-02-18"));
}

TEST(ModifierTest, UnitTable) {
    EXPECT_EQ(Modifier::unit_seconds('w'), 604800);
    EXPECT_EQ(Modifier::unit_seconds('d'), 86400);
    EXPECT_EQ(Modifier::unit_seconds('h'), 3600);
    EXPECT_EQ(Modifier::unit_seconds('m'), 60);
    EXPECT_EQ(Modifier::unit_seconds('s'), 1);
    EXPECT_EQ(Modifier::unit_seconds('y'), 0);
}

TEST(ModifierTest, Arithmetic) {
    auto sum = Modifier::from_seconds(1) + Modifier::from_microseconds(-250'000);
    EXPECT_EQ(sum.microseconds(), 750'000);
    EXPECT_EQ((-sum).microseconds(), -750'000);
    EXPECT_LT(-sum, sum);
}
