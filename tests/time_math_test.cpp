#include <gtest/gtest.h>
#include <utcnow/detail/time_math.hpp>

using namespace utcnow::detail;

// =============================================================================
// Floor arithmetic
// =============================================================================

TEST(TimeMathTest, FloorDivRoundsTowardNegativeInfinity) {
    EXPECT_EQ(floor_div(7, 2), 3);
    EXPECT_EQ(floor_div(-7, 2), -4);
    EXPECT_EQ(floor_div(-8, 2), -4);
    EXPECT_EQ(floor_div(0, 5), 0);
    EXPECT_EQ(floor_mod(-7, 2), 1);
    EXPECT_EQ(floor_mod(-1, MICROS_PER_SEC), 999'999);
}

TEST(TimeMathTest, NormalizeCarriesMicroseconds) {
    auto [sec, us] = normalize(5, 2'500'000);
    EXPECT_EQ(sec, 7);
    EXPECT_EQ(us, 500'000);
}

TEST(TimeMathTest, NormalizeBorrowsWithFloorSemantics) {
    // -0.25s is {-1, 750000}
    auto [sec, us] = normalize(0, -250'000);
    EXPECT_EQ(sec, -1);
    EXPECT_EQ(us, 750'000);

    auto [sec2, us2] = normalize(-1, -500'000);
    EXPECT_EQ(sec2, -2);
    EXPECT_EQ(us2, 500'000);
}

TEST(TimeMathTest, NormalizeIsIdempotent) {
    auto [sec, us] = normalize(-3, 1'750'000);
    auto [sec2, us2] = normalize(sec, us);
    EXPECT_EQ(sec, sec2);
    EXPECT_EQ(us, us2);
}

TEST(TimeMathTest, AddMicrosLargeDelta) {
    // One week forward from 1970-01-01T00:00:00.5
    auto [sec, us] = add_micros(0, 500'000, SECONDS_PER_WEEK * MICROS_PER_SEC);
    EXPECT_EQ(sec, SECONDS_PER_WEEK);
    EXPECT_EQ(us, 500'000);

    auto [sec2, us2] = add_micros(0, 0, -1);
    EXPECT_EQ(sec2, -1);
    EXPECT_EQ(us2, 999'999);
}

TEST(TimeMathTest, DiffMicros) {
    EXPECT_EQ(diff_micros(10, 0, 9, 999'999), 1);
    EXPECT_EQ(diff_micros(-1, 750'000, 0, 0), -250'000);
}

// =============================================================================
// Calendar
// =============================================================================

TEST(TimeMathTest, LeapYears) {
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_TRUE(is_leap_year(2024));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_FALSE(is_leap_year(2023));
    EXPECT_TRUE(is_leap_year(4));
}

TEST(TimeMathTest, DaysInMonth) {
    EXPECT_EQ(days_in_month(2024, 2), 29);
    EXPECT_EQ(days_in_month(2023, 2), 28);
    EXPECT_EQ(days_in_month(2023, 4), 30);
    EXPECT_EQ(days_in_month(2023, 12), 31);
    EXPECT_EQ(days_in_month(2023, 0), 0);
    EXPECT_EQ(days_in_month(2023, 13), 0);
}

TEST(TimeMathTest, DaysFromCivilKnownDates) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
    EXPECT_EQ(days_from_civil(2000, 1, 1), 10957);
    EXPECT_EQ(days_from_civil(2023, 1, 1), 19358);
}

TEST(TimeMathTest, CivilFromDaysInvertsDaysFromCivil) {
    for (int64_t day = -800'000; day <= 800'000; day += 997) {
        const CivilDate date = civil_from_days(day);
        EXPECT_EQ(days_from_civil(date.year, date.month, date.day), day);
    }
}

TEST(TimeMathTest, CivilFromSecondsBeforeEpoch) {
    const CivilTime t = civil_from_seconds(-1);
    EXPECT_EQ(t.date.year, 1969);
    EXPECT_EQ(t.date.month, 12);
    EXPECT_EQ(t.date.day, 31);
    EXPECT_EQ(t.hour, 23);
    EXPECT_EQ(t.minute, 59);
    EXPECT_EQ(t.second, 59);
}

TEST(TimeMathTest, SecondsFromCivil) {
    EXPECT_EQ(seconds_from_civil(1996, 12, 20, 0, 39, 57), 851042397);
    EXPECT_EQ(seconds_from_civil(2023, 9, 7, 2, 18, 0), 1694053080);
}

TEST(TimeMathTest, CanonicalRangeBounds) {
    EXPECT_TRUE(in_canonical_range(MIN_CANONICAL_SECONDS));
    EXPECT_TRUE(in_canonical_range(MAX_CANONICAL_SECONDS));
    EXPECT_FALSE(in_canonical_range(MIN_CANONICAL_SECONDS - 1));
    EXPECT_FALSE(in_canonical_range(MAX_CANONICAL_SECONDS + 1));
}
