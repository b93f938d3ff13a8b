#include <chrono>
#include <limits>

#include <gtest/gtest.h>
#include <utcnow/instant.hpp>

using namespace utcnow;

// Test fixture for Instant tests
class InstantTest : public ::testing::Test {
protected:
    static constexpr int64_t test_seconds = 1640995200; // 2022-01-01T00:00:00Z
    static constexpr int64_t test_micros = 123456;
};

// Construction tests
TEST_F(InstantTest, DefaultConstructionIsEpoch) {
    Instant i;
    EXPECT_EQ(i.seconds(), 0);
    EXPECT_EQ(i.microseconds(), 0);
}

TEST_F(InstantTest, ComponentConstruction) {
    Instant i(test_seconds, test_micros);
    EXPECT_EQ(i.seconds(), test_seconds);
    EXPECT_EQ(i.microseconds(), test_micros);
}

TEST_F(InstantTest, NormalizationOnConstruction) {
    Instant i(100, 1'500'000);
    EXPECT_EQ(i.seconds(), 101);
    EXPECT_EQ(i.microseconds(), 500'000);
}

TEST_F(InstantTest, NegativeFractionUsesFloorSemantics) {
    Instant i(0, -250'000);
    EXPECT_EQ(i.seconds(), -1);
    EXPECT_EQ(i.microseconds(), 750'000);
}

// Factory method tests
TEST_F(InstantTest, FromUnixtimeSplitsFraction) {
    auto i = Instant::from_unixtime(1693005993.285967);
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(i->seconds(), 1693005993);
    EXPECT_EQ(i->microseconds(), 285967);
}

TEST_F(InstantTest, FromUnixtimeRoundsToNearestMicrosecond) {
    auto i = Instant::from_unixtime(1695694079.9417229);
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(i->seconds(), 1695694079);
    EXPECT_EQ(i->microseconds(), 941723);

    // 4711 * 3.14 is 14792.539999999999 as a double
    auto j = Instant::from_unixtime(4711 * 3.14);
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(j->seconds(), 14792);
    EXPECT_EQ(j->microseconds(), 540000);
}

TEST_F(InstantTest, FromUnixtimeNegative) {
    auto i = Instant::from_unixtime(-1614300199.462145);
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(i->seconds(), -1614300200);
    EXPECT_EQ(i->microseconds(), 537855);

    auto j = Instant::from_unixtime(-0.25);
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(j->seconds(), -1);
    EXPECT_EQ(j->microseconds(), 750000);
}

TEST_F(InstantTest, FromUnixtimeRejectsNonFinite) {
    auto nan = Instant::from_unixtime(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, ErrorCode::out_of_range);

    auto inf = Instant::from_unixtime(std::numeric_limits<double>::infinity());
    ASSERT_FALSE(inf.has_value());
    EXPECT_EQ(inf.error().code, ErrorCode::out_of_range);
}

TEST_F(InstantTest, FromUnixtimeRejectsOutOfRange) {
    EXPECT_FALSE(Instant::from_unixtime(1e15).has_value());
    EXPECT_FALSE(Instant::from_unixtime(253402300800.0).has_value());
    EXPECT_FALSE(Instant::from_unixtime(-62135596801.0).has_value());
    EXPECT_TRUE(Instant::from_unixtime(-62135596800.0).has_value());
}

TEST_F(InstantTest, Now) {
    auto before = std::chrono::system_clock::now();
    auto i = Instant::now();
    auto after = std::chrono::system_clock::now();

    auto before_sec =
        std::chrono::duration_cast<std::chrono::seconds>(before.time_since_epoch()).count();
    auto after_sec =
        std::chrono::duration_cast<std::chrono::seconds>(after.time_since_epoch()).count();

    EXPECT_GE(i.seconds(), before_sec);
    EXPECT_LE(i.seconds(), after_sec);
}

TEST_F(InstantTest, FromChronoTruncatesToMicroseconds) {
    using namespace std::chrono;
    system_clock::time_point tp{duration_cast<system_clock::duration>(
        seconds(test_seconds) + microseconds(test_micros) + nanoseconds(999))};
    auto i = Instant::from_chrono(tp);
    EXPECT_EQ(i.seconds(), test_seconds);
    EXPECT_EQ(i.microseconds(), test_micros);
}

TEST_F(InstantTest, FromChronoBeforeEpoch) {
    using namespace std::chrono;
    system_clock::time_point tp{duration_cast<system_clock::duration>(milliseconds(-250))};
    auto i = Instant::from_chrono(tp);
    EXPECT_EQ(i.seconds(), -1);
    EXPECT_EQ(i.microseconds(), 750'000);
}

// Conversion tests
TEST_F(InstantTest, ToUnixtimeInvertsFromUnixtime) {
    Instant i(test_seconds, test_micros);
    EXPECT_DOUBLE_EQ(i.to_unixtime(), 1640995200.123456);
    EXPECT_EQ(i.to_unixtime(), 1640995200.123456);

    auto back = Instant::from_unixtime(i.to_unixtime());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, i);
}

TEST_F(InstantTest, ToNanoseconds) {
    Instant i(1, 500);
    auto ns = i.to_nanoseconds();
    ASSERT_TRUE(ns.has_value());
    EXPECT_EQ(*ns, 1'000'500'000);

    auto far = Instant::max().to_nanoseconds();
    ASSERT_FALSE(far.has_value());
    EXPECT_EQ(far.error().code, ErrorCode::out_of_range);
}

// Comparison tests
TEST_F(InstantTest, Ordering) {
    Instant a(-1, 999'999);
    Instant b(0, 0);
    Instant c(0, 1);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(Instant(0, 1'000'000), Instant(1, 0));
}

// Arithmetic tests
TEST_F(InstantTest, ShiftedByModifier) {
    Instant i(test_seconds, 0);
    auto shifted = i.shifted(Modifier::from_seconds(86400));
    ASSERT_TRUE(shifted.has_value());
    EXPECT_EQ(shifted->seconds(), test_seconds + 86400);
}

TEST_F(InstantTest, ShiftedBorrowsAcrossSecond) {
    Instant i(1234567890, 50'000);
    auto shifted = i.shifted(Modifier::from_microseconds(-100'000));
    ASSERT_TRUE(shifted.has_value());
    EXPECT_EQ(shifted->seconds(), 1234567889);
    EXPECT_EQ(shifted->microseconds(), 950'000);
}

TEST_F(InstantTest, ShiftedOutOfRange) {
    auto shifted = Instant::max().shifted(Modifier::from_microseconds(1));
    ASSERT_FALSE(shifted.has_value());
    EXPECT_EQ(shifted.error().code, ErrorCode::out_of_range);

    auto before = Instant::min().shifted(Modifier::from_microseconds(-1));
    EXPECT_FALSE(before.has_value());
}

TEST_F(InstantTest, DifferenceIsExact) {
    Instant a(test_seconds, 0);
    Instant b(test_seconds + 108000, 1);
    EXPECT_EQ((b - a).microseconds(), 108'000'000'001);
    EXPECT_EQ((a - b).microseconds(), -108'000'000'001);
}

TEST_F(InstantTest, RangeChecks) {
    EXPECT_TRUE(Instant::min().in_range());
    EXPECT_TRUE(Instant::max().in_range());
    EXPECT_FALSE(Instant(Instant::max().seconds() + 1, 0).in_range());
    EXPECT_FALSE(Instant::checked(Instant::min().seconds() - 1, 999'999).has_value());
}
