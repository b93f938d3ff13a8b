#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <utcnow/canonical.hpp>

using namespace utcnow;

class CanonicalStringTest : public ::testing::Test {
protected:
    static std::string format(int64_t seconds, int64_t micros) {
        auto cs = CanonicalString::from_instant(Instant(seconds, micros));
        EXPECT_TRUE(cs.has_value());
        return cs ? cs->str() : std::string{};
    }
};

// =============================================================================
// Formatting
// =============================================================================

TEST_F(CanonicalStringTest, Epoch) {
    EXPECT_EQ(format(0, 0), "1970-01-01T00:00:00.000000Z");
}

TEST_F(CanonicalStringTest, KnownInstants) {
    EXPECT_EQ(format(1693005993, 285967), "2023-08-25T23:26:33.285967Z");
    EXPECT_EQ(format(851042397, 0), "1996-12-20T00:39:57.000000Z");
    EXPECT_EQ(format(1670329924, 170660), "2022-12-06T12:32:04.170660Z");
}

TEST_F(CanonicalStringTest, PreEpoch) {
    EXPECT_EQ(format(-1614300200, 537855), "1918-11-05T23:16:40.537855Z");
    EXPECT_EQ(format(-1001, 446001), "1969-12-31T23:43:19.446001Z");
    EXPECT_EQ(format(0, -1), "1969-12-31T23:59:59.999999Z");
}

TEST_F(CanonicalStringTest, RangeBounds) {
    EXPECT_EQ(format(Instant::min().seconds(), 0), "0001-01-01T00:00:00.000000Z");
    EXPECT_EQ(format(Instant::max().seconds(), 999'999), "9999-12-31T23:59:59.999999Z");

    auto past = CanonicalString::from_instant(Instant(Instant::max().seconds() + 1, 0));
    ASSERT_FALSE(past.has_value());
    EXPECT_EQ(past.error().code, ErrorCode::out_of_range);
}

TEST_F(CanonicalStringTest, FixedWidth) {
    for (int64_t s : {Instant::min().seconds(), int64_t{-1}, int64_t{0}, int64_t{1234567890},
                      Instant::max().seconds()}) {
        auto cs = CanonicalString::from_instant(Instant(s, 0));
        ASSERT_TRUE(cs.has_value());
        EXPECT_EQ(cs->str().size(), CanonicalString::LENGTH);
        EXPECT_EQ(cs->str().back(), 'Z');
        EXPECT_EQ(cs->str()[10], 'T');
    }
}

TEST_F(CanonicalStringTest, Accessors) {
    auto cs = CanonicalString::from_instant(Instant(1234567890, 123456));
    ASSERT_TRUE(cs.has_value());
    EXPECT_EQ(cs->date(), "2009-02-13");
    EXPECT_EQ(cs->instant(), Instant(1234567890, 123456));
    EXPECT_STREQ(cs->c_str(), "2009-02-13T23:31:30.123456Z");
    EXPECT_TRUE(*cs == "2009-02-13T23:31:30.123456Z");

    std::ostringstream oss;
    oss << *cs;
    EXPECT_EQ(oss.str(), cs->str());
}

// =============================================================================
// Strict parsing
// =============================================================================

TEST_F(CanonicalStringTest, ParseRoundTrip) {
    const char* samples[] = {"1970-01-01T00:00:00.000000Z", "0001-01-01T00:00:00.000000Z",
                             "9999-12-31T23:59:59.999999Z", "2000-02-29T12:34:56.789012Z",
                             "1918-11-05T23:16:40.537855Z"};
    for (const char* text : samples) {
        auto cs = CanonicalString::parse(text);
        ASSERT_TRUE(cs.has_value()) << text;
        EXPECT_EQ(cs->str(), text);
        auto again = CanonicalString::from_instant(cs->instant());
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(*again, *cs);
    }
}

TEST_F(CanonicalStringTest, ParseRejectsOtherShapes) {
    const char* bad[] = {"2021-02-18 10:00",
                         "2021-02-18T10:00:00Z",
                         "2021-02-18T10:00:00.000000z",
                         "2021-02-18t10:00:00.000000Z",
                         "2021-02-18 10:00:00.000000Z",
                         "2021-02-18T10:00:00.000000+00:00",
                         " 2021-02-18T10:00:00.00000Z",
                         "2021-02-18T10:00:00.0000000"};
    for (const char* text : bad) {
        auto cs = CanonicalString::parse(text);
        ASSERT_FALSE(cs.has_value()) << text;
        EXPECT_EQ(cs.error().code, ErrorCode::invalid_format) << text;
    }
}

TEST_F(CanonicalStringTest, ParseReportsImpossibleDate) {
    auto cs = CanonicalString::parse("2021-02-30T10:00:00.000000Z");
    ASSERT_FALSE(cs.has_value());
    EXPECT_EQ(cs.error().category(), ErrorCategory::invalid_format);
}

// =============================================================================
// Ordering
// =============================================================================

TEST_F(CanonicalStringTest, TextOrderMatchesInstantOrder) {
    std::vector<Instant> instants = {Instant::min(),       Instant(-1614300200, 537855),
                                     Instant(-1, 999'999), Instant(0, 0),
                                     Instant(0, 1),        Instant(1234567890, 50'000),
                                     Instant(1693005993, 285967), Instant::max()};
    for (size_t i = 0; i < instants.size(); ++i) {
        for (size_t j = 0; j < instants.size(); ++j) {
            auto a = CanonicalString::from_instant(instants[i]);
            auto b = CanonicalString::from_instant(instants[j]);
            ASSERT_TRUE(a && b);
            EXPECT_EQ(a->str() < b->str(), instants[i] < instants[j]);
            EXPECT_EQ(*a < *b, instants[i] < instants[j]);
            EXPECT_EQ(*a == *b, i == j);
        }
    }
}
