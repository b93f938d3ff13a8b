// include/utcnow/detail/time_math.hpp
#pragma once

#include <limits>
#include <utility>

#include <cstdint>

namespace utcnow::detail {

/**
 * Centralized time arithmetic for Instant, Modifier and the calendar codecs.
 *
 * All instants are (seconds, microseconds) pairs with floor semantics:
 * microseconds always lie in [0, 10^6) and the sign lives in seconds.
 *
 * Calendar conversions are proleptic Gregorian over int64 day numbers
 * (days since 1970-01-01), valid for every day reachable from an int64
 * seconds count.
 */

/// Microseconds per second (10^6)
inline constexpr int64_t MICROS_PER_SEC = 1'000'000;

/// Nanoseconds per microsecond
inline constexpr int64_t NANOS_PER_MICRO = 1'000;

/// Nanoseconds per second (10^9)
inline constexpr int64_t NANOS_PER_SEC = 1'000'000'000;

inline constexpr int64_t SECONDS_PER_MINUTE = 60;
inline constexpr int64_t SECONDS_PER_HOUR = 3'600;
inline constexpr int64_t SECONDS_PER_DAY = 86'400;
inline constexpr int64_t SECONDS_PER_WEEK = 604'800;

/// 0001-01-01T00:00:00Z, first instant with a 4-digit year
inline constexpr int64_t MIN_CANONICAL_SECONDS = -62'135'596'800;

/// 9999-12-31T23:59:59Z, last whole second with a 4-digit year
inline constexpr int64_t MAX_CANONICAL_SECONDS = 253'402'300'799;

/// Floor division (rounds toward negative infinity)
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

/// Floor modulo, result has the sign of b
constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    return a - floor_div(a, b) * b;
}

/**
 * Normalize (seconds, microseconds) to canonical form with floor semantics.
 *
 * Handles:
 * - Microsecond overflow (>=10^6) -> carry to seconds
 * - Microsecond underflow (<0) -> borrow from seconds
 * - Floor semantics for negatives: -0.25s -> {-1, 750000}
 *
 * @param sec Seconds (may need adjustment)
 * @param micros Microseconds (may be out of range or negative)
 * @return Pair of (normalized_sec, normalized_micros) where micros in [0, 10^6)
 */
constexpr auto normalize(int64_t sec, int64_t micros) noexcept -> std::pair<int64_t, int64_t> {
    return {sec + floor_div(micros, MICROS_PER_SEC), floor_mod(micros, MICROS_PER_SEC)};
}

/**
 * Add a signed microsecond delta to a normalized (seconds, microseconds) value.
 *
 * The delta is split into whole seconds and a remainder first so that large
 * deltas never overflow the microsecond intermediate.
 */
constexpr auto add_micros(int64_t sec, int64_t micros,
                          int64_t delta_micros) noexcept -> std::pair<int64_t, int64_t> {
    return normalize(sec + floor_div(delta_micros, MICROS_PER_SEC),
                     micros + floor_mod(delta_micros, MICROS_PER_SEC));
}

/**
 * Difference (sec_a, micros_a) - (sec_b, micros_b) in microseconds.
 *
 * Exact for any pair of instants within the canonical range.
 */
constexpr int64_t diff_micros(int64_t sec_a, int64_t micros_a, int64_t sec_b,
                              int64_t micros_b) noexcept {
    return (sec_a - sec_b) * MICROS_PER_SEC + (micros_a - micros_b);
}

constexpr bool is_leap_year(int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr int days_in_month(int64_t year, int month) noexcept {
    constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

/// Calendar date in the proleptic Gregorian calendar
struct CivilDate {
    int64_t year{1970};
    int month{1};
    int day{1};
};

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 *
 * Era-based computation (400-year cycles of 146097 days), so there is no
 * table lookup and no iteration over years.
 */
constexpr int64_t days_from_civil(int64_t y, int m, int d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = floor_div(y, 400);
    const int64_t yoe = y - era * 400;                                    // [0, 399]
    const int64_t mp = (m + 9) % 12;                                      // March = 0
    const int64_t doy = (153 * mp + 2) / 5 + d - 1;                       // [0, 365]
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;            // [0, 146096]
    return era * 146097 + doe - 719468;
}

/// Inverse of days_from_civil()
constexpr CivilDate civil_from_days(int64_t z) noexcept {
    z += 719468;
    const int64_t era = floor_div(z, 146097);
    const int64_t doe = z - era * 146097;                                 // [0, 146096]
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);          // [0, 365]
    const int64_t mp = (5 * doy + 2) / 153;                               // [0, 11]
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);         // [1, 31]
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);            // [1, 12]
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return CivilDate{y, m, d};
}

/// Broken-down UTC time of day plus date for a seconds count
struct CivilTime {
    CivilDate date{};
    int hour{0};
    int minute{0};
    int second{0};
};

constexpr CivilTime civil_from_seconds(int64_t seconds) noexcept {
    const int64_t days = floor_div(seconds, SECONDS_PER_DAY);
    const int64_t sod = seconds - days * SECONDS_PER_DAY;
    return CivilTime{civil_from_days(days), static_cast<int>(sod / SECONDS_PER_HOUR),
                     static_cast<int>((sod % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE),
                     static_cast<int>(sod % SECONDS_PER_MINUTE)};
}

constexpr int64_t seconds_from_civil(int64_t year, int month, int day, int hour, int minute,
                                     int second) noexcept {
    return days_from_civil(year, month, day) * SECONDS_PER_DAY + hour * SECONDS_PER_HOUR +
           minute * SECONDS_PER_MINUTE + second;
}

/// True if seconds falls inside the 4-digit-year canonical range
constexpr bool in_canonical_range(int64_t seconds) noexcept {
    return seconds >= MIN_CANONICAL_SECONDS && seconds <= MAX_CANONICAL_SECONDS;
}

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(days_from_civil(2000, 3, 1) == 11017);
static_assert(seconds_from_civil(1, 1, 1, 0, 0, 0) == MIN_CANONICAL_SECONDS);
static_assert(seconds_from_civil(9999, 12, 31, 23, 59, 59) == MAX_CANONICAL_SECONDS);

} // namespace utcnow::detail
