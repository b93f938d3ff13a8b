#pragma once

#include "utcnow/detail/time_math.hpp"
#include "utcnow/error.hpp"
#include "utcnow/modifier.hpp"

#include <chrono>
#include <compare>
#include <limits>

#include <cmath>
#include <cstdint>

namespace utcnow {

/**
 * Point in time as seconds since the Unix epoch plus microseconds.
 *
 * ## Storage
 * int64_t seconds + int64_t microseconds, microseconds always in [0, 10^6).
 *
 * ## Negative Value Representation (Floor Semantics)
 * The fraction never carries sign, the seconds count does:
 * - `-0.25 seconds` = `{seconds: -1, microseconds: 750000}`
 * - `-1.5 seconds`  = `{seconds: -2, microseconds: 500000}`
 *
 * Ordering of Instants is ordering of (seconds, microseconds).
 *
 * ## Range
 * Any int64 seconds count can be held. Only instants with a four-digit year
 * (0001-01-01 .. 9999-12-31) have a canonical string form, see in_range().
 * The checked factories and shifted() reject everything outside that range.
 */
class Instant {
public:
    static constexpr int64_t MICROSECONDS_PER_SECOND = detail::MICROS_PER_SEC;

    constexpr Instant() noexcept = default;

    /// Construct from possibly unnormalized parts, e.g. {0, -250000} -> {-1, 750000}
    constexpr Instant(int64_t sec, int64_t micros) noexcept {
        auto [s, us] = detail::normalize(sec, micros);
        seconds_ = s;
        micros_ = us;
    }

    static constexpr Instant min() noexcept { return Instant(detail::MIN_CANONICAL_SECONDS, 0); }

    static constexpr Instant max() noexcept {
        return Instant(detail::MAX_CANONICAL_SECONDS, detail::MICROS_PER_SEC - 1);
    }

    static Instant now() noexcept { return from_chrono(std::chrono::system_clock::now()); }

    /// Sub-microsecond clock precision is truncated toward the past
    static Instant from_chrono(std::chrono::system_clock::time_point tp) noexcept {
        const auto us = std::chrono::floor<std::chrono::microseconds>(tp.time_since_epoch());
        return Instant(0, us.count());
    }

    /**
     * Checked factory from floating epoch seconds.
     *
     * The integral and fractional parts are split with modf() and the
     * fraction is rounded to the nearest microsecond (ties to even), so
     * `1695694079.9417229` becomes `{1695694079, 941723}`.
     *
     * @return out_of_range for NaN/Inf or a value outside the canonical range
     */
    static Result<Instant> from_unixtime(double value) {
        constexpr double limit = 1.0e15;
        if (!std::isfinite(value) || value > limit || value < -limit) {
            return make_error(ErrorCode::out_of_range);
        }
        double int_part;
        const double frac_part = std::modf(value, &int_part);
        Instant result(static_cast<int64_t>(int_part),
                       static_cast<int64_t>(std::nearbyint(frac_part * 1e6)));
        if (!result.in_range()) {
            return make_error(ErrorCode::out_of_range);
        }
        return result;
    }

    /// Checked factory from parts that may lie outside the canonical range
    static Result<Instant> checked(int64_t sec, int64_t micros) {
        Instant result(sec, micros);
        if (!result.in_range()) {
            return make_error(ErrorCode::out_of_range);
        }
        return result;
    }

    [[nodiscard]] constexpr int64_t seconds() const noexcept { return seconds_; }
    [[nodiscard]] constexpr int64_t microseconds() const noexcept { return micros_; }

    /// Total microseconds since the epoch (exact inside the canonical range)
    [[nodiscard]] constexpr int64_t total_microseconds() const noexcept {
        return seconds_ * detail::MICROS_PER_SEC + micros_;
    }

    [[nodiscard]] constexpr bool in_range() const noexcept {
        return detail::in_canonical_range(seconds_);
    }

    /**
     * Floating epoch seconds.
     *
     * Computed as one division of the exact microsecond count, the inverse of
     * from_unixtime() for every instant whose microsecond count is exactly
     * representable as a double.
     */
    [[nodiscard]] double to_unixtime() const noexcept {
        return static_cast<double>(total_microseconds()) /
               static_cast<double>(detail::MICROS_PER_SEC);
    }

    /**
     * Nanoseconds since the epoch (microsecond resolution).
     *
     * @return out_of_range when the count does not fit int64 (after 2262)
     */
    [[nodiscard]] Result<int64_t> to_nanoseconds() const {
        constexpr int64_t max_sec = std::numeric_limits<int64_t>::max() / detail::NANOS_PER_SEC - 1;
        if (seconds_ > max_sec || seconds_ < -max_sec) {
            return make_error(ErrorCode::out_of_range);
        }
        return seconds_ * detail::NANOS_PER_SEC + micros_ * detail::NANOS_PER_MICRO;
    }

    /// UTC calendar breakdown (proleptic Gregorian)
    [[nodiscard]] constexpr detail::CivilTime civil() const noexcept {
        return detail::civil_from_seconds(seconds_);
    }

    /**
     * Apply a modifier and re-normalize.
     *
     * @return out_of_range if the shifted instant leaves the canonical range
     */
    [[nodiscard]] Result<Instant> shifted(Modifier m) const {
        auto [sec, us] = detail::add_micros(seconds_, micros_, m.microseconds());
        return checked(sec, us);
    }

    constexpr auto operator<=>(const Instant&) const noexcept = default;

    /// Exact difference lhs - rhs
    friend constexpr Modifier operator-(const Instant& lhs, const Instant& rhs) noexcept {
        return Modifier::from_microseconds(
            detail::diff_micros(lhs.seconds_, lhs.micros_, rhs.seconds_, rhs.micros_));
    }

private:
    int64_t seconds_{0};
    int64_t micros_{0};
};

} // namespace utcnow
