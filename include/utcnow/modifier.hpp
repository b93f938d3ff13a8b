#pragma once

#include "utcnow/detail/numeric.hpp"
#include "utcnow/detail/time_math.hpp"
#include "utcnow/error.hpp"

#include <compare>
#include <limits>
#include <string_view>

#include <cmath>
#include <cstdint>

namespace utcnow {

/**
 * Signed time shift with exact microsecond precision.
 *
 * ## Storage
 * A single int64_t microsecond count. seconds() reports it as a double for
 * callers that want the fractional-second view.
 *
 * ## Sources
 * - Integral seconds: `Modifier::from_seconds(3600)`
 * - Real seconds: `Modifier::from_fractional_seconds(0.5)`, rounded to the
 *   nearest microsecond (ties to even)
 * - Expressions: `Modifier::parse("+10d")`, `"-1h"`, `"+15m"`, `"+0.5s"`,
 *   `"1w"`, `".4"` (unitless means seconds)
 *
 * | unit | seconds |
 * |------|---------|
 * | w    | 604800  |
 * | d    | 86400   |
 * | h    | 3600    |
 * | m    | 60      |
 * | s    | 1       |
 *
 * Fractional expressions are converted exactly: "+0.1w" is 60480 seconds.
 */
class Modifier {
public:
    constexpr Modifier() noexcept = default;

    static constexpr Modifier zero() noexcept { return Modifier{}; }

    static constexpr Modifier from_microseconds(int64_t us) noexcept { return Modifier(us); }

    /// Integral seconds, saturating at the int64 microsecond limits
    static constexpr Modifier from_seconds(int64_t s) noexcept {
        constexpr int64_t max_s = std::numeric_limits<int64_t>::max() / detail::MICROS_PER_SEC;
        if (s > max_s) {
            return Modifier(max_s * detail::MICROS_PER_SEC);
        }
        if (s < -max_s) {
            return Modifier(-max_s * detail::MICROS_PER_SEC);
        }
        return Modifier(s * detail::MICROS_PER_SEC);
    }

    /**
     * Checked factory from real seconds.
     *
     * @return invalid_modifier for NaN/Inf, out_of_range when the magnitude
     *         does not fit an int64 microsecond count
     */
    static Result<Modifier> from_fractional_seconds(double s) {
        if (!std::isfinite(s)) {
            return make_error(ErrorCode::invalid_modifier);
        }
        constexpr double limit = 9.0e12; // ~285000 years, well inside int64 micros
        if (s > limit || s < -limit) {
            return make_error(ErrorCode::out_of_range);
        }
        double int_part;
        const double frac_part = std::modf(s, &int_part);
        const auto micros = static_cast<int64_t>(std::nearbyint(frac_part * 1e6));
        return Modifier(static_cast<int64_t>(int_part) * detail::MICROS_PER_SEC + micros);
    }

    /// Seconds per unit letter, or 0 for an unknown letter
    static constexpr int64_t unit_seconds(char unit) noexcept {
        switch (unit) {
            case 'w':
                return detail::SECONDS_PER_WEEK;
            case 'd':
                return detail::SECONDS_PER_DAY;
            case 'h':
                return detail::SECONDS_PER_HOUR;
            case 'm':
                return detail::SECONDS_PER_MINUTE;
            case 's':
                return 1;
            default:
                return 0;
        }
    }

    /**
     * Parse a modifier expression `[+|-]<number>[w|d|h|m|s]`.
     *
     * <number> follows the epoch-number shape ("5", "5.", ".5", "5.25").
     * Surrounding whitespace is ignored.
     *
     * @return invalid_modifier on a malformed number or unknown unit,
     *         out_of_range when the result overflows
     */
    static Result<Modifier> parse(std::string_view text) {
        const std::string_view input = text;
        text = detail::trim(text);
        bool negative = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        int64_t unit = 1;
        if (!text.empty() && !detail::is_digit(text.back()) && text.back() != '.') {
            unit = unit_seconds(text.back());
            if (unit == 0) {
                return make_error(ErrorCode::invalid_modifier, input);
            }
            text.remove_suffix(1);
        }
        // A second sign ("--5s") or an empty body is malformed
        if (text.empty() || text.front() == '-' || !detail::is_numeric(text)) {
            return make_error(ErrorCode::invalid_modifier, input);
        }

        auto number = detail::parse_decimal(text);
        if (!number) {
            return make_error(number.error().code, input);
        }
        auto micros = detail::decimal_to_micros(*number, unit, input);
        if (!micros) {
            return make_unexpected(micros.error());
        }
        return Modifier(negative ? -*micros : *micros);
    }

    /**
     * True if text has the shape of a modifier used in place of a timestamp
     * value: a leading sign and a trailing unit letter ("+1h", "-10s").
     */
    static constexpr bool looks_like_expression(std::string_view text) noexcept {
        text = detail::trim(text);
        return text.size() >= 2 && (text.front() == '+' || text.front() == '-') &&
               unit_seconds(text.back()) != 0;
    }

    [[nodiscard]] constexpr int64_t microseconds() const noexcept { return micros_; }

    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(micros_) / static_cast<double>(detail::MICROS_PER_SEC);
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return micros_ == 0; }

    constexpr auto operator<=>(const Modifier&) const noexcept = default;

    constexpr Modifier operator-() const noexcept { return Modifier(-micros_); }

    friend constexpr Modifier operator+(Modifier a, Modifier b) noexcept {
        return Modifier(a.micros_ + b.micros_);
    }

private:
    constexpr explicit Modifier(int64_t micros) noexcept : micros_(micros) {}

    int64_t micros_{0};
};

} // namespace utcnow
