#pragma once

#include "utcnow/detail/time_math.hpp"
#include "utcnow/error.hpp"

#include <array>
#include <limits>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace utcnow::detail {

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Strip leading and trailing ASCII whitespace
constexpr std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * Decide whether text is a plain epoch number.
 *
 * Accepted shapes (after an optional single leading '-'):
 *   "123", ".456", "123.", "123.456"
 *
 * Rejected: ".", "-", "", "+1", "1.2.3", "1e5", any whitespace.
 */
constexpr bool is_numeric(std::string_view text) noexcept {
    if (!text.empty() && text.front() == '-') {
        text.remove_prefix(1);
    }
    size_t int_digits = 0;
    size_t frac_digits = 0;
    bool seen_dot = false;
    for (char c : text) {
        if (c == '.') {
            if (seen_dot) {
                return false;
            }
            seen_dot = true;
        } else if (is_digit(c)) {
            (seen_dot ? frac_digits : int_digits)++;
        } else {
            return false;
        }
    }
    return int_digits + frac_digits > 0;
}

/**
 * Decimal number split into an exact integer part and raw fraction digits.
 *
 * Produced by parse_decimal() from text already accepted by is_numeric().
 */
struct DecimalNumber {
    bool negative{false};
    uint64_t integer{0};
    std::string_view fraction{}; ///< Fraction digits as written, no dot
};

/// Largest integer part accepted by parse_decimal() (18 significant digits)
inline constexpr uint64_t MAX_DECIMAL_INTEGER = 999'999'999'999'999'999ULL;

/**
 * Split numeric text into sign, integer and fraction digits.
 *
 * Leading zeros of the integer part do not count toward the digit limit.
 *
 * @return out_of_range if the integer part exceeds 18 significant digits,
 *         invalid_format if the text is not numeric
 */
inline Result<DecimalNumber> parse_decimal(std::string_view text) {
    if (!is_numeric(text)) {
        return make_error(ErrorCode::invalid_format, text);
    }
    DecimalNumber number;
    std::string_view body = text;
    if (body.front() == '-') {
        number.negative = true;
        body.remove_prefix(1);
    }
    const size_t dot = body.find('.');
    std::string_view int_part = body.substr(0, dot);
    if (dot != std::string_view::npos) {
        number.fraction = body.substr(dot + 1);
    }
    while (int_part.size() > 1 && int_part.front() == '0') {
        int_part.remove_prefix(1);
    }
    if (int_part.size() > 18) {
        return make_error(ErrorCode::out_of_range, text);
    }
    for (char c : int_part) {
        number.integer = number.integer * 10 + static_cast<uint64_t>(c - '0');
    }
    return number;
}

/**
 * Convert a decimal number of `unit_seconds` units to exact microseconds.
 *
 * The fraction digits are multiplied by the unit as a digit string, so
 * "0.1" of a week is exactly 60480 seconds. Digits past the microsecond are
 * rounded half to even, the same rule used for floating-point inputs.
 *
 * @param number Parsed decimal
 * @param unit_seconds Seconds per unit (1 for plain seconds), at most one week
 * @return Signed microseconds, or out_of_range on int64 overflow
 */
inline Result<int64_t> decimal_to_micros(const DecimalNumber& number, int64_t unit_seconds,
                                         std::string_view input) {
    constexpr size_t MAX_FRACTION_DIGITS = 64;
    std::array<uint8_t, MAX_FRACTION_DIGITS> digits{};
    size_t count = number.fraction.size();
    bool sticky = false; // nonzero digits beyond the buffer
    if (count > MAX_FRACTION_DIGITS) {
        for (char c : number.fraction.substr(MAX_FRACTION_DIGITS)) {
            sticky = sticky || c != '0';
        }
        count = MAX_FRACTION_DIGITS;
    }
    for (size_t i = 0; i < count; ++i) {
        digits[i] = static_cast<uint8_t>(number.fraction[i] - '0');
    }

    // Multiply 0.d1d2...dn by the unit, carrying into the whole part
    int64_t carry = 0;
    for (size_t i = count; i-- > 0;) {
        const int64_t v = digits[i] * unit_seconds + carry;
        digits[i] = static_cast<uint8_t>(v % 10);
        carry = v / 10;
    }

    constexpr int64_t max_whole = std::numeric_limits<int64_t>::max() / MICROS_PER_SEC - 1;
    if (number.integer > static_cast<uint64_t>(max_whole / unit_seconds)) {
        return make_error(ErrorCode::out_of_range, input);
    }
    const int64_t whole = static_cast<int64_t>(number.integer) * unit_seconds + carry;
    if (whole > max_whole) {
        return make_error(ErrorCode::out_of_range, input);
    }

    int64_t frac_micros = 0;
    for (size_t i = 0; i < 6; ++i) {
        frac_micros = frac_micros * 10 + (i < count ? digits[i] : 0);
    }

    // Round half to even on the digits past the sixth
    if (count > 6) {
        bool rest_nonzero = sticky;
        for (size_t i = 7; i < count; ++i) {
            rest_nonzero = rest_nonzero || digits[i] != 0;
        }
        const uint8_t first = digits[6];
        if (first > 5 || (first == 5 && (rest_nonzero || (frac_micros % 2) != 0))) {
            ++frac_micros;
        }
    }

    const int64_t micros = whole * MICROS_PER_SEC + frac_micros;
    return number.negative ? -micros : micros;
}

} // namespace utcnow::detail
