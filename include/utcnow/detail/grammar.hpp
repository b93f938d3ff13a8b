#pragma once

#include "utcnow/detail/numeric.hpp"
#include "utcnow/detail/time_math.hpp"
#include "utcnow/error.hpp"
#include "utcnow/instant.hpp"

#include <optional>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace utcnow::detail {

enum class OffsetKind : uint8_t {
    absent, ///< No marker, read as UTC
    zulu,   ///< "Z", "z" or "UTC" (uppercase only)
    numeric ///< "+HH:MM", "-HH:MM", "+HHMM", "-HHMM"
};

/**
 * Fields of a textual timestamp, before offset arithmetic.
 *
 * `microsecond` holds the fraction already right-padded or truncated to six
 * digits; `fraction_digits` records how many digits were written (0-9).
 */
struct ParsedFields {
    int64_t year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    int32_t microsecond{0};
    uint8_t fraction_digits{0};
    OffsetKind offset_kind{OffsetKind::absent};
    int32_t offset_seconds{0}; ///< East of UTC, only for OffsetKind::numeric

    /// instant = naive wall-clock seconds - offset
    [[nodiscard]] Result<Instant> to_instant() const {
        const int64_t naive = seconds_from_civil(year, month, day, hour, minute, second);
        return Instant::checked(naive - offset_seconds, microsecond);
    }

    friend bool operator==(const ParsedFields&, const ParsedFields&) = default;
};

/**
 * Cursor-based parser for the tolerant timestamp grammar:
 *
 * ```
 * timestamp := date [ ('T' | 't' | ' ') time ] [ ws* offset ] ws*
 * date      := YYYY '-' MM '-' DD
 * time      := HH ':' MM [ ':' SS [ '.' 1*9DIGIT ] ]
 * offset    := 'Z' | 'z' | 'UTC' | ('+' | '-') HH [':'] MM
 * ```
 *
 * Surrounding whitespace is ignored. Range failures are reported as
 * out_of_range, malformed offsets as invalid_offset, anything else as
 * invalid_format. No field is wrapped or repaired.
 */
class GrammarParser {
public:
    explicit GrammarParser(std::string_view input) noexcept : input_(input), text_(trim(input)) {}

    Result<ParsedFields> parse() {
        ParsedFields fields;

        if (!parse_date(fields)) {
            return fail(ErrorCode::invalid_format);
        }
        if (fields.year < 1 || fields.month < 1 || fields.month > 12 || fields.day < 1 ||
            fields.day > days_in_month(fields.year, fields.month)) {
            return fail(ErrorCode::out_of_range);
        }

        if (!at_end()) {
            const char sep = peek();
            const bool time_follows = sep == 'T' || sep == 't' ||
                                      (sep == ' ' && pos_ + 1 < text_.size() &&
                                       is_digit(text_[pos_ + 1]));
            if (time_follows) {
                ++pos_;
                if (!parse_time(fields)) {
                    return fail(ErrorCode::invalid_format);
                }
                if (fields.hour > 23 || fields.minute > 59 || fields.second > 59) {
                    return fail(ErrorCode::out_of_range);
                }
            }
        }

        skip_space();
        if (!at_end()) {
            if (auto code = parse_offset(fields); code.has_value()) {
                return fail(*code);
            }
            skip_space();
            if (!at_end()) {
                // A second designator after an offset ("+00:00 UTC") or garbage
                return fail(ErrorCode::invalid_format);
            }
        }
        return fields;
    }

private:
    std::string_view input_;
    std::string_view text_;
    size_t pos_{0};

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const noexcept { return text_[pos_]; }

    unexpected<Error> fail(ErrorCode code) const { return make_error(code, input_); }

    void skip_space() noexcept {
        while (!at_end() && is_space(peek())) {
            ++pos_;
        }
    }

    bool expect(char c) noexcept {
        if (at_end() || peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    /// Read exactly `count` digits
    bool read_fixed(size_t count, int64_t& out) noexcept {
        if (pos_ + count > text_.size()) {
            return false;
        }
        int64_t value = 0;
        for (size_t i = 0; i < count; ++i) {
            const char c = text_[pos_ + i];
            if (!is_digit(c)) {
                return false;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

    bool read_fixed(size_t count, int& out) noexcept {
        int64_t value = 0;
        if (!read_fixed(count, value)) {
            return false;
        }
        out = static_cast<int>(value);
        return true;
    }

    bool parse_date(ParsedFields& f) noexcept {
        return read_fixed(4, f.year) && expect('-') && read_fixed(2, f.month) && expect('-') &&
               read_fixed(2, f.day) && (at_end() || !is_digit(peek()));
    }

    bool parse_time(ParsedFields& f) noexcept {
        if (!(read_fixed(2, f.hour) && expect(':') && read_fixed(2, f.minute))) {
            return false;
        }
        if (at_end() || peek() != ':') {
            return at_end() || !is_digit(peek());
        }
        ++pos_;
        if (!read_fixed(2, f.second)) {
            return false;
        }
        if (at_end() || peek() != '.') {
            return at_end() || !is_digit(peek());
        }
        ++pos_;

        int32_t micros = 0;
        uint8_t digits = 0;
        while (!at_end() && is_digit(peek())) {
            if (digits == 9) {
                return false;
            }
            if (digits < 6) {
                micros = micros * 10 + (peek() - '0');
            }
            ++digits;
            ++pos_;
        }
        if (digits == 0) {
            return false;
        }
        for (uint8_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
        f.microsecond = micros;
        f.fraction_digits = digits;
        return true;
    }

    bool match_word(std::string_view word) noexcept {
        if (text_.size() - pos_ < word.size()) {
            return false;
        }
        if (text_.substr(pos_, word.size()) != word) {
            return false;
        }
        pos_ += word.size();
        return true;
    }

    /// @return error code on failure, nullopt on success
    std::optional<ErrorCode> parse_offset(ParsedFields& f) noexcept {
        const char c = peek();
        if (c == 'Z' || c == 'z') {
            ++pos_;
            f.offset_kind = OffsetKind::zulu;
            return std::nullopt;
        }
        if (match_word("UTC")) {
            f.offset_kind = OffsetKind::zulu;
            return std::nullopt;
        }
        if (c != '+' && c != '-') {
            return ErrorCode::invalid_format;
        }
        ++pos_;
        int hours = 0;
        int minutes = 0;
        if (!read_fixed(2, hours)) {
            return ErrorCode::invalid_offset;
        }
        if (!at_end() && peek() == ':') {
            ++pos_;
        }
        if (!read_fixed(2, minutes) || (!at_end() && is_digit(peek()))) {
            return ErrorCode::invalid_offset;
        }
        if (hours > 23 || minutes > 59) {
            return ErrorCode::invalid_offset;
        }
        const int32_t magnitude = hours * 3600 + minutes * 60;
        f.offset_kind = OffsetKind::numeric;
        f.offset_seconds = c == '-' ? -magnitude : magnitude;
        return std::nullopt;
    }
};

/// Parse a textual timestamp into its fields
inline Result<ParsedFields> parse_fields(std::string_view text) {
    return GrammarParser(text).parse();
}

} // namespace utcnow::detail
