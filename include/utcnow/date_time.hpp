#pragma once

#include "utcnow/detail/format.hpp"
#include "utcnow/detail/time_math.hpp"
#include "utcnow/error.hpp"
#include "utcnow/instant.hpp"

#include <optional>
#include <ostream>
#include <string>

#include <cstdint>
#include <cstdlib>

namespace utcnow {

/**
 * Structured calendar date-time value.
 *
 * Fields are wall-clock values at `utc_offset_seconds` east of UTC. A value
 * without an offset is naive and is read as UTC.
 *
 * Values produced by the library are always UTC-tagged (offset 0).
 */
struct DateTime {
    int64_t year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    int microsecond{0};
    std::optional<int32_t> utc_offset_seconds{}; ///< nullopt = naive, assumed UTC

    /// Largest accepted offset magnitude (exclusive), one day
    static constexpr int32_t MAX_OFFSET_SECONDS = 86'400;

    /// UTC-tagged breakdown of an instant
    static DateTime from_instant(const Instant& instant) noexcept {
        const detail::CivilTime civil = instant.civil();
        return DateTime{civil.date.year,
                        civil.date.month,
                        civil.date.day,
                        civil.hour,
                        civil.minute,
                        civil.second,
                        static_cast<int>(instant.microseconds()),
                        0};
    }

    [[nodiscard]] bool is_naive() const noexcept { return !utc_offset_seconds.has_value(); }

    /**
     * Validate the fields and convert to an Instant.
     *
     * @return out_of_range on an invalid calendar/clock field or a result
     *         outside years 1..9999, invalid_offset on an offset of a day or more
     */
    [[nodiscard]] Result<Instant> to_instant() const {
        if (month < 1 || month > 12 || day < 1 || day > detail::days_in_month(year, month) ||
            hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 ||
            microsecond < 0 || microsecond >= detail::MICROS_PER_SEC || year < 1 || year > 9999) {
            return make_error(ErrorCode::out_of_range, iso_string());
        }
        const int32_t offset = utc_offset_seconds.value_or(0);
        if (offset <= -MAX_OFFSET_SECONDS || offset >= MAX_OFFSET_SECONDS) {
            return make_error(ErrorCode::invalid_offset, iso_string());
        }
        const int64_t naive = detail::seconds_from_civil(year, month, day, hour, minute, second);
        auto result = Instant::checked(naive - offset, microsecond);
        if (!result) {
            return make_error(ErrorCode::out_of_range, iso_string());
        }
        return result;
    }

    /**
     * ISO 8601 text: "2023-08-01T10:10:59.123456+00:00", or without the
     * offset suffix for naive values.
     */
    [[nodiscard]] std::string iso_string() const {
        std::string out;
        if (year >= 0 && year <= 9999) {
            detail::append_date(out, detail::CivilDate{year, month < 0 ? 0 : month, day < 0 ? 0 : day});
        } else {
            out += std::to_string(year);
            out += '-';
            out += std::to_string(month);
            out += '-';
            out += std::to_string(day);
        }
        out.push_back('T');
        detail::append_time(out, hour < 0 ? 0 : hour, minute < 0 ? 0 : minute,
                            second < 0 ? 0 : second, microsecond < 0 ? 0 : microsecond);
        if (utc_offset_seconds) {
            const int32_t offset = *utc_offset_seconds;
            const int64_t magnitude = std::abs(static_cast<int64_t>(offset));
            out.push_back(offset < 0 ? '-' : '+');
            detail::append_padded(out, magnitude / 3600, 2);
            out.push_back(':');
            detail::append_padded(out, (magnitude % 3600) / 60, 2);
        }
        return out;
    }

    friend bool operator==(const DateTime&, const DateTime&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const DateTime& dt) {
    return os << dt.iso_string();
}

} // namespace utcnow
