#pragma once

#include "utcnow/canonical.hpp"
#include "utcnow/date_time.hpp"
#include "utcnow/detail/caches.hpp"
#include "utcnow/detail/format.hpp"
#include "utcnow/detail/numeric.hpp"
#include "utcnow/detail/resolve.hpp"
#include "utcnow/error.hpp"
#include "utcnow/input.hpp"
#include "utcnow/instant.hpp"
#include "utcnow/message.hpp"
#include "utcnow/synchronizer.hpp"
#include "utcnow/utils/lru_cache.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstdint>

namespace utcnow {

/// Units accepted by timediff()
enum class TimeUnit : uint8_t {
    nanoseconds,
    microseconds,
    milliseconds,
    seconds,
    minutes,
    hours,
    days,
    weeks,
    months, ///< Fixed 30 days
    years   ///< Fixed 365 days
};

/// Microseconds per unit (nanoseconds handled separately)
constexpr int64_t unit_microseconds(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::nanoseconds:
        case TimeUnit::microseconds:
            return 1;
        case TimeUnit::milliseconds:
            return 1'000;
        case TimeUnit::seconds:
            return detail::MICROS_PER_SEC;
        case TimeUnit::minutes:
            return detail::SECONDS_PER_MINUTE * detail::MICROS_PER_SEC;
        case TimeUnit::hours:
            return detail::SECONDS_PER_HOUR * detail::MICROS_PER_SEC;
        case TimeUnit::days:
            return detail::SECONDS_PER_DAY * detail::MICROS_PER_SEC;
        case TimeUnit::weeks:
            return detail::SECONDS_PER_WEEK * detail::MICROS_PER_SEC;
        case TimeUnit::months:
            return 30 * detail::SECONDS_PER_DAY * detail::MICROS_PER_SEC;
        case TimeUnit::years:
            return 365 * detail::SECONDS_PER_DAY * detail::MICROS_PER_SEC;
        default:
            return detail::MICROS_PER_SEC;
    }
}

namespace detail {

inline std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

} // namespace detail

/**
 * Parse a unit name (case-insensitive).
 *
 * | unit         | accepted spellings                       |
 * |--------------|------------------------------------------|
 * | nanoseconds  | nanoseconds, nanosecond, ns              |
 * | microseconds | microseconds, microsecond, us            |
 * | milliseconds | milliseconds, millisecond, ms            |
 * | seconds      | seconds, second, sec, s                  |
 * | minutes      | minutes, minute, min, m                  |
 * | hours        | hours, hour, h                           |
 * | days         | days, day, d                             |
 * | weeks        | weeks, week, w                           |
 * | months       | months, month                            |
 * | years        | years, year, y                           |
 *
 * @return unknown_unit for anything else
 */
inline Result<TimeUnit> parse_time_unit(std::string_view name) {
    struct Spelling {
        std::string_view name;
        TimeUnit unit;
    };
    static constexpr Spelling spellings[] = {
        {"nanoseconds", TimeUnit::nanoseconds},   {"nanosecond", TimeUnit::nanoseconds},
        {"ns", TimeUnit::nanoseconds},            {"microseconds", TimeUnit::microseconds},
        {"microsecond", TimeUnit::microseconds},  {"us", TimeUnit::microseconds},
        {"milliseconds", TimeUnit::milliseconds}, {"millisecond", TimeUnit::milliseconds},
        {"ms", TimeUnit::milliseconds},           {"seconds", TimeUnit::seconds},
        {"second", TimeUnit::seconds},            {"sec", TimeUnit::seconds},
        {"s", TimeUnit::seconds},                 {"minutes", TimeUnit::minutes},
        {"minute", TimeUnit::minutes},            {"min", TimeUnit::minutes},
        {"m", TimeUnit::minutes},                 {"hours", TimeUnit::hours},
        {"hour", TimeUnit::hours},                {"h", TimeUnit::hours},
        {"days", TimeUnit::days},                 {"day", TimeUnit::days},
        {"d", TimeUnit::days},                    {"weeks", TimeUnit::weeks},
        {"week", TimeUnit::weeks},                {"w", TimeUnit::weeks},
        {"months", TimeUnit::months},             {"month", TimeUnit::months},
        {"years", TimeUnit::years},               {"year", TimeUnit::years},
        {"y", TimeUnit::years},
    };
    const std::string lowered = detail::to_lower_ascii(name);
    for (const auto& spelling : spellings) {
        if (spelling.name == lowered) {
            return spelling.unit;
        }
    }
    return make_error(ErrorCode::unknown_unit, name);
}

/**
 * Parse a fixed UTC offset designator into seconds east of UTC.
 *
 * UTC spellings (case-insensitive): "", UTC, GMT, UTC+0, UTC-0, GMT+0,
 * GMT-0, Z, ZULU, 00:00, +00:00, -00:00, 0000, +0000, -0000.
 * Offsets: "+HH:MM", "+HHMM" and the '-' forms, hours 0-23, minutes 0-59.
 *
 * @return invalid_offset for anything else
 */
inline Result<int32_t> parse_timezone(std::string_view tz) {
    static constexpr std::array<std::string_view, 14> utc_names{
        "utc",   "gmt",    "utc+0",  "utc-0", "gmt+0", "gmt-0", "z",
        "zulu", "00:00", "+00:00", "-00:00", "0000",  "+0000", "-0000"};
    if (tz.empty()) {
        return 0;
    }
    const std::string lowered = detail::to_lower_ascii(tz);
    for (auto name : utc_names) {
        if (lowered == name) {
            return 0;
        }
    }
    if (tz.front() != '+' && tz.front() != '-') {
        return make_error(ErrorCode::invalid_offset, tz);
    }
    // "+HH:MM" or "+HHMM"
    const std::string_view body = tz.substr(1);
    std::string digits;
    if (body.size() == 5 && body[2] == ':') {
        digits = std::string(body.substr(0, 2)) + std::string(body.substr(3, 2));
    } else if (body.size() == 4) {
        digits = std::string(body);
    }
    if (digits.size() != 4 || !detail::is_digit(digits[0]) || !detail::is_digit(digits[1]) ||
        !detail::is_digit(digits[2]) || !detail::is_digit(digits[3])) {
        return make_error(ErrorCode::invalid_offset, tz);
    }
    const int hours = (digits[0] - '0') * 10 + (digits[1] - '0');
    const int minutes = (digits[2] - '0') * 10 + (digits[3] - '0');
    if (hours > 23 || minutes > 59) {
        return make_error(ErrorCode::invalid_offset, tz);
    }
    const int32_t magnitude = hours * 3600 + minutes * 60;
    return tz.front() == '-' ? -magnitude : magnitude;
}

/// Selects one of the memoization caches
enum class CacheKind : uint8_t {
    numeric,  ///< Numeric classifier
    grammar,  ///< Timestamp grammar parser
    canonical ///< Value to canonical string
};

/// Hit/miss counters, capacity and size of one cache
inline utils::CacheInfo cache_info(CacheKind kind) {
    auto& c = detail::caches();
    switch (kind) {
        case CacheKind::numeric:
            return c.numeric.info();
        case CacheKind::grammar:
            return c.grammar.info();
        case CacheKind::canonical:
        default:
            return c.canonical.info();
    }
}

/// Empty every cache. Results never change because of this.
inline void clear_caches() {
    auto& c = detail::caches();
    c.numeric.clear();
    c.grammar.clear();
    c.canonical.clear();
}

/**
 * @brief Conversion entry points bound to one Synchronizer
 *
 * Every operation takes a timestamp value (default: now) and an optional
 * modifier, resolves them to one Instant and renders the requested
 * representation. "Now" is read from the bound synchronizer, so a frozen
 * frame makes every call deterministic.
 *
 * Example usage:
 * @code
 *   Synchronizer sync;
 *   Converter convert(sync);
 *   auto frame = sync.frame("2023-09-07 02:18:00");
 *   frame.enter();
 *   convert.rfc3339_timestamp();               // "2023-09-07T02:18:00.000000Z"
 *   convert.rfc3339_timestamp("+7d");          // "2023-09-14T02:18:00.000000Z"
 *   convert.as_unixtime("1970-01-01", "+24h"); // 86400.0
 * @endcode
 */
class Converter {
public:
    explicit Converter(const Synchronizer& sync = Synchronizer::global()) noexcept
        : sync_(&sync) {}

    [[nodiscard]] const Synchronizer& synchronizer() const noexcept { return *sync_; }

    /**
     * Resolve value + modifier to an Instant (modifier-apply).
     *
     * Clock-independent values are memoized as canonical strings; the
     * modifier is applied to the memoized base.
     */
    [[nodiscard]] Result<Instant> instant(const TimestampInput& value = {},
                                          const ModifierInput& modifier = {}) const {
        if (auto key = value.cache_key()) {
            auto shift = modifier.resolve();
            if (!shift) {
                return make_unexpected(shift.error());
            }
            auto base = detail::caches().canonical.get_or_compute(*key, [&value] {
                return detail::value_to_instant(value).and_then(
                    [](const Instant& i) { return CanonicalString::from_instant(i); });
            });
            if (!base) {
                return make_unexpected(base.error());
            }
            return base->instant().shifted(*shift);
        }
        return detail::resolve(value, modifier, [this] { return sync_->now(); });
    }

    /// Canonical 27-character string
    [[nodiscard]] Result<CanonicalString> rfc3339_timestamp(const TimestampInput& value = {},
                                                            const ModifierInput& modifier = {}) const {
        return instant(value, modifier).and_then(
            [](const Instant& i) { return CanonicalString::from_instant(i); });
    }

    /// UTC-tagged structured value
    [[nodiscard]] Result<DateTime> as_datetime(const TimestampInput& value = {},
                                               const ModifierInput& modifier = {}) const {
        return instant(value, modifier).map(
            [](const Instant& i) { return DateTime::from_instant(i); });
    }

    /// Floating epoch seconds
    [[nodiscard]] Result<double> as_unixtime(const TimestampInput& value = {},
                                             const ModifierInput& modifier = {}) const {
        return instant(value, modifier).map([](const Instant& i) { return i.to_unixtime(); });
    }

    /// {seconds, nanos} message
    [[nodiscard]] Result<TimestampMessage> as_message(const TimestampInput& value = {},
                                                      const ModifierInput& modifier = {}) const {
        return instant(value, modifier).map(
            [](const Instant& i) { return TimestampMessage::from_instant(i); });
    }

    /// Wire encoding of as_message()
    [[nodiscard]] Result<WireBytes> as_message_bytes(const TimestampInput& value = {},
                                                     const ModifierInput& modifier = {}) const {
        return as_message(value, modifier).map(
            [](const TimestampMessage& msg) { return msg.encode(); });
    }

    /**
     * "YYYY-MM-DD" of the instant as seen at a fixed UTC offset.
     *
     * @param tz Offset designator, see parse_timezone(); empty means UTC
     * @return invalid_offset for an unknown designator, out_of_range if the
     *         local date leaves years 1..9999
     */
    [[nodiscard]] Result<std::string> as_date_string(const TimestampInput& value = {},
                                                     std::string_view tz = {}) const {
        auto offset = parse_timezone(tz);
        if (!offset) {
            return make_unexpected(offset.error());
        }
        auto resolved = instant(value);
        if (!resolved) {
            return make_unexpected(resolved.error());
        }
        const detail::CivilDate date =
            detail::civil_from_seconds(resolved->seconds() + *offset).date;
        if (date.year < 1 || date.year > 9999) {
            return make_error(ErrorCode::out_of_range, value.describe());
        }
        std::string out;
        out.reserve(detail::DATE_LENGTH);
        detail::append_date(out, date);
        return out;
    }

    /**
     * end - begin expressed in `unit`.
     *
     * The difference is computed exactly in microseconds and divided once,
     * so `timediff(0, 7200, "hours")` is exactly 2.0.
     *
     * @return unknown_unit for an unrecognized unit name
     */
    [[nodiscard]] Result<double> timediff(const TimestampInput& begin, const TimestampInput& end,
                                          std::string_view unit = "seconds") const {
        auto parsed_unit = parse_time_unit(unit);
        if (!parsed_unit) {
            return make_unexpected(parsed_unit.error());
        }
        return timediff(begin, end, *parsed_unit);
    }

    [[nodiscard]] Result<double> timediff(const TimestampInput& begin, const TimestampInput& end,
                                          TimeUnit unit) const {
        auto from = instant(begin);
        if (!from) {
            return make_unexpected(from.error());
        }
        auto to = instant(end);
        if (!to) {
            return make_unexpected(to.error());
        }
        const int64_t micros = (*to - *from).microseconds();
        if (unit == TimeUnit::nanoseconds) {
            return static_cast<double>(micros) * static_cast<double>(detail::NANOS_PER_MICRO);
        }
        return static_cast<double>(micros) / static_cast<double>(unit_microseconds(unit));
    }

private:
    const Synchronizer* sync_;
};

// === Free functions bound to Synchronizer::global() ===

/// Normalize any supported value to its canonical string
inline Result<CanonicalString> rfc3339_timestamp(const TimestampInput& value = {},
                                                 const ModifierInput& modifier = {}) {
    return Converter{}.rfc3339_timestamp(value, modifier);
}

inline Result<Instant> apply_modifier(const TimestampInput& value,
                                      const ModifierInput& modifier) {
    return Converter{}.instant(value, modifier);
}

inline Result<DateTime> as_datetime(const TimestampInput& value = {},
                                    const ModifierInput& modifier = {}) {
    return Converter{}.as_datetime(value, modifier);
}

inline Result<double> as_unixtime(const TimestampInput& value = {},
                                  const ModifierInput& modifier = {}) {
    return Converter{}.as_unixtime(value, modifier);
}

inline Result<TimestampMessage> as_message(const TimestampInput& value = {},
                                           const ModifierInput& modifier = {}) {
    return Converter{}.as_message(value, modifier);
}

inline Result<std::string> as_date_string(const TimestampInput& value = {},
                                          std::string_view tz = {}) {
    return Converter{}.as_date_string(value, tz);
}

inline Result<double> timediff(const TimestampInput& begin, const TimestampInput& end,
                               std::string_view unit = "seconds") {
    return Converter{}.timediff(begin, end, unit);
}

} // namespace utcnow
