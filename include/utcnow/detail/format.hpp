#pragma once

#include "utcnow/detail/time_math.hpp"

#include <string>

#include <cstddef>
#include <cstdint>

namespace utcnow::detail {

/// Length of "YYYY-MM-DDTHH:MM:SS.ffffffZ"
inline constexpr size_t CANONICAL_LENGTH = 27;

/// Length of "YYYY-MM-DD"
inline constexpr size_t DATE_LENGTH = 10;

/// Append a non-negative value zero-padded to `width` digits
inline void append_padded(std::string& out, int64_t value, int width) {
    char buf[20];
    int n = 0;
    do {
        buf[n++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0 && n < 20);
    for (int i = n; i < width; ++i) {
        out.push_back('0');
    }
    while (n > 0) {
        out.push_back(buf[--n]);
    }
}

/// "YYYY-MM-DD" for a date with a year in [1, 9999]
inline void append_date(std::string& out, const CivilDate& date) {
    append_padded(out, date.year, 4);
    out.push_back('-');
    append_padded(out, date.month, 2);
    out.push_back('-');
    append_padded(out, date.day, 2);
}

/// "HH:MM:SS.ffffff"
inline void append_time(std::string& out, int hour, int minute, int second, int64_t micros) {
    append_padded(out, hour, 2);
    out.push_back(':');
    append_padded(out, minute, 2);
    out.push_back(':');
    append_padded(out, second, 2);
    out.push_back('.');
    append_padded(out, micros, 6);
}

/**
 * Canonical text for (seconds, microseconds), caller guarantees the canonical
 * range and a normalized microsecond field.
 */
inline std::string format_canonical(int64_t seconds, int64_t micros) {
    const CivilTime civil = civil_from_seconds(seconds);
    std::string out;
    out.reserve(CANONICAL_LENGTH);
    append_date(out, civil.date);
    out.push_back('T');
    append_time(out, civil.hour, civil.minute, civil.second, micros);
    out.push_back('Z');
    return out;
}

} // namespace utcnow::detail
