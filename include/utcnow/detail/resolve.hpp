#pragma once

#include "utcnow/detail/caches.hpp"
#include "utcnow/detail/numeric.hpp"
#include "utcnow/error.hpp"
#include "utcnow/input.hpp"
#include "utcnow/instant.hpp"
#include "utcnow/modifier.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace utcnow::detail {

inline Result<Instant> numeric_text_to_instant(std::string_view text, std::string_view raw) {
    auto number = parse_decimal(text);
    if (!number) {
        return make_error(number.error().code, raw);
    }
    auto micros = decimal_to_micros(*number, 1, raw);
    if (!micros) {
        return make_unexpected(micros.error());
    }
    auto instant = Instant::checked(0, *micros);
    if (!instant) {
        return make_error(ErrorCode::out_of_range, raw);
    }
    return instant;
}

inline Result<Instant> grammar_text_to_instant(std::string_view text, std::string_view raw) {
    auto fields = cached_parse_fields(text);
    if (!fields) {
        return make_error(fields.error().code, raw);
    }
    auto instant = fields->to_instant();
    if (!instant) {
        return make_error(ErrorCode::out_of_range, raw);
    }
    return instant;
}

/**
 * Instant for a textual value that is not "now" or an expression.
 *
 * Numeric text is epoch seconds, converted exactly from its digits; all
 * other text goes through the timestamp grammar. The classification is
 * memoized only when the conversion succeeds.
 */
inline Result<Instant> text_to_instant(std::string_view raw) {
    const std::string_view text = trim(raw);
    if (text.empty()) {
        return make_error(ErrorCode::invalid_format, raw);
    }

    Result<Instant> converted = make_error(ErrorCode::invalid_format, raw);
    auto numeric = caches().numeric.get_or_compute(std::string(text), [&]() -> Result<bool> {
        const bool is_number = is_numeric(text);
        converted = is_number ? numeric_text_to_instant(text, raw)
                              : grammar_text_to_instant(text, raw);
        if (!converted) {
            return make_unexpected(converted.error());
        }
        return is_number;
    });
    if (!numeric) {
        return make_unexpected(numeric.error());
    }
    if (converted) {
        return converted;
    }
    // Cache hit: convert along the remembered path
    return *numeric ? numeric_text_to_instant(text, raw) : grammar_text_to_instant(text, raw);
}

/**
 * Instant for a clock-independent input, without any modifier.
 *
 * Callers handle Now and clock-dependent strings before calling this.
 */
inline Result<Instant> value_to_instant(const TimestampInput& input) {
    return std::visit(
        [&input](const auto& v) -> Result<Instant> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Now>) {
                return make_error(ErrorCode::invalid_format, "now");
            } else if constexpr (std::is_same_v<T, std::string>) {
                return text_to_instant(v);
            } else if constexpr (std::is_same_v<T, double>) {
                auto instant = Instant::from_unixtime(v);
                if (!instant) {
                    return make_error(ErrorCode::out_of_range, input.describe());
                }
                return instant;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                auto instant = Instant::checked(v, 0);
                if (!instant) {
                    return make_error(ErrorCode::out_of_range, input.describe());
                }
                return instant;
            } else if constexpr (std::is_same_v<T, DateTime> || std::is_same_v<T, TimestampMessage>) {
                return v.to_instant();
            } else if constexpr (std::is_same_v<T, WireBytes>) {
                auto msg = TimestampMessage::decode(v);
                if (!msg) {
                    return make_unexpected(msg.error());
                }
                return msg->to_instant();
            } else {
                auto instant = Instant::checked(v.seconds(), v.microseconds());
                if (!instant) {
                    return make_error(ErrorCode::out_of_range, input.describe());
                }
                return instant;
            }
        },
        input.value());
}

/**
 * Resolve an input and a modifier to one instant.
 *
 * - Now and "now" read `now()`.
 * - A "+1h"-style string in value position means now() shifted by that
 *   expression, as long as the explicit modifier is zero.
 * - Everything else is converted by value_to_instant().
 *
 * The modifier is applied last. `now` is only called when needed.
 *
 * @tparam NowFn Callable returning the current Instant
 */
template <typename NowFn>
Result<Instant> resolve(const TimestampInput& input, const ModifierInput& modifier_input,
                        NowFn&& now) {
    auto modifier = modifier_input.resolve();
    if (!modifier) {
        return make_unexpected(modifier.error());
    }
    Modifier shift = *modifier;

    if (input.depends_on_clock()) {
        if (auto text = input.text(); text && *text != "now") {
            if (!shift.is_zero()) {
                // An expression value with an explicit shift is just a bad timestamp
                return make_error(ErrorCode::invalid_format, *text);
            }
            auto expression = Modifier::parse(*text);
            if (!expression) {
                return make_unexpected(expression.error());
            }
            shift = *expression;
        }
        return Instant(now()).shifted(shift);
    }

    auto base = value_to_instant(input);
    if (!base) {
        return base;
    }
    return base->shifted(shift);
}

} // namespace utcnow::detail
