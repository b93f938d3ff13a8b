#pragma once

#include "utcnow/canonical.hpp"
#include "utcnow/date_time.hpp"
#include "utcnow/detail/numeric.hpp"
#include "utcnow/error.hpp"
#include "utcnow/instant.hpp"
#include "utcnow/message.hpp"
#include "utcnow/modifier.hpp"

#include <chrono>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstdint>
#include <cstring>

namespace utcnow {

/// Marker for "the current instant" (the real clock, or a frozen frame)
struct Now {
    friend bool operator==(Now, Now) noexcept { return true; }
};

/// Raw protocol-buffer encoding of a timestamp message
using WireBytes = std::vector<uint8_t>;

/**
 * @brief Any value accepted as a timestamp
 *
 * Implicitly constructible from every supported representation so that the
 * conversion functions read naturally:
 * @code
 *   utcnow::rfc3339_timestamp("2023-09-07 02:18:00");
 *   utcnow::rfc3339_timestamp(1693005993.285967);
 *   utcnow::rfc3339_timestamp(0);
 *   utcnow::rfc3339_timestamp(std::chrono::system_clock::now());
 *   utcnow::rfc3339_timestamp(utcnow::TimestampMessage{1670329924, 170660000});
 * @endcode
 *
 * Integers are epoch seconds, floating-point values are epoch seconds with
 * a fraction, strings go through the numeric classifier and then the
 * timestamp grammar. Default construction means Now.
 */
class TimestampInput {
public:
    using Variant = std::variant<Now, std::string, double, int64_t, DateTime, TimestampMessage,
                                 WireBytes, Instant>;

    TimestampInput() noexcept = default;
    TimestampInput(Now) noexcept {}
    /// A null pointer carries no text and means Now
    TimestampInput(const char* text) {
        if (text != nullptr) {
            value_ = std::string(text);
        }
    }
    TimestampInput(std::string text) : value_(std::move(text)) {}
    TimestampInput(std::string_view text) : value_(std::string(text)) {}
    TimestampInput(double epoch_seconds) noexcept : value_(epoch_seconds) {}
    TimestampInput(float epoch_seconds) noexcept : value_(static_cast<double>(epoch_seconds)) {}

    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    TimestampInput(T epoch_seconds) noexcept : value_(static_cast<int64_t>(epoch_seconds)) {}

    TimestampInput(const DateTime& dt) : value_(dt) {}
    TimestampInput(const TimestampMessage& msg) noexcept : value_(msg) {}
    TimestampInput(WireBytes bytes) : value_(std::move(bytes)) {}
    TimestampInput(const Instant& instant) noexcept : value_(instant) {}
    TimestampInput(const CanonicalString& cs) noexcept : value_(cs.instant()) {}
    TimestampInput(std::chrono::system_clock::time_point tp) noexcept
        : value_(Instant::from_chrono(tp)) {}

    [[nodiscard]] const Variant& value() const noexcept { return value_; }

    [[nodiscard]] bool is_now() const noexcept { return std::holds_alternative<Now>(value_); }

    /// Text of a string input, trimmed; nullopt for other kinds
    [[nodiscard]] std::optional<std::string_view> text() const noexcept {
        if (const auto* s = std::get_if<std::string>(&value_)) {
            return detail::trim(*s);
        }
        return std::nullopt;
    }

    /// True for Now and for the strings "now" and "+1h"-style expressions
    [[nodiscard]] bool depends_on_clock() const noexcept {
        if (is_now()) {
            return true;
        }
        if (auto t = text()) {
            return *t == "now" || Modifier::looks_like_expression(*t);
        }
        return false;
    }

    /**
     * Equality-preserving, type-tagged key for memoization.
     *
     * The string "0" and the integer 0 produce different keys. Inputs whose
     * meaning depends on the clock have no key.
     */
    [[nodiscard]] std::optional<std::string> cache_key() const {
        if (depends_on_clock()) {
            return std::nullopt;
        }
        return std::visit(
            [](const auto& v) -> std::optional<std::string> {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return "s:" + v;
                } else if constexpr (std::is_same_v<T, double>) {
                    uint64_t bits = 0;
                    std::memcpy(&bits, &v, sizeof(bits));
                    return "f:" + std::to_string(bits);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return "i:" + std::to_string(v);
                } else if constexpr (std::is_same_v<T, DateTime>) {
                    std::string key = "t:" + v.iso_string();
                    if (v.utc_offset_seconds) {
                        key += "@" + std::to_string(*v.utc_offset_seconds);
                    }
                    return key;
                } else if constexpr (std::is_same_v<T, TimestampMessage>) {
                    return "m:" + std::to_string(v.seconds) + "," + std::to_string(v.nanos);
                } else if constexpr (std::is_same_v<T, WireBytes>) {
                    return "b:" + std::string(v.begin(), v.end());
                } else if constexpr (std::is_same_v<T, Instant>) {
                    return "n:" + std::to_string(v.seconds()) + "." +
                           std::to_string(v.microseconds());
                } else {
                    return std::nullopt;
                }
            },
            value_);
    }

    /// Human-readable rendering for error messages
    [[nodiscard]] std::string describe() const {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Now>) {
                    return "now";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, DateTime>) {
                    return v.iso_string();
                } else if constexpr (std::is_same_v<T, TimestampMessage>) {
                    return v.describe();
                } else if constexpr (std::is_same_v<T, WireBytes>) {
                    return std::to_string(v.size()) + " bytes";
                } else {
                    return std::to_string(v.seconds()) + "." + std::to_string(v.microseconds());
                }
            },
            value_);
    }

private:
    Variant value_{};
};

/**
 * @brief Modifier argument: seconds as a number, or an expression string
 *
 * Unset and zero both mean "no shift".
 * @code
 *   utcnow::rfc3339_timestamp("2023-09-07 02:18:00", "+7d");
 *   utcnow::rfc3339_timestamp(1234567890.05, -0.1);
 *   utcnow::rfc3339_timestamp(0, 3600);
 * @endcode
 */
class ModifierInput {
public:
    using Variant = std::variant<std::monostate, int64_t, double, std::string, Modifier>;

    ModifierInput() noexcept = default;
    /// A null pointer carries no text and leaves the modifier unset
    ModifierInput(const char* text) {
        if (text != nullptr) {
            value_ = std::string(text);
        }
    }
    ModifierInput(std::string text) : value_(std::move(text)) {}
    ModifierInput(std::string_view text) : value_(std::string(text)) {}
    ModifierInput(double seconds) noexcept : value_(seconds) {}
    ModifierInput(Modifier m) noexcept : value_(m) {}

    template <std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    ModifierInput(T seconds) noexcept : value_(static_cast<int64_t>(seconds)) {}

    [[nodiscard]] bool is_unset() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    [[nodiscard]] const Variant& value() const noexcept { return value_; }

    /// @return invalid_modifier or out_of_range for unusable values
    [[nodiscard]] Result<Modifier> resolve() const {
        return std::visit(
            [](const auto& v) -> Result<Modifier> {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return Modifier{};
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return Modifier::from_seconds(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    return Modifier::from_fractional_seconds(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return Modifier::parse(v);
                } else {
                    return v;
                }
            },
            value_);
    }

private:
    Variant value_{};
};

} // namespace utcnow
