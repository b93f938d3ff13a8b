#pragma once

#include "utcnow/expected.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <cstdint>

namespace utcnow {

/**
 * @brief Error codes reported by normalization and synchronizer operations
 *
 * Codes up to and including invalid_message describe malformed caller input
 * (ErrorCategory::invalid_format). The frame_* codes describe misuse of a
 * Synchronizer frame (ErrorCategory::synchronizer_misuse).
 */
enum class ErrorCode : uint8_t {
    invalid_format,    ///< Text does not match any accepted timestamp shape
    out_of_range,      ///< Calendar field or instant outside the representable range
    invalid_offset,    ///< Unrecognized UTC offset or timezone designator
    invalid_modifier,  ///< Malformed modifier expression or non-finite delta
    unknown_unit,      ///< Unrecognized unit name for a time difference
    invalid_message,   ///< Malformed binary timestamp message
    frame_not_pending, ///< Frame entered twice
    frame_superseded,  ///< Frame replaced by a newer active frame
    frame_not_active   ///< Frame exited or read while not active
};

enum class ErrorCategory : uint8_t { invalid_format, synchronizer_misuse };

constexpr ErrorCategory error_category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::frame_not_pending:
        case ErrorCode::frame_superseded:
        case ErrorCode::frame_not_active:
            return ErrorCategory::synchronizer_misuse;
        default:
            return ErrorCategory::invalid_format;
    }
}

constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::invalid_format:
            return "Input value does not match allowed input formats";
        case ErrorCode::out_of_range:
            return "Input value is outside the supported range";
        case ErrorCode::invalid_offset:
            return "Unknown UTC offset or timezone value";
        case ErrorCode::invalid_modifier:
            return "Invalid modifier value";
        case ErrorCode::unknown_unit:
            return "Unknown time unit";
        case ErrorCode::invalid_message:
            return "Malformed binary timestamp message";
        case ErrorCode::frame_not_pending:
            return "Synchronizer frame has already been entered";
        case ErrorCode::frame_superseded:
            return "Synchronizer frame was superseded by a newer frame";
        case ErrorCode::frame_not_active:
            return "Synchronizer frame is not active";
        default:
            return "Unknown error";
    }
}

/**
 * @brief Error information from a failed operation
 *
 * Carries the error code plus the offending input rendered as text, so a
 * caller can produce messages like
 * "Input value does not match allowed input formats: '2021-02-30'".
 */
struct Error {
    ErrorCode code{ErrorCode::invalid_format};
    std::string input{}; ///< Offending input (may be empty)

    [[nodiscard]] const char* message() const noexcept { return error_code_string(code); }

    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(code); }

    /// Message with the offending input appended
    [[nodiscard]] std::string describe() const {
        std::string out = message();
        if (!input.empty()) {
            out += ": '";
            out += input;
            out += "'";
        }
        return out;
    }

    friend bool operator==(const Error&, const Error&) = default;
};

/**
 * @brief Result type for fallible operations
 *
 * Holds either the produced value or an Error describing what went wrong.
 *
 * Usage:
 * @code
 *   auto result = utcnow::rfc3339_timestamp("2021-02-18 01:00");
 *   if (result.has_value()) {
 *       std::cout << *result << "\n";
 *   } else {
 *       std::cerr << result.error().describe() << "\n";
 *   }
 * @endcode
 */
template <typename T>
using Result = expected<T, Error>;

/**
 * @brief Factory for unexpected<Error> values
 *
 * @code
 *   return make_error(ErrorCode::invalid_format, text);
 * @endcode
 */
inline auto make_error(ErrorCode code, std::string_view input = {}) {
    return unexpected<Error>(Error{code, std::string(input)});
}

} // namespace utcnow
