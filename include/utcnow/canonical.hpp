#pragma once

#include "utcnow/detail/format.hpp"
#include "utcnow/detail/grammar.hpp"
#include "utcnow/error.hpp"
#include "utcnow/instant.hpp"

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <cstddef>

namespace utcnow {

/**
 * The canonical UTC text form `YYYY-MM-DDTHH:MM:SS.ffffffZ`.
 *
 * Always exactly 27 ASCII characters. Two values compare equal iff their
 * instants are equal, and lexicographic order of the text is instant order,
 * so comparison works on the text directly.
 *
 * Values are only produced from in-range instants:
 * @code
 *   auto cs = CanonicalString::from_instant(Instant{0, 0});
 *   // cs->str() == "1970-01-01T00:00:00.000000Z"
 * @endcode
 */
class CanonicalString {
public:
    static constexpr size_t LENGTH = detail::CANONICAL_LENGTH;

    /// @return out_of_range unless the instant has a four-digit year
    static Result<CanonicalString> from_instant(const Instant& instant) {
        if (!instant.in_range()) {
            return make_error(ErrorCode::out_of_range);
        }
        return CanonicalString(detail::format_canonical(instant.seconds(), instant.microseconds()),
                               instant);
    }

    /**
     * Strict parse: accepts only text already in canonical form.
     *
     * @return invalid_format for anything else, including valid timestamps
     *         in a different shape ("2021-02-18 10:00")
     */
    static Result<CanonicalString> parse(std::string_view text) {
        if (text.size() != LENGTH) {
            return make_error(ErrorCode::invalid_format, text);
        }
        auto fields = detail::parse_fields(text);
        if (!fields) {
            return make_unexpected(fields.error());
        }
        auto instant = fields->to_instant();
        if (!instant) {
            return make_error(instant.error().code, text);
        }
        auto canonical = from_instant(*instant);
        if (!canonical || canonical->view() != text) {
            return make_error(ErrorCode::invalid_format, text);
        }
        return canonical;
    }

    [[nodiscard]] const std::string& str() const noexcept { return text_; }
    [[nodiscard]] std::string_view view() const noexcept { return text_; }
    [[nodiscard]] const char* c_str() const noexcept { return text_.c_str(); }
    [[nodiscard]] const Instant& instant() const noexcept { return instant_; }

    /// "YYYY-MM-DD" prefix
    [[nodiscard]] std::string_view date() const noexcept {
        return std::string_view(text_).substr(0, detail::DATE_LENGTH);
    }

    friend bool operator==(const CanonicalString& lhs, const CanonicalString& rhs) noexcept {
        return lhs.text_ == rhs.text_;
    }

    friend std::strong_ordering operator<=>(const CanonicalString& lhs,
                                            const CanonicalString& rhs) noexcept {
        return lhs.text_.compare(rhs.text_) <=> 0;
    }

    friend bool operator==(const CanonicalString& lhs, std::string_view rhs) noexcept {
        return lhs.view() == rhs;
    }

private:
    CanonicalString(std::string text, const Instant& instant) : text_(std::move(text)), instant_(instant) {}

    std::string text_;
    Instant instant_;
};

inline std::ostream& operator<<(std::ostream& os, const CanonicalString& cs) {
    return os << cs.str();
}

} // namespace utcnow
