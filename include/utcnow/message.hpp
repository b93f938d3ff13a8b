#pragma once

#include "utcnow/detail/time_math.hpp"
#include "utcnow/detail/varint.hpp"
#include "utcnow/error.hpp"
#include "utcnow/instant.hpp"

#include <span>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace utcnow {

/**
 * Binary timestamp message {seconds, nanos}.
 *
 * Byte-compatible with `google.protobuf.Timestamp`:
 * - field 1 `seconds`: int64, varint
 * - field 2 `nanos`:   int32, varint (negative values sign-extended to 10 bytes)
 *
 * Encoding emits only non-zero fields, so the default message encodes to an
 * empty buffer. Decoding skips unknown fields, and the last occurrence of a
 * repeated field wins. No protobuf runtime is required.
 *
 * Example:
 * @code
 *   auto msg = utcnow::TimestampMessage::from_instant(instant);
 *   std::vector<uint8_t> bytes = msg.encode();
 *   auto back = utcnow::TimestampMessage::decode(bytes);
 * @endcode
 */
struct TimestampMessage {
    static constexpr uint32_t SECONDS_FIELD = 1;
    static constexpr uint32_t NANOS_FIELD = 2;

    int64_t seconds{0};
    int32_t nanos{0};

    /// nanos = microseconds * 1000
    static TimestampMessage from_instant(const Instant& instant) noexcept {
        return TimestampMessage{instant.seconds(),
                                static_cast<int32_t>(instant.microseconds() *
                                                     detail::NANOS_PER_MICRO)};
    }

    /**
     * Convert to an Instant.
     *
     * Nanos outside [0, 10^9) are floor-normalized into seconds first, then
     * the last three nanosecond digits are dropped (truncated, not rounded).
     *
     * @return out_of_range if the instant has no four-digit year
     */
    [[nodiscard]] Result<Instant> to_instant() const {
        if (!detail::in_canonical_range(seconds)) {
            return make_error(ErrorCode::out_of_range, describe());
        }
        const int64_t sec = seconds + detail::floor_div(nanos, detail::NANOS_PER_SEC);
        const int64_t ns = detail::floor_mod(nanos, detail::NANOS_PER_SEC);
        auto instant = Instant::checked(sec, ns / detail::NANOS_PER_MICRO);
        if (!instant) {
            return make_error(ErrorCode::out_of_range, describe());
        }
        return instant;
    }

    [[nodiscard]] size_t encoded_size() const noexcept {
        size_t size = 0;
        if (seconds != 0) {
            size += 1 + detail::varint_size(static_cast<uint64_t>(seconds));
        }
        if (nanos != 0) {
            size += 1 + detail::varint_size(static_cast<uint64_t>(static_cast<int64_t>(nanos)));
        }
        return size;
    }

    [[nodiscard]] std::vector<uint8_t> encode() const {
        std::vector<uint8_t> out;
        out.reserve(encoded_size());
        if (seconds != 0) {
            detail::append_varint(out, detail::make_key(SECONDS_FIELD, detail::WireType::varint));
            detail::append_varint(out, static_cast<uint64_t>(seconds));
        }
        if (nanos != 0) {
            detail::append_varint(out, detail::make_key(NANOS_FIELD, detail::WireType::varint));
            detail::append_varint(out, static_cast<uint64_t>(static_cast<int64_t>(nanos)));
        }
        return out;
    }

    /**
     * Decode from the protocol-buffer wire format.
     *
     * @return invalid_message on a truncated buffer, an overlong varint,
     *         field number 0, or a group wire type
     */
    static Result<TimestampMessage> decode(std::span<const uint8_t> data) {
        TimestampMessage msg;
        detail::WireReader reader(data);
        while (!reader.at_end()) {
            uint64_t key = 0;
            if (!reader.read_varint(key)) {
                return make_error(ErrorCode::invalid_message);
            }
            const uint64_t field = key >> 3;
            const auto type = static_cast<detail::WireType>(key & 0x7);
            if (field == 0 || field > detail::MAX_FIELD_NUMBER) {
                return make_error(ErrorCode::invalid_message);
            }
            if (type == detail::WireType::varint &&
                (field == SECONDS_FIELD || field == NANOS_FIELD)) {
                uint64_t value = 0;
                if (!reader.read_varint(value)) {
                    return make_error(ErrorCode::invalid_message);
                }
                if (field == SECONDS_FIELD) {
                    msg.seconds = static_cast<int64_t>(value);
                } else {
                    // int32 fields keep the low 32 bits
                    msg.nanos = static_cast<int32_t>(static_cast<uint32_t>(value));
                }
                continue;
            }
            if (!reader.skip_field(type)) {
                return make_error(ErrorCode::invalid_message);
            }
        }
        return msg;
    }

    /// "seconds: N nanos: M", as protobuf's text format prints it
    [[nodiscard]] std::string describe() const {
        return "seconds: " + std::to_string(seconds) + " nanos: " + std::to_string(nanos);
    }

    friend bool operator==(const TimestampMessage&, const TimestampMessage&) = default;
};

} // namespace utcnow
