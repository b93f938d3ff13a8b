#pragma once

#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace utcnow::detail {

/// Protocol-buffer wire types
enum class WireType : uint8_t {
    varint = 0,
    fixed64 = 1,
    length_delimited = 2,
    start_group = 3,
    end_group = 4,
    fixed32 = 5
};

/// A varint never exceeds 10 bytes (ceil(64 / 7))
inline constexpr size_t MAX_VARINT_BYTES = 10;

/// Largest legal field number (2^29 - 1)
inline constexpr uint64_t MAX_FIELD_NUMBER = (1ULL << 29) - 1;

constexpr uint64_t make_key(uint32_t field, WireType type) noexcept {
    return (static_cast<uint64_t>(field) << 3) | static_cast<uint64_t>(type);
}

inline void append_varint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

constexpr size_t varint_size(uint64_t value) noexcept {
    size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++n;
    }
    return n;
}

/**
 * Bounds-checked forward reader over a protocol-buffer encoded buffer.
 *
 * Every read returns false instead of running past the end, so a truncated
 * or hostile buffer can never cause an out-of-bounds access.
 */
class WireReader {
public:
    explicit WireReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] size_t position() const noexcept { return pos_; }

    /// @return false on truncation or a varint longer than 10 bytes
    bool read_varint(uint64_t& out) noexcept {
        uint64_t value = 0;
        for (size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
            if (at_end()) {
                return false;
            }
            const uint8_t byte = data_[pos_++];
            value |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
            if ((byte & 0x80) == 0) {
                out = value;
                return true;
            }
        }
        return false;
    }

    bool skip(uint64_t count) noexcept {
        if (count > remaining()) {
            return false;
        }
        pos_ += static_cast<size_t>(count);
        return true;
    }

    /// Skip the payload of a field whose key has already been read
    bool skip_field(WireType type) noexcept {
        switch (type) {
            case WireType::varint: {
                uint64_t ignored = 0;
                return read_varint(ignored);
            }
            case WireType::fixed64:
                return skip(8);
            case WireType::length_delimited: {
                uint64_t length = 0;
                return read_varint(length) && skip(length);
            }
            case WireType::fixed32:
                return skip(4);
            default:
                // Groups are not part of any timestamp message
                return false;
        }
    }

private:
    std::span<const uint8_t> data_;
    size_t pos_{0};
};

} // namespace utcnow::detail
