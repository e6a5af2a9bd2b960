#pragma once

#include "common/errors.hpp"
#include "stun/constants.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace stunlink::wire {
class BinaryWriter;
}

namespace stunlink::stun {

// Round a declared attribute length up to the 4-byte boundary
constexpr size_t padded_length(size_t n) {
    return n % 4 == 0 ? n : n + (4 - n % 4);
}

// ============================================================================
// Attribute - one TLV entry of the attribute section
// ============================================================================
struct Attribute {
    uint16_t type = 0;
    uint16_t length = 0;         // declared length, padding excluded
    std::vector<uint8_t> value;  // padded_length(length) bytes

    size_t padded_length() const { return stun::padded_length(length); }

    // Bytes on the wire including the 4-byte TLV header
    size_t wire_size() const { return ATTRIBUTE_HEADER_SIZE + padded_length(); }

    // The declared bytes, padding stripped
    std::span<const uint8_t> payload() const;

    bool is(AttributeType t) const { return type == static_cast<uint16_t>(t); }

    bool operator==(const Attribute&) const = default;

    // Build from an unpadded payload; the value is zero-padded.
    // Payloads longer than 0xFFFF bytes are truncated.
    static Attribute make(uint16_t type, std::span<const uint8_t> payload);
    static Attribute make(AttributeType type, std::span<const uint8_t> payload) {
        return make(static_cast<uint16_t>(type), payload);
    }
};

// Decode one attribute from the front of `data`. Fails with SHORT_BUFFER when
// the TLV header or the padded value does not fit.
std::expected<Attribute, ErrorCode> decode_attribute(std::span<const uint8_t> data);

// Decode attributes until `total_length` bytes are consumed. An attribute
// crossing `total_length`, or `total_length` beyond the buffer, is SHORT_BUFFER.
std::expected<std::vector<Attribute>, ErrorCode>
decode_attributes(std::span<const uint8_t> data, size_t total_length);

// Writes type, declared length and exactly padded_length() value bytes
void encode_attribute(const Attribute& attr, wire::BinaryWriter& writer);
std::vector<uint8_t> encode_attribute(const Attribute& attr);

} // namespace stunlink::stun
