#include "stun/attribute.hpp"
#include "common/binary_codec.hpp"

#include <algorithm>

namespace stunlink::stun {

std::span<const uint8_t> Attribute::payload() const {
    return std::span<const uint8_t>(value).first(std::min<size_t>(length, value.size()));
}

Attribute Attribute::make(uint16_t type, std::span<const uint8_t> payload) {
    size_t len = std::min(payload.size(), static_cast<size_t>(0xFFFF));

    Attribute attr;
    attr.type = type;
    attr.length = static_cast<uint16_t>(len);
    attr.value.assign(payload.begin(), payload.begin() + len);
    attr.value.resize(stun::padded_length(len), 0);
    return attr;
}

std::expected<Attribute, ErrorCode> decode_attribute(std::span<const uint8_t> data) {
    wire::BinaryReader reader(data);
    Attribute attr;

    auto type = reader.read_u16();
    if (!type) return std::unexpected(type.error());
    attr.type = *type;

    auto length = reader.read_u16();
    if (!length) return std::unexpected(length.error());
    attr.length = *length;

    auto value = reader.read_fixed_bytes(attr.padded_length());
    if (!value) return std::unexpected(value.error());
    attr.value = std::move(*value);

    return attr;
}

std::expected<std::vector<Attribute>, ErrorCode>
decode_attributes(std::span<const uint8_t> data, size_t total_length) {
    if (total_length > data.size()) {
        return std::unexpected(ErrorCode::SHORT_BUFFER);
    }

    auto section = data.first(total_length);
    std::vector<Attribute> attributes;
    size_t cursor = 0;

    while (cursor < total_length) {
        auto attr = decode_attribute(section.subspan(cursor));
        if (!attr) return std::unexpected(attr.error());
        cursor += attr->wire_size();
        attributes.push_back(std::move(*attr));
    }

    return attributes;
}

void encode_attribute(const Attribute& attr, wire::BinaryWriter& writer) {
    size_t padded = attr.padded_length();
    size_t copied = std::min(padded, attr.value.size());

    writer.write_u16(attr.type);
    writer.write_u16(attr.length);
    writer.write_fixed_bytes(std::span<const uint8_t>(attr.value).first(copied));
    for (size_t i = copied; i < padded; ++i) {
        writer.write_u8(0);
    }
}

std::vector<uint8_t> encode_attribute(const Attribute& attr) {
    wire::BinaryWriter writer(attr.wire_size());
    encode_attribute(attr, writer);
    return writer.take();
}

} // namespace stunlink::stun
