#include "stun/message.hpp"
#include "common/binary_codec.hpp"
#include "common/crypto.hpp"

namespace stunlink::stun {

std::expected<Message, ErrorCode> Message::decode(std::span<const uint8_t> data) {
    auto header = decode_header(data);
    if (!header) return std::unexpected(header.error());

    if (data.size() - HEADER_SIZE < header->length) {
        return std::unexpected(ErrorCode::SHORT_BUFFER);
    }

    auto attributes = decode_attributes(data.subspan(HEADER_SIZE), header->length);
    if (!attributes) return std::unexpected(attributes.error());

    Message msg;
    msg.header = *header;
    msg.attributes = std::move(*attributes);
    return msg;
}

size_t Message::attributes_length() const {
    size_t total = 0;
    for (const auto& attr : attributes) {
        total += attr.wire_size();
    }
    return total;
}

std::expected<std::vector<uint8_t>, ErrorCode> Message::encode() const {
    size_t body = attributes_length();
    if (body > MAX_ATTRIBUTES_LENGTH) {
        return std::unexpected(ErrorCode::MESSAGE_TOO_LARGE);
    }

    Header out = header;
    out.length = static_cast<uint16_t>(body);

    wire::BinaryWriter writer(HEADER_SIZE + body);
    writer.write_fixed_bytes(encode_header(out));
    for (const auto& attr : attributes) {
        encode_attribute(attr, writer);
    }
    return writer.take();
}

const Attribute* Message::find_attribute(uint16_t type) const {
    for (const auto& attr : attributes) {
        if (attr.type == type) {
            return &attr;
        }
    }
    return nullptr;
}

std::expected<std::optional<XorMappedAddress>, ErrorCode> Message::xor_mapped_address() const {
    if (!header.is(MessageType::BINDING_RESPONSE)) {
        return std::optional<XorMappedAddress>{};
    }

    const Attribute* attr = find_attribute(AttributeType::XOR_MAPPED_ADDRESS);
    if (!attr) {
        return std::unexpected(ErrorCode::ATTRIBUTE_NOT_FOUND);
    }

    auto mapped = deserialize_xor_address(attr->payload());
    if (!mapped) return std::unexpected(mapped.error());
    return std::optional<XorMappedAddress>(*mapped);
}

Message Message::binding_request(const TransactionId& transaction_id) {
    Message msg;
    msg.header.type = static_cast<uint16_t>(MessageType::BINDING_REQUEST);
    msg.header.magic_cookie = MAGIC_COOKIE;
    msg.header.transaction_id = transaction_id;
    return msg;
}

std::expected<Message, ErrorCode> Message::binding_response(
    const TransactionId& transaction_id,
    const boost::asio::ip::address& address, uint16_t port) {

    auto value = serialize_xor_address(address, port);
    if (!value) return std::unexpected(value.error());

    Message msg;
    msg.header.type = static_cast<uint16_t>(MessageType::BINDING_RESPONSE);
    msg.header.magic_cookie = MAGIC_COOKIE;
    msg.header.transaction_id = transaction_id;
    msg.add_attribute(Attribute::make(AttributeType::XOR_MAPPED_ADDRESS, *value));
    msg.header.length = static_cast<uint16_t>(msg.attributes_length());
    return msg;
}

TransactionId generate_transaction_id() {
    TransactionId id;
    crypto::random_bytes(id);
    return id;
}

} // namespace stunlink::stun
