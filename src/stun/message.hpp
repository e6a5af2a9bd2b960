#pragma once

#include "common/errors.hpp"
#include "stun/attribute.hpp"
#include "stun/header.hpp"
#include "stun/xor_address.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace stunlink::stun {

// ============================================================================
// Message - header plus attributes in wire order
// ============================================================================
struct Message {
    Header header;
    std::vector<Attribute> attributes;

    // Decode a complete datagram. The buffer must hold 20 + header.length
    // bytes; trailing bytes past that are ignored. The cookie is not checked
    // here, callers use header.has_valid_cookie().
    static std::expected<Message, ErrorCode> decode(std::span<const uint8_t> data);

    // Serialize with header.length recomputed from the attribute list.
    // MESSAGE_TOO_LARGE when the attributes need more than 0xFFFF bytes.
    std::expected<std::vector<uint8_t>, ErrorCode> encode() const;

    // Sum of 4 + padded_length over all attributes
    size_t attributes_length() const;

    // First attribute of the given type, nullptr when absent
    const Attribute* find_attribute(uint16_t type) const;
    const Attribute* find_attribute(AttributeType type) const {
        return find_attribute(static_cast<uint16_t>(type));
    }

    bool has_attribute(AttributeType type) const { return find_attribute(type) != nullptr; }

    void add_attribute(Attribute attr) { attributes.push_back(std::move(attr)); }

    // nullopt for anything but a binding response; ATTRIBUTE_NOT_FOUND when a
    // binding response lacks XOR-MAPPED-ADDRESS.
    std::expected<std::optional<XorMappedAddress>, ErrorCode> xor_mapped_address() const;

    static Message binding_request(const TransactionId& transaction_id);

    // Binding response carrying a single XOR-MAPPED-ADDRESS
    static std::expected<Message, ErrorCode> binding_response(
        const TransactionId& transaction_id,
        const boost::asio::ip::address& address, uint16_t port);
};

// 12 bytes from the system CSPRNG
TransactionId generate_transaction_id();

} // namespace stunlink::stun
