#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace stunlink::stun {

// ============================================================================
// Protocol Constants (RFC 5389 subset)
// ============================================================================

constexpr uint32_t MAGIC_COOKIE = 0x2112A442;

// Upper 16 bits of the cookie, the XOR key for ports
constexpr uint16_t MAGIC_COOKIE_HIGH = 0x2112;

constexpr size_t HEADER_SIZE = 20;
constexpr size_t TRANSACTION_ID_SIZE = 12;
constexpr size_t ATTRIBUTE_HEADER_SIZE = 4;

// The header length field is 16 bits wide
constexpr size_t MAX_ATTRIBUTES_LENGTH = 0xFFFF;

// XOR-MAPPED-ADDRESS value for IPv4: reserved, family, port, address
constexpr size_t XOR_ADDRESS_V4_SIZE = 8;

// ============================================================================
// Message Types
// ============================================================================
enum class MessageType : uint16_t {
    BINDING_REQUEST  = 0x0001,
    BINDING_RESPONSE = 0x0101,
    ERROR_RESPONSE   = 0x0111,
};

// Display name of a raw type field; anything unknown renders as "Unknown"
constexpr std::string_view message_type_name(uint16_t type) {
    switch (static_cast<MessageType>(type)) {
        case MessageType::BINDING_REQUEST:  return "BindingRequest";
        case MessageType::BINDING_RESPONSE: return "BindingResponse";
        case MessageType::ERROR_RESPONSE:   return "ErrorResponse";
        default:                            return "Unknown";
    }
}

// ============================================================================
// Attribute Types
// ============================================================================
enum class AttributeType : uint16_t {
    MAPPED_ADDRESS     = 0x0001,
    USERNAME           = 0x0006,
    MESSAGE_INTEGRITY  = 0x0008,
    ERROR_CODE         = 0x0009,
    UNKNOWN_ATTRIBUTES = 0x000A,
    REALM              = 0x0014,
    NONCE              = 0x0015,
    XOR_MAPPED_ADDRESS = 0x0020,
};

constexpr std::string_view attribute_type_name(uint16_t type) {
    switch (static_cast<AttributeType>(type)) {
        case AttributeType::MAPPED_ADDRESS:     return "MAPPED-ADDRESS";
        case AttributeType::USERNAME:           return "USERNAME";
        case AttributeType::MESSAGE_INTEGRITY:  return "MESSAGE-INTEGRITY";
        case AttributeType::ERROR_CODE:         return "ERROR-CODE";
        case AttributeType::UNKNOWN_ATTRIBUTES: return "UNKNOWN-ATTRIBUTES";
        case AttributeType::REALM:              return "REALM";
        case AttributeType::NONCE:              return "NONCE";
        case AttributeType::XOR_MAPPED_ADDRESS: return "XOR-MAPPED-ADDRESS";
        default:                                return "Unknown";
    }
}

// ============================================================================
// Address Families
// ============================================================================
enum class AddressFamily : uint8_t {
    IPV4 = 0x01,
    IPV6 = 0x02,
};

} // namespace stunlink::stun
