#pragma once

#include "common/errors.hpp"
#include "stun/constants.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/address_v4.hpp>

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace stunlink::stun {

// ============================================================================
// XorMappedAddress - decoded value of XOR-MAPPED-ADDRESS
// ============================================================================
// The wire form hides the address from NATs that rewrite packet payloads:
// port ^ 0x2112 and each IPv4 octet XOR the big-endian magic cookie.
struct XorMappedAddress {
    AddressFamily family = AddressFamily::IPV4;
    boost::asio::ip::address_v4 address;
    uint16_t port = 0;

    // "a.b.c.d:port"
    std::string to_string() const;

    bool operator==(const XorMappedAddress& other) const {
        return family == other.family && address == other.address && port == other.port;
    }
};

using XorAddressValue = std::array<uint8_t, XOR_ADDRESS_V4_SIZE>;

// IPv4 (or IPv4-mapped IPv6) only; anything else is UNSUPPORTED_ADDRESS_FAMILY
std::expected<XorAddressValue, ErrorCode>
serialize_xor_address(const boost::asio::ip::address& address, uint16_t port);

// Parses the textual address first; an unparsable string is
// UNSUPPORTED_ADDRESS_FAMILY.
std::expected<XorAddressValue, ErrorCode>
serialize_xor_address(std::string_view address, uint16_t port);

std::expected<XorMappedAddress, ErrorCode>
deserialize_xor_address(std::span<const uint8_t> value);

} // namespace stunlink::stun
