#include "stun/xor_address.hpp"
#include "common/binary_codec.hpp"

#include <boost/asio/ip/address_v6.hpp>
#include <algorithm>

namespace stunlink::stun {

namespace {

constexpr std::array<uint8_t, 4> COOKIE_BYTES = {
    static_cast<uint8_t>((MAGIC_COOKIE >> 24) & 0xFF),
    static_cast<uint8_t>((MAGIC_COOKIE >> 16) & 0xFF),
    static_cast<uint8_t>((MAGIC_COOKIE >> 8) & 0xFF),
    static_cast<uint8_t>(MAGIC_COOKIE & 0xFF),
};

std::array<uint8_t, 4> xor_octets(const std::array<uint8_t, 4>& octets) {
    std::array<uint8_t, 4> out;
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = octets[i] ^ COOKIE_BYTES[i];
    }
    return out;
}

} // anonymous namespace

std::string XorMappedAddress::to_string() const {
    return address.to_string() + ":" + std::to_string(port);
}

std::expected<XorAddressValue, ErrorCode>
serialize_xor_address(const boost::asio::ip::address& address, uint16_t port) {
    boost::asio::ip::address_v4 v4;
    if (address.is_v4()) {
        v4 = address.to_v4();
    } else if (address.to_v6().is_v4_mapped()) {
        v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
    } else {
        return std::unexpected(ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
    }

    wire::BinaryWriter writer(XOR_ADDRESS_V4_SIZE);
    writer.write_u8(0);  // reserved
    writer.write_u8(static_cast<uint8_t>(AddressFamily::IPV4));
    writer.write_u16(static_cast<uint16_t>(port ^ MAGIC_COOKIE_HIGH));
    writer.write_fixed_bytes(xor_octets(v4.to_bytes()));

    XorAddressValue out;
    std::copy(writer.data().begin(), writer.data().end(), out.begin());
    return out;
}

std::expected<XorAddressValue, ErrorCode>
serialize_xor_address(std::string_view address, uint16_t port) {
    boost::system::error_code ec;
    auto parsed = boost::asio::ip::make_address(std::string(address), ec);
    if (ec) {
        return std::unexpected(ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
    }
    return serialize_xor_address(parsed, port);
}

std::expected<XorMappedAddress, ErrorCode>
deserialize_xor_address(std::span<const uint8_t> value) {
    if (value.size() < XOR_ADDRESS_V4_SIZE) {
        return std::unexpected(ErrorCode::SHORT_BUFFER);
    }

    wire::BinaryReader reader(value);
    if (!reader.skip(1)) {  // reserved
        return std::unexpected(ErrorCode::SHORT_BUFFER);
    }

    auto family = reader.read_u8();
    if (!family) return std::unexpected(family.error());
    if (*family != static_cast<uint8_t>(AddressFamily::IPV4)) {
        return std::unexpected(ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
    }

    auto xport = reader.read_u16();
    if (!xport) return std::unexpected(xport.error());

    auto xaddr = reader.read_fixed_array<4>();
    if (!xaddr) return std::unexpected(xaddr.error());

    XorMappedAddress result;
    result.family = AddressFamily::IPV4;
    result.port = static_cast<uint16_t>(*xport ^ MAGIC_COOKIE_HIGH);
    result.address = boost::asio::ip::address_v4(xor_octets(*xaddr));
    return result;
}

} // namespace stunlink::stun
