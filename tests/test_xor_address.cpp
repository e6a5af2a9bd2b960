#include <gtest/gtest.h>
#include "stun/xor_address.hpp"

#include <random>

using namespace stunlink;
using namespace stunlink::stun;
namespace ip = boost::asio::ip;

TEST(XorAddressTest, SerializeLayout) {
    auto value = serialize_xor_address(ip::make_address("192.0.2.1"), 32853);
    ASSERT_TRUE(value.has_value());

    // 32853 = 0x8055, 0x8055 ^ 0x2112 = 0xA147
    // 192.0.2.1 ^ 21.12.A4.42 = E1.12.A6.43
    const XorAddressValue expected = {0x00, 0x01, 0xA1, 0x47, 0xE1, 0x12, 0xA6, 0x43};
    EXPECT_EQ(*value, expected);
}

TEST(XorAddressTest, DeserializeKnownValue) {
    const XorAddressValue value = {0x00, 0x01, 0xA1, 0x47, 0xE1, 0x12, 0xA6, 0x43};
    auto mapped = deserialize_xor_address(value);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->family, AddressFamily::IPV4);
    EXPECT_EQ(mapped->address.to_string(), "192.0.2.1");
    EXPECT_EQ(mapped->port, 32853);
    EXPECT_EQ(mapped->to_string(), "192.0.2.1:32853");
}

TEST(XorAddressTest, Involution) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<uint32_t> addr_dist;
    std::uniform_int_distribution<uint32_t> port_dist(0, 65535);

    for (int i = 0; i < 500; ++i) {
        ip::address_v4 address(addr_dist(rng));
        auto port = static_cast<uint16_t>(port_dist(rng));

        auto value = serialize_xor_address(ip::address(address), port);
        ASSERT_TRUE(value.has_value());
        auto mapped = deserialize_xor_address(*value);
        ASSERT_TRUE(mapped.has_value());
        EXPECT_EQ(mapped->address, address);
        EXPECT_EQ(mapped->port, port);
    }
}

TEST(XorAddressTest, BoundaryValues) {
    for (const char* text : {"0.0.0.0", "255.255.255.255", "127.0.0.1"}) {
        for (uint16_t port : {uint16_t{0}, uint16_t{1}, uint16_t{0x2112}, uint16_t{65535}}) {
            auto value = serialize_xor_address(std::string_view(text), port);
            ASSERT_TRUE(value.has_value()) << text;
            auto mapped = deserialize_xor_address(*value);
            ASSERT_TRUE(mapped.has_value());
            EXPECT_EQ(mapped->address.to_string(), text);
            EXPECT_EQ(mapped->port, port);
        }
    }
}

TEST(XorAddressTest, V4MappedAddressAccepted) {
    auto value = serialize_xor_address(std::string_view("::ffff:203.0.113.5"), 54321);
    ASSERT_TRUE(value.has_value());
    auto mapped = deserialize_xor_address(*value);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->to_string(), "203.0.113.5:54321");
}

TEST(XorAddressTest, IPv6Rejected) {
    auto value = serialize_xor_address(ip::make_address("2001:db8::1"), 3478);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error(), ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
}

TEST(XorAddressTest, UnparsableAddressRejected) {
    auto value = serialize_xor_address(std::string_view("not-an-address"), 3478);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error(), ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
}

TEST(XorAddressTest, DeserializeShortValue) {
    const std::vector<uint8_t> value = {0x00, 0x01, 0xA1, 0x47, 0xE1, 0x12, 0xA6};
    auto mapped = deserialize_xor_address(value);
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error(), ErrorCode::SHORT_BUFFER);
}

TEST(XorAddressTest, DeserializeIPv6FamilyRejected) {
    std::vector<uint8_t> value(20, 0x00);
    value[1] = static_cast<uint8_t>(AddressFamily::IPV6);
    auto mapped = deserialize_xor_address(value);
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error(), ErrorCode::UNSUPPORTED_ADDRESS_FAMILY);
}
