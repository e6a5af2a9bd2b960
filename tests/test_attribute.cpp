#include <gtest/gtest.h>
#include "common/binary_codec.hpp"
#include "stun/attribute.hpp"

using namespace stunlink;
using namespace stunlink::stun;

TEST(AttributeTest, PaddingLaw) {
    EXPECT_EQ(padded_length(0), 0u);
    EXPECT_EQ(padded_length(1), 4u);
    EXPECT_EQ(padded_length(3), 4u);
    EXPECT_EQ(padded_length(4), 4u);
    EXPECT_EQ(padded_length(5), 8u);
    EXPECT_EQ(padded_length(6), 8u);
    EXPECT_EQ(padded_length(8), 8u);

    for (size_t n = 0; n < 1024; ++n) {
        size_t padded = padded_length(n);
        EXPECT_EQ(padded % 4, 0u) << "n=" << n;
        EXPECT_GE(padded, n);
        EXPECT_LT(padded - n, 4u);
    }
}

TEST(AttributeTest, TypeNames) {
    EXPECT_EQ(attribute_type_name(0x0020), "XOR-MAPPED-ADDRESS");
    EXPECT_EQ(attribute_type_name(0x0001), "MAPPED-ADDRESS");
    EXPECT_EQ(attribute_type_name(0x0006), "USERNAME");
    EXPECT_EQ(attribute_type_name(0x0015), "NONCE");
    EXPECT_EQ(attribute_type_name(0x8028), "Unknown");
}

TEST(AttributeTest, MakeZeroPadsValue) {
    const std::vector<uint8_t> payload = {'a', 'b', 'c', 'd', 'e'};
    auto attr = Attribute::make(AttributeType::USERNAME, payload);

    EXPECT_EQ(attr.type, 0x0006);
    EXPECT_EQ(attr.length, 5);
    EXPECT_EQ(attr.padded_length(), 8u);
    ASSERT_EQ(attr.value.size(), 8u);
    EXPECT_EQ(attr.value[5], 0);
    EXPECT_EQ(attr.value[7], 0);

    auto declared = attr.payload();
    EXPECT_EQ(std::vector<uint8_t>(declared.begin(), declared.end()), payload);
}

TEST(AttributeTest, EncodeLayout) {
    const std::vector<uint8_t> payload = {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    auto encoded = encode_attribute(Attribute::make(0x8001, payload));

    const std::vector<uint8_t> expected = {
        0x80, 0x01, 0x00, 0x06,
        0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF, 0x00, 0x00,
    };
    EXPECT_EQ(encoded, expected);
}

TEST(AttributeTest, DecodeEncodeRoundTrip) {
    const std::vector<uint8_t> payload = {1, 2, 3, 4, 5, 6, 7};
    auto attr = Attribute::make(AttributeType::NONCE, payload);

    auto decoded = decode_attribute(encode_attribute(attr));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, attr);
}

TEST(AttributeTest, EncodeFillsMissingPadding) {
    // A hand-built value without its padding still encodes to the padded size
    Attribute attr;
    attr.type = 0x0015;
    attr.length = 3;
    attr.value = {0x10, 0x20, 0x30};

    auto encoded = encode_attribute(attr);
    ASSERT_EQ(encoded.size(), 8u);
    EXPECT_EQ(encoded[7], 0x00);
}

TEST(AttributeTest, DecodeShortHeader) {
    const std::vector<uint8_t> data = {0x00, 0x20, 0x00};
    auto decoded = decode_attribute(data);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), ErrorCode::SHORT_BUFFER);
}

TEST(AttributeTest, DecodeValuePastBufferEnd) {
    // Declares 8 bytes, carries only 6
    const std::vector<uint8_t> data = {0x00, 0x20, 0x00, 0x08, 1, 2, 3, 4, 5, 6};
    auto decoded = decode_attribute(data);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), ErrorCode::SHORT_BUFFER);
}

TEST(AttributeTest, DecodePaddingPastBufferEnd) {
    // Declared length 5 fits, but the padded length of 8 does not
    const std::vector<uint8_t> data = {0x00, 0x06, 0x00, 0x05, 1, 2, 3, 4, 5};
    auto decoded = decode_attribute(data);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), ErrorCode::SHORT_BUFFER);
}

TEST(AttributeTest, DecodeAllTwoAttributes) {
    wire::BinaryWriter writer;
    encode_attribute(Attribute::make(0x0001, std::vector<uint8_t>{0xA1, 0xA2, 0xA3, 0xA4}), writer);
    encode_attribute(Attribute::make(0x0002, std::vector<uint8_t>{0xB1, 0xB2, 0xB3, 0xB4, 0xB5, 0xB6}), writer);
    ASSERT_EQ(writer.size(), 8u + 12u);

    auto decoded = decode_attributes(writer.data(), writer.size());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 2u);

    const auto& first = (*decoded)[0];
    EXPECT_EQ(first.type, 0x0001);
    EXPECT_EQ(first.length, 4);
    EXPECT_EQ(first.value, (std::vector<uint8_t>{0xA1, 0xA2, 0xA3, 0xA4}));

    const auto& second = (*decoded)[1];
    EXPECT_EQ(second.type, 0x0002);
    EXPECT_EQ(second.length, 6);
    EXPECT_EQ(second.value, (std::vector<uint8_t>{0xB1, 0xB2, 0xB3, 0xB4, 0xB5, 0xB6, 0x00, 0x00}));

    size_t consumed = first.wire_size() + second.wire_size();
    EXPECT_EQ(consumed, writer.size());
}

TEST(AttributeTest, DecodeAllStopsAtTotalLength) {
    wire::BinaryWriter writer;
    encode_attribute(Attribute::make(0x0001, std::vector<uint8_t>{1, 2, 3, 4}), writer);
    encode_attribute(Attribute::make(0x0002, std::vector<uint8_t>{5, 6, 7, 8}), writer);

    // Only the first attribute belongs to the section
    auto decoded = decode_attributes(writer.data(), 8);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 1u);
    EXPECT_EQ((*decoded)[0].type, 0x0001);
}

TEST(AttributeTest, DecodeAllEmptySection) {
    auto decoded = decode_attributes(std::span<const uint8_t>{}, 0);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(AttributeTest, DecodeAllTotalBeyondBuffer) {
    auto encoded = encode_attribute(Attribute::make(0x0001, std::vector<uint8_t>{1, 2, 3, 4}));
    auto decoded = decode_attributes(encoded, encoded.size() + 4);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), ErrorCode::SHORT_BUFFER);
}

TEST(AttributeTest, DecodeAllAttributeCrossesTotalLength) {
    auto encoded = encode_attribute(Attribute::make(0x0001, std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}));
    // Section claims 8 bytes, the attribute needs 12
    auto decoded = decode_attributes(encoded, 8);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), ErrorCode::SHORT_BUFFER);
}
