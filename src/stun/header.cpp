#include "stun/header.hpp"
#include "common/binary_codec.hpp"

#include <algorithm>

namespace stunlink::stun {

std::expected<Header, ErrorCode> decode_header(std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        return std::unexpected(ErrorCode::SHORT_BUFFER);
    }

    wire::BinaryReader reader(data.first(HEADER_SIZE));
    Header header;

    auto type = reader.read_u16();
    if (!type) return std::unexpected(type.error());
    header.type = *type;

    auto length = reader.read_u16();
    if (!length) return std::unexpected(length.error());
    header.length = *length;

    auto cookie = reader.read_u32();
    if (!cookie) return std::unexpected(cookie.error());
    header.magic_cookie = *cookie;

    auto txn = reader.read_fixed_array<TRANSACTION_ID_SIZE>();
    if (!txn) return std::unexpected(txn.error());
    header.transaction_id = *txn;

    return header;
}

std::array<uint8_t, HEADER_SIZE> encode_header(const Header& header) {
    wire::BinaryWriter writer(HEADER_SIZE);
    writer.write_u16(header.type);
    writer.write_u16(header.length);
    writer.write_u32(header.magic_cookie);
    writer.write_fixed_bytes(header.transaction_id);

    std::array<uint8_t, HEADER_SIZE> out;
    std::copy(writer.data().begin(), writer.data().end(), out.begin());
    return out;
}

} // namespace stunlink::stun
