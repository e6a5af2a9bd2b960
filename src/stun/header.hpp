#pragma once

#include "common/errors.hpp"
#include "stun/constants.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace stunlink::stun {

using TransactionId = std::array<uint8_t, TRANSACTION_ID_SIZE>;

// ============================================================================
// Header - fixed 20-byte message header
// ============================================================================
// | type (2) | length (2) | magic cookie (4) | transaction id (12) |
// length counts the attribute section only, never the header itself.
struct Header {
    uint16_t type = 0;
    uint16_t length = 0;
    uint32_t magic_cookie = MAGIC_COOKIE;
    TransactionId transaction_id{};

    bool has_valid_cookie() const { return magic_cookie == MAGIC_COOKIE; }

    bool is(MessageType t) const { return type == static_cast<uint16_t>(t); }

    std::string_view type_name() const { return message_type_name(type); }

    bool operator==(const Header&) const = default;
};

// Decode the first 20 bytes. Unknown message types and foreign cookies are
// accepted; only a buffer shorter than the header fails (SHORT_BUFFER).
std::expected<Header, ErrorCode> decode_header(std::span<const uint8_t> data);

std::array<uint8_t, HEADER_SIZE> encode_header(const Header& header);

} // namespace stunlink::stun
