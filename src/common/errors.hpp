#pragma once

#include <cstdint>
#include <string_view>

namespace stunlink {

// ============================================================================
// Error Codes
// ============================================================================
enum class ErrorCode : uint16_t {
    // Codec errors (1xx)
    SHORT_BUFFER               = 101,
    INVALID_COOKIE             = 102,
    ATTRIBUTE_NOT_FOUND        = 103,
    UNSUPPORTED_ADDRESS_FAMILY = 104,
    MESSAGE_TOO_LARGE          = 105,

    // Transport errors (2xx)
    SHORT_WRITE                = 201,
    ADDRESS_RESOLUTION_FAILURE = 202,
    SOCKET_FAILURE             = 203,
    TIMEOUT                    = 204,

    // Transaction errors (3xx)
    TRANSACTION_MISMATCH       = 301,
};

constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SHORT_BUFFER:               return "Short buffer";
        case ErrorCode::INVALID_COOKIE:             return "Invalid magic cookie";
        case ErrorCode::ATTRIBUTE_NOT_FOUND:        return "Attribute not found";
        case ErrorCode::UNSUPPORTED_ADDRESS_FAMILY: return "Unsupported address family";
        case ErrorCode::MESSAGE_TOO_LARGE:          return "Message too large";
        case ErrorCode::SHORT_WRITE:                return "Short write";
        case ErrorCode::ADDRESS_RESOLUTION_FAILURE: return "Address resolution failure";
        case ErrorCode::SOCKET_FAILURE:             return "Socket failure";
        case ErrorCode::TIMEOUT:                    return "Timeout";
        case ErrorCode::TRANSACTION_MISMATCH:       return "Transaction ID mismatch";
        default:                                    return "Unknown error";
    }
}

} // namespace stunlink
