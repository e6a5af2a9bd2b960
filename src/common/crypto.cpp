#include "common/crypto.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>

namespace stunlink::crypto {

bool init() {
    return sodium_init() >= 0;
}

// ============================================================================
// Random Generation
// ============================================================================

void random_bytes(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

// ============================================================================
// Utility
// ============================================================================

std::string to_hex(std::span<const uint8_t> data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace stunlink::crypto
