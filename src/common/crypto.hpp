#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace stunlink::crypto {

// Initialize libsodium (call once at startup, safe to call again)
bool init();

// ============================================================================
// Random Generation
// ============================================================================

// Fill the buffer with cryptographically secure random bytes
void random_bytes(std::span<uint8_t> buffer);

// ============================================================================
// Utility
// ============================================================================

// Lowercase hex rendering, used for transaction IDs in logs
std::string to_hex(std::span<const uint8_t> data);

} // namespace stunlink::crypto
