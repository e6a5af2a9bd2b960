#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <chrono>
#include <expected>
#include <utility>

namespace stunlink {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
};

std::string config_error_message(ConfigError error);

constexpr uint16_t DEFAULT_STUN_PORT = 3478;

// Split "host", "host:port" or "[v6addr]:port". A missing port yields
// default_port; a port outside 1-65535 or a non-numeric port is INVALID_VALUE.
std::expected<std::pair<std::string, uint16_t>, ConfigError>
parse_host_port(std::string_view text, uint16_t default_port = DEFAULT_STUN_PORT);

// ============================================================================
// Server Configuration
// ============================================================================

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t port = DEFAULT_STUN_PORT;
    size_t threads = 1;              // io_context runner threads
    size_t max_inflight = 64;        // concurrent request handlers
    size_t recv_buffer_size = 1024;  // one datagram

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Load from JSON file
    static std::expected<ServerConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<ServerConfig, ConfigError> parse(const std::string& json_content);
};

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    std::string server_host = "stun.l.google.com";
    uint16_t server_port = 19302;
    std::chrono::milliseconds timeout{5000};
    size_t recv_buffer_size = 2048;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    static std::expected<ClientConfig, ConfigError> load(const std::string& path);
    static std::expected<ClientConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace stunlink
