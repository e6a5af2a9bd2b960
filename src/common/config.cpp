#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <charconv>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace stunlink {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::CONFIG_LOGGER);
    return instance;
}

std::unexpected<ConfigError> invalid(std::string_view key) {
    logger().error("Invalid value for '{}'", key);
    return std::unexpected(ConfigError::INVALID_VALUE);
}

// Typed field accessors: an absent key yields the default, a key of the
// wrong JSON type is INVALID_VALUE.

std::expected<std::string, ConfigError> jstr(const json::object& obj, std::string_view key,
                                             const std::string& def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (!it->value().is_string()) return invalid(key);
    return std::string(it->value().as_string());
}

std::expected<uint64_t, ConfigError> juint(const json::object& obj, std::string_view key,
                                           uint64_t def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (it->value().is_uint64()) return it->value().as_uint64();
    if (it->value().is_int64() && it->value().as_int64() >= 0) {
        return static_cast<uint64_t>(it->value().as_int64());
    }
    return invalid(key);
}

std::expected<uint64_t, ConfigError> juint_range(const json::object& obj, std::string_view key,
                                                 uint64_t def, uint64_t min, uint64_t max) {
    auto value = juint(obj, key, def);
    if (!value) return value;
    if (*value < min || *value > max) return invalid(key);
    return value;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

std::expected<json::object, ConfigError> parse_root(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            logger().error("Configuration root must be a JSON object");
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        return std::move(jv.as_object());
    } catch (const boost::system::system_error& e) {
        logger().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

std::expected<std::string, ConfigError> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger().error("Cannot open configuration file: {}", path);
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// "log": { "level": "...", "file": "..." }
std::expected<void, ConfigError> parse_log_section(const json::object& root,
                                                   std::string& level, std::string& file) {
    auto* log_sec = jsection(root, "log");
    if (!log_sec) return {};

    auto lvl = jstr(*log_sec, "level", level);
    if (!lvl) return std::unexpected(lvl.error());
    if (!log::parse_level(*lvl)) return invalid("log.level");
    level = *lvl;

    auto path = jstr(*log_sec, "file", file);
    if (!path) return std::unexpected(path.error());
    file = *path;
    return {};
}

}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        default: return "Unknown configuration error";
    }
}

std::expected<std::pair<std::string, uint16_t>, ConfigError>
parse_host_port(std::string_view text, uint16_t default_port) {
    std::string_view host = text;
    std::string_view port_part;

    if (!host.empty() && host.front() == '[') {
        // [v6addr]:port
        auto bracket = host.find(']');
        if (bracket == std::string_view::npos) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        auto rest = host.substr(bracket + 1);
        host = host.substr(1, bracket - 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return std::unexpected(ConfigError::INVALID_VALUE);
            port_part = rest.substr(1);
            if (port_part.empty()) return std::unexpected(ConfigError::INVALID_VALUE);
        }
    } else if (auto colon = host.rfind(':'); colon != std::string_view::npos) {
        // A bare IPv6 literal has several colons and no port
        if (host.find(':') == colon) {
            port_part = host.substr(colon + 1);
            host = host.substr(0, colon);
            if (port_part.empty()) return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }

    if (host.empty()) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    uint16_t port = default_port;
    if (!port_part.empty()) {
        unsigned int value = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), value);
        if (ec != std::errc() || ptr != port_part.data() + port_part.size() ||
            value == 0 || value > 65535) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        port = static_cast<uint16_t>(value);
    }

    return std::make_pair(std::string(host), port);
}

// ============================================================================
// ServerConfig
// ============================================================================

std::expected<ServerConfig, ConfigError> ServerConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) return std::unexpected(content.error());
    return parse(*content);
}

std::expected<ServerConfig, ConfigError> ServerConfig::parse(const std::string& json_content) {
    auto root = parse_root(json_content);
    if (!root) return std::unexpected(root.error());

    ServerConfig config;

    if (auto* server = jsection(*root, "server")) {
        auto address = jstr(*server, "listen_address", config.listen_address);
        if (!address) return std::unexpected(address.error());
        config.listen_address = *address;

        auto port = juint_range(*server, "port", config.port, 1, 65535);
        if (!port) return std::unexpected(port.error());
        config.port = static_cast<uint16_t>(*port);

        auto threads = juint_range(*server, "threads", config.threads, 1, 256);
        if (!threads) return std::unexpected(threads.error());
        config.threads = static_cast<size_t>(*threads);

        auto inflight = juint_range(*server, "max_inflight", config.max_inflight, 1, 65536);
        if (!inflight) return std::unexpected(inflight.error());
        config.max_inflight = static_cast<size_t>(*inflight);

        auto buffer = juint_range(*server, "recv_buffer_size", config.recv_buffer_size, 20, 65535);
        if (!buffer) return std::unexpected(buffer.error());
        config.recv_buffer_size = static_cast<size_t>(*buffer);
    }

    if (auto r = parse_log_section(*root, config.log_level, config.log_file); !r) {
        return std::unexpected(r.error());
    }

    return config;
}

// ============================================================================
// ClientConfig
// ============================================================================

std::expected<ClientConfig, ConfigError> ClientConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) return std::unexpected(content.error());
    return parse(*content);
}

std::expected<ClientConfig, ConfigError> ClientConfig::parse(const std::string& json_content) {
    auto root = parse_root(json_content);
    if (!root) return std::unexpected(root.error());

    ClientConfig config;

    if (auto* client = jsection(*root, "client")) {
        auto server = jstr(*client, "server", {});
        if (!server) return std::unexpected(server.error());
        if (!server->empty()) {
            auto host_port = parse_host_port(*server, DEFAULT_STUN_PORT);
            if (!host_port) return invalid("client.server");
            config.server_host = host_port->first;
            config.server_port = host_port->second;
        }

        auto timeout = juint_range(*client, "timeout_ms", config.timeout.count(), 1, 600000);
        if (!timeout) return std::unexpected(timeout.error());
        config.timeout = std::chrono::milliseconds(*timeout);

        auto buffer = juint_range(*client, "recv_buffer_size", config.recv_buffer_size, 20, 65535);
        if (!buffer) return std::unexpected(buffer.error());
        config.recv_buffer_size = static_cast<size_t>(*buffer);
    }

    if (auto r = parse_log_section(*root, config.log_level, config.log_file); !r) {
        return std::unexpected(r.error());
    }

    return config;
}

} // namespace stunlink
