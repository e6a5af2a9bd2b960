#include "client/stun_client.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"

#include <boost/asio.hpp>
#include <charconv>
#include <iostream>
#include <optional>
#include <string>

using namespace stunlink;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [host[:port]]\n"
              << "Discover the public address of this host via a STUN server.\n"
              << "Options:\n"
              << "  -c, --config <file>     Configuration file (JSON)\n"
              << "  -t, --timeout <ms>      Response timeout (default: 5000)\n"
              << "      --log-level <level> trace, debug, info, warn, error, off\n"
              << "  -h, --help              Show this help message\n"
              << "\n"
              << "Default server: stun.l.google.com:19302\n"
              << std::endl;
}

std::optional<unsigned int> parse_uint(std::string_view text) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> server_override;
    std::optional<unsigned int> timeout_override;
    std::optional<log::Level> level_override;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            timeout_override = parse_uint(argv[++i]);
            if (!timeout_override) {
                std::cerr << "Invalid timeout: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            level_override = log::parse_level(argv[++i]);
            if (!level_override) {
                std::cerr << "Invalid log level: " << argv[i] << std::endl;
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-' && !server_override) {
            server_override = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ClientConfig config;
    if (!config_path.empty()) {
        auto loaded = ClientConfig::load(config_path);
        if (!loaded) {
            std::cerr << "Error: " << config_error_message(loaded.error())
                      << " (" << config_path << ")" << std::endl;
            return 1;
        }
        config = std::move(*loaded);

        log::LogConfig log_config;
        log_config.level = log::parse_level(config.log_level).value_or(log::Level::Info);
        log_config.file_path = config.log_file;
        log::init(log_config);
    } else {
        log::init_from_env();
    }

    if (level_override) log::set_level(*level_override);

    if (server_override) {
        auto host_port = parse_host_port(*server_override, DEFAULT_STUN_PORT);
        if (!host_port) {
            std::cerr << "Invalid server address: " << *server_override << std::endl;
            return 1;
        }
        config.server_host = host_port->first;
        config.server_port = host_port->second;
    }
    if (timeout_override) config.timeout = std::chrono::milliseconds(*timeout_override);

    if (!crypto::init()) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return 1;
    }
    LOG_DEBUG("Querying {}:{} (timeout {}ms)",
              config.server_host, config.server_port, config.timeout.count());

    try {
        boost::asio::io_context ioc;
        StunClient client(ioc, config);

        auto mapped = client.query_mapped_address_sync();
        if (!mapped) {
            std::cerr << "Error: " << error_code_to_string(mapped.error()) << std::endl;
            return 1;
        }

        std::cout << "XOR Mapped Address: " << mapped->to_string() << std::endl;
        log::shutdown();
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
