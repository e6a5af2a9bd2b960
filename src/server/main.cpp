#include "server/stun_server.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace stunlink;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>     Configuration file (JSON)\n"
              << "  -l, --listen <address>  Listen address (default: 0.0.0.0)\n"
              << "  -p, --port <port>       Listen port (default: 3478)\n"
              << "      --log-level <level> trace, debug, info, warn, error, off\n"
              << "  -h, --help              Show this help message\n"
              << "\n"
              << "Environment (used when no config file is given):\n"
              << "  STUNLINK_LOG_LEVEL, STUNLINK_LOG_FILE\n"
              << std::endl;
}

std::optional<uint16_t> parse_port(std::string_view text) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> listen_override;
    std::optional<uint16_t> port_override;
    std::optional<log::Level> level_override;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            listen_override = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port_override = parse_port(argv[++i]);
            if (!port_override) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            level_override = log::parse_level(argv[++i]);
            if (!level_override) {
                std::cerr << "Invalid log level: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServerConfig config;
    if (!config_path.empty()) {
        auto loaded = ServerConfig::load(config_path);
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
    if (listen_override) config.listen_address = *listen_override;
    if (port_override) config.port = *port_override;

    if (!crypto::init()) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return 1;
    }

    LOG_INFO("stunlink server starting");
    if (!config_path.empty()) {
        LOG_INFO("Configuration loaded from: {}", config_path);
    }
    LOG_DEBUG("Listen {}:{}, max_inflight {}, recv_buffer_size {}",
              config.listen_address, config.port, config.max_inflight, config.recv_buffer_size);

    try {
        boost::asio::io_context ioc(static_cast<int>(config.threads));

        StunServer server(ioc, config);
        if (auto started = server.start(); !started) {
            LOG_ERROR("Failed to start: {}", error_code_to_string(started.error()));
            return 1;
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (ec) {
                LOG_WARN("Signal wait failed: {}", ec.message());
                server.stop();
                return;
            }
            // Once the socket is closed the io_context runs out of work
            LOG_INFO("Received signal {}, shutting down...", signal_number);
            server.stop();
        });

        std::vector<std::thread> workers;
        for (size_t i = 1; i < config.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }

        LOG_INFO("Server running with {} IO thread(s)", config.threads);
        ioc.run();

        for (auto& worker : workers) {
            worker.join();
        }

        LOG_INFO("Server stopped");
        log::shutdown();
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
