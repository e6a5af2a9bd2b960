#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <optional>
#include <string_view>

namespace stunlink {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "stunlink";
constexpr const char* SERVER_LOGGER = "stun.server";
constexpr const char* CLIENT_LOGGER = "stun.client";
constexpr const char* CONFIG_LOGGER = "config";

// ============================================================================
// Log Levels (runtime configurable)
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{5};
};

// ============================================================================
// Initialization
// ============================================================================

// Initialize logging with the given configuration
void init(const LogConfig& config = LogConfig{});

// Initialize logging from environment variables
// STUNLINK_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// STUNLINK_LOG_FILE: path to log file
void init_from_env();

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Set log level for all loggers (runtime configurable)
void set_level(Level level);

// Get current log level
Level get_level();

// Check if a level is enabled (for conditional logging)
bool is_level_enabled(Level level);

// Shutdown logging
void shutdown();

// Parse a level name ("debug", "warn", ...); unknown names yield nullopt
std::optional<Level> parse_level(std::string_view name);

// Convert Level to spdlog level
spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Template logging functions - check level at runtime
// ============================================================================

template<typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Debug)) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Info)) {
        get()->info(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Warn)) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Error)) {
        get()->error(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Critical)) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }
}

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    explicit Logger(const std::string& name) : name_(name) {}

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Debug)) {
            get(name_)->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Info)) {
            get(name_)->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Warn)) {
            get(name_)->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Error)) {
            get(name_)->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Critical)) {
            get(name_)->critical(fmt, std::forward<Args>(args)...);
        }
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define LOG_DEBUG(...) ::stunlink::log::debug(__VA_ARGS__)
#define LOG_INFO(...) ::stunlink::log::info(__VA_ARGS__)
#define LOG_WARN(...) ::stunlink::log::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::stunlink::log::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::stunlink::log::critical(__VA_ARGS__)


} // namespace log
} // namespace stunlink
