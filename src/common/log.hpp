#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relaysync {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "relaysync";
constexpr const char* CONNECTION_LOGGER = "connection";
constexpr const char* TRANSPORT_LOGGER = "transport";
constexpr const char* SESSION_LOGGER = "session";
constexpr const char* CONTROL_LOGGER = "control";
constexpr const char* SYNC_LOGGER = "sync";
constexpr const char* PROTOCOL_LOGGER = "protocol";

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
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{5 * 1024 * 1024};  // 5 MB
    size_t max_files{3};
};

// ============================================================================
// Initialization
// ============================================================================

// Initialize logging with the given configuration. Later calls are ignored.
void init(const LogConfig& config = LogConfig{});

// Initialize logging from base, overridden by environment variables
// RELAYSYNC_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// RELAYSYNC_LOG_FILE: path to a rotating log file
void init_from_env(LogConfig base = LogConfig{});

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Set log level for all loggers
void set_level(Level level);

Level get_level();

bool is_level_enabled(Level level);

void flush();

void shutdown();

// Parses "trace".."off" (also "warning", "err", "crit"); nullopt for anything else
std::optional<Level> level_from_string(std::string_view name);

std::string_view level_name(Level level);

spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Trace)) {
            get(name_)->trace(fmt, std::forward<Args>(args)...);
        }
    }

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

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// ============================================================================
// Convenience macros for one-off messages on a named logger
// ============================================================================

#define NLOG_TRACE(name, ...) ::relaysync::log::Logger(name).trace(__VA_ARGS__)
#define NLOG_DEBUG(name, ...) ::relaysync::log::Logger(name).debug(__VA_ARGS__)
#define NLOG_INFO(name, ...) ::relaysync::log::Logger(name).info(__VA_ARGS__)
#define NLOG_WARN(name, ...) ::relaysync::log::Logger(name).warn(__VA_ARGS__)
#define NLOG_ERROR(name, ...) ::relaysync::log::Logger(name).error(__VA_ARGS__)

} // namespace log
} // namespace relaysync
