#include "common/log.hpp"
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relaysync::log {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
std::vector<spdlog::sink_ptr> g_sinks;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level{Level::Info};

// All named loggers share one set of sinks so that a rotating file is opened once.
void build_sinks() {
    g_sinks.clear();
    auto spdlog_level = to_spdlog_level(g_config.level);

    if (g_config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        g_sinks.push_back(console_sink);
    }

    if (!g_config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            g_config.file_path, g_config.max_file_size, g_config.max_files);
        file_sink->set_level(spdlog_level);
        g_sinks.push_back(file_sink);
    }
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    logger->set_level(to_spdlog_level(g_config.level));
    logger->set_pattern(g_config.pattern);
    return logger;
}

} // anonymous namespace

std::optional<Level> level_from_string(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error" || name == "err") return Level::Error;
    if (name == "critical" || name == "crit") return Level::Critical;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
        case Level::Off: return "off";
    }
    return "info";
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    if (g_initialized) {
        return;
    }

    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    build_sinks();
    g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
    g_initialized = true;
}

void init_from_env(LogConfig base) {
    LogConfig config = std::move(base);

    if (const char* level = std::getenv("RELAYSYNC_LOG_LEVEL")) {
        config.level = level_from_string(level).value_or(config.level);
    }

    if (const char* file = std::getenv("RELAYSYNC_LOG_FILE")) {
        config.file_path = file;
    }

    init(config);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Auto-initialize with whatever g_config holds (set_level may have run first)
    if (!g_initialized) {
        build_sinks();
        g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
        g_initialized = true;
    }

    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) {
        return it->second;
    }

    auto logger = create_logger(name);
    g_loggers[name] = logger;
    return logger;
}

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config.level = level;
    g_current_level.store(level, std::memory_order_relaxed);

    auto spdlog_level = to_spdlog_level(level);
    for (auto& sink : g_sinks) {
        sink->set_level(spdlog_level);
    }
    for (auto& [name, logger] : g_loggers) {
        logger->set_level(spdlog_level);
    }
}

Level get_level() {
    return g_current_level.load(std::memory_order_relaxed);
}

bool is_level_enabled(Level level) {
    return level != Level::Off &&
           static_cast<int>(level) >= static_cast<int>(g_current_level.load(std::memory_order_relaxed));
}

void flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
    g_loggers.clear();
    g_sinks.clear();
    g_initialized = false;
}

} // namespace relaysync::log
