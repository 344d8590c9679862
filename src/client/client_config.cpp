#include "client/client_config.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace relaysync {

using json = nlohmann::json;

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

namespace client {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::MAIN_LOGGER);
    return instance;
}

// Reads an optional field of the expected JSON kind. Returns false on a kind mismatch.
template<typename T>
bool read_field(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) return false;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) return false;
    } else {
        if (!it->is_number_integer() || it->template get<int64_t>() < 0) return false;
    }
    out = it->template get<T>();
    return true;
}

bool read_millis(const json& obj, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    if (!read_field(obj, key, ms)) {
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

} // anonymous namespace

std::expected<void, ConfigError> RelayClientConfig::validate() const {
    if (server_url.empty()) {
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    auto parts = UrlComponents::parse(server_url);
    if (!parts || !parts->is_websocket()) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (session_endpoint.empty() || session_endpoint.front() != '/') {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

std::expected<RelayClientConfig, ConfigError> RelayClientConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<RelayClientConfig, ConfigError> RelayClientConfig::parse(const std::string& json_content) {
    json root = json::parse(json_content, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        logger().error("Config is not a JSON object");
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    RelayClientConfig config;
    bool ok = true;

    // [server]
    if (auto it = root.find("server"); it != root.end() && it->is_object()) {
        ok &= read_field(*it, "url", config.server_url);
        ok &= read_field(*it, "session_endpoint", config.session_endpoint);
    }

    // [reconnect]
    if (auto it = root.find("reconnect"); it != root.end() && it->is_object()) {
        ok &= read_field(*it, "enabled", config.auto_reconnect);
        ok &= read_field(*it, "max_attempts", config.max_reconnect_attempts);
        ok &= read_millis(*it, "delay_ms", config.reconnect_delay);
    }

    ok &= read_millis(root, "connection_timeout_ms", config.connection_timeout);
    ok &= read_millis(root, "request_timeout_ms", config.request_timeout);
    ok &= read_field(root, "user_agent", config.user_agent);

    // [tls]
    if (auto it = root.find("tls"); it != root.end() && it->is_object()) {
        ok &= read_field(*it, "verify", config.ssl_verify);
    }

    // [log]
    if (auto it = root.find("log"); it != root.end() && it->is_object()) {
        ok &= read_field(*it, "level", config.log_level);
        ok &= read_field(*it, "file", config.log_file);
    }

    if (!ok) {
        logger().error("Config has a field of the wrong type");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (!log::level_from_string(config.log_level)) {
        logger().error("Unknown log level '{}'", config.log_level);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    // The URL may still come from the command line; validate() checks it later
    if (config.server_url.empty()) {
        return config;
    }
    auto valid = config.validate();
    if (!valid) {
        logger().error("Config rejected: {}", config_error_message(valid.error()));
        return std::unexpected(valid.error());
    }
    return config;
}

} // namespace client
} // namespace relaysync
