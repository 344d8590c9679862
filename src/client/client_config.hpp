#pragma once

#include "client/events.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace relaysync {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

namespace client {

// ============================================================================
// Relay Client Configuration
// ============================================================================
// Every default lives here and nowhere else.
// ============================================================================

struct RelayClientConfig {
    // Relay WebSocket endpoint, e.g. ws://localhost:8080/ws
    std::string server_url;
    // Session API path, resolved against the HTTP form of server_url
    std::string session_endpoint = "/api/sessions";

    EventHandler event_handler;

    bool auto_reconnect = true;
    uint32_t max_reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_delay{1000};
    // Covers socket open plus the relay handshake
    std::chrono::milliseconds connection_timeout{5000};
    // Session API requests
    std::chrono::milliseconds request_timeout{10000};

    // SSL/TLS settings
    bool ssl_verify = false;  // Verify server certificate (default: false for dev)
    std::string user_agent = "relaysync/1.0";

    // Logging (applied by the host, not by the client)
    std::string log_level = "info";
    std::string log_file;

    std::expected<void, ConfigError> validate() const;

    // Load from a JSON file
    static std::expected<RelayClientConfig, ConfigError> load(const std::string& path);

    // Parse from a JSON string
    static std::expected<RelayClientConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace client
} // namespace relaysync
