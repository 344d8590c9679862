#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace relaysync {

// ============================================================================
// Sync Error Types
// ============================================================================
enum class SyncErrorType : uint8_t {
    CONNECTION_FAILED,
    CONNECTION_LOST,
    INVALID_MESSAGE,
    SERVER_ERROR,
    TIMEOUT,
    MAX_RECONNECT_ATTEMPTS_EXCEEDED,
    PROTOCOL_VERSION,
    INVALID_STATE_TRANSITION,
    INVALID_OPERATION
};

constexpr std::string_view sync_error_type_name(SyncErrorType type) {
    switch (type) {
        case SyncErrorType::CONNECTION_FAILED:               return "CONNECTION_FAILED";
        case SyncErrorType::CONNECTION_LOST:                 return "CONNECTION_LOST";
        case SyncErrorType::INVALID_MESSAGE:                 return "INVALID_MESSAGE";
        case SyncErrorType::SERVER_ERROR:                    return "SERVER_ERROR";
        case SyncErrorType::TIMEOUT:                         return "TIMEOUT";
        case SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED: return "MAX_RECONNECT_ATTEMPTS_EXCEEDED";
        case SyncErrorType::PROTOCOL_VERSION:                return "PROTOCOL_VERSION";
        case SyncErrorType::INVALID_STATE_TRANSITION:        return "INVALID_STATE_TRANSITION";
        case SyncErrorType::INVALID_OPERATION:               return "INVALID_OPERATION";
    }
    return "UNKNOWN";
}

// Whether the condition clears without the host doing anything (retry, next frame)
constexpr bool is_recoverable(SyncErrorType type) {
    switch (type) {
        case SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED:
        case SyncErrorType::PROTOCOL_VERSION:
        case SyncErrorType::INVALID_STATE_TRANSITION:
        case SyncErrorType::INVALID_OPERATION:
            return false;
        default:
            return true;
    }
}

// ============================================================================
// SyncError - asynchronous error value delivered through the event handler
// ============================================================================
struct SyncError {
    SyncErrorType type = SyncErrorType::INVALID_OPERATION;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    bool recoverable = false;
    std::optional<std::string> action;  // suggested host action, if any

    std::string to_string() const;
};

SyncError make_sync_error(SyncErrorType type, std::string message,
                          std::optional<std::string> action = std::nullopt);

// ============================================================================
// SyncException - synchronous misuse of the client API
// ============================================================================
class SyncException : public std::runtime_error {
public:
    SyncException(SyncErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    SyncErrorType type() const noexcept { return type_; }

private:
    SyncErrorType type_;
};

} // namespace relaysync
