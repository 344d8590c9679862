#include "common/error.hpp"
#include <fmt/format.h>

namespace relaysync {

SyncError make_sync_error(SyncErrorType type, std::string message,
                          std::optional<std::string> action) {
    SyncError error;
    error.type = type;
    error.message = std::move(message);
    error.timestamp = std::chrono::system_clock::now();
    error.recoverable = is_recoverable(type);
    error.action = std::move(action);
    return error;
}

std::string SyncError::to_string() const {
    if (action) {
        return fmt::format("{}: {} ({})", sync_error_type_name(type), message, *action);
    }
    return fmt::format("{}: {}", sync_error_type_name(type), message);
}

} // namespace relaysync
