#pragma once

#include "common/error.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relaysync::client {

// ============================================================================
// Session metadata as returned by the relay's session endpoint
// ============================================================================
struct SessionInfo {
    std::string id;
    std::string created_at;      // ISO-8601, as sent by the relay
    std::string expires_at;
    std::string last_activity;
    uint32_t client_count = 0;
    std::optional<std::string> active_client_id;
    std::string status;          // "active", "expired", "deleted"
    nlohmann::json metadata;

    static std::expected<SessionInfo, std::string> from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// ============================================================================
// SessionEndpoint - request/response exchange with the session API
// ============================================================================
// Completion handlers run on the client's io_context. After cancel(), handlers
// of requests that were in flight are not invoked.
// ============================================================================
class SessionEndpoint {
public:
    using CreateHandler = std::function<void(std::expected<SessionInfo, SyncError>)>;
    // nullopt when the session does not exist
    using GetHandler = std::function<void(std::expected<std::optional<SessionInfo>, SyncError>)>;
    using ListHandler = std::function<void(std::expected<std::vector<SessionInfo>, SyncError>)>;
    // false when the relay did not delete anything
    using DeleteHandler = std::function<void(std::expected<bool, SyncError>)>;

    virtual ~SessionEndpoint() = default;

    virtual void create_session(const nlohmann::json& metadata, CreateHandler handler) = 0;
    virtual void get_session(const std::string& id, GetHandler handler) = 0;
    virtual void list_sessions(ListHandler handler) = 0;
    virtual void delete_session(const std::string& id, DeleteHandler handler) = 0;
    virtual void cancel() = 0;
};

} // namespace relaysync::client
