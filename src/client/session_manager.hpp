#pragma once

#include "client/session_endpoint.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relaysync::client {

// ============================================================================
// SessionManager - SessionId and ClientId for the connection
// ============================================================================
// A SessionId supplied by the host outlives disconnects. One issued by the
// relay (create() or the handshake) is connection-scoped and is dropped on
// the final disconnect. The ClientId is dropped on every connection loss.
// ============================================================================
class SessionManager {
public:
    explicit SessionManager(std::unique_ptr<SessionEndpoint> endpoint);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Session API requests; results also update the stored session
    void create(const nlohmann::json& metadata, SessionEndpoint::CreateHandler handler);
    void refresh(SessionEndpoint::GetHandler handler);
    void list(SessionEndpoint::ListHandler handler);
    void remove(SessionEndpoint::DeleteHandler handler);

    // Drops results of requests still in flight
    void cancel_pending();

    // Host-supplied session to join
    void supply(std::string session_id);

    const std::optional<std::string>& id() const { return session_id_; }
    const std::optional<SessionInfo>& info() const { return info_; }
    bool is_server_issued() const { return session_id_.has_value() && server_issued_; }

    void on_handshake(const std::string& client_id, const std::optional<std::string>& session_id);
    const std::optional<std::string>& client_id() const { return client_id_; }

    void on_connection_lost();
    void on_connection_closed();

private:
    std::unique_ptr<SessionEndpoint> endpoint_;
    std::optional<std::string> session_id_;
    std::optional<SessionInfo> info_;
    std::optional<std::string> client_id_;
    bool server_issued_ = false;
    uint64_t generation_ = 0;
};

} // namespace relaysync::client
