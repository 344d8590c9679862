#include "client/session_manager.hpp"
#include "common/log.hpp"

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SESSION_LOGGER);
    return instance;
}
} // anonymous namespace

SessionManager::SessionManager(std::unique_ptr<SessionEndpoint> endpoint)
    : endpoint_(std::move(endpoint)) {}

SessionManager::~SessionManager() {
    cancel_pending();
}

void SessionManager::cancel_pending() {
    ++generation_;
    if (endpoint_) {
        endpoint_->cancel();
    }
}

void SessionManager::create(const nlohmann::json& metadata, SessionEndpoint::CreateHandler handler) {
    endpoint_->create_session(metadata,
        [this, gen = generation_, handler = std::move(handler)](std::expected<SessionInfo, SyncError> result) {
            if (gen != generation_) {
                return;
            }
            if (result) {
                session_id_ = result->id;
                info_ = *result;
                server_issued_ = true;
                logger().info("Session {} created", result->id);
            } else {
                logger().warn("Session creation failed: {}", result.error().message);
            }
            handler(std::move(result));
        });
}

void SessionManager::refresh(SessionEndpoint::GetHandler handler) {
    if (!session_id_) {
        handler(std::optional<SessionInfo>{});
        return;
    }
    endpoint_->get_session(*session_id_,
        [this, gen = generation_, requested = *session_id_, handler = std::move(handler)](
            std::expected<std::optional<SessionInfo>, SyncError> result) {
            if (gen != generation_) {
                return;
            }
            if (result && *result && session_id_ == requested) {
                info_ = **result;
            }
            handler(std::move(result));
        });
}

void SessionManager::list(SessionEndpoint::ListHandler handler) {
    endpoint_->list_sessions(
        [this, gen = generation_, handler = std::move(handler)](
            std::expected<std::vector<SessionInfo>, SyncError> result) {
            if (gen != generation_) {
                return;
            }
            handler(std::move(result));
        });
}

void SessionManager::remove(SessionEndpoint::DeleteHandler handler) {
    if (!session_id_) {
        handler(false);
        return;
    }
    endpoint_->delete_session(*session_id_,
        [this, gen = generation_, requested = *session_id_, handler = std::move(handler)](
            std::expected<bool, SyncError> result) {
            if (gen != generation_) {
                return;
            }
            if (result && session_id_ == requested) {
                session_id_.reset();
                info_.reset();
                server_issued_ = false;
            }
            handler(std::move(result));
        });
}

void SessionManager::supply(std::string session_id) {
    if (session_id_ != session_id) {
        info_.reset();
    }
    session_id_ = std::move(session_id);
    server_issued_ = false;
}

void SessionManager::on_handshake(const std::string& client_id, const std::optional<std::string>& session_id) {
    client_id_ = client_id;
    if (session_id && !session_id_) {
        session_id_ = *session_id;
        server_issued_ = true;
    } else if (session_id && *session_id != *session_id_) {
        logger().warn("Relay placed us in session {} instead of {}", *session_id, *session_id_);
        session_id_ = *session_id;
        info_.reset();
        server_issued_ = true;
    }
    logger().info("Assigned client id {} in session {}", client_id, session_id_.value_or("?"));
}

void SessionManager::on_connection_lost() {
    client_id_.reset();
}

void SessionManager::on_connection_closed() {
    client_id_.reset();
    if (server_issued_) {
        session_id_.reset();
        info_.reset();
        server_issued_ = false;
    }
}

} // namespace relaysync::client
