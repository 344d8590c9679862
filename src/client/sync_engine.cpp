#include "client/sync_engine.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::MAIN_LOGGER);
    return instance;
}

ReconnectPolicy make_policy(const RelayClientConfig& config) {
    ReconnectPolicy policy;
    policy.auto_reconnect = config.auto_reconnect;
    policy.max_attempts = config.max_reconnect_attempts;
    policy.delay = config.reconnect_delay;
    policy.connection_timeout = config.connection_timeout;
    return policy;
}
} // anonymous namespace

SyncEngine::SyncEngine(boost::asio::io_context& ioc, RelayClientConfig config,
                       std::shared_ptr<Transport> transport, std::unique_ptr<SessionEndpoint> endpoint)
    : config_(std::move(config))
    , session_(std::move(endpoint))
    , connection_(ioc, std::move(transport), make_policy(config_), phases_)
    , outbox_(connection_, session_, [this](RelayClientEvent e) { emit(std::move(e)); })
    , tutorial_(phases_, outbox_, [this](RelayClientEvent e) { emit(std::move(e)); })
    , control_(std::make_shared<ControlNegotiator>(phases_, session_, outbox_, tutorial_,
                                                   [this](RelayClientEvent e) { emit(std::move(e)); }))
    , dispatcher_(phases_, session_, connection_, tutorial_, control_,
                  [this](RelayClientEvent e) { emit(std::move(e)); }) {
    wire_callbacks();
}

SyncEngine::~SyncEngine() {
    phases_.set_listener(nullptr);
    connection_.set_callbacks({});
    session_.cancel_pending();
}

void SyncEngine::wire_callbacks() {
    phases_.set_listener([this](const PhaseChange& change) {
        emit(PhaseChangedEvent{change.phase, change.previous, change.reason});
    });

    ConnectionCallbacks callbacks;
    callbacks.on_message = [this](const std::string& text) { dispatcher_.dispatch(text); };
    callbacks.on_status_changed = [this](ConnectionStatus status) {
        emit(ConnectionStatusChangedEvent{status});
    };
    callbacks.on_error = [this](const SyncError& error) {
        if (error.type == SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED) {
            session_.on_connection_closed();
        }
        emit(ErrorEvent{error});
    };
    callbacks.on_closed = [this](const std::string& reason, bool will_reconnect) {
        control_->reset();
        if (will_reconnect) {
            session_.on_connection_lost();
        } else {
            session_.on_connection_closed();
        }
        emit(DisconnectedEvent{reason, will_reconnect});
    };
    callbacks.on_reconnect_scheduled = [this](uint32_t attempt, std::chrono::milliseconds delay) {
        emit(ReconnectingEvent{attempt, delay});
    };
    connection_.set_callbacks(std::move(callbacks));
}

void SyncEngine::emit(RelayClientEvent event) {
    logger().debug("Event: {}", event_name(event));
    if (!config_.event_handler) {
        return;
    }
    try {
        config_.event_handler(event);
    } catch (const std::exception& e) {
        logger().error("Event handler threw on {}: {}", event_name(event), e.what());
    }
}

void SyncEngine::connect(std::optional<std::string> session_id) {
    if (phases_.current_phase() != SyncPhase::DISCONNECTED) {
        throw SyncException(SyncErrorType::INVALID_OPERATION,
                            std::string("Already ") + sync_phase_name(phases_.current_phase()));
    }
    if (creating_session_) {
        throw SyncException(SyncErrorType::INVALID_OPERATION, "Session creation already in progress");
    }

    if (session_id) {
        if (session_id->empty()) {
            throw SyncException(SyncErrorType::INVALID_OPERATION, "Session id must not be empty");
        }
        session_.supply(std::move(*session_id));
    }

    if (session_.id()) {
        open_socket();
        return;
    }

    logger().info("No session yet, creating one");
    creating_session_ = true;
    session_.create(nlohmann::json::object(), [this](std::expected<SessionInfo, SyncError> result) {
        creating_session_ = false;
        if (!result) {
            emit(ErrorEvent{result.error()});
            return;
        }
        emit(SessionCreatedEvent{*result});
        if (phases_.current_phase() == SyncPhase::DISCONNECTED) {
            open_socket();
        }
    });
}

void SyncEngine::open_socket() {
    connection_.connect(append_query(config_.server_url, "session", *session_.id()));
}

void SyncEngine::disconnect(const std::string& reason) {
    creating_session_ = false;
    session_.cancel_pending();
    control_->reset();
    connection_.disconnect(reason);
    session_.on_connection_closed();
}

void SyncEngine::create_session(const nlohmann::json& metadata, SessionEndpoint::CreateHandler handler) {
    if (phases_.current_phase() != SyncPhase::DISCONNECTED) {
        throw SyncException(SyncErrorType::INVALID_OPERATION, "Sessions can only be created while disconnected");
    }
    session_.create(metadata, [this, handler = std::move(handler)](std::expected<SessionInfo, SyncError> result) {
        if (result) {
            emit(SessionCreatedEvent{*result});
        }
        if (handler) {
            handler(std::move(result));
        }
    });
}

void SyncEngine::remove_session(SessionEndpoint::DeleteHandler handler) {
    session_.remove([this, handler = std::move(handler)](std::expected<bool, SyncError> result) {
        if (result && *result) {
            disconnect("Session removed");
        }
        if (handler) {
            handler(std::move(result));
        }
    });
}

} // namespace relaysync::client
