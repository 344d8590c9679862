#include "client/message_dispatcher.hpp"
#include "common/log.hpp"

#include <fmt/format.h>

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::PROTOCOL_LOGGER);
    return instance;
}

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
} // anonymous namespace

MessageDispatcher::MessageDispatcher(PhaseStateMachine& phases, SessionManager& session,
                                     ConnectionManager& connection, TutorialStateSynchronizer& tutorial,
                                     std::shared_ptr<ControlNegotiator> control, EventSink emit)
    : phases_(phases)
    , session_(session)
    , connection_(connection)
    , tutorial_(tutorial)
    , control_(std::move(control))
    , emit_(std::move(emit)) {}

void MessageDispatcher::dispatch(const std::string& frame) noexcept {
    logger().trace("<< {}", frame);

    try {
        auto message = protocol::decode(frame);
        if (!message) {
            const auto& failure = message.error();
            auto text = fmt::format("{}: {}", protocol::decode_error_to_string(failure.error), failure.detail);
            logger().warn("Dropping frame: {}", text);
            report(failure.error == protocol::DecodeError::UNSUPPORTED_VERSION
                       ? SyncErrorType::PROTOCOL_VERSION
                       : SyncErrorType::INVALID_MESSAGE,
                   text);
            return;
        }

        if (protocol::is_peer_routed(message->type()) && !message->client_id.empty() &&
            session_.client_id() == message->client_id) {
            logger().trace("Ignoring echo of our own {}", protocol::message_type_to_string(message->type()));
            return;
        }

        route(*message);
    } catch (const SyncException& e) {
        logger().error("Handling frame failed: {}", e.what());
        report(e.type(), e.what());
    } catch (const std::exception& e) {
        logger().error("Handling frame failed: {}", e.what());
        report(SyncErrorType::INVALID_MESSAGE, e.what());
    }
}

void MessageDispatcher::route(const protocol::SyncMessage& message) {
    const std::string& sender = message.client_id;
    logger().debug("Received {} from {}", protocol::message_type_to_string(message.type()),
                   sender.empty() ? std::string("relay") : sender);

    std::visit(overloaded{
        [&](const protocol::ClientIdAssigned& m) { on_client_id_assigned(m); },
        [&](const protocol::ClientConnected& m) {
            logger().info("Peer {} joined", m.client_id);
            emit_(ClientConnectedEvent{m.client_id});
        },
        [&](const protocol::ClientDisconnected& m) {
            logger().info("Peer {} left", m.client_id);
            control_->on_peer_disconnected(m.client_id);
            emit_(ClientDisconnectedEvent{m.client_id});
        },
        [&](const protocol::StateUpdate& m) { tutorial_.on_state_received(sender, m.state); },
        [&](const protocol::RequestSync&) { tutorial_.on_state_requested(sender); },
        [&](const protocol::OfferControl& m) { control_->on_offer(sender, m); },
        [&](const protocol::AcceptControl& m) { control_->on_accept(sender, m); },
        [&](const protocol::DeclineControl& m) { control_->on_decline(sender, m); },
        [&](const protocol::ReleaseControl&) { control_->on_release(sender); },
        [&](const protocol::RequestControl&) {
            logger().debug("Ignoring request_control from {}: arbitrated by the relay", sender);
        },
        [&](const protocol::ConfirmTransfer& m) { control_->on_confirm(m); },
        [&](const protocol::CoordinateSyncDirection&) {
            logger().debug("Ignoring coordinate_sync_direction from {}", sender);
        },
        [&](const protocol::AssignSyncDirection& m) { control_->on_direction_assigned(m); },
        [&](const protocol::RoleChanged& m) { control_->on_role_changed(m); },
        [&](const protocol::ErrorNotice& m) {
            logger().warn("Relay error{}: {}", m.code.empty() ? std::string() : " " + m.code, m.message);
            control_->on_server_error(m);
            report(SyncErrorType::SERVER_ERROR, m.message);
        },
    }, message.payload);
}

void MessageDispatcher::on_client_id_assigned(const protocol::ClientIdAssigned& assigned) {
    if (phases_.current_phase() != SyncPhase::CONNECTING) {
        logger().warn("Unexpected client id assignment in phase {}", sync_phase_name(phases_.current_phase()));
        return;
    }

    session_.on_handshake(assigned.client_id, assigned.session_id);
    connection_.handshake_complete();
    phases_.set_phase(SyncPhase::CONNECTED_IDLE, "Client id assigned");
    emit_(ConnectedEvent{assigned.client_id, session_.id().value_or("")});
}

void MessageDispatcher::report(SyncErrorType type, const std::string& message) noexcept {
    try {
        emit_(ErrorEvent{make_sync_error(type, message)});
    } catch (const std::exception& e) {
        logger().error("Failed to report error: {}", e.what());
    }
}

} // namespace relaysync::client
