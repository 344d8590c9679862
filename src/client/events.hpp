#pragma once

#include "client/connection_state.hpp"
#include "client/control_offer.hpp"
#include "client/session_endpoint.hpp"
#include "common/error.hpp"
#include "common/protocol.hpp"
#include "common/tutorial_state.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace relaysync::client {

// ============================================================================
// Events delivered to the host's single event handler
// ============================================================================

struct ConnectedEvent {
    std::string client_id;
    std::string session_id;
};

struct DisconnectedEvent {
    std::string reason;
    bool will_reconnect = false;
};

struct ConnectionStatusChangedEvent {
    ConnectionStatus status;
};

struct ReconnectingEvent {
    uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
};

struct PhaseChangedEvent {
    SyncPhase phase;
    SyncPhase previous;
    std::string reason;
};

struct SessionCreatedEvent {
    SessionInfo session;
};

struct ClientConnectedEvent {
    std::string client_id;
};

struct ClientDisconnectedEvent {
    std::string client_id;
};

struct PeerRoleChangedEvent {
    std::string client_id;
    protocol::PeerRole role;
};

struct TutorialStateReceivedEvent {
    TutorialSyncState state;
    std::string from_client_id;
};

struct ControlOfferedEvent {
    ControlOfferEvent offer;
};

struct ControlAcceptedEvent {
    std::string by_client_id;
};

struct ControlDeclinedEvent {
    std::string by_client_id;
};

struct ControlReleasedEvent {
    std::string from_client_id;
};

struct ErrorEvent {
    SyncError error;
};

using RelayClientEvent = std::variant<
    ConnectedEvent,
    DisconnectedEvent,
    ConnectionStatusChangedEvent,
    ReconnectingEvent,
    PhaseChangedEvent,
    SessionCreatedEvent,
    ClientConnectedEvent,
    ClientDisconnectedEvent,
    PeerRoleChangedEvent,
    TutorialStateReceivedEvent,
    ControlOfferedEvent,
    ControlAcceptedEvent,
    ControlDeclinedEvent,
    ControlReleasedEvent,
    ErrorEvent>;

using EventHandler = std::function<void(const RelayClientEvent&)>;

// Internal fan-in used by the components
using EventSink = std::function<void(RelayClientEvent)>;

const char* event_name(const RelayClientEvent& event);

} // namespace relaysync::client
