#pragma once

#include "client/connection_manager.hpp"
#include "client/events.hpp"
#include "client/session_manager.hpp"
#include "common/protocol.hpp"

namespace relaysync::client {

// Stamps the envelope (sender, time, version), encodes and sends.
// A send without an open channel is reported as CONNECTION_LOST.
class Outbox {
public:
    Outbox(ConnectionManager& connection, SessionManager& session, EventSink emit)
        : connection_(connection), session_(session), emit_(std::move(emit)) {}

    bool send(protocol::Payload payload);

private:
    ConnectionManager& connection_;
    SessionManager& session_;
    EventSink emit_;
};

} // namespace relaysync::client
