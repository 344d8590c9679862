#include "client/outbox.hpp"
#include "common/log.hpp"

#include <fmt/format.h>

namespace relaysync::client {

bool Outbox::send(protocol::Payload payload) {
    protocol::SyncMessage message;
    message.client_id = session_.client_id().value_or("");
    message.timestamp = protocol::now_millis();
    message.payload = std::move(payload);

    auto type = protocol::message_type_to_string(message.type());
    if (!connection_.send(protocol::encode(message))) {
        NLOG_WARN(log::PROTOCOL_LOGGER, "Dropped outgoing {}: not connected", type);
        emit_(ErrorEvent{make_sync_error(SyncErrorType::CONNECTION_LOST,
                                         fmt::format("Not connected to relay server; {} not sent", type))});
        return false;
    }
    NLOG_DEBUG(log::PROTOCOL_LOGGER, "Sent {}", type);
    return true;
}

} // namespace relaysync::client
