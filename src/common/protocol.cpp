#include "common/protocol.hpp"
#include <array>
#include <chrono>
#include <fmt/format.h>

namespace relaysync::protocol {

using json = nlohmann::json;

namespace {

constexpr std::array<MessageType, 15> ALL_TYPES = {
    MessageType::CLIENT_ID_ASSIGNED, MessageType::CLIENT_CONNECTED,
    MessageType::CLIENT_DISCONNECTED, MessageType::STATE_UPDATE,
    MessageType::REQUEST_SYNC, MessageType::OFFER_CONTROL,
    MessageType::ACCEPT_CONTROL, MessageType::DECLINE_CONTROL,
    MessageType::RELEASE_CONTROL, MessageType::REQUEST_CONTROL,
    MessageType::CONFIRM_TRANSFER, MessageType::COORDINATE_SYNC_DIRECTION,
    MessageType::ASSIGN_SYNC_DIRECTION, MessageType::ROLE_CHANGED,
    MessageType::ERROR_MSG};

static_assert(std::variant_size_v<Payload> == ALL_TYPES.size());

DecodeFailure invalid(std::string detail) {
    return DecodeFailure{DecodeError::INVALID_FIELD, std::move(detail)};
}

// Optional string field: absent or null yields an empty string
std::expected<std::string, DecodeFailure> opt_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::string{};
    }
    if (!it->is_string()) {
        return std::unexpected(invalid(fmt::format("'{}' must be a string", key)));
    }
    return it->get<std::string>();
}

std::expected<std::string, DecodeFailure> req_string(const json& obj, const char* key) {
    auto value = opt_string(obj, key);
    if (value && value->empty()) {
        return std::unexpected(invalid(fmt::format("'{}' is required", key)));
    }
    return value;
}

std::expected<SyncDirection, DecodeFailure> direction_field(const json& obj, const char* key) {
    auto value = req_string(obj, key);
    if (!value) return std::unexpected(value.error());
    if (*value == "ACTIVE") return SyncDirection::ACTIVE;
    if (*value == "PASSIVE") return SyncDirection::PASSIVE;
    return std::unexpected(invalid(fmt::format("'{}' has unknown direction '{}'", key, *value)));
}

std::expected<PeerRole, DecodeFailure> role_field(const json& obj, const char* key) {
    auto value = req_string(obj, key);
    if (!value) return std::unexpected(value.error());
    if (*value == "ACTIVE") return PeerRole::ACTIVE;
    if (*value == "PASSIVE") return PeerRole::PASSIVE;
    if (*value == "CONNECTED") return PeerRole::CONNECTED;
    return std::unexpected(invalid(fmt::format("'{}' has unknown role '{}'", key, *value)));
}

std::expected<TutorialSyncState, DecodeFailure> state_field(const json& value) {
    auto state = TutorialSyncState::from_json(value);
    if (!state) {
        return std::unexpected(invalid(state.error()));
    }
    return std::move(*state);
}

// ----------------------------------------------------------------------------
// Per-type payload decoding. `sender` is the envelope clientId.
// ----------------------------------------------------------------------------

std::expected<Payload, DecodeFailure> decode_payload(MessageType type, const json& data,
                                                     const std::string& sender) {
    switch (type) {
        case MessageType::CLIENT_ID_ASSIGNED: {
            auto id = req_string(data, "clientId");
            if (!id) return std::unexpected(id.error());
            auto session = opt_string(data, "sessionId");
            if (!session) return std::unexpected(session.error());
            ClientIdAssigned msg{std::move(*id), std::nullopt};
            if (!session->empty()) msg.session_id = std::move(*session);
            return msg;
        }

        case MessageType::CLIENT_CONNECTED:
        case MessageType::CLIENT_DISCONNECTED: {
            auto id = opt_string(data, "clientId");
            if (!id) return std::unexpected(id.error());
            std::string client = id->empty() ? sender : std::move(*id);
            if (client.empty()) return std::unexpected(invalid("'clientId' is required"));
            if (type == MessageType::CLIENT_CONNECTED) return ClientConnected{std::move(client)};
            return ClientDisconnected{std::move(client)};
        }

        case MessageType::STATE_UPDATE: {
            auto state = state_field(data);
            if (!state) return std::unexpected(state.error());
            return StateUpdate{std::move(*state)};
        }

        case MessageType::REQUEST_SYNC:
            return RequestSync{};

        case MessageType::OFFER_CONTROL: {
            OfferControl msg;
            auto offer_id = req_string(data, "offerId");
            if (!offer_id) return std::unexpected(offer_id.error());
            msg.offer_id = std::move(*offer_id);

            auto to = opt_string(data, "toClientId");
            if (!to) return std::unexpected(to.error());
            msg.to_client_id = std::move(*to);

            auto state_it = data.find("tutorialState");
            if (state_it != data.end() && !state_it->is_null()) {
                auto state = state_field(*state_it);
                if (!state) return std::unexpected(state.error());
                msg.state = std::move(*state);
            }

            msg.from_client_id = sender;
            auto meta_it = data.find("metadata");
            if (meta_it != data.end() && meta_it->is_object()) {
                auto from = opt_string(*meta_it, "fromClientId");
                if (!from) return std::unexpected(from.error());
                if (!from->empty()) msg.from_client_id = std::move(*from);

                auto checksum = opt_string(*meta_it, "stateChecksum");
                if (!checksum) return std::unexpected(checksum.error());
                msg.state_checksum = std::move(*checksum);

                auto ts = meta_it->find("transferTimestamp");
                if (ts != meta_it->end() && ts->is_number_integer()) {
                    msg.transfer_timestamp = ts->get<int64_t>();
                }
            }

            if (msg.from_client_id.empty()) {
                return std::unexpected(invalid("offer has no originating client"));
            }
            if (msg.state && !msg.state_checksum.empty() &&
                msg.state->checksum() != msg.state_checksum) {
                return std::unexpected(DecodeFailure{DecodeError::CHECKSUM_MISMATCH,
                    fmt::format("offer {} checksum {} does not match state", msg.offer_id,
                                msg.state_checksum)});
            }
            return msg;
        }

        case MessageType::ACCEPT_CONTROL:
        case MessageType::DECLINE_CONTROL: {
            auto offer_id = opt_string(data, "offerId");
            if (!offer_id) return std::unexpected(offer_id.error());
            auto from = opt_string(data, "fromClientId");
            if (!from) return std::unexpected(from.error());
            if (type == MessageType::ACCEPT_CONTROL) {
                return AcceptControl{std::move(*offer_id), std::move(*from)};
            }
            return DeclineControl{std::move(*offer_id), std::move(*from)};
        }

        case MessageType::RELEASE_CONTROL:
            return ReleaseControl{};

        case MessageType::REQUEST_CONTROL: {
            auto reason = opt_string(data, "reason");
            if (!reason) return std::unexpected(reason.error());
            return RequestControl{std::move(*reason)};
        }

        case MessageType::CONFIRM_TRANSFER: {
            auto to = opt_string(data, "toClientId");
            if (!to) return std::unexpected(to.error());
            auto reason = opt_string(data, "reason");
            if (!reason) return std::unexpected(reason.error());
            return ConfirmTransfer{std::move(*to), std::move(*reason)};
        }

        case MessageType::COORDINATE_SYNC_DIRECTION: {
            auto dir = direction_field(data, "preferredDirection");
            if (!dir) return std::unexpected(dir.error());
            auto reason = opt_string(data, "reason");
            if (!reason) return std::unexpected(reason.error());
            return CoordinateSyncDirection{*dir, std::move(*reason)};
        }

        case MessageType::ASSIGN_SYNC_DIRECTION: {
            auto dir = direction_field(data, "assignedDirection");
            if (!dir) return std::unexpected(dir.error());
            auto reason = opt_string(data, "reason");
            if (!reason) return std::unexpected(reason.error());
            return AssignSyncDirection{*dir, std::move(*reason)};
        }

        case MessageType::ROLE_CHANGED: {
            auto role = role_field(data, "role");
            if (!role) return std::unexpected(role.error());
            auto id = opt_string(data, "clientId");
            if (!id) return std::unexpected(id.error());
            std::string client = id->empty() ? sender : std::move(*id);
            if (client.empty()) return std::unexpected(invalid("'clientId' is required"));
            return RoleChanged{std::move(client), *role};
        }

        case MessageType::ERROR_MSG: {
            auto message = opt_string(data, "message");
            if (!message) return std::unexpected(message.error());
            if (message->empty()) {
                auto reason = opt_string(data, "reason");
                if (!reason) return std::unexpected(reason.error());
                *message = reason->empty() ? "Unspecified server error" : std::move(*reason);
            }
            std::string code;
            auto code_it = data.find("code");
            if (code_it != data.end()) {
                code = code_it->is_string() ? code_it->get<std::string>() : code_it->dump();
            }
            return ErrorNotice{std::move(*message), std::move(code)};
        }
    }
    return std::unexpected(DecodeFailure{DecodeError::UNKNOWN_TYPE, "unhandled type"});
}

// ----------------------------------------------------------------------------
// Payload encoding
// ----------------------------------------------------------------------------

struct PayloadEncoder {
    const SyncMessage& envelope;

    json operator()(const ClientIdAssigned& m) const {
        json data{{"clientId", m.client_id}};
        if (m.session_id) data["sessionId"] = *m.session_id;
        return data;
    }
    json operator()(const ClientConnected& m) const { return json{{"clientId", m.client_id}}; }
    json operator()(const ClientDisconnected& m) const { return json{{"clientId", m.client_id}}; }
    json operator()(const StateUpdate& m) const { return m.state.to_json(); }
    json operator()(const RequestSync&) const { return json::object(); }

    json operator()(const OfferControl& m) const {
        json metadata;
        metadata["transferTimestamp"] = m.transfer_timestamp;
        metadata["fromClientId"] = m.from_client_id.empty() ? envelope.client_id : m.from_client_id;
        metadata["toClientId"] = m.to_client_id;
        metadata["stateChecksum"] = m.state ? m.state->checksum() : std::string{};

        json data;
        data["offerId"] = m.offer_id;
        data["toClientId"] = m.to_client_id;
        data["tutorialState"] = m.state ? m.state->to_json() : json(nullptr);
        data["metadata"] = std::move(metadata);
        return data;
    }

    json operator()(const AcceptControl& m) const {
        return json{{"offerId", m.offer_id}, {"fromClientId", m.from_client_id}};
    }
    json operator()(const DeclineControl& m) const {
        return json{{"offerId", m.offer_id}, {"fromClientId", m.from_client_id}};
    }
    json operator()(const ReleaseControl&) const { return json::object(); }
    json operator()(const RequestControl& m) const { return json{{"reason", m.reason}}; }
    json operator()(const ConfirmTransfer& m) const {
        return json{{"toClientId", m.to_client_id}, {"reason", m.reason}};
    }
    json operator()(const CoordinateSyncDirection& m) const {
        return json{{"preferredDirection", std::string(sync_direction_to_string(m.preferred))},
                    {"reason", m.reason}};
    }
    json operator()(const AssignSyncDirection& m) const {
        return json{{"assignedDirection", std::string(sync_direction_to_string(m.assigned))},
                    {"reason", m.reason}};
    }
    json operator()(const RoleChanged& m) const {
        return json{{"clientId", m.client_id}, {"role", std::string(peer_role_to_string(m.role))}};
    }
    json operator()(const ErrorNotice& m) const {
        json data{{"message", m.message}};
        if (!m.code.empty()) data["code"] = m.code;
        return data;
    }
};

} // anonymous namespace

std::optional<MessageType> message_type_from_string(std::string_view name) {
    for (auto type : ALL_TYPES) {
        if (message_type_to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

MessageType payload_type(const Payload& payload) {
    return ALL_TYPES[payload.index()];
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::expected<SyncMessage, DecodeFailure> decode(std::string_view text) {
    json root = json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(DecodeFailure{DecodeError::MALFORMED_JSON, "frame is not valid JSON"});
    }
    if (!root.is_object()) {
        return std::unexpected(DecodeFailure{DecodeError::NOT_AN_OBJECT, root.type_name()});
    }

    auto type_it = root.find("type");
    if (type_it == root.end() || !type_it->is_string()) {
        return std::unexpected(DecodeFailure{DecodeError::MISSING_TYPE, "no 'type' string"});
    }
    auto type_name = type_it->get<std::string>();
    auto type = message_type_from_string(type_name);
    if (!type) {
        return std::unexpected(DecodeFailure{DecodeError::UNKNOWN_TYPE, type_name});
    }

    SyncMessage message;

    auto version_it = root.find("protocol_version");
    if (version_it != root.end() && !version_it->is_null()) {
        if (!version_it->is_number_integer()) {
            return std::unexpected(invalid("'protocol_version' must be an integer"));
        }
        message.protocol_version = version_it->get<int>();
        if (message.protocol_version != PROTOCOL_VERSION) {
            return std::unexpected(DecodeFailure{DecodeError::UNSUPPORTED_VERSION,
                fmt::format("got version {}, expected {}", message.protocol_version, PROTOCOL_VERSION)});
        }
    }

    auto sender = opt_string(root, "clientId");
    if (!sender) return std::unexpected(sender.error());
    message.client_id = std::move(*sender);

    auto ts_it = root.find("timestamp");
    if (ts_it != root.end() && ts_it->is_number()) {
        message.timestamp = ts_it->get<int64_t>();
    }

    static const json empty_object = json::object();
    const json* data = &empty_object;
    auto data_it = root.find("data");
    if (data_it != root.end() && !data_it->is_null()) {
        if (!data_it->is_object()) {
            return std::unexpected(invalid("'data' must be an object"));
        }
        data = &*data_it;
    }

    auto payload = decode_payload(*type, *data, message.client_id);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    message.payload = std::move(*payload);
    return message;
}

std::string encode(const SyncMessage& message) {
    json root;
    root["type"] = std::string(message_type_to_string(message.type()));
    root["clientId"] = message.client_id;
    root["timestamp"] = message.timestamp;
    root["protocol_version"] = message.protocol_version;
    root["data"] = std::visit(PayloadEncoder{message}, message.payload);
    return root.dump();
}

} // namespace relaysync::protocol
