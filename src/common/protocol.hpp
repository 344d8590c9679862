#pragma once

#include "common/tutorial_state.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace relaysync::protocol {

// ============================================================================
// Protocol Version
// ============================================================================
constexpr int PROTOCOL_VERSION = 1;

// ============================================================================
// Message Types
// ============================================================================
enum class MessageType : uint8_t {
    // Handshake / presence
    CLIENT_ID_ASSIGNED,
    CLIENT_CONNECTED,
    CLIENT_DISCONNECTED,

    // Tutorial state
    STATE_UPDATE,
    REQUEST_SYNC,

    // Control
    OFFER_CONTROL,
    ACCEPT_CONTROL,
    DECLINE_CONTROL,
    RELEASE_CONTROL,
    REQUEST_CONTROL,
    CONFIRM_TRANSFER,
    COORDINATE_SYNC_DIRECTION,
    ASSIGN_SYNC_DIRECTION,
    ROLE_CHANGED,

    // Error
    ERROR_MSG
};

enum class MessageCategory : uint8_t {
    HANDSHAKE,
    CONTROL,
    TUTORIAL_STATE,
    SYSTEM,
    ERROR
};

constexpr std::string_view message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::CLIENT_ID_ASSIGNED:        return "client_id_assigned";
        case MessageType::CLIENT_CONNECTED:          return "client_connected";
        case MessageType::CLIENT_DISCONNECTED:       return "client_disconnected";
        case MessageType::STATE_UPDATE:              return "state_update";
        case MessageType::REQUEST_SYNC:              return "request_sync";
        case MessageType::OFFER_CONTROL:             return "offer_control";
        case MessageType::ACCEPT_CONTROL:            return "accept_control";
        case MessageType::DECLINE_CONTROL:           return "decline_control";
        case MessageType::RELEASE_CONTROL:           return "release_control";
        case MessageType::REQUEST_CONTROL:           return "request_control";
        case MessageType::CONFIRM_TRANSFER:          return "confirm_transfer";
        case MessageType::COORDINATE_SYNC_DIRECTION: return "coordinate_sync_direction";
        case MessageType::ASSIGN_SYNC_DIRECTION:     return "assign_sync_direction";
        case MessageType::ROLE_CHANGED:              return "role_changed";
        case MessageType::ERROR_MSG:                 return "error";
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(std::string_view name);

constexpr MessageCategory message_category(MessageType type) {
    switch (type) {
        case MessageType::CLIENT_ID_ASSIGNED:
            return MessageCategory::HANDSHAKE;
        case MessageType::STATE_UPDATE:
        case MessageType::REQUEST_SYNC:
            return MessageCategory::TUTORIAL_STATE;
        case MessageType::CLIENT_CONNECTED:
        case MessageType::CLIENT_DISCONNECTED:
            return MessageCategory::SYSTEM;
        case MessageType::ERROR_MSG:
            return MessageCategory::ERROR;
        default:
            return MessageCategory::CONTROL;
    }
}

// Messages that a relay forwards from one peer to the other
constexpr bool is_peer_routed(MessageType type) {
    switch (type) {
        case MessageType::STATE_UPDATE:
        case MessageType::REQUEST_SYNC:
        case MessageType::OFFER_CONTROL:
        case MessageType::ACCEPT_CONTROL:
        case MessageType::DECLINE_CONTROL:
        case MessageType::RELEASE_CONTROL:
            return true;
        default:
            return false;
    }
}

enum class SyncDirection : uint8_t { ACTIVE, PASSIVE };
enum class PeerRole : uint8_t { CONNECTED, ACTIVE, PASSIVE };

constexpr std::string_view sync_direction_to_string(SyncDirection d) {
    return d == SyncDirection::ACTIVE ? "ACTIVE" : "PASSIVE";
}

constexpr std::string_view peer_role_to_string(PeerRole role) {
    switch (role) {
        case PeerRole::CONNECTED: return "CONNECTED";
        case PeerRole::ACTIVE:    return "ACTIVE";
        case PeerRole::PASSIVE:   return "PASSIVE";
    }
    return "CONNECTED";
}

// ============================================================================
// Message Payloads
// ============================================================================

struct ClientIdAssigned {
    std::string client_id;
    std::optional<std::string> session_id;
};

struct ClientConnected {
    std::string client_id;
};

struct ClientDisconnected {
    std::string client_id;
};

struct StateUpdate {
    TutorialSyncState state;
};

struct RequestSync {};

struct OfferControl {
    std::string offer_id;
    std::string from_client_id;
    std::string to_client_id;                // empty: any peer
    std::optional<TutorialSyncState> state;
    int64_t transfer_timestamp = 0;
    std::string state_checksum;              // empty when state is absent
};

// from_client_id is the peer that made the offer
struct AcceptControl {
    std::string offer_id;
    std::string from_client_id;
};

struct DeclineControl {
    std::string offer_id;
    std::string from_client_id;
};

struct ReleaseControl {};

struct RequestControl {
    std::string reason;
};

struct ConfirmTransfer {
    std::string to_client_id;
    std::string reason;
};

struct CoordinateSyncDirection {
    SyncDirection preferred = SyncDirection::PASSIVE;
    std::string reason;
};

struct AssignSyncDirection {
    SyncDirection assigned = SyncDirection::PASSIVE;
    std::string reason;
};

struct RoleChanged {
    std::string client_id;
    PeerRole role = PeerRole::CONNECTED;
};

struct ErrorNotice {
    std::string message;
    std::string code;
};

// Closed set: alternative order matches MessageType
using Payload = std::variant<
    ClientIdAssigned,
    ClientConnected,
    ClientDisconnected,
    StateUpdate,
    RequestSync,
    OfferControl,
    AcceptControl,
    DeclineControl,
    ReleaseControl,
    RequestControl,
    ConfirmTransfer,
    CoordinateSyncDirection,
    AssignSyncDirection,
    RoleChanged,
    ErrorNotice>;

MessageType payload_type(const Payload& payload);

// ============================================================================
// Envelope
// ============================================================================
struct SyncMessage {
    std::string client_id;        // sender, as stamped by the relay or the sending client
    int64_t timestamp = 0;        // milliseconds since epoch
    int protocol_version = PROTOCOL_VERSION;
    Payload payload;

    MessageType type() const { return payload_type(payload); }
};

// ============================================================================
// Codec
// ============================================================================
enum class DecodeError : uint8_t {
    MALFORMED_JSON,
    NOT_AN_OBJECT,
    MISSING_TYPE,
    UNKNOWN_TYPE,
    INVALID_FIELD,
    CHECKSUM_MISMATCH,
    UNSUPPORTED_VERSION
};

constexpr std::string_view decode_error_to_string(DecodeError error) {
    switch (error) {
        case DecodeError::MALFORMED_JSON:      return "Malformed JSON";
        case DecodeError::NOT_AN_OBJECT:       return "Message is not a JSON object";
        case DecodeError::MISSING_TYPE:        return "Missing message type";
        case DecodeError::UNKNOWN_TYPE:        return "Unknown message type";
        case DecodeError::INVALID_FIELD:       return "Invalid message field";
        case DecodeError::CHECKSUM_MISMATCH:   return "State checksum mismatch";
        case DecodeError::UNSUPPORTED_VERSION: return "Unsupported protocol version";
    }
    return "Unknown decode error";
}

struct DecodeFailure {
    DecodeError error;
    std::string detail;
};

std::expected<SyncMessage, DecodeFailure> decode(std::string_view text);

std::string encode(const SyncMessage& message);

int64_t now_millis();

} // namespace relaysync::protocol
