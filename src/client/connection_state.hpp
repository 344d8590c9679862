#pragma once

#include <cstdint>

namespace relaysync::client {

// ============================================================================
// Sync phase - local session lifecycle
// ============================================================================
//
//   DISCONNECTED -> CONNECTING -> CONNECTED_IDLE -> { ACTIVE, PASSIVE }
//   ACTIVE <-> PASSIVE
//   any -> DISCONNECTED
//
// ============================================================================
enum class SyncPhase : uint8_t {
    DISCONNECTED = 0,   // no relay connection
    CONNECTING,         // socket opening or handshake pending
    CONNECTED_IDLE,     // handshake done, no role chosen
    ACTIVE,             // drives the tutorial state
    PASSIVE,            // follows the active peer
};

const char* sync_phase_name(SyncPhase phase);

// ============================================================================
// Transport connection status, tracked independently of the phase
// ============================================================================
enum class ConnectionStatus : uint8_t {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED,
};

const char* connection_status_name(ConnectionStatus status);

} // namespace relaysync::client
