#include "client/connection_state.hpp"

namespace relaysync::client {

const char* sync_phase_name(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::DISCONNECTED: return "DISCONNECTED";
        case SyncPhase::CONNECTING: return "CONNECTING";
        case SyncPhase::CONNECTED_IDLE: return "CONNECTED_IDLE";
        case SyncPhase::ACTIVE: return "ACTIVE";
        case SyncPhase::PASSIVE: return "PASSIVE";
        default: return "UNKNOWN";
    }
}

const char* connection_status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING: return "CONNECTING";
        case ConnectionStatus::CONNECTED: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

} // namespace relaysync::client
