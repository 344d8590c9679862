#pragma once

#include "client/connection_state.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace relaysync::client {

struct PhaseChange {
    SyncPhase previous;
    SyncPhase phase;
    std::string reason;
};

// ============================================================================
// PhaseStateMachine - single source of truth for the SyncPhase
// ============================================================================
class PhaseStateMachine {
public:
    using Listener = std::function<void(const PhaseChange&)>;

    PhaseStateMachine() = default;

    PhaseStateMachine(const PhaseStateMachine&) = delete;
    PhaseStateMachine& operator=(const PhaseStateMachine&) = delete;

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    // Applies a legal transition and notifies the listener.
    // Throws SyncException(INVALID_STATE_TRANSITION) and keeps the current phase otherwise.
    // DISCONNECTED -> DISCONNECTED is accepted as a silent no-op.
    void set_phase(SyncPhase next, std::string_view reason);

    // Always legal; no-op when already DISCONNECTED
    void force_disconnected(std::string_view reason);

    SyncPhase current_phase() const { return phase_; }

    static bool is_legal(SyncPhase from, SyncPhase to);

    bool is_connected() const {
        return phase_ == SyncPhase::CONNECTED_IDLE || phase_ == SyncPhase::ACTIVE ||
               phase_ == SyncPhase::PASSIVE;
    }
    bool is_active() const { return phase_ == SyncPhase::ACTIVE; }
    bool is_passive() const { return phase_ == SyncPhase::PASSIVE; }
    bool is_idle() const { return phase_ == SyncPhase::CONNECTED_IDLE; }

private:
    SyncPhase phase_ = SyncPhase::DISCONNECTED;
    Listener listener_;
};

} // namespace relaysync::client
