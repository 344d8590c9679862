#pragma once

#include "client/events.hpp"
#include "client/outbox.hpp"
#include "client/phase_state_machine.hpp"
#include "common/tutorial_state.hpp"

#include <optional>
#include <string>

namespace relaysync::client {

// ============================================================================
// TutorialStateSynchronizer - cached tutorial state with phase-gated access
// ============================================================================
// The cache holds whatever was sent or received last. It survives
// disconnects.
// ============================================================================
class TutorialStateSynchronizer {
public:
    TutorialStateSynchronizer(PhaseStateMachine& phases, Outbox& outbox, EventSink emit)
        : phases_(phases), outbox_(outbox), emit_(std::move(emit)) {}

    // Throws SyncException unless ACTIVE or if the state is malformed
    void send_state(const TutorialSyncState& state);

    // Throws SyncException while DISCONNECTED or CONNECTING
    void request_state();

    const std::optional<TutorialSyncState>& last_state() const { return last_state_; }

    // Replaces the cache without sending (accepted offer, initial passive state)
    void adopt(const TutorialSyncState& state) { last_state_ = state; }

    void on_state_received(const std::string& from_client_id, TutorialSyncState state);
    void on_state_requested(const std::string& from_client_id);

private:
    PhaseStateMachine& phases_;
    Outbox& outbox_;
    EventSink emit_;
    std::optional<TutorialSyncState> last_state_;
};

} // namespace relaysync::client
