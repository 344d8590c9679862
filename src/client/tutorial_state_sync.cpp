#include "client/tutorial_state_sync.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SYNC_LOGGER);
    return instance;
}
} // anonymous namespace

void TutorialStateSynchronizer::send_state(const TutorialSyncState& state) {
    if (!phases_.is_active()) {
        throw SyncException(SyncErrorType::INVALID_OPERATION,
                            "Only active clients can send tutorial state");
    }
    if (auto problem = state.validate(); !problem.empty()) {
        throw SyncException(SyncErrorType::INVALID_OPERATION, "Invalid tutorial state: " + problem);
    }

    last_state_ = state;
    logger().debug("Sending state: {} step {} ({}/{})", state.tutorial_id, state.step_content.id,
                   state.step_content.index + 1, state.total_steps);
    outbox_.send(protocol::StateUpdate{state});
}

void TutorialStateSynchronizer::request_state() {
    auto phase = phases_.current_phase();
    if (phase == SyncPhase::DISCONNECTED || phase == SyncPhase::CONNECTING) {
        throw SyncException(SyncErrorType::INVALID_OPERATION, "Not connected to relay server");
    }
    outbox_.send(protocol::RequestSync{});
}

void TutorialStateSynchronizer::on_state_received(const std::string& from_client_id, TutorialSyncState state) {
    if (phases_.is_active()) {
        logger().warn("Received state from {} while active; taking it anyway", from_client_id);
    }
    logger().debug("State from {}: {} step {}", from_client_id, state.tutorial_id, state.step_content.id);
    last_state_ = state;
    emit_(TutorialStateReceivedEvent{std::move(state), from_client_id});
}

void TutorialStateSynchronizer::on_state_requested(const std::string& from_client_id) {
    if (!phases_.is_active()) {
        logger().debug("Ignoring sync request from {}: not active", from_client_id);
        return;
    }
    if (!last_state_) {
        logger().debug("Sync request from {} but no state yet", from_client_id);
        return;
    }
    outbox_.send(protocol::StateUpdate{*last_state_});
}

} // namespace relaysync::client
