#include "client/phase_state_machine.hpp"
#include "common/error.hpp"
#include "common/log.hpp"
#include <fmt/format.h>

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SYNC_LOGGER);
    return instance;
}
} // anonymous namespace

bool PhaseStateMachine::is_legal(SyncPhase from, SyncPhase to) {
    if (to == SyncPhase::DISCONNECTED) {
        return true;
    }
    switch (from) {
        case SyncPhase::DISCONNECTED:
            return to == SyncPhase::CONNECTING;
        case SyncPhase::CONNECTING:
            return to == SyncPhase::CONNECTED_IDLE;
        case SyncPhase::CONNECTED_IDLE:
            return to == SyncPhase::ACTIVE || to == SyncPhase::PASSIVE;
        case SyncPhase::ACTIVE:
            return to == SyncPhase::PASSIVE;
        case SyncPhase::PASSIVE:
            return to == SyncPhase::ACTIVE;
    }
    return false;
}

void PhaseStateMachine::set_phase(SyncPhase next, std::string_view reason) {
    if (next == SyncPhase::DISCONNECTED && phase_ == SyncPhase::DISCONNECTED) {
        return;
    }

    if (!is_legal(phase_, next)) {
        auto message = fmt::format("Invalid phase transition {} -> {} ({})",
                                   sync_phase_name(phase_), sync_phase_name(next), reason);
        logger().error("{}", message);
        throw SyncException(SyncErrorType::INVALID_STATE_TRANSITION, message);
    }

    PhaseChange change{phase_, next, std::string(reason)};
    phase_ = next;
    logger().info("Phase: {} -> {} ({})", sync_phase_name(change.previous),
                  sync_phase_name(next), change.reason);

    if (listener_) {
        listener_(change);
    }
}

void PhaseStateMachine::force_disconnected(std::string_view reason) {
    set_phase(SyncPhase::DISCONNECTED, reason);
}

} // namespace relaysync::client
