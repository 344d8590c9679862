#pragma once

#include "client/connection_manager.hpp"
#include "client/control_negotiator.hpp"
#include "client/events.hpp"
#include "client/phase_state_machine.hpp"
#include "client/session_manager.hpp"
#include "client/tutorial_state_sync.hpp"
#include "common/protocol.hpp"

#include <memory>
#include <string>

namespace relaysync::client {

// ============================================================================
// MessageDispatcher - inbound frames to typed messages to components
// ============================================================================
// dispatch() never throws. Undecodable frames are reported as errors and
// dropped without touching the connection or the phase.
// ============================================================================
class MessageDispatcher {
public:
    MessageDispatcher(PhaseStateMachine& phases, SessionManager& session, ConnectionManager& connection,
                      TutorialStateSynchronizer& tutorial, std::shared_ptr<ControlNegotiator> control,
                      EventSink emit);

    void dispatch(const std::string& frame) noexcept;

private:
    void route(const protocol::SyncMessage& message);
    void on_client_id_assigned(const protocol::ClientIdAssigned& assigned);
    void report(SyncErrorType type, const std::string& message) noexcept;

    PhaseStateMachine& phases_;
    SessionManager& session_;
    ConnectionManager& connection_;
    TutorialStateSynchronizer& tutorial_;
    std::shared_ptr<ControlNegotiator> control_;
    EventSink emit_;
};

} // namespace relaysync::client
