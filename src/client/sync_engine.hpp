#pragma once

#include "client/client_config.hpp"
#include "client/connection_manager.hpp"
#include "client/control_negotiator.hpp"
#include "client/events.hpp"
#include "client/message_dispatcher.hpp"
#include "client/outbox.hpp"
#include "client/phase_state_machine.hpp"
#include "client/session_endpoint.hpp"
#include "client/session_manager.hpp"
#include "client/transport.hpp"
#include "client/tutorial_state_sync.hpp"

#include <boost/asio.hpp>

#include <memory>
#include <optional>
#include <string>

namespace relaysync::client {

// ============================================================================
// SyncEngine - the component tree behind one RelayClient
// ============================================================================
// Every component lives on the io_context thread. Events from all of them
// funnel through emit(), which shields the components from exceptions
// thrown by the host's handler.
// ============================================================================
class SyncEngine {
public:
    SyncEngine(boost::asio::io_context& ioc, RelayClientConfig config, std::shared_ptr<Transport> transport,
               std::unique_ptr<SessionEndpoint> endpoint);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Joins session_id when given, otherwise the known session, otherwise
    // creates one first. Throws SyncException when not DISCONNECTED.
    void connect(std::optional<std::string> session_id = std::nullopt);
    void disconnect(const std::string& reason = "Disconnected by host");

    // Only while DISCONNECTED
    void create_session(const nlohmann::json& metadata, SessionEndpoint::CreateHandler handler);
    // Deletes the current session and disconnects
    void remove_session(SessionEndpoint::DeleteHandler handler);

    const RelayClientConfig& config() const { return config_; }
    PhaseStateMachine& phases() { return phases_; }
    const PhaseStateMachine& phases() const { return phases_; }
    SessionManager& session() { return session_; }
    const SessionManager& session() const { return session_; }
    ConnectionManager& connection() { return connection_; }
    const ConnectionManager& connection() const { return connection_; }
    TutorialStateSynchronizer& tutorial() { return tutorial_; }
    const TutorialStateSynchronizer& tutorial() const { return tutorial_; }
    ControlNegotiator& control() { return *control_; }
    const ControlNegotiator& control() const { return *control_; }

private:
    void emit(RelayClientEvent event);
    void open_socket();
    void wire_callbacks();

    RelayClientConfig config_;
    PhaseStateMachine phases_;
    SessionManager session_;
    ConnectionManager connection_;
    Outbox outbox_;
    TutorialStateSynchronizer tutorial_;
    std::shared_ptr<ControlNegotiator> control_;
    MessageDispatcher dispatcher_;
    bool creating_session_ = false;
};

} // namespace relaysync::client
