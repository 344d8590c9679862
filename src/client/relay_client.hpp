#pragma once

#include "client/client_config.hpp"
#include "client/connection_state.hpp"
#include "client/phase_state_machine.hpp"
#include "client/session_endpoint.hpp"
#include "client/sync_engine.hpp"
#include "client/transport.hpp"
#include "common/tutorial_state.hpp"

#include <boost/asio.hpp>

#include <memory>
#include <optional>
#include <string>

namespace relaysync::client {

// ============================================================================
// RelayClient - host-facing facade
// ============================================================================
// Grouped operations over one SyncEngine. Synchronous misuse throws
// SyncException; everything asynchronous arrives through the event handler
// given in the config.
//
//   RelayClient client(ioc, config);
//   client.connect("session-42");
//   ...
//   if (client.is.active()) client.tutorial.send_state(state);
// ============================================================================
class RelayClient {
public:
    class SessionOps {
    public:
        explicit SessionOps(SyncEngine& engine) : engine_(engine) {}

        std::optional<std::string> id() const { return engine_.session().id(); }
        std::optional<SessionInfo> info() const { return engine_.session().info(); }

        // Only while disconnected
        void create(const nlohmann::json& metadata = nlohmann::json::object(),
                    SessionEndpoint::CreateHandler handler = nullptr) {
            engine_.create_session(metadata, std::move(handler));
        }
        void refresh(SessionEndpoint::GetHandler handler) { engine_.session().refresh(std::move(handler)); }
        void list(SessionEndpoint::ListHandler handler) { engine_.session().list(std::move(handler)); }
        // Deletes the current session, then disconnects
        void remove(SessionEndpoint::DeleteHandler handler = nullptr) {
            engine_.remove_session(std::move(handler));
        }

    private:
        SyncEngine& engine_;
    };

    class TutorialOps {
    public:
        explicit TutorialOps(SyncEngine& engine) : engine_(engine) {}

        void send_state(const TutorialSyncState& state) { engine_.tutorial().send_state(state); }
        void request_state() { engine_.tutorial().request_state(); }
        std::optional<TutorialSyncState> last_state() const { return engine_.tutorial().last_state(); }

    private:
        SyncEngine& engine_;
    };

    class ControlOps {
    public:
        explicit ControlOps(SyncEngine& engine) : engine_(engine) {}

        void take_control() { engine_.control().take_control(); }
        void offer_to_peer(const std::string& client_id) { engine_.control().offer_to_peer(client_id); }
        void release() { engine_.control().release(); }
        std::optional<std::string> active_client() const { return engine_.control().known_active(); }

    private:
        SyncEngine& engine_;
    };

    class SyncOps {
    public:
        explicit SyncOps(SyncEngine& engine) : engine_(engine) {}

        void as_active() { engine_.control().request_direction(protocol::SyncDirection::ACTIVE); }
        void as_passive(std::optional<TutorialSyncState> initial_state = std::nullopt) {
            engine_.control().request_direction(protocol::SyncDirection::PASSIVE, std::move(initial_state));
        }

    private:
        SyncEngine& engine_;
    };

    class StatusOps {
    public:
        explicit StatusOps(const SyncEngine& engine) : engine_(engine) {}

        bool connected() const { return engine_.phases().is_connected(); }
        bool active() const { return engine_.phases().is_active(); }
        bool passive() const { return engine_.phases().is_passive(); }
        bool idle() const { return engine_.phases().is_idle(); }

    private:
        const SyncEngine& engine_;
    };

    // WebSocket transport and HTTP session endpoint on ioc.
    // Throws std::invalid_argument for an unusable config.
    RelayClient(boost::asio::io_context& ioc, RelayClientConfig config);

    // Caller-provided transport and session endpoint
    RelayClient(boost::asio::io_context& ioc, RelayClientConfig config, std::shared_ptr<Transport> transport,
                std::unique_ptr<SessionEndpoint> endpoint);

    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    // Creates a session first when none is known
    void connect();
    void connect(const std::string& session_id);
    void disconnect();

    SyncPhase current_phase() const { return engine_->phases().current_phase(); }
    ConnectionStatus connection_status() const { return engine_->connection().status(); }
    std::optional<std::string> client_id() const { return engine_->session().client_id(); }

    // Direct access to the phase machine, for hosts that drive phases themselves
    PhaseStateMachine& phases() { return engine_->phases(); }

private:
    std::unique_ptr<SyncEngine> engine_;

public:
    SessionOps session;
    TutorialOps tutorial;
    ControlOps control;
    SyncOps sync;
    StatusOps is;
};

} // namespace relaysync::client
