#pragma once

#include "client/control_offer.hpp"
#include "client/events.hpp"
#include "client/outbox.hpp"
#include "client/phase_state_machine.hpp"
#include "client/session_manager.hpp"
#include "client/tutorial_state_sync.hpp"
#include "common/protocol.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace relaysync::client {

// ============================================================================
// ControlNegotiator - handoff of the ACTIVE role
// ============================================================================
// Outbound: offer_to_peer() sends one offer at a time; the phase only moves
// when the peer accepts. Inbound: each offer becomes one ControlOfferEvent
// that refers back here by offer id, and the first accept() or decline()
// resolves it.
//
// The relay arbitrates take_control() races. The client follows the latest
// role_changed broadcast.
// ============================================================================
class ControlNegotiator : public OfferResolver,
                          public std::enable_shared_from_this<ControlNegotiator> {
public:
    ControlNegotiator(PhaseStateMachine& phases, SessionManager& session, Outbox& outbox,
                      TutorialStateSynchronizer& tutorial, EventSink emit);

    // Throws SyncException(INVALID_OPERATION) on phase or argument misuse
    void offer_to_peer(const std::string& target_client_id);
    void take_control();
    void release();
    void request_direction(protocol::SyncDirection direction,
                           std::optional<TutorialSyncState> initial_state = std::nullopt);

    // OfferResolver
    bool resolve_offer(const std::string& offer_id, OfferDecision decision) override;
    bool is_offer_pending(const std::string& offer_id) const override;

    // Inbound protocol messages
    void on_offer(const std::string& sender, const protocol::OfferControl& offer);
    void on_accept(const std::string& sender, const protocol::AcceptControl& accept);
    void on_decline(const std::string& sender, const protocol::DeclineControl& decline);
    void on_release(const std::string& sender);
    void on_confirm(const protocol::ConfirmTransfer& confirm);
    void on_direction_assigned(const protocol::AssignSyncDirection& assign);
    void on_role_changed(const protocol::RoleChanged& role);
    void on_peer_disconnected(const std::string& client_id);
    void on_server_error(const protocol::ErrorNotice& notice);

    // Forgets all negotiation state (connection lost or closed)
    void reset();

    // Peer currently believed to be ACTIVE (ourselves included), if any
    const std::optional<std::string>& known_active() const { return known_active_; }

private:
    struct InboundOffer {
        std::string from_client_id;
        std::optional<TutorialSyncState> state;
    };

    std::string local_id() const { return session_.client_id().value_or(""); }
    bool is_self(const std::string& client_id) const;

    PhaseStateMachine& phases_;
    SessionManager& session_;
    Outbox& outbox_;
    TutorialStateSynchronizer& tutorial_;
    EventSink emit_;

    std::map<std::string, InboundOffer> inbound_offers_;
    std::optional<std::string> outbound_offer_id_;
    std::string outbound_target_;
    std::optional<std::string> known_active_;
    std::optional<protocol::SyncDirection> direction_requested_;
    bool control_requested_ = false;
    uint64_t offer_seq_ = 0;
};

} // namespace relaysync::client
