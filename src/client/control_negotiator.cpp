#include "client/control_negotiator.hpp"
#include "common/error.hpp"
#include "common/log.hpp"

#include <fmt/format.h>

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::CONTROL_LOGGER);
    return instance;
}

[[noreturn]] void invalid_operation(const std::string& message) {
    throw SyncException(SyncErrorType::INVALID_OPERATION, message);
}
} // anonymous namespace

ControlNegotiator::ControlNegotiator(PhaseStateMachine& phases, SessionManager& session, Outbox& outbox,
                                     TutorialStateSynchronizer& tutorial, EventSink emit)
    : phases_(phases)
    , session_(session)
    , outbox_(outbox)
    , tutorial_(tutorial)
    , emit_(std::move(emit)) {}

bool ControlNegotiator::is_self(const std::string& client_id) const {
    const auto& me = session_.client_id();
    return me.has_value() && *me == client_id;
}

// ============================================================================
// Host commands
// ============================================================================

void ControlNegotiator::offer_to_peer(const std::string& target_client_id) {
    if (!phases_.is_active()) {
        invalid_operation("Only active clients can offer control");
    }
    if (!target_client_id.empty() && is_self(target_client_id)) {
        invalid_operation("Cannot offer control to ourselves");
    }
    if (outbound_offer_id_) {
        invalid_operation(fmt::format("Control offer {} is still outstanding", *outbound_offer_id_));
    }

    protocol::OfferControl offer;
    offer.offer_id = fmt::format("{}-{}", local_id(), ++offer_seq_);
    offer.from_client_id = local_id();
    offer.to_client_id = target_client_id;
    offer.state = tutorial_.last_state();
    offer.transfer_timestamp = protocol::now_millis();

    auto offer_id = offer.offer_id;
    logger().info("Offering control to {} (offer {})",
                  target_client_id.empty() ? std::string("any peer") : target_client_id, offer_id);
    if (outbox_.send(std::move(offer))) {
        outbound_offer_id_ = std::move(offer_id);
        outbound_target_ = target_client_id;
    }
}

void ControlNegotiator::take_control() {
    if (!phases_.is_idle() && !phases_.is_passive()) {
        invalid_operation(fmt::format("Cannot take control while {}", sync_phase_name(phases_.current_phase())));
    }
    if (known_active_ && !is_self(*known_active_)) {
        invalid_operation(fmt::format("Client {} is already active", *known_active_));
    }
    if (control_requested_) {
        invalid_operation("A control request is already pending");
    }

    logger().info("Requesting control");
    if (outbox_.send(protocol::RequestControl{"take_control"})) {
        control_requested_ = true;
    }
}

void ControlNegotiator::release() {
    if (!phases_.is_active()) {
        invalid_operation("Only active clients can release control");
    }

    outbound_offer_id_.reset();
    outbound_target_.clear();
    known_active_.reset();
    phases_.set_phase(SyncPhase::PASSIVE, "Released control");
    outbox_.send(protocol::ReleaseControl{});
}

void ControlNegotiator::request_direction(protocol::SyncDirection direction,
                                          std::optional<TutorialSyncState> initial_state) {
    if (!phases_.is_idle()) {
        invalid_operation(fmt::format("Sync direction can only be chosen while idle (now {})",
                                      sync_phase_name(phases_.current_phase())));
    }
    if (direction_requested_) {
        invalid_operation("A sync direction request is already pending");
    }

    if (direction == protocol::SyncDirection::PASSIVE && initial_state) {
        tutorial_.adopt(*initial_state);
    }

    logger().info("Requesting sync direction {}", protocol::sync_direction_to_string(direction));
    protocol::CoordinateSyncDirection request;
    request.preferred = direction;
    request.reason = direction == protocol::SyncDirection::ACTIVE ? "Host wants to drive the tutorial"
                                                                  : "Host wants to follow the tutorial";
    if (outbox_.send(std::move(request))) {
        direction_requested_ = direction;
    }
}

// ============================================================================
// Offer resolution
// ============================================================================

bool ControlNegotiator::is_offer_pending(const std::string& offer_id) const {
    return inbound_offers_.contains(offer_id);
}

bool ControlNegotiator::resolve_offer(const std::string& offer_id, OfferDecision decision) {
    auto it = inbound_offers_.find(offer_id);
    if (it == inbound_offers_.end()) {
        logger().debug("Offer {} already resolved", offer_id);
        return false;
    }

    if (decision == OfferDecision::ACCEPT && !phases_.is_passive() && !phases_.is_idle()) {
        invalid_operation(fmt::format("Cannot accept control while {}", sync_phase_name(phases_.current_phase())));
    }

    InboundOffer offer = std::move(it->second);
    inbound_offers_.erase(it);

    if (decision == OfferDecision::DECLINE) {
        logger().info("Declining control offer {} from {}", offer_id, offer.from_client_id);
        outbox_.send(protocol::DeclineControl{offer_id, offer.from_client_id});
        return true;
    }

    logger().info("Accepting control offer {} from {}", offer_id, offer.from_client_id);
    if (offer.state) {
        tutorial_.adopt(*offer.state);
    }
    control_requested_ = false;
    known_active_ = local_id();
    phases_.set_phase(SyncPhase::ACTIVE, fmt::format("Accepted control from {}", offer.from_client_id));
    outbox_.send(protocol::AcceptControl{offer_id, offer.from_client_id});
    return true;
}

// ============================================================================
// Inbound messages
// ============================================================================

void ControlNegotiator::on_offer(const std::string& sender, const protocol::OfferControl& offer) {
    if (!offer.to_client_id.empty() && !is_self(offer.to_client_id)) {
        logger().debug("Ignoring offer {} addressed to {}", offer.offer_id, offer.to_client_id);
        return;
    }
    if (inbound_offers_.contains(offer.offer_id)) {
        logger().debug("Duplicate offer {}", offer.offer_id);
        return;
    }

    std::string from = offer.from_client_id.empty() ? sender : offer.from_client_id;
    if (phases_.is_active()) {
        logger().warn("Control offered by {} while we are active", from);
    }
    logger().info("Control offered by {} (offer {})", from, offer.offer_id);

    inbound_offers_.emplace(offer.offer_id, InboundOffer{from, offer.state});
    emit_(ControlOfferedEvent{ControlOfferEvent(weak_from_this(), offer.offer_id, from, offer.state)});
}

void ControlNegotiator::on_accept(const std::string& sender, const protocol::AcceptControl& accept) {
    if (!outbound_offer_id_ || *outbound_offer_id_ != accept.offer_id) {
        logger().debug("Ignoring accept for unknown offer {}", accept.offer_id);
        return;
    }
    outbound_offer_id_.reset();
    outbound_target_.clear();
    known_active_ = sender;

    if (phases_.is_active()) {
        phases_.set_phase(SyncPhase::PASSIVE, fmt::format("Control transferred to {}", sender));
        outbox_.send(protocol::ConfirmTransfer{sender, "Control offer accepted"});
    }
    emit_(ControlAcceptedEvent{sender});
}

void ControlNegotiator::on_decline(const std::string& sender, const protocol::DeclineControl& decline) {
    if (!outbound_offer_id_ || *outbound_offer_id_ != decline.offer_id) {
        logger().debug("Ignoring decline for unknown offer {}", decline.offer_id);
        return;
    }
    logger().info("Control offer {} declined by {}", decline.offer_id, sender);
    outbound_offer_id_.reset();
    outbound_target_.clear();
    emit_(ControlDeclinedEvent{sender});
}

void ControlNegotiator::on_release(const std::string& sender) {
    if (!known_active_ || *known_active_ == sender) {
        known_active_.reset();
    }
    logger().info("Control released by {}", sender);
    emit_(ControlReleasedEvent{sender});
}

void ControlNegotiator::on_confirm(const protocol::ConfirmTransfer& confirm) {
    if (!confirm.to_client_id.empty() && !is_self(confirm.to_client_id)) {
        known_active_ = confirm.to_client_id;
        control_requested_ = false;
        if (phases_.is_active()) {
            phases_.set_phase(SyncPhase::PASSIVE, fmt::format("Control confirmed to {}", confirm.to_client_id));
        }
        return;
    }

    control_requested_ = false;
    known_active_ = local_id();
    if (phases_.is_idle() || phases_.is_passive()) {
        phases_.set_phase(SyncPhase::ACTIVE,
                          confirm.reason.empty() ? std::string("Control confirmed") : confirm.reason);
    }
}

void ControlNegotiator::on_direction_assigned(const protocol::AssignSyncDirection& assign) {
    direction_requested_.reset();

    auto target = assign.assigned == protocol::SyncDirection::ACTIVE ? SyncPhase::ACTIVE : SyncPhase::PASSIVE;
    if (phases_.current_phase() != target) {
        phases_.set_phase(target, assign.reason.empty()
                                      ? fmt::format("Assigned {}", protocol::sync_direction_to_string(assign.assigned))
                                      : assign.reason);
    }
    if (target == SyncPhase::ACTIVE) {
        known_active_ = local_id();
    }
}

void ControlNegotiator::on_role_changed(const protocol::RoleChanged& role) {
    bool self = is_self(role.client_id);

    if (role.role == protocol::PeerRole::ACTIVE) {
        known_active_ = role.client_id;
        if (self) {
            control_requested_ = false;
            if (phases_.is_idle() || phases_.is_passive()) {
                phases_.set_phase(SyncPhase::ACTIVE, "Relay reports us active");
            }
        } else {
            outbound_offer_id_.reset();
            outbound_target_.clear();
            if (phases_.is_active()) {
                phases_.set_phase(SyncPhase::PASSIVE, fmt::format("Client {} took control", role.client_id));
            }
        }
    } else if (known_active_ && *known_active_ == role.client_id) {
        known_active_.reset();
        if (self && role.role == protocol::PeerRole::PASSIVE && phases_.is_active()) {
            phases_.set_phase(SyncPhase::PASSIVE, "Relay reports us passive");
        }
    }

    if (!self) {
        emit_(PeerRoleChangedEvent{role.client_id, role.role});
    }
}

void ControlNegotiator::on_peer_disconnected(const std::string& client_id) {
    if (known_active_ && *known_active_ == client_id) {
        known_active_.reset();
    }
    std::erase_if(inbound_offers_, [&](const auto& entry) { return entry.second.from_client_id == client_id; });
    if (outbound_offer_id_ && outbound_target_ == client_id) {
        logger().info("Dropping offer {}: {} left", *outbound_offer_id_, client_id);
        outbound_offer_id_.reset();
        outbound_target_.clear();
    }
}

void ControlNegotiator::on_server_error(const protocol::ErrorNotice& notice) {
    if (control_requested_ || direction_requested_) {
        logger().warn("Relay rejected pending request: {}", notice.message);
    }
    control_requested_ = false;
    direction_requested_.reset();
}

void ControlNegotiator::reset() {
    inbound_offers_.clear();
    outbound_offer_id_.reset();
    outbound_target_.clear();
    known_active_.reset();
    direction_requested_.reset();
    control_requested_ = false;
}

} // namespace relaysync::client
