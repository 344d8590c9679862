#pragma once

#include "common/tutorial_state.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relaysync::client {

enum class OfferDecision : uint8_t { ACCEPT, DECLINE };

// Implemented by the negotiator that owns the pending offers
class OfferResolver {
public:
    virtual ~OfferResolver() = default;

    // Returns false if the offer is unknown or already resolved
    virtual bool resolve_offer(const std::string& offer_id, OfferDecision decision) = 0;
    virtual bool is_offer_pending(const std::string& offer_id) const = 0;
};

// ============================================================================
// ControlOfferEvent - a peer offers us the ACTIVE role
// ============================================================================
// A command object naming the offer by id. accept() and decline() ask the
// negotiator to resolve it; only the first call on any copy has an effect.
// ============================================================================
class ControlOfferEvent {
public:
    ControlOfferEvent(std::weak_ptr<OfferResolver> resolver, std::string offer_id,
                      std::string from_client_id, std::optional<TutorialSyncState> state)
        : resolver_(std::move(resolver))
        , offer_id_(std::move(offer_id))
        , from_client_id_(std::move(from_client_id))
        , state_(std::move(state)) {}

    const std::string& offer_id() const { return offer_id_; }
    const std::string& from_client_id() const { return from_client_id_; }
    const std::optional<TutorialSyncState>& state() const { return state_; }

    // Throws SyncException if the current phase cannot become ACTIVE; the
    // offer then stays pending.
    void accept() const { resolve(OfferDecision::ACCEPT); }
    void decline() const { resolve(OfferDecision::DECLINE); }

    bool pending() const {
        auto resolver = resolver_.lock();
        return resolver && resolver->is_offer_pending(offer_id_);
    }

private:
    void resolve(OfferDecision decision) const {
        if (auto resolver = resolver_.lock()) {
            resolver->resolve_offer(offer_id_, decision);
        }
    }

    std::weak_ptr<OfferResolver> resolver_;
    std::string offer_id_;
    std::string from_client_id_;
    std::optional<TutorialSyncState> state_;
};

} // namespace relaysync::client
