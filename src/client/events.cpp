#include "client/events.hpp"
#include <iterator>

namespace relaysync::client {

namespace {

constexpr const char* EVENT_NAMES[] = {
    "connected",
    "disconnected",
    "connectionStatusChanged",
    "reconnecting",
    "phaseChanged",
    "sessionCreated",
    "clientConnected",
    "clientDisconnected",
    "peerRoleChanged",
    "tutorialStateReceived",
    "controlOffered",
    "controlAccepted",
    "controlDeclined",
    "controlReleased",
    "error",
};

static_assert(std::size(EVENT_NAMES) == std::variant_size_v<RelayClientEvent>);

} // anonymous namespace

const char* event_name(const RelayClientEvent& event) {
    return EVENT_NAMES[event.index()];
}

} // namespace relaysync::client
