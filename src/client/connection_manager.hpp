#pragma once

#include "client/connection_state.hpp"
#include "client/phase_state_machine.hpp"
#include "client/transport.hpp"
#include "common/error.hpp"

#include <utility>  // needed before Boost 1.74 asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relaysync::client {

struct ReconnectPolicy {
    bool auto_reconnect = true;
    uint32_t max_attempts = 5;
    std::chrono::milliseconds delay{1000};
    std::chrono::milliseconds connection_timeout{5000};
};

// ============================================================================
// Connection Callbacks
// ============================================================================
struct ConnectionCallbacks {
    std::function<void()> on_open;
    std::function<void(const std::string& text)> on_message;
    std::function<void(ConnectionStatus)> on_status_changed;
    std::function<void(const SyncError&)> on_error;
    // Channel went away. will_reconnect is false when this ends the connection.
    std::function<void(const std::string& reason, bool will_reconnect)> on_closed;
    std::function<void(uint32_t attempt, std::chrono::milliseconds delay)> on_reconnect_scheduled;
};

// ============================================================================
// ConnectionManager - transport lifecycle and retry policy
// ============================================================================
// Owns the transport. Moves the phase through CONNECTING on every attempt
// and to DISCONNECTED whenever the channel goes away; everything else is
// forwarded through the callbacks.
//
// The connect timer covers the socket open plus the relay handshake, which
// the owner marks with handshake_complete().
// ============================================================================
class ConnectionManager {
public:
    ConnectionManager(boost::asio::io_context& ioc, std::shared_ptr<Transport> transport,
                      ReconnectPolicy policy, PhaseStateMachine& phases);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_callbacks(ConnectionCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    // Starts a fresh connection sequence with the attempt counter at zero
    void connect(const std::string& url);

    // Cancels timers and any attempt in flight, closes the transport and
    // forces the phase to DISCONNECTED. Safe to call repeatedly.
    void disconnect(const std::string& reason = "Disconnected by host");

    // false when no channel is open
    bool send(const std::string& payload);

    void handshake_complete();

    ConnectionStatus status() const { return status_; }
    bool is_open() const { return link_ == Link::OPEN; }
    bool reconnect_pending() const { return link_ == Link::WAITING_RETRY; }
    uint32_t reconnect_attempts() const { return attempts_; }
    const std::string& url() const { return url_; }
    const ReconnectPolicy& policy() const { return policy_; }

private:
    enum class Link : uint8_t {
        IDLE,
        OPENING,
        OPEN,
        WAITING_RETRY,
    };

    void start_attempt();
    void arm_connect_timer();
    void handle_open();
    void handle_message(const std::string& text);
    void handle_error(const std::string& what);
    void handle_close(const std::string& reason);
    void fail_link(const std::string& reason);
    void schedule_reconnect(const std::string& reason);
    void set_status(ConnectionStatus status);
    void report(SyncError error);

    std::shared_ptr<Transport> transport_;
    ReconnectPolicy policy_;
    PhaseStateMachine& phases_;
    ConnectionCallbacks callbacks_;

    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer reconnect_timer_;

    std::string url_;
    Link link_ = Link::IDLE;
    ConnectionStatus status_ = ConnectionStatus::DISCONNECTED;
    uint32_t attempts_ = 0;
    bool handshake_done_ = false;
    // Bumped whenever pending timer completions must be ignored
    uint64_t epoch_ = 0;
    // Timer completions hold a weak reference; they may run after destruction
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

} // namespace relaysync::client
