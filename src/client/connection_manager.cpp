#include "client/connection_manager.hpp"
#include "common/log.hpp"

#include <fmt/format.h>

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::CONNECTION_LOGGER);
    return instance;
}
} // anonymous namespace

ConnectionManager::ConnectionManager(boost::asio::io_context& ioc, std::shared_ptr<Transport> transport,
                                     ReconnectPolicy policy, PhaseStateMachine& phases)
    : transport_(std::move(transport))
    , policy_(policy)
    , phases_(phases)
    , connect_timer_(ioc)
    , reconnect_timer_(ioc) {
    transport_->on_open([this]() { handle_open(); });
    transport_->on_message([this](const std::string& text) { handle_message(text); });
    transport_->on_error([this](const std::string& what) { handle_error(what); });
    transport_->on_close([this](const std::string& reason) { handle_close(reason); });
}

ConnectionManager::~ConnectionManager() {
    ++epoch_;
    connect_timer_.cancel();
    reconnect_timer_.cancel();
    transport_->clear_handlers();
    transport_->close();
}

void ConnectionManager::connect(const std::string& url) {
    ++epoch_;
    connect_timer_.cancel();
    reconnect_timer_.cancel();
    if (link_ == Link::OPENING || link_ == Link::OPEN) {
        transport_->close();
    }

    url_ = url;
    attempts_ = 0;
    start_attempt();
}

void ConnectionManager::start_attempt() {
    handshake_done_ = false;
    link_ = Link::OPENING;

    if (phases_.current_phase() != SyncPhase::CONNECTING) {
        phases_.set_phase(SyncPhase::CONNECTING,
                          attempts_ == 0 ? std::string("Connecting to relay")
                                         : fmt::format("Reconnecting (attempt {}/{})",
                                                       attempts_, policy_.max_attempts));
    }
    set_status(ConnectionStatus::CONNECTING);
    arm_connect_timer();

    logger().info("Connecting to {}", url_);
    try {
        transport_->connect(url_);
    } catch (const std::exception& e) {
        if (link_ == Link::OPENING) {
            report(make_sync_error(SyncErrorType::CONNECTION_FAILED, e.what()));
            fail_link(e.what());
        }
    }
}

void ConnectionManager::arm_connect_timer() {
    connect_timer_.expires_after(policy_.connection_timeout);
    connect_timer_.async_wait(
        [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_](boost::system::error_code ec) {
            if (ec || alive.expired() || epoch != epoch_) {
                return;
            }
            auto timeout_ms = policy_.connection_timeout.count();
            if (link_ == Link::OPENING) {
                logger().warn("Connection to {} timed out after {}ms", url_, timeout_ms);
                report(make_sync_error(SyncErrorType::CONNECTION_FAILED,
                                       fmt::format("Connection timed out after {}ms", timeout_ms)));
                fail_link("Connection timeout");
            } else if (link_ == Link::OPEN && !handshake_done_) {
                logger().warn("Relay handshake not completed within {}ms", timeout_ms);
                report(make_sync_error(SyncErrorType::TIMEOUT,
                                       fmt::format("Relay handshake not completed within {}ms", timeout_ms)));
                fail_link("Handshake timeout");
            }
        });
}

void ConnectionManager::handle_open() {
    if (link_ != Link::OPENING) {
        return;
    }
    link_ = Link::OPEN;
    attempts_ = 0;
    logger().info("Connected to {}", url_);
    set_status(ConnectionStatus::CONNECTED);
    if (callbacks_.on_open) {
        callbacks_.on_open();
    }
}

void ConnectionManager::handle_message(const std::string& text) {
    if (link_ != Link::OPEN) {
        return;
    }
    if (callbacks_.on_message) {
        callbacks_.on_message(text);
    }
}

void ConnectionManager::handle_error(const std::string& what) {
    if (link_ == Link::OPENING) {
        report(make_sync_error(SyncErrorType::CONNECTION_FAILED, what));
    } else if (link_ == Link::OPEN) {
        report(make_sync_error(SyncErrorType::CONNECTION_LOST, what));
    } else {
        return;
    }
    fail_link(what);
}

void ConnectionManager::handle_close(const std::string& reason) {
    if (link_ == Link::OPENING) {
        report(make_sync_error(SyncErrorType::CONNECTION_FAILED, "Connection closed before open: " + reason));
    } else if (link_ == Link::OPEN) {
        report(make_sync_error(SyncErrorType::CONNECTION_LOST, "Connection closed: " + reason));
    } else {
        return;
    }
    fail_link(reason);
}

void ConnectionManager::fail_link(const std::string& reason) {
    ++epoch_;
    auto epoch = epoch_;
    connect_timer_.cancel();
    link_ = Link::IDLE;
    transport_->close();

    set_status(ConnectionStatus::DISCONNECTED);
    phases_.force_disconnected(reason);
    if (epoch != epoch_) {
        return;  // disconnect() or connect() ran from a callback
    }

    bool will_reconnect = policy_.auto_reconnect && attempts_ < policy_.max_attempts;
    if (callbacks_.on_closed) {
        callbacks_.on_closed(reason, will_reconnect);
    }
    if (epoch != epoch_) {
        return;
    }

    if (policy_.auto_reconnect) {
        schedule_reconnect(reason);
    }
}

void ConnectionManager::schedule_reconnect(const std::string& reason) {
    ++attempts_;
    if (attempts_ > policy_.max_attempts) {
        logger().error("Max reconnect attempts ({}) exceeded, last failure: {}", policy_.max_attempts, reason);
        attempts_ = 0;
        link_ = Link::IDLE;
        report(make_sync_error(SyncErrorType::MAX_RECONNECT_ATTEMPTS_EXCEEDED,
                               fmt::format("Gave up after {} reconnect attempts", policy_.max_attempts),
                               "Call connect() to try again"));
        return;
    }

    link_ = Link::WAITING_RETRY;
    logger().info("Reconnecting in {}ms (attempt {}/{})", policy_.delay.count(), attempts_,
                  policy_.max_attempts);
    if (callbacks_.on_reconnect_scheduled) {
        callbacks_.on_reconnect_scheduled(attempts_, policy_.delay);
    }

    reconnect_timer_.expires_after(policy_.delay);
    reconnect_timer_.async_wait(
        [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_](boost::system::error_code ec) {
            if (ec || alive.expired() || epoch != epoch_ || link_ != Link::WAITING_RETRY) {
                return;
            }
            start_attempt();
        });
}

void ConnectionManager::disconnect(const std::string& reason) {
    ++epoch_;
    connect_timer_.cancel();
    reconnect_timer_.cancel();

    bool was_live = link_ != Link::IDLE || status_ != ConnectionStatus::DISCONNECTED;
    link_ = Link::IDLE;
    attempts_ = 0;
    handshake_done_ = false;
    transport_->close();

    if (was_live) {
        logger().info("Disconnecting: {}", reason);
    }
    set_status(ConnectionStatus::DISCONNECTED);
    phases_.force_disconnected(reason);

    if (was_live && callbacks_.on_closed) {
        callbacks_.on_closed(reason, false);
    }
}

bool ConnectionManager::send(const std::string& payload) {
    if (link_ != Link::OPEN) {
        return false;
    }
    return transport_->send(payload);
}

void ConnectionManager::handshake_complete() {
    if (link_ != Link::OPEN) {
        return;
    }
    handshake_done_ = true;
    connect_timer_.cancel();
}

void ConnectionManager::set_status(ConnectionStatus status) {
    if (status_ == status) {
        return;
    }
    logger().debug("Connection status: {} -> {}", connection_status_name(status_),
                   connection_status_name(status));
    status_ = status;
    if (callbacks_.on_status_changed) {
        callbacks_.on_status_changed(status);
    }
}

void ConnectionManager::report(SyncError error) {
    logger().warn("{}", error.to_string());
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

} // namespace relaysync::client
