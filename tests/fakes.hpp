#pragma once

#include "client/events.hpp"
#include "client/session_endpoint.hpp"
#include "client/transport.hpp"
#include "common/protocol.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace relaysync::testing {

// ============================================================================
// FakeTransport - scripted Transport
// ============================================================================
// Tests drive the channel by hand (open(), drop(), emit_message()) or let it
// fail every connect() asynchronously with set_auto_fail(true).
// ============================================================================
class FakeTransport : public client::Transport {
public:
    explicit FakeTransport(boost::asio::io_context& ioc) : ioc_(ioc) {}

    void connect(const std::string& url) override {
        if (reject_urls_) {
            throw std::invalid_argument("Rejected URL: " + url);
        }
        ++connect_count_;
        ++generation_;
        last_url_ = url;
        open_ = false;
        connecting_ = true;
        if (auto_fail_) {
            boost::asio::post(ioc_, [this, gen = generation_]() {
                if (gen == generation_ && connecting_) {
                    fail_open("Connection refused");
                }
            });
        }
    }

    bool send(const std::string& payload) override {
        if (!open_) {
            return false;
        }
        sent_.push_back(payload);
        return true;
    }

    void close() override {
        ++close_count_;
        ++generation_;
        open_ = false;
        connecting_ = false;
    }

    bool is_open() const override { return open_; }

    // ------------------------------------------------------------------------
    // Test helpers
    // ------------------------------------------------------------------------

    void open() {
        connecting_ = false;
        open_ = true;
        notify_open();
    }

    void fail_open(const std::string& reason) {
        connecting_ = false;
        notify_error(reason);
        notify_close(reason);
    }

    void drop(const std::string& reason = "Connection reset by peer") {
        open_ = false;
        notify_error(reason);
        notify_close(reason);
    }

    void emit_message(const std::string& text) { notify_message(text); }

    void set_auto_fail(bool enabled) { auto_fail_ = enabled; }
    void set_reject_urls(bool enabled) { reject_urls_ = enabled; }

    int connect_count() const { return connect_count_; }
    int close_count() const { return close_count_; }
    bool connecting() const { return connecting_; }
    const std::string& last_url() const { return last_url_; }
    const std::vector<std::string>& sent() const { return sent_; }
    void clear_sent() { sent_.clear(); }

    // Decoded outgoing frames of one type
    std::vector<protocol::SyncMessage> sent_of(protocol::MessageType type) const {
        std::vector<protocol::SyncMessage> out;
        for (const auto& frame : sent_) {
            auto message = protocol::decode(frame);
            if (message && message->type() == type) {
                out.push_back(std::move(*message));
            }
        }
        return out;
    }

private:
    boost::asio::io_context& ioc_;
    std::vector<std::string> sent_;
    std::string last_url_;
    uint64_t generation_ = 0;
    int connect_count_ = 0;
    int close_count_ = 0;
    bool open_ = false;
    bool connecting_ = false;
    bool auto_fail_ = false;
    bool reject_urls_ = false;
};

// ============================================================================
// FakeSessionEndpoint - holds requests until the test answers them
// ============================================================================
class FakeSessionEndpoint : public client::SessionEndpoint {
public:
    void create_session(const nlohmann::json& metadata, CreateHandler handler) override {
        last_metadata_ = metadata;
        creates_.push_back(std::move(handler));
    }

    void get_session(const std::string& id, GetHandler handler) override {
        last_id_ = id;
        gets_.push_back(std::move(handler));
    }

    void list_sessions(ListHandler handler) override {
        lists_.push_back(std::move(handler));
    }

    void delete_session(const std::string& id, DeleteHandler handler) override {
        last_id_ = id;
        deletes_.push_back(std::move(handler));
    }

    void cancel() override {
        ++cancel_count_;
    }

    // Answers the oldest pending request of each kind
    void complete_create(std::expected<client::SessionInfo, SyncError> result) {
        auto handler = take(creates_);
        handler(std::move(result));
    }

    void complete_get(std::expected<std::optional<client::SessionInfo>, SyncError> result) {
        auto handler = take(gets_);
        handler(std::move(result));
    }

    void complete_list(std::expected<std::vector<client::SessionInfo>, SyncError> result) {
        auto handler = take(lists_);
        handler(std::move(result));
    }

    void complete_delete(std::expected<bool, SyncError> result) {
        auto handler = take(deletes_);
        handler(std::move(result));
    }

    size_t pending_creates() const { return creates_.size(); }
    size_t pending_gets() const { return gets_.size(); }
    size_t pending_deletes() const { return deletes_.size(); }
    int cancel_count() const { return cancel_count_; }
    const nlohmann::json& last_metadata() const { return last_metadata_; }
    const std::string& last_id() const { return last_id_; }

    static client::SessionInfo session(const std::string& id) {
        client::SessionInfo info;
        info.id = id;
        info.status = "active";
        return info;
    }

private:
    template<typename H>
    static H take(std::vector<H>& pending) {
        if (pending.empty()) {
            throw std::logic_error("no pending session request");
        }
        H handler = std::move(pending.front());
        pending.erase(pending.begin());
        return handler;
    }

    std::vector<CreateHandler> creates_;
    std::vector<GetHandler> gets_;
    std::vector<ListHandler> lists_;
    std::vector<DeleteHandler> deletes_;
    nlohmann::json last_metadata_;
    std::string last_id_;
    int cancel_count_ = 0;
};

// ============================================================================
// Relay frames
// ============================================================================

inline std::string relay_frame(const std::string& type, const std::string& sender,
                               nlohmann::json data = nlohmann::json::object()) {
    nlohmann::json root;
    root["type"] = type;
    root["clientId"] = sender;
    root["timestamp"] = 1700000000000;
    root["protocol_version"] = protocol::PROTOCOL_VERSION;
    root["data"] = std::move(data);
    return root.dump();
}

inline std::string handshake_frame(const std::string& client_id, const std::string& session_id = "") {
    nlohmann::json data{{"clientId", client_id}};
    if (!session_id.empty()) {
        data["sessionId"] = session_id;
    }
    return relay_frame("client_id_assigned", "", std::move(data));
}

inline TutorialSyncState sample_state(uint32_t index = 0) {
    TutorialSyncState state;
    state.tutorial_id = "rust-state-machines";
    state.tutorial_title = "Rust State Machines";
    state.total_steps = 5;
    state.is_showing_solution = false;
    state.step_content.id = "step-" + std::to_string(index + 1);
    state.step_content.title = "Step " + std::to_string(index + 1);
    state.step_content.commit_hash = "a1b2c3d";
    state.step_content.type = "section";
    state.step_content.index = index;
    state.repo_url = "https://github.com/example/rust-state-machines";
    return state;
}

// Runs everything that is ready, including zero-delay timers, without
// waiting for timers further out
inline void drain(boost::asio::io_context& ioc) {
    for (int i = 0; i < 256; ++i) {
        ioc.restart();
        if (ioc.poll() > 0) {
            continue;
        }
        ioc.restart();
        if (ioc.run_one_for(std::chrono::milliseconds(5)) == 0) {
            return;
        }
    }
}

// Collects events delivered to the host handler
class EventLog {
public:
    client::EventHandler handler() {
        return [this](const client::RelayClientEvent& event) { events_.push_back(event); };
    }

    template<typename E>
    std::vector<E> all() const {
        std::vector<E> out;
        for (const auto& event : events_) {
            if (auto* e = std::get_if<E>(&event)) {
                out.push_back(*e);
            }
        }
        return out;
    }

    template<typename E>
    size_t count() const { return all<E>().size(); }

    size_t errors_of(SyncErrorType type) const {
        size_t n = 0;
        for (const auto& e : all<client::ErrorEvent>()) {
            if (e.error.type == type) ++n;
        }
        return n;
    }

    const std::vector<client::RelayClientEvent>& events() const { return events_; }
    void clear() { events_.clear(); }

private:
    std::vector<client::RelayClientEvent> events_;
};

} // namespace relaysync::testing
