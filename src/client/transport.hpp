#pragma once

#include <functional>
#include <string>

namespace relaysync::client {

// ============================================================================
// Transport - duplex text-message channel to the relay
// ============================================================================
//
// Contract for implementations:
//   - connect() starts opening a channel; failures are reported through
//     on_error followed by on_close. It may throw std::invalid_argument for
//     a URL it cannot use.
//   - Every channel that stops after on_open, or fails before it, ends with
//     exactly one on_close.
//   - close() is issued by the owner and is silent: no handler fires for the
//     channel being closed.
//   - Handlers may be registered at any time; the ones current when an event
//     happens are used, so registering before connect() is enough.
//
// ============================================================================
class Transport {
public:
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(const std::string&)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~Transport() = default;

    virtual void connect(const std::string& url) = 0;

    // Queues a text frame; false when no channel is open
    virtual bool send(const std::string& payload) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    void on_open(OpenHandler handler) { on_open_ = std::move(handler); }
    void on_message(MessageHandler handler) { on_message_ = std::move(handler); }
    void on_error(ErrorHandler handler) { on_error_ = std::move(handler); }
    void on_close(CloseHandler handler) { on_close_ = std::move(handler); }

    void clear_handlers() {
        on_open_ = nullptr;
        on_message_ = nullptr;
        on_error_ = nullptr;
        on_close_ = nullptr;
    }

protected:
    void notify_open() {
        if (on_open_) on_open_();
    }
    void notify_message(const std::string& text) {
        if (on_message_) on_message_(text);
    }
    void notify_error(const std::string& what) {
        if (on_error_) on_error_(what);
    }
    void notify_close(const std::string& reason) {
        if (on_close_) on_close_(reason);
    }

private:
    OpenHandler on_open_;
    MessageHandler on_message_;
    ErrorHandler on_error_;
    CloseHandler on_close_;
};

} // namespace relaysync::client
