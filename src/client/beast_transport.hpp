#pragma once

#include "client/transport.hpp"
#include "common/url.hpp"

#include <utility>  // needed before Boost 1.74 asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace relaysync::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct BeastTransportOptions {
    bool ssl_verify = false;
    std::string user_agent = "relaysync/1.0";
};

// ============================================================================
// BeastTransport - WebSocket (ws/wss) transport on Boost.Beast
// ============================================================================
// resolve -> TCP connect -> [TLS handshake] -> WS handshake -> read loop.
// Every asynchronous step carries the generation it was started for; a
// step whose generation is no longer current is dropped, which is how
// close() stays silent.
// ============================================================================
class BeastTransport : public Transport,
                       public std::enable_shared_from_this<BeastTransport> {
public:
    BeastTransport(net::io_context& ioc, BeastTransportOptions options = {});
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    void connect(const std::string& url) override;
    bool send(const std::string& payload) override;
    void close() override;
    bool is_open() const override { return open_; }

private:
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    void do_resolve(uint64_t gen);
    void do_connect(uint64_t gen, const tcp::resolver::results_type& results);
    void do_ssl_handshake(uint64_t gen);
    void do_ws_handshake(uint64_t gen);
    void do_read(uint64_t gen);
    void do_write(uint64_t gen);

    // Ends the current channel: on_error (when ec is an error) then on_close
    void fail(uint64_t gen, const char* stage, beast::error_code ec);
    void close_streams();

    template<typename F>
    void with_stream(F&& f) {
        if (wss_) {
            f(*wss_);
        } else if (ws_) {
            f(*ws_);
        }
    }

    net::io_context& ioc_;
    BeastTransportOptions options_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_;

    UrlComponents url_;
    std::unique_ptr<PlainStream> ws_;
    std::unique_ptr<TlsStream> wss_;

    beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;
    bool writing_ = false;
    bool open_ = false;
    uint64_t generation_ = 0;
};

} // namespace relaysync::client
