#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relaysync::testing {

// ============================================================================
// Loopback servers on 127.0.0.1 for exercising the Beast transport and
// session endpoint against real sockets. Both run on the test's io_context.
// ============================================================================

// Runs handlers until pred() holds or the timeout passes
template<typename Pred>
bool run_until(boost::asio::io_context& ioc, Pred pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        ioc.restart();
        ioc.run_one_for(std::chrono::milliseconds(10));
    }
    return true;
}

// Runs whatever completes within the window
inline void settle(boost::asio::io_context& ioc, std::chrono::milliseconds window = std::chrono::milliseconds(100)) {
    run_until(ioc, [] { return false; }, window);
}

inline boost::asio::ip::tcp::endpoint loopback_endpoint() {
    return {boost::asio::ip::make_address("127.0.0.1"), 0};
}

// ============================================================================
// LoopbackWsServer - WebSocket peer, one connection at a time
// ============================================================================
class LoopbackWsServer {
public:
    using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    explicit LoopbackWsServer(boost::asio::io_context& ioc)
        : acceptor_(ioc, loopback_endpoint()) {
        port_ = acceptor_.local_endpoint().port();
        do_accept();
    }

    ~LoopbackWsServer() {
        stop();
        drop();
    }

    LoopbackWsServer(const LoopbackWsServer&) = delete;
    LoopbackWsServer& operator=(const LoopbackWsServer&) = delete;

    std::string url(const std::string& target = "/ws") const {
        return "ws://127.0.0.1:" + std::to_string(port_) + target;
    }

    // Stops listening; later connects are refused
    void stop() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

    void set_echo(bool echo) { echo_ = echo; }

    void send(const std::string& text) {
        if (!ws_) {
            return;
        }
        outbox_.push_back(text);
        if (!writing_) {
            do_write(ws_);
        }
    }

    // Orderly close with a close frame
    void close(const std::string& reason) {
        if (ws_) {
            ws_->async_close(boost::beast::websocket::close_reason(reason),
                             [ws = ws_](boost::beast::error_code) {});
        }
    }

    // Drops the TCP connection without a close frame
    void drop() {
        if (ws_) {
            boost::beast::error_code ec;
            auto& socket = boost::beast::get_lowest_layer(*ws_).socket();
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
            ws_.reset();
        }
    }

    size_t accepted() const { return accepted_; }
    size_t upgraded() const { return upgraded_; }
    bool peer_gone() const { return peer_gone_; }
    const std::string& last_target() const { return last_target_; }
    const std::vector<std::string>& received() const { return received_; }

private:
    struct Upgrade {
        boost::beast::flat_buffer buffer;
        boost::beast::http::request<boost::beast::http::string_body> request;
    };

    void do_accept() {
        acceptor_.async_accept([this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            ++accepted_;
            auto ws = std::make_shared<WsStream>(std::move(socket));
            auto upgrade = std::make_shared<Upgrade>();
            boost::beast::http::async_read(ws->next_layer(), upgrade->buffer, upgrade->request,
                [this, ws, upgrade](boost::beast::error_code read_ec, std::size_t) {
                    if (read_ec || !boost::beast::websocket::is_upgrade(upgrade->request)) {
                        return;
                    }
                    last_target_ = std::string(upgrade->request.target());
                    ws->async_accept(upgrade->request, [this, ws, upgrade](boost::beast::error_code accept_ec) {
                        if (accept_ec) {
                            return;
                        }
                        ++upgraded_;
                        ws_ = ws;
                        peer_gone_ = false;
                        outbox_.clear();
                        writing_ = false;
                        do_read(ws);
                    });
                });
            do_accept();
        });
    }

    void do_read(std::shared_ptr<WsStream> ws) {
        auto buffer = std::make_shared<boost::beast::flat_buffer>();
        ws->async_read(*buffer, [this, ws, buffer](boost::beast::error_code ec, std::size_t) {
            if (ws != ws_) {
                return;
            }
            if (ec) {
                peer_gone_ = true;
                return;
            }
            auto text = boost::beast::buffers_to_string(buffer->data());
            received_.push_back(text);
            if (echo_) {
                send(text);
            }
            do_read(ws);
        });
    }

    void do_write(std::shared_ptr<WsStream> ws) {
        if (outbox_.empty() || ws != ws_) {
            writing_ = false;
            return;
        }
        writing_ = true;
        ws->text(true);
        ws->async_write(boost::asio::buffer(outbox_.front()),
            [this, ws](boost::beast::error_code ec, std::size_t) {
                if (ws != ws_) {
                    return;
                }
                if (ec) {
                    writing_ = false;
                    return;
                }
                outbox_.pop_front();
                do_write(ws);
            });
    }

    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::shared_ptr<WsStream> ws_;
    std::deque<std::string> outbox_;
    bool writing_ = false;
    bool echo_ = false;
    bool peer_gone_ = false;
    size_t accepted_ = 0;
    size_t upgraded_ = 0;
    std::string last_target_;
    std::vector<std::string> received_;
};

// ============================================================================
// LoopbackHttpServer - answers each request through a responder, then closes
// ============================================================================
class LoopbackHttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    struct Answer {
        unsigned status = 200;
        std::string body;
    };
    using Responder = std::function<Answer(const Request&)>;

    struct Recorded {
        boost::beast::http::verb method;
        std::string target;
        std::string body;
        std::string content_type;
    };

    explicit LoopbackHttpServer(boost::asio::io_context& ioc)
        : acceptor_(ioc, loopback_endpoint()) {
        port_ = acceptor_.local_endpoint().port();
        do_accept();
    }

    ~LoopbackHttpServer() { stop(); }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    void stop() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

    void respond(Responder responder) { responder_ = std::move(responder); }
    void respond(unsigned status, std::string body) {
        responder_ = [status, body = std::move(body)](const Request&) { return Answer{status, body}; };
    }

    const std::vector<Recorded>& requests() const { return requests_; }

private:
    struct Exchange {
        explicit Exchange(boost::asio::ip::tcp::socket socket) : stream(std::move(socket)) {}

        boost::beast::tcp_stream stream;
        boost::beast::flat_buffer buffer;
        Request request;
        boost::beast::http::response<boost::beast::http::string_body> response;
    };

    void do_accept() {
        acceptor_.async_accept([this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            auto exchange = std::make_shared<Exchange>(std::move(socket));
            boost::beast::http::async_read(exchange->stream, exchange->buffer, exchange->request,
                [this, exchange](boost::beast::error_code read_ec, std::size_t) {
                    if (read_ec) {
                        return;
                    }
                    on_request(exchange);
                });
            do_accept();
        });
    }

    void on_request(const std::shared_ptr<Exchange>& exchange) {
        namespace http = boost::beast::http;
        const auto& req = exchange->request;
        requests_.push_back(Recorded{req.method(), std::string(req.target()), req.body(),
                                     std::string(req[http::field::content_type])});

        auto answer = responder_ ? responder_(req) : Answer{404, {}};
        auto& res = exchange->response;
        res.version(req.version());
        res.result(answer.status);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(answer.body);
        res.prepare_payload();

        http::async_write(exchange->stream, res, [exchange](boost::beast::error_code, std::size_t) {
            boost::beast::error_code ec;
            exchange->stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        });
    }

    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    Responder responder_;
    std::vector<Recorded> requests_;
};

} // namespace relaysync::testing
