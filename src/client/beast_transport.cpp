#include "client/beast_transport.hpp"
#include "common/log.hpp"

#include <openssl/err.h>
#include <chrono>
#include <stdexcept>

namespace relaysync::client {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::TRANSPORT_LOGGER);
    return instance;
}

constexpr auto TCP_CONNECT_TIMEOUT = std::chrono::seconds(30);
} // anonymous namespace

BeastTransport::BeastTransport(net::io_context& ioc, BeastTransportOptions options)
    : ioc_(ioc)
    , options_(std::move(options))
    , ssl_ctx_(ssl::context::tlsv12_client)
    , resolver_(ioc) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(options_.ssl_verify ? ssl::verify_peer : ssl::verify_none);
}

BeastTransport::~BeastTransport() {
    ++generation_;
    close_streams();
}

void BeastTransport::connect(const std::string& url) {
    auto parts = UrlComponents::parse(url);
    if (!parts || !parts->is_websocket()) {
        throw std::invalid_argument("Invalid WebSocket URL: " + url);
    }

    // A new channel replaces whatever was there
    ++generation_;
    close_streams();

    url_ = std::move(*parts);
    read_buffer_.consume(read_buffer_.size());
    write_queue_.clear();
    writing_ = false;
    open_ = false;

    do_resolve(generation_);
}

void BeastTransport::close() {
    ++generation_;
    if (open_) {
        logger().debug("Closing connection to {}:{}", url_.host, url_.port);
    }
    close_streams();
    open_ = false;
    write_queue_.clear();
    writing_ = false;
}

void BeastTransport::close_streams() {
    resolver_.cancel();
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).socket().close(ec);
        wss_.reset();
    }
    if (ws_) {
        beast::get_lowest_layer(*ws_).socket().close(ec);
        ws_.reset();
    }
}

void BeastTransport::fail(uint64_t gen, const char* stage, beast::error_code ec) {
    if (gen != generation_) {
        return;
    }

    bool was_open = open_;
    std::string reason;
    if (ec == websocket::error::closed) {
        std::string close_reason;
        with_stream([&](auto& stream) {
            const auto& r = stream.reason().reason;
            close_reason.assign(r.data(), r.size());
        });
        reason = close_reason.empty() ? "Closed by server" : "Closed by server: " + close_reason;
        logger().info("{}:{} {}", url_.host, url_.port, reason);
    } else {
        reason = std::string(stage) + ": " + ec.message();
        if (was_open) {
            logger().warn("{}:{} {}", url_.host, url_.port, reason);
        } else {
            logger().error("{}:{} {}", url_.host, url_.port, reason);
        }
    }

    ++generation_;
    close_streams();
    open_ = false;
    write_queue_.clear();
    writing_ = false;

    if (ec != websocket::error::closed) {
        notify_error(reason);
    }
    notify_close(reason);
}

void BeastTransport::do_resolve(uint64_t gen) {
    logger().debug("Resolving {}:{}", url_.host, url_.port);

    resolver_.async_resolve(
        url_.host, url_.port,
        [self = shared_from_this(), gen](beast::error_code ec, tcp::resolver::results_type results) {
            if (gen != self->generation_) return;
            if (ec) {
                self->fail(gen, "DNS resolve failed", ec);
                return;
            }
            self->do_connect(gen, results);
        });
}

void BeastTransport::do_connect(uint64_t gen, const tcp::resolver::results_type& results) {
    auto on_connect = [self = shared_from_this(), gen](beast::error_code ec, const tcp::endpoint& ep) {
        if (gen != self->generation_) return;
        if (ec) {
            self->fail(gen, "TCP connect failed", ec);
            return;
        }
        logger().debug("TCP connected to {}:{}", ep.address().to_string(), ep.port());
        if (self->url_.use_ssl) {
            self->do_ssl_handshake(gen);
        } else {
            self->do_ws_handshake(gen);
        }
    };

    if (url_.use_ssl) {
        wss_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);

        // SNI
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            fail(gen, "Failed to set SNI hostname", ec);
            return;
        }

        beast::get_lowest_layer(*wss_).expires_after(TCP_CONNECT_TIMEOUT);
        beast::get_lowest_layer(*wss_).async_connect(results, std::move(on_connect));
    } else {
        ws_ = std::make_unique<PlainStream>(ioc_);
        beast::get_lowest_layer(*ws_).expires_after(TCP_CONNECT_TIMEOUT);
        beast::get_lowest_layer(*ws_).async_connect(results, std::move(on_connect));
    }
}

void BeastTransport::do_ssl_handshake(uint64_t gen) {
    wss_->next_layer().async_handshake(
        ssl::stream_base::client,
        [self = shared_from_this(), gen](beast::error_code ec) {
            if (gen != self->generation_) return;
            if (ec) {
                self->fail(gen, "TLS handshake failed", ec);
                return;
            }
            self->do_ws_handshake(gen);
        });
}

void BeastTransport::do_ws_handshake(uint64_t gen) {
    with_stream([this, gen](auto& stream) {
        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(stream).expires_never();
        stream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        stream.set_option(websocket::stream_base::decorator(
            [agent = options_.user_agent](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, agent);
            }));
        stream.text(true);

        stream.async_handshake(url_.host_header(), url_.target,
            [self = shared_from_this(), gen](beast::error_code ec) {
                if (gen != self->generation_) return;
                if (ec) {
                    self->fail(gen, "WebSocket handshake failed", ec);
                    return;
                }

                logger().info("WebSocket connected to {}{}", self->url_.host_header(), self->url_.target);
                self->open_ = true;
                self->do_read(gen);
                self->notify_open();
            });
    });
}

void BeastTransport::do_read(uint64_t gen) {
    with_stream([this, gen](auto& stream) {
        stream.async_read(
            read_buffer_,
            [self = shared_from_this(), gen](beast::error_code ec, std::size_t bytes_transferred) {
                if (gen != self->generation_) return;
                if (ec) {
                    self->fail(gen, "Read error", ec);
                    return;
                }

                std::string text = beast::buffers_to_string(self->read_buffer_.data());
                self->read_buffer_.consume(bytes_transferred);
                logger().trace("<< {}", text);

                // Keep reading before handing the frame up; the handler may close us
                self->do_read(gen);
                self->notify_message(text);
            });
    });
}

bool BeastTransport::send(const std::string& payload) {
    if (!open_) {
        return false;
    }

    logger().trace(">> {}", payload);
    write_queue_.push_back(payload);
    if (!writing_) {
        do_write(generation_);
    }
    return true;
}

void BeastTransport::do_write(uint64_t gen) {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }
    writing_ = true;

    with_stream([this, gen](auto& stream) {
        stream.async_write(
            net::buffer(write_queue_.front()),
            [self = shared_from_this(), gen](beast::error_code ec, std::size_t) {
                if (gen != self->generation_) return;
                if (ec) {
                    self->fail(gen, "Write error", ec);
                    return;
                }
                self->write_queue_.pop_front();
                self->do_write(gen);
            });
    });
}

} // namespace relaysync::client
