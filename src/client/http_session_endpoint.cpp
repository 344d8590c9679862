#include "client/http_session_endpoint.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

namespace relaysync::client {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SESSION_LOGGER);
    return instance;
}

bool is_success(unsigned status) {
    return status >= 200 && status < 300;
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// Relay error bodies: {"message": "..."}, {"error": "..."} or {"error": {"code": ..., "message": ...}}
std::string error_detail(const json& j) {
    if (!j.is_object()) {
        return {};
    }
    if (auto message = string_field(j, "message"); !message.empty()) {
        return message;
    }
    auto error = j.find("error");
    if (error == j.end()) {
        return {};
    }
    if (error->is_string()) {
        return error->get<std::string>();
    }
    if (error->is_object()) {
        auto message = string_field(*error, "message");
        return message.empty() ? string_field(*error, "code") : message;
    }
    return {};
}

SyncError status_error(const char* what, unsigned status, const std::string& body) {
    std::string message = fmt::format("{} failed: HTTP {}", what, status);
    auto detail = error_detail(json::parse(body, nullptr, false));
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    return make_sync_error(SyncErrorType::SERVER_ERROR, message);
}

} // anonymous namespace

// ============================================================================
// HttpExchange - one request/response on a fresh connection
// ============================================================================
namespace detail {

class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    using Response = http::response<http::string_body>;
    using Done = std::function<void(beast::error_code, const char* stage, Response)>;

    HttpExchange(net::io_context& ioc, ssl::context& ssl_ctx, UrlComponents url,
                 http::request<http::string_body> req, std::chrono::milliseconds timeout, Done done)
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , resolver_(ioc)
        , url_(std::move(url))
        , req_(std::move(req))
        , timeout_(timeout)
        , done_(std::move(done)) {}

    void run() {
        resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    self->finish(ec, "resolve");
                    return;
                }
                self->on_resolve(results);
            });
    }

    void cancel() {
        cancelled_ = true;
        resolver_.cancel();
        close();
    }

private:
    void on_resolve(const tcp::resolver::results_type& results) {
        auto on_connect = [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
            if (ec) {
                self->finish(ec, "connect");
                return;
            }
            if (self->tls_) {
                self->tls_->async_handshake(ssl::stream_base::client,
                    [self](beast::error_code hs_ec) {
                        if (hs_ec) {
                            self->finish(hs_ec, "TLS handshake");
                            return;
                        }
                        self->do_write();
                    });
            } else {
                self->do_write();
            }
        };

        if (url_.use_ssl) {
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                finish(ec, "SNI");
                return;
            }
            beast::get_lowest_layer(*tls_).expires_after(timeout_);
            beast::get_lowest_layer(*tls_).async_connect(results, std::move(on_connect));
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
            plain_->expires_after(timeout_);
            plain_->async_connect(results, std::move(on_connect));
        }
    }

    template<typename F>
    void with_stream(F&& f) {
        if (tls_) {
            f(*tls_);
        } else if (plain_) {
            f(*plain_);
        }
    }

    void do_write() {
        with_stream([this](auto& stream) {
            beast::get_lowest_layer(stream).expires_after(timeout_);
            http::async_write(stream, req_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->finish(ec, "write");
                        return;
                    }
                    self->do_read();
                });
        });
    }

    void do_read() {
        with_stream([this](auto& stream) {
            http::async_read(stream, buffer_, res_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->finish(ec, "read");
                });
        });
    }

    void close() {
        beast::error_code ec;
        if (tls_) {
            beast::get_lowest_layer(*tls_).socket().close(ec);
        }
        if (plain_) {
            plain_->socket().shutdown(tcp::socket::shutdown_both, ec);
            plain_->socket().close(ec);
        }
    }

    void finish(beast::error_code ec, const char* stage) {
        if (finished_) {
            return;
        }
        finished_ = true;
        close();
        if (!cancelled_ && done_) {
            done_(ec, stage, std::move(res_));
        }
    }

    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::resolver resolver_;
    UrlComponents url_;
    http::request<http::string_body> req_;
    std::chrono::milliseconds timeout_;
    Done done_;

    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    Response res_;
    bool cancelled_ = false;
    bool finished_ = false;
};

} // namespace detail

// ============================================================================
// HttpSessionEndpoint
// ============================================================================

HttpSessionEndpoint::HttpSessionEndpoint(net::io_context& ioc, HttpSessionEndpointOptions options)
    : ioc_(ioc)
    , options_(std::move(options))
    , ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(options_.ssl_verify ? ssl::verify_peer : ssl::verify_none);
}

HttpSessionEndpoint::~HttpSessionEndpoint() {
    cancel();
}

void HttpSessionEndpoint::cancel() {
    for (auto& weak : in_flight_) {
        if (auto exchange = weak.lock()) {
            exchange->cancel();
        }
    }
    in_flight_.clear();
}

void HttpSessionEndpoint::request(http::verb method, const std::string& target, std::string body,
                                  ReplyHandler handler) {
    std::string url = options_.base_url + target;
    auto parts = UrlComponents::parse(url);
    if (!parts || parts->is_websocket()) {
        auto error = make_sync_error(SyncErrorType::CONNECTION_FAILED,
                                     "Invalid session endpoint URL: " + url);
        net::post(ioc_, [handler = std::move(handler), error]() { handler(std::unexpected(error)); });
        return;
    }

    http::request<http::string_body> req{method, parts->target, 11};
    req.set(http::field::host, parts->host_header());
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::accept, "application/json");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
    }
    req.prepare_payload();

    logger().debug("{} {}", std::string(http::to_string(method)), url);

    auto exchange = std::make_shared<detail::HttpExchange>(
        ioc_, ssl_ctx_, std::move(*parts), std::move(req), options_.timeout,
        [handler = std::move(handler), url](beast::error_code ec, const char* stage,
                                            detail::HttpExchange::Response res) {
            if (ec) {
                auto type = (ec == beast::error::timeout) ? SyncErrorType::TIMEOUT
                                                          : SyncErrorType::CONNECTION_FAILED;
                logger().warn("Session request to {} failed during {}: {}", url, stage, ec.message());
                handler(std::unexpected(make_sync_error(
                    type, fmt::format("Session request failed during {}: {}", stage, ec.message()))));
                return;
            }
            handler(Reply{res.result_int(), std::move(res.body())});
        });

    // Drop entries of finished exchanges
    std::erase_if(in_flight_, [](const auto& weak) { return weak.expired(); });
    in_flight_.push_back(exchange);
    exchange->run();
}

void HttpSessionEndpoint::create_session(const json& metadata, CreateHandler handler) {
    json body;
    body["metadata"] = metadata.is_null() ? json::object() : metadata;

    request(http::verb::post, options_.session_path, body.dump(),
        [handler = std::move(handler)](std::expected<Reply, SyncError> reply) {
            if (!reply) {
                handler(std::unexpected(reply.error()));
                return;
            }
            if (!is_success(reply->status)) {
                handler(std::unexpected(status_error("Create session", reply->status, reply->body)));
                return;
            }
            auto info = SessionInfo::from_json(json::parse(reply->body, nullptr, false));
            if (!info) {
                handler(std::unexpected(make_sync_error(SyncErrorType::SERVER_ERROR,
                                                        "Invalid create-session response: " + info.error())));
                return;
            }
            logger().info("Created session {}", info->id);
            handler(std::move(*info));
        });
}

void HttpSessionEndpoint::get_session(const std::string& id, GetHandler handler) {
    request(http::verb::get, options_.session_path + "/" + percent_encode(id), {},
        [handler = std::move(handler)](std::expected<Reply, SyncError> reply) {
            if (!reply) {
                handler(std::unexpected(reply.error()));
                return;
            }
            if (reply->status == 404) {
                handler(std::optional<SessionInfo>{});
                return;
            }
            if (!is_success(reply->status)) {
                handler(std::unexpected(status_error("Get session", reply->status, reply->body)));
                return;
            }
            auto info = SessionInfo::from_json(json::parse(reply->body, nullptr, false));
            if (!info) {
                handler(std::unexpected(make_sync_error(SyncErrorType::SERVER_ERROR,
                                                        "Invalid session response: " + info.error())));
                return;
            }
            handler(std::optional<SessionInfo>{std::move(*info)});
        });
}

void HttpSessionEndpoint::list_sessions(ListHandler handler) {
    request(http::verb::get, options_.session_path, {},
        [handler = std::move(handler)](std::expected<Reply, SyncError> reply) {
            if (!reply) {
                handler(std::unexpected(reply.error()));
                return;
            }
            if (!is_success(reply->status)) {
                handler(std::unexpected(status_error("List sessions", reply->status, reply->body)));
                return;
            }

            auto parsed = json::parse(reply->body, nullptr, false);
            // The relay answers either with a bare array or {"sessions": [...]}
            if (parsed.is_object() && parsed.contains("sessions")) {
                parsed = parsed["sessions"];
            }
            if (!parsed.is_array()) {
                handler(std::unexpected(make_sync_error(SyncErrorType::SERVER_ERROR,
                                                        "Invalid session list response")));
                return;
            }

            std::vector<SessionInfo> sessions;
            for (const auto& item : parsed) {
                auto info = SessionInfo::from_json(item);
                if (!info) {
                    logger().warn("Skipping session entry: {}", info.error());
                    continue;
                }
                sessions.push_back(std::move(*info));
            }
            handler(std::move(sessions));
        });
}

void HttpSessionEndpoint::delete_session(const std::string& id, DeleteHandler handler) {
    request(http::verb::delete_, options_.session_path + "/" + percent_encode(id), {},
        [handler = std::move(handler), id](std::expected<Reply, SyncError> reply) {
            if (!reply) {
                handler(std::unexpected(reply.error()));
                return;
            }
            if (reply->status == 404) {
                handler(false);
                return;
            }
            if (!is_success(reply->status)) {
                handler(std::unexpected(status_error("Delete session", reply->status, reply->body)));
                return;
            }
            logger().info("Deleted session {}", id);
            handler(true);
        });
}

} // namespace relaysync::client
