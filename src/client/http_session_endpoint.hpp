#pragma once

#include "client/session_endpoint.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace relaysync::client {

namespace detail {
class HttpExchange;
}

struct HttpSessionEndpointOptions {
    std::string base_url;                        // e.g. http://localhost:8080
    std::string session_path = "/api/sessions";
    std::chrono::milliseconds timeout{10000};
    bool ssl_verify = false;
    std::string user_agent = "relaysync/1.0";
};

// ============================================================================
// HttpSessionEndpoint - session API over HTTP(S) using Boost.Beast
// ============================================================================
//   POST   {path}        create   body {"metadata": ...}
//   GET    {path}/{id}   get      404 -> nullopt
//   GET    {path}        list
//   DELETE {path}/{id}   delete
// ============================================================================
class HttpSessionEndpoint : public SessionEndpoint {
public:
    HttpSessionEndpoint(boost::asio::io_context& ioc, HttpSessionEndpointOptions options);
    ~HttpSessionEndpoint() override;

    void create_session(const nlohmann::json& metadata, CreateHandler handler) override;
    void get_session(const std::string& id, GetHandler handler) override;
    void list_sessions(ListHandler handler) override;
    void delete_session(const std::string& id, DeleteHandler handler) override;
    void cancel() override;

    const HttpSessionEndpointOptions& options() const { return options_; }

private:
    struct Reply {
        unsigned status = 0;
        std::string body;
    };
    using ReplyHandler = std::function<void(std::expected<Reply, SyncError>)>;

    void request(boost::beast::http::verb method, const std::string& target, std::string body, ReplyHandler handler);

    boost::asio::io_context& ioc_;
    HttpSessionEndpointOptions options_;
    boost::asio::ssl::context ssl_ctx_;
    std::vector<std::weak_ptr<detail::HttpExchange>> in_flight_;
};

} // namespace relaysync::client
