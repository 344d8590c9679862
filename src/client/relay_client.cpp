#include "client/relay_client.hpp"
#include "client/beast_transport.hpp"
#include "client/http_session_endpoint.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

#include <stdexcept>

namespace relaysync::client {

namespace {

RelayClientConfig checked(RelayClientConfig config) {
    if (auto valid = config.validate(); !valid) {
        throw std::invalid_argument(config_error_message(valid.error()) + ": server_url '" +
                                    config.server_url + "'");
    }
    auto url = UrlComponents::parse(config.server_url);
    if (!url || !url->is_websocket()) {
        throw std::invalid_argument("Invalid relay server URL: " + config.server_url);
    }
    return config;
}

std::unique_ptr<SyncEngine> make_engine(boost::asio::io_context& ioc, RelayClientConfig config) {
    config = checked(std::move(config));

    BeastTransportOptions transport_options;
    transport_options.ssl_verify = config.ssl_verify;
    transport_options.user_agent = config.user_agent;

    HttpSessionEndpointOptions endpoint_options;
    endpoint_options.base_url = http_base_url(config.server_url);
    endpoint_options.session_path = config.session_endpoint;
    endpoint_options.timeout = config.request_timeout;
    endpoint_options.ssl_verify = config.ssl_verify;
    endpoint_options.user_agent = config.user_agent;

    auto transport = std::make_shared<BeastTransport>(ioc, transport_options);
    auto endpoint = std::make_unique<HttpSessionEndpoint>(ioc, std::move(endpoint_options));
    return std::make_unique<SyncEngine>(ioc, std::move(config), std::move(transport), std::move(endpoint));
}

} // anonymous namespace

RelayClient::RelayClient(boost::asio::io_context& ioc, RelayClientConfig config)
    : engine_(make_engine(ioc, std::move(config)))
    , session(*engine_)
    , tutorial(*engine_)
    , control(*engine_)
    , sync(*engine_)
    , is(*engine_) {
    NLOG_DEBUG(log::MAIN_LOGGER, "Relay client created for {}", engine_->config().server_url);
}

RelayClient::RelayClient(boost::asio::io_context& ioc, RelayClientConfig config,
                         std::shared_ptr<Transport> transport, std::unique_ptr<SessionEndpoint> endpoint)
    : engine_(std::make_unique<SyncEngine>(ioc, checked(std::move(config)), std::move(transport),
                                           std::move(endpoint)))
    , session(*engine_)
    , tutorial(*engine_)
    , control(*engine_)
    , sync(*engine_)
    , is(*engine_) {}

RelayClient::~RelayClient() = default;

void RelayClient::connect() {
    engine_->connect();
}

void RelayClient::connect(const std::string& session_id) {
    engine_->connect(session_id);
}

void RelayClient::disconnect() {
    engine_->disconnect();
}

} // namespace relaysync::client
