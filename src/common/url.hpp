#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace relaysync {

// ============================================================================
// URL Components (ws, wss, http, https)
// ============================================================================
struct UrlComponents {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // path plus query, always starts with '/'
    bool use_ssl = false;

    static std::optional<UrlComponents> parse(const std::string& url);

    bool is_websocket() const { return scheme == "ws" || scheme == "wss"; }
    std::string host_header() const;
};

// ws://host:port/app/ws?x=1 -> http://host:port/app (wss -> https). The path is cut at "/ws".
std::string http_base_url(const std::string& server_url);

// Appends key=value to the query string, percent-encoding the value
std::string append_query(const std::string& url, std::string_view key, std::string_view value);

std::string percent_encode(std::string_view value);

} // namespace relaysync
