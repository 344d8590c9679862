#include "common/url.hpp"
#include <algorithm>
#include <cctype>
#include <boost/url.hpp>
#include <fmt/format.h>

namespace relaysync {

std::optional<UrlComponents> UrlComponents::parse(const std::string& url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed || !parsed->has_authority()) {
        return std::nullopt;
    }

    UrlComponents result;
    result.scheme = std::string(parsed->scheme());
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "ws" && result.scheme != "wss" && result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    // IPv6 literals come back without brackets, ready for the resolver
    result.host = parsed->host_address();
    if (result.host.empty()) {
        return std::nullopt;
    }
    result.use_ssl = (result.scheme == "wss" || result.scheme == "https");
    result.port = (parsed->has_port() && !parsed->port().empty()) ? std::string(parsed->port())
                                                                  : (result.use_ssl ? "443" : "80");

    result.target = parsed->encoded_path().empty() ? "/" : std::string(parsed->encoded_path());
    if (parsed->has_query()) {
        result.target += "?" + std::string(parsed->encoded_query());
    }
    return result;
}

std::string UrlComponents::host_header() const {
    std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
    bool default_port = (use_ssl && port == "443") || (!use_ssl && port == "80");
    return default_port ? name : name + ":" + port;
}

std::string http_base_url(const std::string& server_url) {
    auto parts = UrlComponents::parse(server_url);
    if (!parts) {
        return {};
    }
    std::string path = parts->target.substr(0, parts->target.find('?'));
    if (parts->is_websocket()) {
        if (auto ws = path.find("/ws"); ws != std::string::npos) {
            path.resize(ws);
        }
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    std::string scheme = parts->use_ssl ? "https" : "http";
    return fmt::format("{}://{}{}", scheme, parts->host_header(), path);
}

std::string percent_encode(std::string_view value) {
    return boost::urls::encode(value, boost::urls::unreserved_chars);
}

std::string append_query(const std::string& url, std::string_view key, std::string_view value) {
    std::string base = url;
    std::string fragment;
    if (auto hash = base.find('#'); hash != std::string::npos) {
        fragment = base.substr(hash);
        base.resize(hash);
    }
    char sep = base.find('?') == std::string::npos ? '?' : '&';
    return fmt::format("{}{}{}={}{}", base, sep, key, percent_encode(value), fragment);
}

} // namespace relaysync
