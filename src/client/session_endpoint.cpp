#include "client/session_endpoint.hpp"

namespace relaysync::client {

using json = nlohmann::json;

namespace {

std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::expected<SessionInfo, std::string> SessionInfo::from_json(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("session must be a JSON object");
    }

    SessionInfo info;
    info.id = string_or_empty(j, "id");
    if (info.id.empty()) {
        return std::unexpected("session has no 'id'");
    }

    info.created_at = string_or_empty(j, "createdAt");
    info.expires_at = string_or_empty(j, "expiresAt");
    info.last_activity = string_or_empty(j, "lastActivity");
    info.status = string_or_empty(j, "status");

    auto count = j.find("clientCount");
    if (count != j.end() && count->is_number_integer() && count->get<int64_t>() >= 0) {
        info.client_count = static_cast<uint32_t>(count->get<int64_t>());
    }

    auto active = string_or_empty(j, "activeClientId");
    if (!active.empty()) {
        info.active_client_id = std::move(active);
    }

    auto meta = j.find("metadata");
    if (meta != j.end()) {
        info.metadata = *meta;
    }
    return info;
}

json SessionInfo::to_json() const {
    json j;
    j["id"] = id;
    j["createdAt"] = created_at;
    j["expiresAt"] = expires_at;
    j["lastActivity"] = last_activity;
    j["clientCount"] = client_count;
    j["activeClientId"] = active_client_id ? json(*active_client_id) : json(nullptr);
    j["status"] = status;
    j["metadata"] = metadata;
    return j;
}

} // namespace relaysync::client
