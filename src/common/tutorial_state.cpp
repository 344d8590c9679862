#include "common/tutorial_state.hpp"
#include <fmt/format.h>

namespace relaysync {

using json = nlohmann::json;

namespace {

std::expected<std::string, std::string> required_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(fmt::format("'{}' must be a string", key));
    }
    return it->get<std::string>();
}

std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::expected<uint32_t, std::string> required_count(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
        return std::unexpected(fmt::format("'{}' must be a non-negative integer", key));
    }
    return static_cast<uint32_t>(it->get<int64_t>());
}

} // anonymous namespace

json TutorialSyncState::to_json() const {
    json step;
    step["id"] = step_content.id;
    step["title"] = step_content.title;
    step["commitHash"] = step_content.commit_hash;
    step["type"] = step_content.type;
    step["index"] = step_content.index;

    json j;
    j["tutorialId"] = tutorial_id;
    j["tutorialTitle"] = tutorial_title;
    j["totalSteps"] = total_steps;
    j["isShowingSolution"] = is_showing_solution;
    j["stepContent"] = std::move(step);
    j["repoUrl"] = repo_url;
    return j;
}

std::expected<TutorialSyncState, std::string> TutorialSyncState::from_json(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("tutorial state must be an object");
    }

    TutorialSyncState state;

    auto tutorial_id = required_string(j, "tutorialId");
    if (!tutorial_id) return std::unexpected(tutorial_id.error());
    state.tutorial_id = std::move(*tutorial_id);

    state.tutorial_title = optional_string(j, "tutorialTitle");
    state.repo_url = optional_string(j, "repoUrl");

    auto total = required_count(j, "totalSteps");
    if (!total) return std::unexpected(total.error());
    state.total_steps = *total;

    auto solution = j.find("isShowingSolution");
    if (solution != j.end()) {
        if (!solution->is_boolean()) {
            return std::unexpected("'isShowingSolution' must be a boolean");
        }
        state.is_showing_solution = solution->get<bool>();
    }

    auto step = j.find("stepContent");
    if (step == j.end() || !step->is_object()) {
        return std::unexpected("'stepContent' must be an object");
    }
    auto step_id = required_string(*step, "id");
    if (!step_id) return std::unexpected(step_id.error());
    state.step_content.id = std::move(*step_id);
    state.step_content.title = optional_string(*step, "title");
    state.step_content.commit_hash = optional_string(*step, "commitHash");
    state.step_content.type = optional_string(*step, "type");

    auto index = required_count(*step, "index");
    if (!index) return std::unexpected(index.error());
    state.step_content.index = *index;

    return state;
}

std::string TutorialSyncState::validate() const {
    if (tutorial_id.empty()) {
        return "tutorial id is empty";
    }
    if (step_content.id.empty()) {
        return "step id is empty";
    }
    if (total_steps > 0 && step_content.index >= total_steps) {
        return fmt::format("step index {} out of range (total {})", step_content.index, total_steps);
    }
    return {};
}

std::string TutorialSyncState::checksum() const {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : to_json().dump()) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return fmt::format("{:016x}", hash);
}

} // namespace relaysync
