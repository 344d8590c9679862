#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace relaysync {

// ============================================================================
// Tutorial state shared between the two peers of a session
// ============================================================================

struct StepData {
    std::string id;
    std::string title;
    std::string commit_hash;
    std::string type;       // "section", "template", "solution", ...
    uint32_t index = 0;

    bool operator==(const StepData&) const = default;
};

// Immutable value: replaced wholesale on update, never merged
struct TutorialSyncState {
    std::string tutorial_id;
    std::string tutorial_title;
    uint32_t total_steps = 0;
    bool is_showing_solution = false;
    StepData step_content;
    std::string repo_url;

    bool operator==(const TutorialSyncState&) const = default;

    nlohmann::json to_json() const;
    static std::expected<TutorialSyncState, std::string> from_json(const nlohmann::json& j);

    // Empty string if valid, otherwise a description of the first problem found
    std::string validate() const;

    // FNV-1a 64 over the canonical JSON dump, hex encoded
    std::string checksum() const;
};

} // namespace relaysync
