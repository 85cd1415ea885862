#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cortex {

enum class WizardStep {
    Welcome,
    ProviderSetup,
    HardwareDetection,
    Preferences,
    ShellIntegration,
    TestCommand,
    Complete
};

// Fixed canonical order of the steps
const std::vector<WizardStep>& wizard_steps();

const char* step_to_string(WizardStep step);
std::optional<WizardStep> step_from_string(const std::string& name);

struct WizardState {
    WizardStep current_step = WizardStep::Welcome;
    std::vector<WizardStep> completed_steps;  // ordered, no duplicates
    std::vector<WizardStep> skipped_steps;    // ordered, no duplicates
    nlohmann::json collected_data = nlohmann::json::object();
    std::string started_at;
    std::optional<std::string> completed_at;

    static WizardState fresh();

    bool is_completed(WizardStep step) const;
    bool is_skipped(WizardStep step) const;

    // A completed step leaves the skipped list
    void mark_completed(WizardStep step);
    // No-op for a step that already completed
    void mark_skipped(WizardStep step);

    // Shallow merge of a step's data payload
    void merge_data(const nlohmann::json& data);

    // Sets completed_at once; later calls keep the first stamp
    void stamp_completed(const std::string& when);

    nlohmann::json to_json() const;
    // Unknown fields are ignored; a missing started_at defaults to now
    static WizardState from_json(const nlohmann::json& j);

    static std::optional<WizardState> load(const std::string& path);
    bool save(const std::string& path) const;

    bool operator==(const WizardState& other) const;
};

} // namespace cortex
