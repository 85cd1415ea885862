#include "wizard_state.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace cortex {

const std::vector<WizardStep>& wizard_steps() {
    static const std::vector<WizardStep> steps = {
        WizardStep::Welcome,
        WizardStep::ProviderSetup,
        WizardStep::HardwareDetection,
        WizardStep::Preferences,
        WizardStep::ShellIntegration,
        WizardStep::TestCommand,
        WizardStep::Complete,
    };
    return steps;
}

const char* step_to_string(WizardStep step) {
    switch (step) {
        case WizardStep::Welcome: return "welcome";
        case WizardStep::ProviderSetup: return "provider_setup";
        case WizardStep::HardwareDetection: return "hardware_detection";
        case WizardStep::Preferences: return "preferences";
        case WizardStep::ShellIntegration: return "shell_integration";
        case WizardStep::TestCommand: return "test_command";
        case WizardStep::Complete: return "complete";
    }
    return "welcome";
}

std::optional<WizardStep> step_from_string(const std::string& name) {
    for (WizardStep step : wizard_steps()) {
        if (name == step_to_string(step)) return step;
    }
    // Older state files used "api_setup"
    if (name == "api_setup") return WizardStep::ProviderSetup;
    return std::nullopt;
}

WizardState WizardState::fresh() {
    WizardState state;
    state.started_at = timestamp_now();
    return state;
}

static bool contains(const std::vector<WizardStep>& steps, WizardStep step) {
    return std::find(steps.begin(), steps.end(), step) != steps.end();
}

bool WizardState::is_completed(WizardStep step) const {
    return contains(completed_steps, step);
}

bool WizardState::is_skipped(WizardStep step) const {
    return contains(skipped_steps, step);
}

void WizardState::mark_completed(WizardStep step) {
    skipped_steps.erase(std::remove(skipped_steps.begin(), skipped_steps.end(), step),
                        skipped_steps.end());
    if (!is_completed(step)) completed_steps.push_back(step);
}

void WizardState::mark_skipped(WizardStep step) {
    if (is_completed(step) || is_skipped(step)) return;
    skipped_steps.push_back(step);
}

void WizardState::merge_data(const nlohmann::json& data) {
    if (!data.is_object()) return;
    for (auto& [key, value] : data.items()) {
        collected_data[key] = value;
    }
}

void WizardState::stamp_completed(const std::string& when) {
    if (!completed_at) completed_at = when;
}

static nlohmann::json steps_to_json(const std::vector<WizardStep>& steps) {
    nlohmann::json arr = nlohmann::json::array();
    for (WizardStep s : steps) arr.push_back(step_to_string(s));
    return arr;
}

nlohmann::json WizardState::to_json() const {
    nlohmann::json j = {
        {"current_step", step_to_string(current_step)},
        {"completed_steps", steps_to_json(completed_steps)},
        {"skipped_steps", steps_to_json(skipped_steps)},
        {"collected_data", collected_data},
        {"started_at", started_at},
    };
    j["completed_at"] = completed_at ? nlohmann::json(*completed_at) : nlohmann::json(nullptr);
    return j;
}

WizardState WizardState::from_json(const nlohmann::json& j) {
    WizardState state;

    if (j.contains("current_step") && j["current_step"].is_string()) {
        if (auto step = step_from_string(j["current_step"].get<std::string>()))
            state.current_step = *step;
    }

    auto read_steps = [&j](const char* key, WizardState& st, bool completed) {
        if (!j.contains(key) || !j[key].is_array()) return;
        for (const auto& item : j[key]) {
            if (!item.is_string()) continue;
            auto step = step_from_string(item.get<std::string>());
            if (!step) continue;
            if (completed) st.mark_completed(*step);
            else st.mark_skipped(*step);
        }
    };
    read_steps("completed_steps", state, true);
    read_steps("skipped_steps", state, false);

    if (j.contains("collected_data") && j["collected_data"].is_object())
        state.collected_data = j["collected_data"];

    if (j.contains("started_at") && j["started_at"].is_string() &&
        !j["started_at"].get<std::string>().empty())
        state.started_at = j["started_at"].get<std::string>();
    else
        state.started_at = timestamp_now();

    if (j.contains("completed_at") && j["completed_at"].is_string())
        state.completed_at = j["completed_at"].get<std::string>();

    return state;
}

std::optional<WizardState> WizardState::load(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) return std::nullopt;
    try {
        return from_json(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[wizard] Ignoring malformed state " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool WizardState::save(const std::string& path) const {
    if (!atomic_write_file(path, to_json().dump(2) + "\n")) {
        std::cerr << "[wizard] Failed to write state " << path << "\n";
        return false;
    }
    return true;
}

bool WizardState::operator==(const WizardState& other) const {
    return current_step == other.current_step &&
           completed_steps == other.completed_steps &&
           skipped_steps == other.skipped_steps &&
           collected_data == other.collected_data &&
           started_at == other.started_at &&
           completed_at == other.completed_at;
}

} // namespace cortex
