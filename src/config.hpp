#pragma once
#include "credential.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace cortex {

// Every persisted location used by onboarding
struct Paths {
    std::string config_dir;   // ~/.cortex
    std::string project_dir;  // working directory of the run

    // Throws std::runtime_error when no home directory can be determined
    static Paths defaults();
    static Paths under(const std::string& config_dir, const std::string& project_dir);

    std::string credential_file() const { return config_dir + "/.env"; }
    std::string state_file() const { return config_dir + "/wizard_state.json"; }
    std::string config_file() const { return config_dir + "/config.json"; }
    std::string setup_marker() const { return config_dir + "/.setup_complete"; }
    std::string project_credential_file() const { return project_dir + "/.env"; }
};

enum class Verbosity { Quiet, Normal, Verbose };

const char* verbosity_to_string(Verbosity v);
Verbosity verbosity_from_string(const std::string& s);

struct Preferences {
    bool auto_confirm = false;
    Verbosity verbosity = Verbosity::Normal;
    bool caching_enabled = true;
};

struct ShellIntegration {
    std::string shell;
    bool enabled = false;
};

struct SetupConfig {
    ProviderKind provider = ProviderKind::None;
    bool credential_configured = false;
    nlohmann::json hardware = nlohmann::json::object();
    Preferences preferences;
    ShellIntegration shell_integration;

    // Load from <config_dir>/config.json. Missing keys take defaults, unknown
    // keys are ignored, a malformed document yields the defaults.
    static SetupConfig load(const Paths& paths);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static SetupConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Full-document overwrite, never a partial write
    bool save(const Paths& paths) const;
};

} // namespace cortex
