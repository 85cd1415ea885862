#include "config.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cortex {

Paths Paths::defaults() {
    std::string home = home_dir();
    if (home.empty()) {
        throw std::runtime_error("cannot determine home directory: HOME is unset "
                                 "and the user has no passwd entry");
    }
    if (env_or_empty("HOME").empty()) {
        std::cerr << "[config] HOME is not set; using " << home << " from passwd\n";
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return under(home + "/.cortex", ec ? std::string(".") : cwd.string());
}

Paths Paths::under(const std::string& config_dir, const std::string& project_dir) {
    Paths p;
    p.config_dir = config_dir;
    p.project_dir = project_dir;
    return p;
}

const char* verbosity_to_string(Verbosity v) {
    switch (v) {
        case Verbosity::Quiet: return "quiet";
        case Verbosity::Normal: return "normal";
        case Verbosity::Verbose: return "verbose";
    }
    return "normal";
}

Verbosity verbosity_from_string(const std::string& s) {
    if (s == "quiet") return Verbosity::Quiet;
    if (s == "verbose") return Verbosity::Verbose;
    return Verbosity::Normal;
}

nlohmann::json SetupConfig::defaults_json() {
    return {
        {"provider", "none"},
        {"credential_configured", false},
        {"hardware", nlohmann::json::object()},
        {"preferences", {
            {"auto_confirm", false},
            {"verbosity", "normal"},
            {"caching_enabled", true}
        }},
        {"shell_integration", {
            {"shell", ""},
            {"enabled", false}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

SetupConfig SetupConfig::from_json(const nlohmann::json& input) {
    SetupConfig cfg;
    nlohmann::json j = input.is_object() ? merge_defaults(input, defaults_json())
                                         : defaults_json();

    if (j["provider"].is_string())
        cfg.provider = provider_from_string(j["provider"].get<std::string>());
    if (j["credential_configured"].is_boolean())
        cfg.credential_configured = j["credential_configured"].get<bool>();
    if (j["hardware"].is_object())
        cfg.hardware = j["hardware"];

    if (j["preferences"].is_object()) {
        auto& p = j["preferences"];
        if (p.contains("auto_confirm") && p["auto_confirm"].is_boolean())
            cfg.preferences.auto_confirm = p["auto_confirm"].get<bool>();
        if (p.contains("verbosity") && p["verbosity"].is_string())
            cfg.preferences.verbosity = verbosity_from_string(p["verbosity"].get<std::string>());
        if (p.contains("caching_enabled") && p["caching_enabled"].is_boolean())
            cfg.preferences.caching_enabled = p["caching_enabled"].get<bool>();
    }

    if (j["shell_integration"].is_object()) {
        auto& s = j["shell_integration"];
        if (s.contains("shell") && s["shell"].is_string())
            cfg.shell_integration.shell = s["shell"].get<std::string>();
        if (s.contains("enabled") && s["enabled"].is_boolean())
            cfg.shell_integration.enabled = s["enabled"].get<bool>();
    }
    return cfg;
}

nlohmann::json SetupConfig::to_json() const {
    return {
        {"provider", provider_to_string(provider)},
        {"credential_configured", credential_configured},
        {"hardware", hardware},
        {"preferences", {
            {"auto_confirm", preferences.auto_confirm},
            {"verbosity", verbosity_to_string(preferences.verbosity)},
            {"caching_enabled", preferences.caching_enabled}
        }},
        {"shell_integration", {
            {"shell", shell_integration.shell},
            {"enabled", shell_integration.enabled}
        }}
    };
}

SetupConfig SetupConfig::load(const Paths& paths) {
    std::string text;
    if (!read_file(paths.config_file(), text)) {
        return from_json(defaults_json());
    }
    try {
        return from_json(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Ignoring malformed " << paths.config_file()
                  << ": " << e.what() << "\n";
        return from_json(defaults_json());
    }
}

bool SetupConfig::save(const Paths& paths) const {
    if (!atomic_write_file(paths.config_file(), to_json().dump(4) + "\n")) {
        std::cerr << "[config] Failed to write " << paths.config_file() << "\n";
        return false;
    }
    return true;
}

} // namespace cortex
