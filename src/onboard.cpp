#include "onboard.hpp"
#include "util.hpp"
#include "validator.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace cortex {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Format: return "format";
        case ErrorKind::Io: return "io";
        case ErrorKind::Availability: return "availability";
        case ErrorKind::NoProvider: return "no_provider";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::Verification: return "verification";
    }
    return "none";
}

StepResult StepResult::ok(std::string message, nlohmann::json data) {
    StepResult r;
    r.message = std::move(message);
    r.data = std::move(data);
    return r;
}

StepResult StepResult::skip(std::string message) {
    StepResult r;
    r.skipped = true;
    r.message = std::move(message);
    return r;
}

StepResult StepResult::skip_to(WizardStep next, std::string message, nlohmann::json data) {
    StepResult r = ok(std::move(message), std::move(data));
    r.next_step = next;
    return r;
}

StepResult StepResult::fail(ErrorKind error, std::string message) {
    StepResult r;
    r.success = false;
    r.error = error;
    r.message = std::move(message);
    return r;
}

const std::vector<std::string>& dry_run_examples() {
    static const std::vector<std::string> examples = {
        "Machine learning module",
        "libraries for video compression tool",
        "web development framework",
        "data analysis tools",
        "image processing library",
        "database management system",
        "text editor with plugins",
        "networking utilities",
        "game development engine",
        "scientific computing tools",
    };
    return examples;
}

std::string format_provider_status(CredentialLocator& locator,
                                   ProviderAvailability& availability) {
    std::string status = "Provider status:\n";
    for (ProviderKind kind : canonical_provider_order()) {
        std::string label = provider_label(kind);
        status += "  " + label;
        // Pad to align status column
        for (size_t i = label.size(); i < 28; ++i) status += ' ';

        if (!provider_needs_credential(kind)) {
            status += availability.is_available(kind) ? "installed" : "not installed";
            status += "\n";
            continue;
        }

        auto located = locator.locate_for(kind);
        if (located.found()) {
            status += std::string("API key (") +
                      provenance_to_string(located.credential->provenance) + ")";
        } else if (located.found_invalid()) {
            status += "key found but invalid";
        } else {
            status += "not configured";
        }
        status += "\n";
        for (const auto& d : located.diagnostics) {
            if (d.state == LookupState::Absent) continue;
            status += "      " + d.source + ": " + lookup_state_to_string(d.state) + "\n";
        }
    }
    return status;
}

// ── OnboardingWizard ────────────────────────────────────────────

OnboardingWizard::OnboardingWizard(Paths paths,
                                   Prompter& prompter,
                                   CredentialVerifier& verifier,
                                   HardwareDetector& hardware,
                                   WizardOptions options,
                                   ExecutableLookup find_executable,
                                   SecretStore* secret_store)
    : paths_(std::move(paths)),
      prompter_(prompter),
      verifier_(verifier),
      hardware_(hardware),
      options_(options),
      find_executable_(find_executable ? std::move(find_executable)
                                       : path_executable_lookup()),
      locator_(CredentialLocator::default_sources(paths_), cache_),
      store_(paths_, cache_, secret_store),
      availability_(locator_, find_executable_),
      resolver_(prompter),
      state_(WizardState::fresh()) {}

bool OnboardingWizard::needs_setup() const {
    std::error_code ec;
    return !std::filesystem::exists(paths_.setup_marker(), ec);
}

RunOutcome OnboardingWizard::run() {
    if (!options_.force && !needs_setup()) {
        prompter_.say("Setup already complete. Use --force to run again.");
        return RunOutcome::AlreadyComplete;
    }

    state_ = WizardState::fresh();
    cache_.clear();
    config_ = SetupConfig::load(paths_);
    previous_provider_ = config_.provider;

    const auto& steps = wizard_steps();
    size_t index = 0;
    while (index < steps.size()) {
        WizardStep step = steps[index];
        state_.current_step = step;

        StepResult result = run_step(step);
        if (!result.success) {
            std::cerr << "[wizard] Step " << step_to_string(step) << " failed ("
                      << error_kind_to_string(result.error) << "): " << result.message << "\n";
            prompter_.say(result.message);
            // Nothing was written before this; keep it that way
            if (result.error != ErrorKind::NoProvider) persist_state();
            return RunOutcome::Failed;
        }

        if (!result.message.empty()) prompter_.say(result.message);
        state_.merge_data(result.data);
        if (result.skipped) {
            state_.mark_skipped(step);
        } else {
            state_.mark_completed(step);
        }

        size_t next = index + 1;
        if (result.next_step) {
            for (size_t i = 0; i < steps.size(); ++i) {
                if (steps[i] == *result.next_step) next = i;
            }
            for (size_t i = index + 1; i < next; ++i) {
                state_.mark_skipped(steps[i]);
            }
        }

        if (step != WizardStep::Welcome) persist_state();
        index = next > index ? next : index + 1;
    }
    return RunOutcome::Completed;
}

StepResult OnboardingWizard::run_step(WizardStep step) {
    switch (step) {
        case WizardStep::Welcome: return step_welcome();
        case WizardStep::ProviderSetup: return step_provider_setup();
        case WizardStep::HardwareDetection: return step_hardware_detection();
        case WizardStep::Preferences: return step_preferences();
        case WizardStep::ShellIntegration: return step_shell_integration();
        case WizardStep::TestCommand: return step_test_command();
        case WizardStep::Complete: return step_complete();
    }
    return StepResult::fail(ErrorKind::Resolution, "Unknown step");
}

StepResult OnboardingWizard::step_welcome() {
    prompter_.say("Welcome to Cortex setup!\n");
    if (options_.interactive) {
        prompter_.say("This will configure an AI provider, detect your hardware and\n"
                      "set a few preferences. It is safe to run again later.");
    }
    return StepResult::ok("", {{"interactive", options_.interactive}});
}

std::optional<std::string> OnboardingWizard::prompt_for_key(ProviderKind kind) {
    const std::string question = std::string("Enter your ") + provider_label(kind) + " API key: ";
    for (;;) {
        std::string value = trim(prompter_.ask_secret(question));
        if (value.empty()) return std::nullopt;
        if (is_valid_credential(value, kind)) return value;
        prompter_.say(std::string("That does not look like a ") + provider_label(kind) +
                      " key (expected it to start with \"" + credential_prefix(kind) +
                      "\"). Try again, or press Enter to cancel.");
    }
}

StepResult OnboardingWizard::step_provider_setup() {
    auto available = availability_.detect();
    ResolveResult resolved = resolver_.resolve(available, previous_provider_, options_.interactive);

    switch (resolved.status) {
        case ResolveStatus::NoProvider:
            return StepResult::fail(ErrorKind::NoProvider, resolved.message);
        case ResolveStatus::InvalidChoice:
            return StepResult::fail(ErrorKind::Resolution, resolved.message);
        case ResolveStatus::KeptCurrent: {
            // Stored credentials are left untouched
            config_.provider = resolved.provider;
            config_.credential_configured = !provider_needs_credential(resolved.provider) ||
                                            locator_.locate_for(resolved.provider).found();
            return StepResult::skip_to(WizardStep::Complete, resolved.message,
                                       {{"provider", provider_to_string(resolved.provider)},
                                        {"kept_current", true}});
        }
        case ResolveStatus::Selected:
            break;
    }

    ProviderKind provider = resolved.provider;
    prompter_.say(resolved.message);
    nlohmann::json data = {{"provider", provider_to_string(provider)}};

    if (!provider_needs_credential(provider)) {
        std::string runtime = find_executable_(ProviderAvailability::kLocalRuntime);
        if (runtime.empty()) {
            return StepResult::fail(ErrorKind::Availability,
                                    "Ollama is not installed. Install it from https://ollama.com "
                                    "and run setup again.");
        }
        config_.provider = provider;
        config_.credential_configured = false;
        save_config();
        data["ollama_installed"] = true;
        return StepResult::ok("Using local models via " + runtime, data);
    }

    const std::string name = credential_env_name(provider);
    auto located = locator_.locate(name, provider);
    Credential credential;

    if (located.found()) {
        credential = *located.credential;
        prompter_.say(name + " found in " + provenance_to_string(credential.provenance) + ".");
    } else {
        if (located.found_invalid()) {
            prompter_.say(name + " is set but is not a valid " + provider_label(provider) + " key.");
        }
        if (!options_.interactive) {
            return StepResult::fail(ErrorKind::Availability,
                                    "No valid " + name + " found. Add it to " +
                                    paths_.credential_file() + " and run setup again.");
        }

        auto entered = prompt_for_key(provider);
        if (!entered) {
            return StepResult::fail(ErrorKind::Format, "No API key provided.");
        }

        UpsertResult stored = store_.upsert(name, *entered);
        Provenance provenance = Provenance::CanonicalFile;
        if (stored.success && stored.tier == StoreTier::CanonicalFile) {
            prompter_.say("Saved " + name + " to " + stored.location + ".");
        } else if (stored.success) {
            provenance = Provenance::ShellProfile;
            prompter_.say("Could not write " + paths_.credential_file() + "; added " + name +
                          " to " + stored.location + " instead.");
        } else {
            provenance = Provenance::ProcessEnvironment;
            prompter_.say("Warning: could not save " + name + " (" + stored.error +
                          "). It is set for this session only.");
        }
        credential = {name, *entered, provider, provenance};
        data["credential_store"] = store_tier_to_string(stored.tier);

        // The key stays persisted even if verification fails below
        prompter_.say("Verifying " + std::string(provider_label(provider)) + " key...");
        if (!verifier_.verify(provider, credential)) {
            return StepResult::fail(ErrorKind::Verification,
                                    std::string("Could not verify the ") + provider_label(provider) +
                                    " key. Check the key and your network connection.");
        }
        prompter_.say("Key verified.");
    }

    config_.provider = provider;
    config_.credential_configured = true;
    save_config();
    data["credential_source"] = provenance_to_string(credential.provenance);
    return StepResult::ok("", data);
}

StepResult OnboardingWizard::step_hardware_detection() {
    nlohmann::json hw = hardware_.detect();
    if (!hw.is_object()) hw = unknown_hardware();
    config_.hardware = hw;
    save_config();

    std::string summary = "Hardware: ";
    if (hw.value("status", "") == "unknown") {
        summary += "could not be detected";
    } else {
        summary += hw.value("cpu_model", std::string("unknown CPU"));
        if (hw.contains("ram_gb") && hw["ram_gb"].is_number())
            summary += ", " + std::to_string(hw["ram_gb"].get<uint64_t>()) + " GB RAM";
        summary += ", GPU: " + hw.value("gpu", std::string("none detected"));
    }
    return StepResult::ok(summary, {{"hardware", hw}});
}

StepResult OnboardingWizard::step_preferences() {
    Preferences& prefs = config_.preferences;
    if (options_.interactive) {
        prefs.auto_confirm = prompter_.confirm("Run suggested commands without asking?", false);

        std::string current = verbosity_to_string(prefs.verbosity);
        std::string answer = prompter_.ask("Output verbosity (quiet/normal/verbose) [" +
                                           current + "]: ", current);
        if (answer != "quiet" && answer != "normal" && answer != "verbose") {
            prompter_.say("Unknown verbosity '" + answer + "', keeping " + current + ".");
            answer = current;
        }
        prefs.verbosity = verbosity_from_string(answer);

        prefs.caching_enabled = prompter_.confirm("Cache responses to speed up repeat requests?",
                                                  prefs.caching_enabled);
    }
    save_config();
    return StepResult::ok("", {{"preferences", config_.to_json()["preferences"]}});
}

StepResult OnboardingWizard::step_shell_integration() {
    if (!options_.interactive) {
        return StepResult::skip("Shell integration skipped (non-interactive).");
    }

    std::string shell = std::filesystem::path(env_or_empty("SHELL")).filename().string();
    if (shell.empty()) shell = "unknown";

    bool enabled = prompter_.confirm("Enable shell integration for " + shell + "?", true);
    config_.shell_integration.shell = shell;
    config_.shell_integration.enabled = enabled;
    save_config();
    return StepResult::ok("", {{"shell", shell}, {"shell_integration", enabled}});
}

StepResult OnboardingWizard::step_test_command() {
    if (!options_.interactive) {
        return StepResult::skip("Test command skipped (non-interactive).");
    }

    const auto& examples = dry_run_examples();
    static std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, examples.size() - 1);
    const std::string& example = examples[dist(gen)];

    prompter_.say("Try a dry run to see what Cortex would do:\n"
                  "  cortex install \"" + example + "\" --dry-run");
    return StepResult::ok("", {{"test_example", example}});
}

StepResult OnboardingWizard::step_complete() {
    if (!config_.save(paths_)) {
        return StepResult::fail(ErrorKind::Io, "Could not write " + paths_.config_file() + ".");
    }

    {
        std::ofstream marker(paths_.setup_marker(), std::ios::trunc);
        if (!marker.is_open()) {
            return StepResult::fail(ErrorKind::Io,
                                    "Could not create " + paths_.setup_marker() + ".");
        }
    }

    state_.stamp_completed(timestamp_now());
    return StepResult::ok(std::string("\nSetup complete! Provider: ") +
                          provider_to_string(config_.provider));
}

void OnboardingWizard::persist_state() {
    if (!state_.save(paths_.state_file())) {
        std::cerr << "[wizard] Progress was not saved; the next run starts over anyway\n";
    }
}

bool OnboardingWizard::save_config() {
    if (!config_.save(paths_)) {
        std::cerr << "[wizard] Continuing without a saved config\n";
        return false;
    }
    return true;
}

bool needs_first_run(const Paths& paths) {
    std::error_code ec;
    return !std::filesystem::exists(paths.setup_marker(), ec);
}

RunOutcome run_wizard(const Paths& paths, WizardOptions options) {
    http_init();
    CurlHttpClient http_client;
    HttpCredentialVerifier verifier(http_client);
    SystemHardwareDetector hardware;
    ConsolePrompter prompter;

    OnboardingWizard wizard(paths, prompter, verifier, hardware, options);
    RunOutcome outcome = wizard.run();

    http_cleanup();
    return outcome;
}

} // namespace cortex
