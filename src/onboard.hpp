#pragma once
#include "config.hpp"
#include "hardware.hpp"
#include "locator.hpp"
#include "prompt.hpp"
#include "provider.hpp"
#include "store.hpp"
#include "verifier.hpp"
#include "wizard_state.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cortex {

// Failure classes of a step. NoProvider means nothing at all could be used;
// it is the only failure that leaves no state behind.
enum class ErrorKind { None, Format, Io, Availability, NoProvider, Resolution, Verification };

const char* error_kind_to_string(ErrorKind kind);

// Outcome of one wizard step. next_step is the only way to leave the linear
// order; steps jumped over are recorded as skipped.
struct StepResult {
    bool success = true;
    bool skipped = false;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    std::optional<WizardStep> next_step;
    ErrorKind error = ErrorKind::None;

    static StepResult ok(std::string message = "",
                         nlohmann::json data = nlohmann::json::object());
    static StepResult skip(std::string message);
    static StepResult skip_to(WizardStep next, std::string message,
                              nlohmann::json data = nlohmann::json::object());
    static StepResult fail(ErrorKind error, std::string message);
};

enum class RunOutcome { Completed, AlreadyComplete, Failed };

struct WizardOptions {
    bool interactive = true;
    bool force = false;  // run even when the setup marker exists
};

// Example requests offered by the test-command step
const std::vector<std::string>& dry_run_examples();

// One line per provider kind: availability and where its credential came from
std::string format_provider_status(CredentialLocator& locator,
                                   ProviderAvailability& availability);

class OnboardingWizard {
public:
    OnboardingWizard(Paths paths,
                     Prompter& prompter,
                     CredentialVerifier& verifier,
                     HardwareDetector& hardware,
                     WizardOptions options,
                     ExecutableLookup find_executable = {},
                     SecretStore* secret_store = nullptr);

    // True when the setup-complete marker is absent
    bool needs_setup() const;

    // Runs every step from Welcome. Always a full re-run, never a resume.
    RunOutcome run();

    const WizardState& state() const { return state_; }
    const SetupConfig& config() const { return config_; }

private:
    StepResult run_step(WizardStep step);
    StepResult step_welcome();
    StepResult step_provider_setup();
    StepResult step_hardware_detection();
    StepResult step_preferences();
    StepResult step_shell_integration();
    StepResult step_test_command();
    StepResult step_complete();

    // Prompt until a well-formed key is entered or input is cancelled
    std::optional<std::string> prompt_for_key(ProviderKind kind);

    void persist_state();
    bool save_config();

    Paths paths_;
    Prompter& prompter_;
    CredentialVerifier& verifier_;
    HardwareDetector& hardware_;
    WizardOptions options_;
    ExecutableLookup find_executable_;

    CredentialCache cache_;
    CredentialLocator locator_;
    CredentialStore store_;
    ProviderAvailability availability_;
    ProviderResolver resolver_;

    WizardState state_;
    SetupConfig config_;
    ProviderKind previous_provider_ = ProviderKind::None;
};

// Convenience entry points for the host application
bool needs_first_run(const Paths& paths);

// Runs the wizard against the console, libcurl and /proc
RunOutcome run_wizard(const Paths& paths, WizardOptions options);

} // namespace cortex
