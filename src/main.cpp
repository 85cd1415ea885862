#include "config.hpp"
#include "locator.hpp"
#include "onboard.hpp"
#include "provider.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

static void print_usage() {
    std::cout << "Usage: cortex-setup [options]\n"
              << "\n"
              << "Options:\n"
              << "  --force                Run setup even if it already completed\n"
              << "  -y, --non-interactive  Never prompt; pick the first available provider\n"
              << "  --status               Show provider availability and setup state\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY      API key for Anthropic\n"
              << "  OPENAI_API_KEY         API key for OpenAI\n"
              << "\n"
              << "Credentials are read from ~/.cortex/.env first, then the environment,\n"
              << "then provider CLI credential files, then ./.env.\n";
}

static int print_status(const cortex::Paths& paths) {
    cortex::CredentialCache cache;
    cortex::CredentialLocator locator(cortex::CredentialLocator::default_sources(paths), cache);
    cortex::ProviderAvailability availability(locator);

    std::cout << cortex::format_provider_status(locator, availability);

    auto config = cortex::SetupConfig::load(paths);
    std::cout << "\nSaved provider: " << cortex::provider_to_string(config.provider) << "\n"
              << "Setup: " << (cortex::needs_first_run(paths) ? "not complete" : "complete")
              << "\n";

    if (auto state = cortex::WizardState::load(paths.state_file())) {
        std::cout << "Last run: started " << state->started_at;
        if (state->completed_at) std::cout << ", completed " << *state->completed_at;
        std::cout << " (" << state->completed_steps.size() << " steps done, "
                  << state->skipped_steps.size() << " skipped)\n";
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    bool force = false;
    bool interactive = isatty(STDIN_FILENO) != 0;
    bool status = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--force") == 0) {
            force = true;
        } else if (std::strcmp(argv[i], "-y") == 0 ||
                   std::strcmp(argv[i], "--non-interactive") == 0) {
            interactive = false;
        } else if (std::strcmp(argv[i], "--status") == 0) {
            status = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto paths = cortex::Paths::defaults();
    if (status) return print_status(paths);

    cortex::WizardOptions options;
    options.interactive = interactive;
    options.force = force;

    return cortex::run_wizard(paths, options) == cortex::RunOutcome::Failed ? 1 : 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
