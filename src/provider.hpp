#pragma once
#include "credential.hpp"
#include "locator.hpp"
#include "prompt.hpp"
#include <functional>
#include <string>
#include <vector>

namespace cortex {

// Returns the path of an executable or "" (injectable for testing)
using ExecutableLookup = std::function<std::string(const std::string& name)>;

// Lookup on the process $PATH
ExecutableLookup path_executable_lookup();

// Which provider kinds are usable right now. Nothing is cached between calls,
// credentials may appear mid-run.
class ProviderAvailability {
public:
    ProviderAvailability(CredentialLocator& locator, ExecutableLookup find_executable);
    explicit ProviderAvailability(CredentialLocator& locator);

    // Available kinds in canonical order
    std::vector<ProviderKind> detect();

    bool is_available(ProviderKind kind);

    // Name of the local runtime executable
    static constexpr const char* kLocalRuntime = "ollama";

private:
    CredentialLocator& locator_;
    ExecutableLookup find_executable_;
};

// ── Provider resolution ─────────────────────────────────────────

enum class ResolveStatus { Selected, KeptCurrent, NoProvider, InvalidChoice };

struct ResolveResult {
    ResolveStatus status = ResolveStatus::NoProvider;
    ProviderKind provider = ProviderKind::None;
    std::string message;

    bool ok() const {
        return status == ResolveStatus::Selected || status == ResolveStatus::KeptCurrent;
    }
};

struct MenuOption {
    std::string label;
    ProviderKind provider = ProviderKind::None;
    bool keep_current = false;
};

// "Keep current" first (repeat runs only), then every kind in canonical order
// annotated with its availability.
std::vector<MenuOption> build_provider_menu(const std::vector<ProviderKind>& available,
                                            ProviderKind previously_saved);

// Actionable text shown when nothing is reachable
std::string no_provider_message();

class ProviderResolver {
public:
    explicit ProviderResolver(Prompter& prompter) : prompter_(prompter) {}

    ResolveResult resolve(const std::vector<ProviderKind>& available,
                          ProviderKind previously_saved,
                          bool interactive);

private:
    Prompter& prompter_;
};

} // namespace cortex
