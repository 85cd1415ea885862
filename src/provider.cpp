#include "provider.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace cortex {

ExecutableLookup path_executable_lookup() {
    return [](const std::string& name) { return find_executable(name); };
}

ProviderAvailability::ProviderAvailability(CredentialLocator& locator,
                                           ExecutableLookup find_exe)
    : locator_(locator),
      find_executable_(find_exe ? std::move(find_exe) : path_executable_lookup()) {}

ProviderAvailability::ProviderAvailability(CredentialLocator& locator)
    : ProviderAvailability(locator, path_executable_lookup()) {}

bool ProviderAvailability::is_available(ProviderKind kind) {
    if (provider_needs_credential(kind)) {
        return locator_.locate_for(kind).found();
    }
    if (kind == ProviderKind::Ollama) {
        return !find_executable_(kLocalRuntime).empty();
    }
    return false;
}

std::vector<ProviderKind> ProviderAvailability::detect() {
    std::vector<ProviderKind> available;
    for (ProviderKind kind : canonical_provider_order()) {
        if (is_available(kind)) available.push_back(kind);
    }
    return available;
}

// ── Resolution ──────────────────────────────────────────────────

namespace {

bool contains(const std::vector<ProviderKind>& kinds, ProviderKind kind) {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

const char* availability_note(ProviderKind kind, bool available) {
    if (available) return "available";
    return kind == ProviderKind::Ollama ? "not installed" : "not configured";
}

// 1-based choice, 0 on invalid input
int parse_choice(const std::string& input, size_t max) {
    std::string s = trim(input);
    if (s.empty()) return 0;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    try {
        int n = std::stoi(s);
        if (n >= 1 && static_cast<size_t>(n) <= max) return n;
    } catch (const std::out_of_range&) {
        return 0;
    }
    return 0;
}

} // namespace

std::vector<MenuOption> build_provider_menu(const std::vector<ProviderKind>& available,
                                            ProviderKind previously_saved) {
    std::vector<MenuOption> menu;
    if (previously_saved != ProviderKind::None) {
        menu.push_back({std::string("Keep current (") + provider_to_string(previously_saved) + ")",
                        previously_saved, true});
    }
    for (ProviderKind kind : canonical_provider_order()) {
        std::string label = provider_label(kind);
        label += " [";
        label += availability_note(kind, contains(available, kind));
        label += "]";
        menu.push_back({label, kind, false});
    }
    return menu;
}

std::string no_provider_message() {
    return "No AI provider is reachable.\n"
           "Set ANTHROPIC_API_KEY or OPENAI_API_KEY in ~/.cortex/.env or your environment,\n"
           "or install Ollama (https://ollama.com) for local models, then run setup again.";
}

ResolveResult ProviderResolver::resolve(const std::vector<ProviderKind>& available,
                                        ProviderKind previously_saved,
                                        bool interactive) {
    ResolveResult result;

    if (available.size() == 1) {
        result.status = ResolveStatus::Selected;
        result.provider = available.front();
        result.message = std::string("Using ") + provider_label(result.provider);
        return result;
    }

    if (available.empty()) {
        result.status = ResolveStatus::NoProvider;
        result.message = no_provider_message();
        return result;
    }

    if (!interactive) {
        for (ProviderKind kind : canonical_provider_order()) {
            if (contains(available, kind)) {
                result.status = ResolveStatus::Selected;
                result.provider = kind;
                result.message = std::string("Using ") + provider_label(kind);
                return result;
            }
        }
        result.message = no_provider_message();
        return result;
    }

    auto menu = build_provider_menu(available, previously_saved);
    prompter_.say("Choose a provider:");
    for (size_t i = 0; i < menu.size(); ++i) {
        prompter_.say("  " + std::to_string(i + 1) + ". " + menu[i].label);
    }

    int choice = parse_choice(prompter_.ask("> ", ""), menu.size());
    if (choice == 0) {
        result.status = ResolveStatus::InvalidChoice;
        result.message = "Invalid choice.";
        return result;
    }

    const MenuOption& picked = menu[static_cast<size_t>(choice - 1)];
    result.provider = picked.provider;
    if (picked.keep_current) {
        result.status = ResolveStatus::KeptCurrent;
        result.message = std::string("Keeping ") + provider_label(picked.provider);
    } else {
        result.status = ResolveStatus::Selected;
        result.message = std::string("Selected ") + provider_label(picked.provider);
    }
    return result;
}

} // namespace cortex
