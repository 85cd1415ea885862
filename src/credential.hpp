#pragma once
#include <string>
#include <vector>

namespace cortex {

enum class ProviderKind { Anthropic, OpenAI, Ollama, None };

// Where a resolved credential came from
enum class Provenance {
    CanonicalFile,
    ProcessEnvironment,
    SecondaryStore,
    ShellProfile,
    ProjectFile
};

struct Credential {
    std::string name;   // env-var style key, e.g. ANTHROPIC_API_KEY
    std::string value;
    ProviderKind kind = ProviderKind::None;
    Provenance provenance = Provenance::CanonicalFile;
};

// Fixed menu/detection order
const std::vector<ProviderKind>& canonical_provider_order();

const char* provider_to_string(ProviderKind kind);
const char* provenance_to_string(Provenance provenance);

// Human-readable label for menus and status output
const char* provider_label(ProviderKind kind);

// Parse "anthropic", "openai", "ollama", "none". Unknown names map to None.
ProviderKind provider_from_string(const std::string& name);

// Local runners need no credential
inline bool provider_needs_credential(ProviderKind kind) {
    return kind == ProviderKind::Anthropic || kind == ProviderKind::OpenAI;
}

} // namespace cortex
