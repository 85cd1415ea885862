#include "credential.hpp"

namespace cortex {

const std::vector<ProviderKind>& canonical_provider_order() {
    static const std::vector<ProviderKind> order = {
        ProviderKind::Anthropic, ProviderKind::OpenAI, ProviderKind::Ollama};
    return order;
}

const char* provider_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return "anthropic";
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::None: return "none";
    }
    return "none";
}

const char* provenance_to_string(Provenance provenance) {
    switch (provenance) {
        case Provenance::CanonicalFile: return "canonical file";
        case Provenance::ProcessEnvironment: return "environment";
        case Provenance::SecondaryStore: return "secondary store";
        case Provenance::ShellProfile: return "shell profile";
        case Provenance::ProjectFile: return "project file";
    }
    return "unknown";
}

const char* provider_label(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return "Anthropic (Claude)";
        case ProviderKind::OpenAI: return "OpenAI (GPT)";
        case ProviderKind::Ollama: return "Ollama (local, no API key)";
        case ProviderKind::None: return "None";
    }
    return "None";
}

ProviderKind provider_from_string(const std::string& name) {
    if (name == "anthropic") return ProviderKind::Anthropic;
    if (name == "openai") return ProviderKind::OpenAI;
    if (name == "ollama") return ProviderKind::Ollama;
    return ProviderKind::None;
}

} // namespace cortex
