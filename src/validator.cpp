#include "validator.hpp"
#include "util.hpp"

namespace cortex {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

const char* credential_prefix(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return "sk-ant-";
        case ProviderKind::OpenAI: return "sk-";
        case ProviderKind::Ollama:
        case ProviderKind::None:
            return "";
    }
    return "";
}

std::string credential_env_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return "ANTHROPIC_API_KEY";
        case ProviderKind::OpenAI: return "OPENAI_API_KEY";
        case ProviderKind::Ollama:
        case ProviderKind::None:
            return "";
    }
    return "";
}

bool is_valid_credential(const std::string& raw, ProviderKind kind) {
    std::string value = trim(raw);
    if (value.empty()) return false;

    switch (kind) {
        case ProviderKind::Anthropic:
            return starts_with(value, credential_prefix(ProviderKind::Anthropic));
        case ProviderKind::OpenAI:
            // "sk-" is shared; the longer Anthropic prefix takes precedence
            return starts_with(value, credential_prefix(ProviderKind::OpenAI)) &&
                   !starts_with(value, credential_prefix(ProviderKind::Anthropic));
        case ProviderKind::Ollama:
        case ProviderKind::None:
            return true;
    }
    return false;
}

} // namespace cortex
