#pragma once
#include "credential.hpp"
#include <string>

namespace cortex {

// Key prefix a provider's credentials start with ("" = no convention)
const char* credential_prefix(ProviderKind kind);

// Env-var style name under which a provider's credential is stored
// ("" for providers that need none)
std::string credential_env_name(ProviderKind kind);

// Format-only check. Blank values are always invalid. A value carrying a more
// specific prefix of another provider is rejected (sk-ant-... is never OpenAI).
bool is_valid_credential(const std::string& raw, ProviderKind kind);

} // namespace cortex
