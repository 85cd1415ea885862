#include "verifier.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cortex {

bool HttpCredentialVerifier::verify(ProviderKind kind, const Credential& credential) {
    HttpResponse response;
    switch (kind) {
        case ProviderKind::Anthropic: {
            json request = {
                {"model", "claude-3-haiku-20240307"},
                {"max_tokens", 1},
                {"messages", json::array({{{"role", "user"}, {"content", "Hello"}}})}
            };
            response = http_.post(kAnthropicUrl, request.dump(),
                                  {{"x-api-key", credential.value},
                                   {"anthropic-version", kAnthropicVersion},
                                   {"content-type", "application/json"}},
                                  timeout_seconds_);
            break;
        }
        case ProviderKind::OpenAI: {
            json request = {
                {"model", "gpt-4o-mini"},
                {"max_tokens", 1},
                {"messages", json::array({{{"role", "user"}, {"content", "Hello"}}})}
            };
            response = http_.post(kOpenAIUrl, request.dump(),
                                  {{"Authorization", "Bearer " + credential.value},
                                   {"Content-Type", "application/json"}},
                                  timeout_seconds_);
            break;
        }
        case ProviderKind::Ollama:
            return true;
        case ProviderKind::None:
            return false;
    }

    if (response.status_code == 200) return true;
    if (response.status_code == 0) {
        std::cerr << "[verify] " << provider_to_string(kind)
                  << ": no response within " << timeout_seconds_ << "s\n";
    } else {
        std::cerr << "[verify] " << provider_to_string(kind)
                  << " rejected the key (HTTP " << response.status_code << ")\n";
    }
    return false;
}

} // namespace cortex
