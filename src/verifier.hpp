#pragma once
#include "credential.hpp"
#include "http.hpp"
#include <string>

namespace cortex {

// Live check that a credential is accepted by its provider
class CredentialVerifier {
public:
    virtual ~CredentialVerifier() = default;
    virtual bool verify(ProviderKind kind, const Credential& credential) = 0;
};

// One minimal request per check. The timeout is a hard cutoff and nothing is
// retried; an expired request counts as a failed verification.
class HttpCredentialVerifier : public CredentialVerifier {
public:
    explicit HttpCredentialVerifier(HttpClient& http, long timeout_seconds = kTimeoutSeconds)
        : http_(http), timeout_seconds_(timeout_seconds) {}

    bool verify(ProviderKind kind, const Credential& credential) override;

    static constexpr long kTimeoutSeconds = 10;
    static constexpr const char* kAnthropicUrl = "https://api.anthropic.com/v1/messages";
    static constexpr const char* kOpenAIUrl = "https://api.openai.com/v1/chat/completions";
    static constexpr const char* kAnthropicVersion = "2023-06-01";

private:
    HttpClient& http_;
    long timeout_seconds_;
};

} // namespace cortex
