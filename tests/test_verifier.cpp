#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "verifier.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cortex;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

TEST_CASE("HttpCredentialVerifier: anthropic request shape", "[verify]") {
    MockHttpClient mock;
    mock.next_response = {200, "{}"};
    HttpCredentialVerifier verifier(mock);

    Credential cred{"ANTHROPIC_API_KEY", "sk-ant-test", ProviderKind::Anthropic,
                    Provenance::CanonicalFile};
    REQUIRE(verifier.verify(ProviderKind::Anthropic, cred));

    REQUIRE(mock.last_url == "https://api.anthropic.com/v1/messages");
    REQUIRE(find_header(mock.last_headers, "x-api-key") == "sk-ant-test");
    REQUIRE(find_header(mock.last_headers, "anthropic-version") == "2023-06-01");
    REQUIRE(mock.last_timeout == HttpCredentialVerifier::kTimeoutSeconds);

    auto body = json::parse(mock.last_body);
    REQUIRE(body["max_tokens"] == 1);
    REQUIRE(body["messages"].size() == 1);
}

TEST_CASE("HttpCredentialVerifier: openai uses bearer auth", "[verify]") {
    MockHttpClient mock;
    mock.next_response = {200, "{}"};
    HttpCredentialVerifier verifier(mock);

    Credential cred{"OPENAI_API_KEY", "sk-test", ProviderKind::OpenAI,
                    Provenance::ProcessEnvironment};
    REQUIRE(verifier.verify(ProviderKind::OpenAI, cred));
    REQUIRE(mock.last_url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer sk-test");
}

TEST_CASE("HttpCredentialVerifier: rejection and timeout both fail, no retry", "[verify]") {
    MockHttpClient mock;
    HttpCredentialVerifier verifier(mock, 3);
    Credential cred{"OPENAI_API_KEY", "sk-test", ProviderKind::OpenAI,
                    Provenance::CanonicalFile};

    mock.next_response = {401, R"({"error":"invalid key"})"};
    REQUIRE_FALSE(verifier.verify(ProviderKind::OpenAI, cred));

    mock.next_response = {0, ""};
    REQUIRE_FALSE(verifier.verify(ProviderKind::OpenAI, cred));
    REQUIRE(mock.call_count == 2);
    REQUIRE(mock.last_timeout == 3);
}

TEST_CASE("HttpCredentialVerifier: local runner needs no network", "[verify]") {
    MockHttpClient mock;
    HttpCredentialVerifier verifier(mock);
    REQUIRE(verifier.verify(ProviderKind::Ollama, Credential{}));
    REQUIRE(mock.call_count == 0);
}
