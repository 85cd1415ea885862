#include <catch2/catch.hpp>
#include "validator.hpp"

using namespace cortex;

TEST_CASE("is_valid_credential: blank values are never valid", "[validator]") {
    for (ProviderKind kind : {ProviderKind::Anthropic, ProviderKind::OpenAI,
                              ProviderKind::Ollama, ProviderKind::None}) {
        REQUIRE_FALSE(is_valid_credential("", kind));
        REQUIRE_FALSE(is_valid_credential("   ", kind));
        REQUIRE_FALSE(is_valid_credential("\t\n", kind));
    }
}

TEST_CASE("is_valid_credential: anthropic requires sk-ant- prefix", "[validator]") {
    REQUIRE(is_valid_credential("sk-ant-x", ProviderKind::Anthropic));
    REQUIRE(is_valid_credential("  sk-ant-api03-abc  ", ProviderKind::Anthropic));
    REQUIRE_FALSE(is_valid_credential("sk-x", ProviderKind::Anthropic));
    REQUIRE_FALSE(is_valid_credential("ant-sk-x", ProviderKind::Anthropic));
}

TEST_CASE("is_valid_credential: openai excludes the anthropic prefix", "[validator]") {
    REQUIRE(is_valid_credential("sk-x", ProviderKind::OpenAI));
    REQUIRE(is_valid_credential("sk-proj-abc", ProviderKind::OpenAI));
    REQUIRE_FALSE(is_valid_credential("sk-ant-x", ProviderKind::OpenAI));
    REQUIRE_FALSE(is_valid_credential("pk-x", ProviderKind::OpenAI));
}

TEST_CASE("is_valid_credential: providers without convention accept any value", "[validator]") {
    REQUIRE(is_valid_credential("anything", ProviderKind::Ollama));
    REQUIRE(is_valid_credential("anything", ProviderKind::None));
}

TEST_CASE("credential_env_name: conventional variable names", "[validator]") {
    REQUIRE(credential_env_name(ProviderKind::Anthropic) == "ANTHROPIC_API_KEY");
    REQUIRE(credential_env_name(ProviderKind::OpenAI) == "OPENAI_API_KEY");
    REQUIRE(credential_env_name(ProviderKind::Ollama).empty());
}
