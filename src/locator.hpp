#pragma once
#include "config.hpp"
#include "credential.hpp"
#include "credential_source.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortex {

// Credentials resolved during one onboarding run. Owned by the run and passed
// explicitly; lookups after the authoritative file consult it before the
// lower-priority sources.
class CredentialCache {
public:
    std::optional<Credential> get(const std::string& name) const;
    void put(const Credential& credential);
    void erase(const std::string& name);
    void clear() { entries_.clear(); }

private:
    std::unordered_map<std::string, Credential> entries_;
};

enum class LookupState { Absent, Blank, Invalid, Unreadable, Found };

const char* lookup_state_to_string(LookupState state);

struct SourceDiagnostic {
    Provenance provenance;
    std::string source;
    LookupState state;
};

struct LocateResult {
    std::optional<Credential> credential;
    std::vector<SourceDiagnostic> diagnostics;

    bool found() const { return credential.has_value(); }
    // Some source held a value that failed the format check
    bool found_invalid() const;
};

class CredentialLocator {
public:
    CredentialLocator(std::vector<std::unique_ptr<CredentialSource>> sources,
                      CredentialCache& cache);

    // Canonical file, environment, provider CLI files, project .env
    static std::vector<std::unique_ptr<CredentialSource>> default_sources(const Paths& paths);

    // First valid hit in source order wins.
    LocateResult locate(const std::string& name, ProviderKind kind);

    // locate() under the provider's conventional env-var name
    LocateResult locate_for(ProviderKind kind);

private:
    std::vector<std::unique_ptr<CredentialSource>> sources_;
    CredentialCache& cache_;
};

} // namespace cortex
