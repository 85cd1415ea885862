#pragma once
#include "config.hpp"
#include "locator.hpp"
#include <string>

namespace cortex {

// Longer-term, possibly encrypted, copy of credentials. Reaching it is
// best-effort and never decides the outcome of an upsert.
class SecretStore {
public:
    virtual ~SecretStore() = default;
    virtual bool put(const std::string& name, const std::string& value) = 0;
};

enum class StoreTier { CanonicalFile, ShellProfile, ProcessOnly };

const char* store_tier_to_string(StoreTier tier);

struct UpsertResult {
    bool success = false;
    StoreTier tier = StoreTier::ProcessOnly;
    bool secondary_stored = false;
    std::string location;  // file that received the value
    std::string error;     // non-empty when a tier failed
};

// Shell profile for a $SHELL value: zsh, bash, fish or ~/.profile
std::string shell_profile_path(const std::string& shell, const std::string& home);

// Line appended to a shell profile
std::string profile_export_line(const std::string& shell,
                                const std::string& name,
                                const std::string& value);

class CredentialStore {
public:
    CredentialStore(Paths paths, CredentialCache& cache, SecretStore* secondary = nullptr);

    // Write or replace name in the canonical file. Falls back to the shell
    // profile, then to this process only.
    UpsertResult upsert(const std::string& name, const std::string& value);

private:
    bool write_canonical(const std::string& name, const std::string& value,
                         std::string& error);
    bool append_to_profile(const std::string& name, const std::string& value,
                           std::string& profile, std::string& error);

    Paths paths_;
    CredentialCache& cache_;
    SecretStore* secondary_;
};

} // namespace cortex
