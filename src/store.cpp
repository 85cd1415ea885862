#include "store.hpp"
#include "env_file.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace cortex {

const char* store_tier_to_string(StoreTier tier) {
    switch (tier) {
        case StoreTier::CanonicalFile: return "canonical file";
        case StoreTier::ShellProfile: return "shell profile";
        case StoreTier::ProcessOnly: return "current process only";
    }
    return "current process only";
}

std::string shell_profile_path(const std::string& shell, const std::string& home) {
    std::string base = std::filesystem::path(shell).filename().string();
    if (base == "zsh") return home + "/.zshrc";
    if (base == "bash") return home + "/.bashrc";
    if (base == "fish") return home + "/.config/fish/config.fish";
    return home + "/.profile";
}

// Single-quoted shell word; nothing inside is expanded when the profile is
// sourced. POSIX shells close and reopen the quote around a literal ';
// fish accepts \\ and \' inside single quotes.
static std::string shell_quote(const std::string& value, bool fish) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += fish ? "\\'" : "'\\''";
        } else if (c == '\\' && fish) {
            out += "\\\\";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string profile_export_line(const std::string& shell,
                                const std::string& name,
                                const std::string& value) {
    if (std::filesystem::path(shell).filename().string() == "fish") {
        return "set -gx " + name + " " + shell_quote(value, true);
    }
    return "export " + name + "=" + shell_quote(value, false);
}

CredentialStore::CredentialStore(Paths paths, CredentialCache& cache, SecretStore* secondary)
    : paths_(std::move(paths)), cache_(cache), secondary_(secondary) {}

bool CredentialStore::write_canonical(const std::string& name, const std::string& value,
                                      std::string& error) {
    const std::string path = paths_.credential_file();
    std::string text;
    if (!read_file(path, text)) {
        std::error_code ec;
        if (std::filesystem::status(path, ec).type() != std::filesystem::file_type::not_found) {
            error = "cannot read " + path;
            return false;
        }
        text.clear();
    }

    if (!atomic_write_file(path, upsert_env_text(text, name, value), 0600)) {
        error = "cannot write " + path;
        return false;
    }
    return true;
}

bool CredentialStore::append_to_profile(const std::string& name, const std::string& value,
                                        std::string& profile, std::string& error) {
    std::string shell = env_or_empty("SHELL");
    profile = shell_profile_path(shell, expand_home("~"));
    std::string line = profile_export_line(shell, name, value);

    std::string existing;
    if (read_file(profile, existing)) {
        for (const auto& l : split(existing, '\n')) {
            if (trim(l) == line) return true;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(profile).parent_path(), ec);
    std::ofstream out(profile, std::ios::app);
    if (!out.is_open()) {
        error = "cannot open " + profile;
        return false;
    }
    if (!existing.empty() && existing.back() != '\n') out << "\n";
    out << "\n# Added by cortex setup\n" << line << "\n";
    out.flush();
    if (!out) {
        error = "cannot write " + profile;
        return false;
    }
    return true;
}

UpsertResult CredentialStore::upsert(const std::string& name, const std::string& value) {
    UpsertResult result;
    std::string clean = trim(value);
    if (name.empty() || clean.empty()) {
        result.error = "refusing to store an empty credential";
        std::cerr << "[store] " << result.error << "\n";
        return result;
    }

    std::string error;
    if (write_canonical(name, clean, error)) {
        result.success = true;
        result.tier = StoreTier::CanonicalFile;
        result.location = paths_.credential_file();
        cache_.put({name, clean, ProviderKind::None, Provenance::CanonicalFile});
    } else {
        std::cerr << "[store] " << error << "; falling back to shell profile\n";
        result.error = error;

        std::string profile;
        std::string profile_error;
        if (append_to_profile(name, clean, profile, profile_error)) {
            result.success = true;
            result.tier = StoreTier::ShellProfile;
            result.location = profile;
            cache_.put({name, clean, ProviderKind::None, Provenance::ShellProfile});
        } else {
            std::cerr << "[store] " << profile_error
                      << "; " << name << " is only set for this process\n";
            result.error += "; " + profile_error;
            result.tier = StoreTier::ProcessOnly;
            cache_.put({name, clean, ProviderKind::None, Provenance::ProcessEnvironment});
            setenv(name.c_str(), clean.c_str(), 1);
        }
    }

    if (secondary_) {
        result.secondary_stored = secondary_->put(name, clean);
        if (!result.secondary_stored) {
            std::cerr << "[store] Secondary store did not accept " << name << "\n";
        }
    }
    return result;
}

} // namespace cortex
