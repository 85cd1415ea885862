#include "locator.hpp"
#include "sources/environment_source.hpp"
#include "sources/file_sources.hpp"
#include "util.hpp"
#include "validator.hpp"

#include <cstdlib>
#include <iostream>

namespace cortex {

std::optional<Credential> CredentialCache::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void CredentialCache::put(const Credential& credential) {
    entries_[credential.name] = credential;
}

void CredentialCache::erase(const std::string& name) {
    entries_.erase(name);
}

const char* lookup_state_to_string(LookupState state) {
    switch (state) {
        case LookupState::Absent: return "absent";
        case LookupState::Blank: return "blank";
        case LookupState::Invalid: return "found but invalid";
        case LookupState::Unreadable: return "unreadable";
        case LookupState::Found: return "found";
    }
    return "absent";
}

bool LocateResult::found_invalid() const {
    for (const auto& d : diagnostics) {
        if (d.state == LookupState::Invalid) return true;
    }
    return false;
}

CredentialLocator::CredentialLocator(std::vector<std::unique_ptr<CredentialSource>> sources,
                                     CredentialCache& cache)
    : sources_(std::move(sources)), cache_(cache) {}

std::vector<std::unique_ptr<CredentialSource>> CredentialLocator::default_sources(
    const Paths& paths) {
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::make_unique<CanonicalFileSource>(paths.credential_file()));
    sources.push_back(std::make_unique<EnvironmentSource>());
    sources.push_back(std::make_unique<ProviderCliSource>(expand_home("~")));
    sources.push_back(std::make_unique<ProjectFileSource>(paths.project_dir, paths.config_dir));
    return sources;
}

LocateResult CredentialLocator::locate(const std::string& name, ProviderKind kind) {
    LocateResult result;
    if (name.empty()) return result;

    for (const auto& source : sources_) {
        SourceHit hit = source->lookup(name, kind);

        if (hit.state == SourceState::Blank && source->authoritative()) {
            // Explicitly unset: drop anything resolved earlier in this run
            result.diagnostics.push_back({source->provenance(), source->describe(),
                                          LookupState::Blank});
            cache_.erase(name);
            std::cerr << "[credentials] " << name << " is blank in " << source->describe();
            if (std::getenv(name.c_str())) {
                unsetenv(name.c_str());
                std::cerr << "; cleared from environment";
            }
            std::cerr << "\n";
            return result;
        }

        if (hit.state == SourceState::Present) {
            if (is_valid_credential(hit.value, kind)) {
                result.diagnostics.push_back({source->provenance(), source->describe(),
                                              LookupState::Found});
                Credential cred{name, trim(hit.value), kind, source->provenance()};
                if (!source->authoritative()) cache_.put(cred);
                result.credential = cred;
                return result;
            }
            std::cerr << "[credentials] " << name << " in " << source->describe()
                      << " does not look like a " << provider_to_string(kind)
                      << " key; ignoring it\n";
            result.diagnostics.push_back({source->provenance(), source->describe(),
                                          LookupState::Invalid});
        } else if (hit.state == SourceState::Unreadable) {
            // Logged by the source; treated as not configured there
            result.diagnostics.push_back({source->provenance(), source->describe(),
                                          LookupState::Unreadable});
        } else {
            result.diagnostics.push_back({source->provenance(), source->describe(),
                                          hit.state == SourceState::Blank
                                              ? LookupState::Blank : LookupState::Absent});
        }

        if (source->authoritative()) {
            auto cached = cache_.get(name);
            if (cached && is_valid_credential(cached->value, kind)) {
                cached->kind = kind;
                result.diagnostics.push_back({cached->provenance, "run cache",
                                              LookupState::Found});
                result.credential = cached;
                return result;
            }
        }
    }
    return result;
}

LocateResult CredentialLocator::locate_for(ProviderKind kind) {
    return locate(credential_env_name(kind), kind);
}

} // namespace cortex
