#pragma once
#include "../credential_source.hpp"
#include <string>
#include <utility>
#include <vector>

namespace cortex {

// ~/.cortex/.env
class CanonicalFileSource : public CredentialSource {
public:
    explicit CanonicalFileSource(std::string path) : path_(std::move(path)) {}

    SourceHit lookup(const std::string& name, ProviderKind kind) const override;
    Provenance provenance() const override { return Provenance::CanonicalFile; }
    std::string describe() const override { return path_; }
    bool authoritative() const override { return true; }

private:
    std::string path_;
};

// Credential files written by a provider's own CLI tooling. A file holds
// either a bare key or NAME=value lines.
class ProviderCliSource : public CredentialSource {
public:
    explicit ProviderCliSource(std::string home_dir) : home_(std::move(home_dir)) {}

    SourceHit lookup(const std::string& name, ProviderKind kind) const override;
    Provenance provenance() const override { return Provenance::SecondaryStore; }
    std::string describe() const override { return "provider CLI credential files"; }

    std::vector<std::string> candidate_files(ProviderKind kind) const;

private:
    std::string home_;
};

// <project>/.env, consulted only when running inside a project directory
class ProjectFileSource : public CredentialSource {
public:
    ProjectFileSource(std::string project_dir, std::string config_dir)
        : project_dir_(std::move(project_dir)), config_dir_(std::move(config_dir)) {}

    SourceHit lookup(const std::string& name, ProviderKind kind) const override;
    Provenance provenance() const override { return Provenance::ProjectFile; }
    std::string describe() const override { return project_dir_ + "/.env"; }

private:
    std::string project_dir_;
    std::string config_dir_;
};

} // namespace cortex
