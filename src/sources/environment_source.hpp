#pragma once
#include "../credential_source.hpp"

namespace cortex {

// Variables of the running process
class EnvironmentSource : public CredentialSource {
public:
    SourceHit lookup(const std::string& name, ProviderKind kind) const override;
    Provenance provenance() const override { return Provenance::ProcessEnvironment; }
    std::string describe() const override { return "process environment"; }
};

} // namespace cortex
