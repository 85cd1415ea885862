#pragma once
#include "credential.hpp"
#include <string>

namespace cortex {

enum class SourceState { Absent, Blank, Present, Unreadable };

struct SourceHit {
    SourceState state = SourceState::Absent;
    std::string value;
};

// One place a credential may be looked up. The locator walks an ordered list
// of these; the order is the precedence.
class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    virtual SourceHit lookup(const std::string& name, ProviderKind kind) const = 0;
    virtual Provenance provenance() const = 0;
    virtual std::string describe() const = 0;

    // An authoritative source is the source of truth: a blank entry there
    // means "explicitly unset" and stops the search.
    virtual bool authoritative() const { return false; }
};

} // namespace cortex
