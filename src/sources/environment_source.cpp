#include "environment_source.hpp"
#include "../util.hpp"

#include <cstdlib>

namespace cortex {

SourceHit EnvironmentSource::lookup(const std::string& name, ProviderKind /*kind*/) const {
    const char* v = std::getenv(name.c_str());
    if (!v) return {};
    std::string value = trim(v);
    if (value.empty()) return {SourceState::Blank, ""};
    return {SourceState::Present, value};
}

} // namespace cortex
