#include "file_sources.hpp"
#include "../env_file.hpp"
#include "../util.hpp"

#include <filesystem>
#include <iostream>

namespace cortex {

namespace {

SourceHit from_lookup(const EnvLookup& lookup) {
    switch (lookup.state) {
        case EntryState::Missing: return {SourceState::Absent, ""};
        case EntryState::Blank: return {SourceState::Blank, ""};
        case EntryState::Present: return {SourceState::Present, lookup.value};
        case EntryState::Unreadable: return {SourceState::Unreadable, ""};
    }
    return {};
}

SourceHit read_env_source(const std::string& path, const std::string& name) {
    EnvLookup lookup = read_env_value(path, name);
    if (lookup.state == EntryState::Unreadable) {
        std::cerr << "[credentials] cannot read " << path << "\n";
    }
    return from_lookup(lookup);
}

// First non-comment line of a file that holds a bare key
std::string bare_key(const std::string& text) {
    for (const auto& line : split(text, '\n')) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.find('=') != std::string::npos) return "";
        return strip_quotes(s);
    }
    return "";
}

bool same_directory(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (std::filesystem::equivalent(a, b, ec)) return true;
    return std::filesystem::path(a).lexically_normal() ==
           std::filesystem::path(b).lexically_normal();
}

} // namespace

SourceHit CanonicalFileSource::lookup(const std::string& name, ProviderKind /*kind*/) const {
    return read_env_source(path_, name);
}

std::vector<std::string> ProviderCliSource::candidate_files(ProviderKind kind) const {
    switch (kind) {
        case ProviderKind::Anthropic:
            return {home_ + "/.config/anthropic/api_key", home_ + "/.anthropic/api_key"};
        case ProviderKind::OpenAI:
            return {home_ + "/.config/openai/api_key", home_ + "/.openai/api_key"};
        case ProviderKind::Ollama:
        case ProviderKind::None:
            return {};
    }
    return {};
}

SourceHit ProviderCliSource::lookup(const std::string& name, ProviderKind kind) const {
    for (const auto& path : candidate_files(kind)) {
        std::string text;
        if (!read_file(path, text)) continue;

        auto hit = from_lookup(find_env_value(text, name));
        if (hit.state == SourceState::Present) return hit;

        std::string key = bare_key(text);
        if (!key.empty()) return {SourceState::Present, key};
    }
    return {};
}

SourceHit ProjectFileSource::lookup(const std::string& name, ProviderKind /*kind*/) const {
    if (project_dir_.empty() || same_directory(project_dir_, config_dir_)) return {};
    return read_env_source(project_dir_ + "/.env", name);
}

} // namespace cortex
