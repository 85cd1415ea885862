#include "env_file.hpp"
#include "util.hpp"

#include <filesystem>
#include <sstream>

namespace cortex {

std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line) {
    std::string s = trim(line);
    if (s.empty() || s[0] == '#') return std::nullopt;
    if (s.rfind("export ", 0) == 0) s = trim(s.substr(7));

    auto eq = s.find('=');
    if (eq == std::string::npos) return std::nullopt;

    std::string name = trim(s.substr(0, eq));
    if (name.empty()) return std::nullopt;
    std::string value = strip_quotes(trim(s.substr(eq + 1)));
    return std::make_pair(name, value);
}

EnvLookup find_env_value(const std::string& text, const std::string& name) {
    EnvLookup result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto entry = parse_env_line(line);
        if (!entry || entry->first != name) continue;
        std::string value = trim(entry->second);
        if (value.empty()) {
            result.state = EntryState::Blank;
            result.value.clear();
        } else {
            result.state = EntryState::Present;
            result.value = value;
        }
    }
    return result;
}

EnvLookup read_env_value(const std::string& path, const std::string& name) {
    std::string text;
    if (!read_file(path, text)) {
        std::error_code ec;
        if (std::filesystem::status(path, ec).type() == std::filesystem::file_type::not_found)
            return {};
        return {EntryState::Unreadable, ""};
    }
    return find_env_value(text, name);
}

std::string format_env_line(const std::string& name, const std::string& value) {
    return name + "=\"" + value + "\"";
}

std::string upsert_env_text(const std::string& text,
                            const std::string& name,
                            const std::string& value) {
    std::string out;
    bool replaced = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto entry = parse_env_line(line);
        if (entry && entry->first == name) {
            if (!replaced) {
                out += format_env_line(name, value) + "\n";
                replaced = true;
            }
            continue;
        }
        out += line + "\n";
    }

    if (!replaced) {
        out += format_env_line(name, value) + "\n";
    }
    return out;
}

} // namespace cortex
