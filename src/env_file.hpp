#pragma once
#include <optional>
#include <string>
#include <utility>

namespace cortex {

// Line-oriented NAME=value documents (.env files, CLI credential files)

// Parse one line. Blank lines, '#' comments and lines without '=' yield
// nullopt. An optional leading "export " is accepted. The value is trimmed and
// one layer of matching quotes is stripped.
std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);

// Unreadable: the file exists but could not be read
enum class EntryState { Missing, Blank, Present, Unreadable };

struct EnvLookup {
    EntryState state = EntryState::Missing;
    std::string value;
};

// Look up a name in document text. The last definition wins.
EnvLookup find_env_value(const std::string& text, const std::string& name);

// Look up a name in a file. A file that does not exist is Missing; one that
// exists but cannot be read is Unreadable.
EnvLookup read_env_value(const std::string& path, const std::string& name);

// NAME="value" line as written by upsert_env_text
std::string format_env_line(const std::string& name, const std::string& value);

// Replace the definition of name (collapsing duplicates into the position of
// the first one) or append it. Unrelated lines keep their content and order.
std::string upsert_env_text(const std::string& text,
                            const std::string& name,
                            const std::string& value);

} // namespace cortex
