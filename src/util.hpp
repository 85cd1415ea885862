#pragma once
#include <string>
#include <vector>

namespace cortex {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Strip exactly one layer of matching single or double quotes
std::string strip_quotes(const std::string& s);

// $HOME, or the passwd entry of the current user when HOME is unset.
// Empty if neither is available.
std::string home_dir();

// Expand ~ to home directory (left as-is when no home directory is known)
std::string expand_home(const std::string& path);

// Read an environment variable (empty if unset)
std::string env_or_empty(const char* name);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write via temp file + rename so readers never see a partial document.
// The temp file is created with mode (before umask), so the final file never
// has wider permissions. Missing parent directories are created owner-only.
bool atomic_write_file(const std::string& path, const std::string& content,
                       unsigned mode = 0666);

// Search $PATH (or the given search path) for an executable. Empty if not found.
std::string find_executable(const std::string& name, const std::string& search_path);
std::string find_executable(const std::string& name);

} // namespace cortex
