#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string to_lower(std::string s);

// Split on runs of whitespace.
std::vector<std::string> split_fields(const std::string& s);

// Split a string the way a POSIX shell would tokenize words: whitespace
// separates, single and double quotes group, backslash escapes.
Result<std::vector<std::string>> shell_split(const std::string& s);

// True if something (file, socket, directory) exists at path.
bool is_file_exist(const std::string& path);

// Expand a leading "~" or "~/" to the home directory.
std::string resolve_home_dir(const std::string& path);

// Yes/no style option value.
bool is_truthy(const std::string& value);
