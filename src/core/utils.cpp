#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <sys/stat.h>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string field;
    while (in >> field) out.push_back(field);
    return out;
}

Result<std::vector<std::string>> shell_split(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else cur += c;
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < s.size() &&
                       (s[i + 1] == '"' || s[i + 1] == '\\')) {
                cur += s[++i];
            } else {
                cur += c;
            }
            continue;
        }
        if (c == '\\') {
            if (i + 1 >= s.size()) {
                return Result<std::vector<std::string>>::Err(
                    "trailing backslash", ErrorKind::Config);
            }
            cur += s[++i];
            in_word = true;
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(cur);
                cur.clear();
                in_word = false;
            }
        } else {
            cur += c;
            in_word = true;
        }
    }

    if (quote) {
        return Result<std::vector<std::string>>::Err(
            "unterminated quote", ErrorKind::Config);
    }
    if (in_word) words.push_back(cur);
    return Result<std::vector<std::string>>::Ok(std::move(words));
}

bool is_file_exist(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

std::string resolve_home_dir(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

bool is_truthy(const std::string& value) {
    auto v = to_lower(value);
    return v == "yes" || v == "true" || v == "1" || v == "on";
}
