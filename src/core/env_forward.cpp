#include "env_forward.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <regex>
#include <set>

extern char** environ;

// Glob → anchored alternation: "LC_*" becomes "(^LC_.*$)".
static std::string build_send_env_regex(const std::set<std::string>& globs) {
    std::string expr;
    for (const auto& glob : globs) {
        if (!expr.empty()) expr += '|';
        expr += "(^";
        for (char c : glob) {
            switch (c) {
            case '*': expr += ".*"; break;
            case '?': expr += '.'; break;
            case '(': case ')': case '[': case ']': case '{': case '}':
            case '.': case '+': case ',': case '-': case '^': case '$':
            case '|': case '\\':
                expr += '\\';
                expr += c;
                break;
            default:
                expr += c;
            }
        }
        expr += "$)";
    }
    return expr;
}

Result<std::vector<EnvVar>> get_send_envs(const std::vector<std::string>& send_env,
                                          const std::vector<std::string>& env_list) {
    std::set<std::string> globs;
    for (const auto& cfg : send_env) {
        for (const auto& g : split_fields(cfg)) globs.insert(g);
    }
    if (globs.empty()) return Result<std::vector<EnvVar>>::Ok({});

    auto expr = build_send_env_regex(globs);
    debug(fmt::format("send env regexp: {}", expr));

    std::regex re;
    try {
        re = std::regex(expr, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return Result<std::vector<EnvVar>>::Err(
            fmt::format("compile SendEnv regexp failed: {}", e.what()), ErrorKind::Config);
    }

    std::vector<EnvVar> envs;
    for (const auto& entry : env_list) {
        auto pos = entry.find('=');
        std::string name = trimmed(pos == std::string::npos ? entry : entry.substr(0, pos));
        if (!std::regex_match(name, re)) continue;
        std::string value = pos == std::string::npos ? "" : trimmed(entry.substr(pos + 1));
        envs.push_back({name, value});
    }
    return Result<std::vector<EnvVar>>::Ok(std::move(envs));
}

Result<std::vector<EnvVar>> get_set_envs(const std::string& set_env) {
    if (set_env.empty()) return Result<std::vector<EnvVar>>::Ok({});

    auto invalid = [&]() {
        return Result<std::vector<EnvVar>>::Err(
            fmt::format("invalid SetEnv: {}", set_env), ErrorKind::Config);
    };

    auto tokens = shell_split(set_env);
    if (tokens.is_err()) return invalid();

    std::vector<EnvVar> envs;
    for (const auto& token : tokens.value) {
        auto pos = token.find('=');
        if (pos == std::string::npos) return invalid();
        std::string name = trimmed(token.substr(0, pos));
        if (name.empty()) return invalid();
        envs.push_back({name, trimmed(token.substr(pos + 1))});
    }
    return Result<std::vector<EnvVar>>::Ok(std::move(envs));
}

Result<std::vector<EnvVar>> collect_envs(const HostConfig& host) {
    auto sent = get_send_envs(host.get_all("SendEnv"), current_environ());
    if (sent.is_err()) return sent;

    auto set = get_set_envs(host.get("SetEnv"));
    if (set.is_err()) return set;

    auto envs = std::move(sent.value);
    envs.insert(envs.end(), set.value.begin(), set.value.end());
    return Result<std::vector<EnvVar>>::Ok(std::move(envs));
}

std::vector<std::string> current_environ() {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) out.emplace_back(*e);
    return out;
}
