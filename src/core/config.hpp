#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include "types.hpp"

namespace fs = std::filesystem;

// Options in effect for one destination, after merging the command line,
// matching host blocks and defaults.
class HostConfig {
public:
    HostConfig() = default;

    // First value of key, or "" if unset. Keys are case-insensitive.
    std::string get(const std::string& key) const;

    // Every value of key from every layer, command line first.
    std::vector<std::string> get_all(const std::string& key) const;

    const CtrlExpectConfig& ctrl_expect() const { return expect_; }

    // Remote host name (HostName or the destination itself).
    std::string hostname() const;
    // Remote user (-l, user@, User, or the local user).
    std::string user() const;
    int port() const;

    // -A / -a, else the ForwardAgent option.
    bool forward_agent() const;

    // Command line command, else RemoteCommand ("none" = unset).
    std::string remote_command() const;

    const SshArgs& args() const { return args_; }

private:
    SshArgs args_;
    std::vector<OptionMap> layers_;  // command line, matching hosts, defaults
    CtrlExpectConfig expect_;

    friend class Config;
};

class Config {
public:
    Config() = default;

    // Load from CTLSSH_CONFIG or ~/.ctlssh/config.yaml. A missing file
    // yields an empty configuration.
    static Result<Config> load();

    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml);

    HostConfig resolve(const SshArgs& args) const;

    size_t host_count() const { return hosts_.size(); }

private:
    struct HostBlock {
        std::string patterns;
        OptionMap options;
        std::optional<CtrlExpectConfig> expect;
    };

    OptionMap defaults_;
    std::vector<HostBlock> hosts_;

    friend struct ConfigParser;
};

// Match a host against space/comma separated glob patterns, honoring "!"
// negation: any negated match rejects, otherwise any positive match accepts.
bool host_matches(const std::string& patterns, const std::string& host);

fs::path get_config_path();
