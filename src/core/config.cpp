#include "config.hpp"
#include "utils.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fnmatch.h>
#include <cstdlib>

namespace fs = std::filesystem;

// ── HostConfig ────────────────────────────────────────────────

std::string HostConfig::get(const std::string& key) const {
    auto k = to_lower(key);
    for (const auto& layer : layers_) {
        auto it = layer.find(k);
        if (it != layer.end() && !it->second.empty()) {
            return it->second.front();
        }
    }
    return "";
}

std::vector<std::string> HostConfig::get_all(const std::string& key) const {
    auto k = to_lower(key);
    std::vector<std::string> values;
    for (const auto& layer : layers_) {
        auto it = layer.find(k);
        if (it == layer.end()) continue;
        values.insert(values.end(), it->second.begin(), it->second.end());
    }
    return values;
}

std::string HostConfig::hostname() const {
    auto name = get("HostName");
    return name.empty() ? args_.destination : name;
}

std::string HostConfig::user() const {
    if (!args_.login_name.empty()) return args_.login_name;
    auto user = get("User");
    return user.empty() ? platform::local_user() : user;
}

int HostConfig::port() const {
    if (args_.port != 0) return args_.port;
    int port = safe_stoi(get("Port"), 22);
    return port > 0 ? port : 22;
}

bool HostConfig::forward_agent() const {
    if (args_.no_forward_agent) return false;
    if (args_.forward_agent) return true;
    return is_truthy(get("ForwardAgent"));
}

std::string HostConfig::remote_command() const {
    if (!args_.command.empty()) return args_.command;
    auto cmd = get(OPT_REMOTE_COMMAND);
    return to_lower(cmd) == "none" ? "" : cmd;
}

// ── Parsing ───────────────────────────────────────────────────

static std::vector<std::string> parse_values(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) values.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    }
    return values;
}

static OptionMap parse_options(const YAML::Node& node) {
    OptionMap options;
    if (!node || !node.IsMap()) return options;
    for (const auto& kv : node) {
        auto key = to_lower(kv.first.as<std::string>());
        auto values = parse_values(kv.second);
        if (!values.empty()) options[key] = std::move(values);
    }
    return options;
}

static CtrlExpectConfig parse_ctrl_expect(const YAML::Node& node) {
    CtrlExpectConfig cfg;
    if (node["timeout"] && node["timeout"].IsScalar()) {
        cfg.timeout_secs = node["timeout"].as<int>(0);
    }
    if (node["prompts"] && node["prompts"].IsSequence()) {
        for (const auto& p : node["prompts"]) {
            ExpectRule rule;
            rule.pattern = p["pattern"] ? p["pattern"].as<std::string>() : "";
            rule.send = p["send"] ? p["send"].as<std::string>() : "";
            if (!rule.pattern.empty()) cfg.prompts.push_back(std::move(rule));
        }
    }
    cfg.count = static_cast<int>(cfg.prompts.size());
    if (node["count"] && node["count"].IsScalar()) {
        cfg.count = node["count"].as<int>(cfg.count);
    }
    return cfg;
}

struct ConfigParser {
    static Config from_node(const YAML::Node& root) {
        Config config;
        if (!root || !root.IsMap()) return config;

        config.defaults_ = parse_options(root["defaults"]);

        if (root["hosts"] && root["hosts"].IsSequence()) {
            for (const auto& h : root["hosts"]) {
                if (!h["host"]) continue;
                Config::HostBlock block;
                block.patterns = h["host"].as<std::string>();
                block.options = parse_options(h["options"]);
                if (h["ctrl_expect"] && h["ctrl_expect"].IsMap()) {
                    block.expect = parse_ctrl_expect(h["ctrl_expect"]);
                }
                config.hosts_.push_back(std::move(block));
            }
        }
        return config;
    }
};

fs::path get_config_path() {
    if (const char* env = std::getenv("CTLSSH_CONFIG")) {
        if (*env) return fs::path(resolve_home_dir(env));
    }
    return platform::home_dir() / ".ctlssh" / "config.yaml";
}

Result<Config> Config::load() {
    auto path = get_config_path();
    if (!fs::exists(path)) {
        ctlssh_log(fmt::format("config: {} not found, using empty configuration", path.string()));
        return Result<Config>::Ok(Config{});
    }
    return load_file(path);
}

Result<Config> Config::load_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(ConfigParser::from_node(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(
            fmt::format("Failed to parse config {}: {}", path.string(), e.what()),
            ErrorKind::Config);
    }
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        return Result<Config>::Ok(ConfigParser::from_node(YAML::Load(yaml)));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Config);
    }
}

// ── Resolution ────────────────────────────────────────────────

bool host_matches(const std::string& patterns, const std::string& host) {
    std::string spaced = patterns;
    for (auto& c : spaced) {
        if (c == ',') c = ' ';
    }

    bool matched = false;
    for (const auto& pat : split_fields(spaced)) {
        bool negate = pat[0] == '!';
        std::string glob = negate ? pat.substr(1) : pat;
        if (fnmatch(glob.c_str(), host.c_str(), 0) == 0) {
            if (negate) return false;
            matched = true;
        }
    }
    return matched;
}

HostConfig Config::resolve(const SshArgs& args) const {
    HostConfig hc;
    hc.args_ = args;
    hc.layers_.push_back(args.options);

    bool have_expect = false;
    for (const auto& block : hosts_) {
        if (!host_matches(block.patterns, args.destination)) continue;
        hc.layers_.push_back(block.options);
        if (block.expect && !have_expect) {
            hc.expect_ = *block.expect;
            have_expect = true;
        }
    }
    hc.layers_.push_back(defaults_);

    auto count = hc.get(OPT_CTRL_EXPECT_COUNT);
    if (!count.empty()) hc.expect_.count = safe_stoi(count, hc.expect_.count);
    auto timeout = hc.get(OPT_CTRL_EXPECT_TIMEOUT);
    if (!timeout.empty()) hc.expect_.timeout_secs = safe_stoi(timeout, hc.expect_.timeout_secs);

    return hc;
}
