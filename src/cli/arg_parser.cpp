#include "arg_parser.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

static const char* FLAGS_WITH_ARG = "pliDLRoFJ";
static const char* FLAGS_BOOL     = "AatTv";

static Result<int> parse_port(const std::string& s) {
    int port = safe_stoi(s, -1);
    if (port <= 0 || port > 65535 || std::to_string(port) != s) {
        return Result<int>::Err(fmt::format("Bad port '{}'", s), ErrorKind::Config);
    }
    return Result<int>::Ok(port);
}

Result<void> parse_destination(const std::string& dest, SshArgs& args) {
    args.original_dest = dest;
    std::string rest = dest;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        if (args.login_name.empty()) args.login_name = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    std::string host = rest;
    std::string port;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return Result<void>::Err(fmt::format("Bad destination '{}'", dest), ErrorKind::Config);
        }
        host = rest.substr(1, close - 1);
        auto tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return Result<void>::Err(fmt::format("Bad destination '{}'", dest), ErrorKind::Config);
            }
            port = tail.substr(1);
        }
    } else if (std::count(rest.begin(), rest.end(), ':') == 1) {
        auto colon = rest.find(':');
        host = rest.substr(0, colon);
        port = rest.substr(colon + 1);
    }

    if (host.empty()) {
        return Result<void>::Err(fmt::format("Bad destination '{}'", dest), ErrorKind::Config);
    }
    args.destination = host;

    if (!port.empty() && args.port == 0) {
        auto p = parse_port(port);
        if (p.is_err()) return Result<void>::Err(p.error, p.kind);
        args.port = p.value;
    }
    return Result<void>::Ok();
}

Result<void> parse_option(const std::string& opt, SshArgs& args) {
    auto text = trimmed(opt);
    auto sep = text.find_first_of("= \t");
    if (sep == std::string::npos || sep == 0) {
        return Result<void>::Err(fmt::format("Bad option '{}': expected Key=Value", opt),
                                 ErrorKind::Config);
    }
    auto key = to_lower(text.substr(0, sep));
    auto value = trimmed(text.substr(sep + 1));
    if (!value.empty() && value[0] == '=') value = trimmed(value.substr(1));
    if (value.empty()) {
        return Result<void>::Err(fmt::format("Bad option '{}': missing value", opt),
                                 ErrorKind::Config);
    }
    args.options[key].push_back(value);
    return Result<void>::Ok();
}

static Result<void> apply_flag(char flag, const std::string& value, SshArgs& args) {
    switch (flag) {
    case 'p': {
        auto p = parse_port(value);
        if (p.is_err()) return Result<void>::Err(p.error, p.kind);
        args.port = p.value;
        break;
    }
    case 'l': args.login_name = value; break;
    case 'i': args.identities.push_back(value); break;
    case 'D': args.dynamic_forwards.push_back(value); break;
    case 'L': args.local_forwards.push_back(value); break;
    case 'R': args.remote_forwards.push_back(value); break;
    case 'o': return parse_option(value, args);
    case 'F': args.config_file = value; break;
    case 'J': args.proxy_jump = value; break;
    case 'A': args.forward_agent = true; args.no_forward_agent = false; break;
    case 'a': args.no_forward_agent = true; args.forward_agent = false; break;
    case 't': args.force_tty = true; break;
    case 'T': args.disable_tty = true; break;
    case 'v': args.debug = true; break;
    }
    return Result<void>::Ok();
}

Result<SshArgs> parse_args(const std::vector<std::string>& argv) {
    SshArgs args;
    std::string destination;
    size_t i = 0;

    for (; i < argv.size(); ++i) {
        const auto& arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') break;

        // Grouped flags: "-vA", "-p22", "-oKey=Value"
        for (size_t j = 1; j < arg.size(); ++j) {
            char flag = arg[j];
            if (std::strchr(FLAGS_BOOL, flag)) {
                auto applied = apply_flag(flag, "", args);
                if (applied.is_err()) return Result<SshArgs>::Err(applied.error, applied.kind);
                continue;
            }
            if (!std::strchr(FLAGS_WITH_ARG, flag)) {
                return Result<SshArgs>::Err(fmt::format("unknown option -- {}", flag),
                                            ErrorKind::Config);
            }
            std::string value = arg.substr(j + 1);
            if (value.empty()) {
                if (i + 1 >= argv.size()) {
                    return Result<SshArgs>::Err(
                        fmt::format("option requires an argument -- {}", flag), ErrorKind::Config);
                }
                value = argv[++i];
            }
            auto applied = apply_flag(flag, value, args);
            if (applied.is_err()) return Result<SshArgs>::Err(applied.error, applied.kind);
            break;
        }
    }

    if (i >= argv.size()) {
        return Result<SshArgs>::Err("missing destination", ErrorKind::Config);
    }
    destination = argv[i++];

    std::vector<std::string> command(argv.begin() + static_cast<long>(i), argv.end());
    for (size_t k = 0; k < command.size(); ++k) {
        if (k) args.command += ' ';
        args.command += command[k];
    }

    auto dest = parse_destination(destination, args);
    if (dest.is_err()) return Result<SshArgs>::Err(dest.error, dest.kind);
    return Result<SshArgs>::Ok(std::move(args));
}
