#include "tokens.hpp"
#include "config.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <unistd.h>

TokenContext make_token_context(const HostConfig& host) {
    TokenContext ctx;
    ctx.host = host.hostname();
    ctx.original = host.args().original_dest.empty() ? host.args().destination
                                                     : host.args().original_dest;
    ctx.port = std::to_string(host.port());
    ctx.remote_user = host.user();
    ctx.local_user = platform::local_user();
    ctx.local_home = platform::home_dir().string();
    ctx.local_uid = std::to_string(getuid());
    ctx.local_host = platform::local_hostname();
    return ctx;
}

Result<std::string> expand_tokens(const std::string& str,
                                  const TokenContext& ctx,
                                  const std::string& allowed) {
    if (str.find('%') == std::string::npos) {
        return Result<std::string>::Ok(str);
    }

    std::string out;
    out.reserve(str.size() + 32);
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '%') {
            out += str[i];
            continue;
        }
        if (i + 1 >= str.size()) {
            return Result<std::string>::Err(
                fmt::format("{} ends with %", str), ErrorKind::Config);
        }
        char c = str[++i];
        if (c == '%') {
            out += '%';
            continue;
        }
        if (allowed.find(c) == std::string::npos) {
            return Result<std::string>::Err(
                fmt::format("token %{} in {} is not allowed", c, str), ErrorKind::Config);
        }
        switch (c) {
        case 'h': out += ctx.host; break;
        case 'n': out += ctx.original; break;
        case 'p': out += ctx.port; break;
        case 'r': out += ctx.remote_user; break;
        case 'u': out += ctx.local_user; break;
        case 'd': out += ctx.local_home; break;
        case 'i': out += ctx.local_uid; break;
        case 'l': out += ctx.local_host; break;
        case 'L': out += ctx.local_host.substr(0, ctx.local_host.find('.')); break;
        default:
            return Result<std::string>::Err(
                fmt::format("token %{} in {} is not supported", c, str), ErrorKind::Config);
        }
    }
    return Result<std::string>::Ok(out);
}
