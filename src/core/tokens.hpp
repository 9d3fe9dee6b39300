#pragma once

#include <string>
#include "types.hpp"

class HostConfig;

// Values substituted into %-tokens of path templates such as ControlPath.
struct TokenContext {
    std::string host;          // %h
    std::string original;      // %n
    std::string port;          // %p
    std::string remote_user;   // %r
    std::string local_user;    // %u
    std::string local_home;    // %d
    std::string local_uid;     // %i
    std::string local_host;    // %l
};

TokenContext make_token_context(const HostConfig& host);

// Expand %-tokens in str. allowed lists the permitted tokens as "%abc".
// Unknown, disallowed or unsupported tokens are configuration errors.
Result<std::string> expand_tokens(const std::string& str,
                                  const TokenContext& ctx,
                                  const std::string& allowed);
