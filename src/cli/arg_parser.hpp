#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Split "[user@]host[:port]" (IPv6 as "[addr]:port") into args. -l and -p
// given on the command line take precedence over the destination parts.
Result<void> parse_destination(const std::string& dest, SshArgs& args);

// Parse "Key=Value" or "Key Value" as given to -o into args.options.
Result<void> parse_option(const std::string& opt, SshArgs& args);

// ssh-style command line (without argv[0]). Options end at the destination;
// everything after it is the remote command.
Result<SshArgs> parse_args(const std::vector<std::string>& argv);
