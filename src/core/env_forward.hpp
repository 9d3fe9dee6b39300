#pragma once

#include <string>
#include <vector>
#include "types.hpp"

class HostConfig;

struct EnvVar {
    std::string name;
    std::string value;
};

// Local environment variables selected by the SendEnv glob patterns.
// env_list is the "NAME=value" list to select from (normally current_environ()).
Result<std::vector<EnvVar>> get_send_envs(const std::vector<std::string>& send_env,
                                          const std::vector<std::string>& env_list);

// NAME=value pairs from a SetEnv value, split shell-style.
Result<std::vector<EnvVar>> get_set_envs(const std::string& set_env);

// SendEnv followed by SetEnv for one destination.
Result<std::vector<EnvVar>> collect_envs(const HostConfig& host);

// The process environment as "NAME=value" strings.
std::vector<std::string> current_environ();
