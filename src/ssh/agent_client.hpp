#pragma once

#include <mutex>
#include <optional>
#include <string>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_AGENT LIBSSH2_AGENT;

class HostConfig;
class ShutdownRegistry;

// Where the local agent listens: IdentityAgent (a literal path, or
// SSH_AUTH_SOCK / $VAR to read the environment), then $SSH_AUTH_SOCK, then
// DEFAULT_AGENT_ADDR if it exists. nullopt when disabled ("none") or unset.
std::optional<std::string> resolve_agent_address(const std::string& identity_agent);

// The local agent for one client run. Created once during setup and passed
// by reference to whatever needs the agent.
//
// address() resolves and probes on first use only; later calls return the
// same answer. An unreachable or unconfigured agent is nullopt, not an error.
class AgentClientHolder {
public:
    AgentClientHolder(const HostConfig& host, ShutdownRegistry& after_login);
    ~AgentClientHolder();

    AgentClientHolder(const AgentClientHolder&) = delete;
    AgentClientHolder& operator=(const AgentClientHolder&) = delete;

    std::optional<std::string> address();

    // libssh2 agent handle for session, connected to address(). Released
    // when after_login drains, or by release(). nullptr if no agent.
    LIBSSH2_AGENT* connect(LIBSSH2_SESSION* session);

    // Disconnect and free the libssh2 handle. Must run before its session
    // is freed. Idempotent.
    void release();

private:
    std::string identity_agent_;
    ShutdownRegistry& after_login_;
    std::once_flag resolved_;
    std::optional<std::string> address_;

    std::mutex agent_mutex_;
    LIBSSH2_AGENT* agent_ = nullptr;
};
