#include "agent_client.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/shutdown_registry.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <cstdlib>

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

std::optional<std::string> resolve_agent_address(const std::string& identity_agent) {
    std::string addr;
    if (!identity_agent.empty()) {
        if (to_lower(identity_agent) == "none") return std::nullopt;
        if (identity_agent == AGENT_ENV_VAR) {
            addr = env_or_empty(AGENT_ENV_VAR);
        } else if (identity_agent[0] == '$') {
            addr = env_or_empty(identity_agent.c_str() + 1);
        } else {
            addr = identity_agent;
        }
    }

    if (addr.empty()) addr = env_or_empty(AGENT_ENV_VAR);

    if (addr.empty()) {
        auto fallback = resolve_home_dir(DEFAULT_AGENT_ADDR);
        if (!is_file_exist(fallback)) return std::nullopt;
        addr = fallback;
    }
    return resolve_home_dir(addr);
}

// ── AgentClientHolder ─────────────────────────────────────────

AgentClientHolder::AgentClientHolder(const HostConfig& host, ShutdownRegistry& after_login)
    : identity_agent_(host.get("IdentityAgent")), after_login_(after_login) {
}

AgentClientHolder::~AgentClientHolder() {
    release();
}

std::optional<std::string> AgentClientHolder::address() {
    std::call_once(resolved_, [this]() {
        auto addr = resolve_agent_address(identity_agent_);
        if (!addr) {
            debug("no agent configured");
            return;
        }
        auto probe = platform::dial_unix(*addr, AGENT_DIAL_TIMEOUT_MS);
        if (probe.is_err()) {
            debug(fmt::format("agent {} not reachable: {}", *addr, probe.error));
            return;
        }
        platform::close_socket(probe.value);
        debug(fmt::format("using agent {}", *addr));
        address_ = std::move(addr);
    });
    return address_;
}

LIBSSH2_AGENT* AgentClientHolder::connect(LIBSSH2_SESSION* session) {
    auto addr = address();
    if (!addr || !session) return nullptr;

    std::lock_guard<std::mutex> lock(agent_mutex_);
    if (agent_) return agent_;

    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (!agent) return nullptr;
    libssh2_agent_set_identity_path(agent, addr->c_str());

    int rc;
    while ((rc = libssh2_agent_connect(agent)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(IO_POLL_INTERVAL_MS);
    }
    if (rc != 0) {
        debug(fmt::format("connect agent {} failed ({})", *addr, rc));
        libssh2_agent_free(agent);
        return nullptr;
    }

    agent_ = agent;
    after_login_.add([this]() { release(); });
    return agent_;
}

void AgentClientHolder::release() {
    std::lock_guard<std::mutex> lock(agent_mutex_);
    if (!agent_) return;
    libssh2_agent_disconnect(agent_);
    libssh2_agent_free(agent_);
    agent_ = nullptr;
}
