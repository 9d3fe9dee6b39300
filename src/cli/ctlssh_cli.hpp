#pragma once

#include <string>
#include <core/types.hpp>
#include <ssh/channel.hpp>

class HostConfig;
class AgentClientHolder;
class ShutdownRegistry;

// One client run: resolve the destination, prefer a control master, fall
// back to a direct session, forward the agent, run the command.
class CtlsshCLI {
public:
    explicit CtlsshCLI(SshArgs args);

    // Returns the process exit status.
    int run();

private:
    SshArgs args_;

    Result<SessionRequest> build_request(const HostConfig& host) const;
    int run_multiplexed(RemoteSession& session, SessionRequest req,
                        const HostConfig& host, ShutdownRegistry& after_login);
    int run_direct(const HostConfig& host, SessionRequest req,
                   AgentClientHolder& agent, ShutdownRegistry& after_login);
    int report(const Result<int>& result, const std::string& target) const;
};
