#include "ctlssh_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/env_forward.hpp>
#include <core/log.hpp>
#include <core/shutdown_registry.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <ssh/agent_client.hpp>
#include <ssh/agent_forward.hpp>
#include <ssh/control_connector.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>

CtlsshCLI::CtlsshCLI(SshArgs args) : args_(std::move(args)) {}

Result<SessionRequest> CtlsshCLI::build_request(const HostConfig& host) const {
    SessionRequest req;
    req.command = host.remote_command();
    req.want_agent = host.forward_agent();

    auto request_tty = to_lower(host.get("RequestTTY"));
    if (args_.force_tty || request_tty == "force") {
        req.want_tty = true;
    } else if (args_.disable_tty || request_tty == "no") {
        req.want_tty = false;
    } else if (request_tty == "yes") {
        req.want_tty = platform::stdin_is_tty();
    } else {
        req.want_tty = req.command.empty() && platform::stdin_is_tty();
    }

    if (const char* term = std::getenv("TERM")) {
        if (*term) req.term = term;
    }

    auto envs = collect_envs(host);
    if (envs.is_err()) return Result<SessionRequest>::Err(envs.error, envs.kind);
    req.env = std::move(envs.value);
    return Result<SessionRequest>::Ok(std::move(req));
}

int CtlsshCLI::report(const Result<int>& result, const std::string& target) const {
    if (result.is_ok()) {
        debug(fmt::format("{}: exit status {}", target, result.value));
        return result.value;
    }
    std::cerr << theme::fail(result.error);
    return EXIT_CONNECT_FAILED;
}

int CtlsshCLI::run_multiplexed(RemoteSession& session, SessionRequest req,
                               const HostConfig& host, ShutdownRegistry& after_login) {
    after_login.drain();
    debug(fmt::format("running on {} via {}", host.args().destination, session.describe()));
    return report(session.run(req), session.describe());
}

int CtlsshCLI::run_direct(const HostConfig& host, SessionRequest req,
                          AgentClientHolder& agent, ShutdownRegistry& after_login) {
    DirectSession session(host, agent);
    auto connected = session.connect([](const std::string& msg) { debug(msg); });
    if (connected.is_err()) {
        std::cerr << theme::fail(connected.error);
        return EXIT_CONNECT_FAILED;
    }
    after_login.drain();

    AgentForwarder forwarder;
    if (req.want_agent) {
        auto addr = agent.address();
        if (!addr) {
            warning("agent forwarding requested but no agent is available");
            req.want_agent = false;
        } else {
            auto enabled = forwarder.enable(session, *addr);
            if (enabled.is_err()) {
                warning(fmt::format("agent forwarding disabled: {}", enabled.error));
                req.want_agent = false;
            }
        }
    }

    auto result = session.run(req);

    // Closing the session ends the relays; only then can they be joined.
    session.close();
    forwarder.stop();
    return report(result, session.describe());
}

int CtlsshCLI::run() {
    set_debug_logging(args_.debug);

    auto config = Config::load();
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return EXIT_CONNECT_FAILED;
    }
    auto host = config.value.resolve(args_);

    auto req = build_request(host);
    if (req.is_err()) {
        std::cerr << theme::fail(req.error);
        return EXIT_CONNECT_FAILED;
    }

    ShutdownRegistry on_exit("on_exit");
    ShutdownRegistry after_login("after_login");

    int status;
    {
        AgentClientHolder agent(host, after_login);
        ControlConnector connector(on_exit);

        auto mux = connector.connect(host);
        if (mux) {
            status = run_multiplexed(*mux, std::move(req.value), host, after_login);
        } else {
            status = run_direct(host, std::move(req.value), agent, after_login);
        }
        after_login.drain();
    }
    on_exit.drain();
    return status;
}
