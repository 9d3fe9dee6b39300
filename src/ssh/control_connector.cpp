#include "control_connector.hpp"
#include "control_master.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/tokens.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

ControlConnector::ControlConnector(ShutdownRegistry& on_exit, MasterLauncher launcher)
    : on_exit_(on_exit),
      launcher_(launcher ? std::move(launcher) : MasterLauncher(start_control_master)) {
}

Result<std::string> ControlConnector::control_path(const HostConfig& host) {
    auto path = host.get("ControlPath");
    auto lower = to_lower(path);
    if (lower.empty() || lower == "none") return Result<std::string>::Ok("");

    auto expanded = expand_tokens(path, make_token_context(host), CONTROL_PATH_TOKENS);
    if (expanded.is_err()) {
        return Result<std::string>::Err(
            fmt::format("expand ControlPath [{}] failed: {}", path, expanded.error),
            expanded.kind);
    }
    return Result<std::string>::Ok(resolve_home_dir(expanded.value));
}

std::unique_ptr<ControlClient> ControlConnector::connect(const HostConfig& host) {
    const auto& dest = host.args().destination;

    auto path = control_path(host);
    if (path.is_err()) {
        warning(path.error);
        return nullptr;
    }
    const auto& socket = path.value;
    if (socket.empty()) return nullptr;

    auto mode = to_lower(host.get("ControlMaster"));
    bool start = false;
    if (mode == "yes" || mode == "ask") {
        if (is_file_exist(socket)) {
            warning(fmt::format("control socket [{}] already exists, disabling multiplexing", socket));
            return nullptr;
        }
        start = true;
    } else if (mode == "auto" || mode == "autoask") {
        start = true;
    }

    if (start) {
        auto started = launcher_(host, socket, on_exit_);
        if (started.is_err()) {
            warning(fmt::format("start control master failed: {}", started.error));
        }
    } else if (!is_file_exist(socket)) {
        debug(fmt::format("no control master at {}", socket));
        return nullptr;
    }

    debug(fmt::format("login to [{}], socket: {}", dest, socket));

    auto sock = platform::dial_unix(socket, CONTROL_DIAL_TIMEOUT_MS);
    if (sock.is_err()) {
        warning(fmt::format("dial control socket [{}] failed: {}", socket, sock.error));
        return nullptr;
    }

    auto client = std::make_unique<ControlClient>(sock.value, socket);
    auto hello = client->hello();
    if (hello.is_err()) {
        warning(fmt::format("new conn from control socket [{}] failed: {}", socket, hello.error));
        return nullptr;
    }

    debug(fmt::format("login to [{}] success", dest));
    return client;
}
