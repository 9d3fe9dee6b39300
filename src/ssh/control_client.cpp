#include "control_client.hpp"
#include "mux_message.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <optional>
#include <signal.h>

ControlClient::ControlClient(socket_t sock, std::string path)
    : sock_(sock), path_(std::move(path)) {
}

ControlClient::~ControlClient() {
    if (sock_ != CTLSSH_INVALID_SOCKET) platform::close_socket(sock_);
}

std::string ControlClient::describe() const {
    return fmt::format("control master at {}", path_);
}

Result<void> ControlClient::hello() {
    MuxWriter msg(MUX_MSG_HELLO);
    msg.put_u32(MUX_PROTOCOL_VERSION);
    if (!mux_write_packet(sock_, msg)) {
        return Result<void>::Err("send hello failed", ErrorKind::Protocol);
    }

    auto reply = mux_read_packet(sock_);
    if (reply.is_err()) return Result<void>::Err(reply.error, reply.kind);

    MuxReader r(std::move(reply.value));
    uint32_t type = 0, version = 0;
    if (!r.get_u32(type) || type != MUX_MSG_HELLO) {
        return Result<void>::Err(fmt::format("expected hello, got {:#x}", type), ErrorKind::Protocol);
    }
    if (!r.get_u32(version) || version != MUX_PROTOCOL_VERSION) {
        return Result<void>::Err(
            fmt::format("unsupported mux protocol version {}", version), ErrorKind::Protocol);
    }
    // Extensions (name/value pairs) are ignored.
    debug(fmt::format("mux hello from {} (version {})", path_, version));
    return Result<void>::Ok();
}

Result<std::string> ControlClient::read_reply() {
    while (true) {
        auto packet = mux_read_packet(sock_);
        if (packet.is_err()) return packet;
        MuxReader r(packet.value);
        uint32_t type = 0;
        r.get_u32(type);
        if (type == MUX_S_TTY_ALLOC_FAIL) {
            warning("control master could not allocate a pty");
            continue;
        }
        return packet;
    }
}

static Result<void> check_request_reply(MuxReader& r, uint32_t type,
                                        uint32_t expected_id, uint32_t want_type) {
    uint32_t id = 0;
    if (!r.get_u32(id)) return Result<void>::Err("truncated reply", ErrorKind::Protocol);
    if (id != expected_id) {
        return Result<void>::Err(
            fmt::format("reply id {} does not match request {}", id, expected_id),
            ErrorKind::Protocol);
    }
    if (type == want_type) return Result<void>::Ok();

    std::string reason;
    r.get_string(reason);
    switch (type) {
    case MUX_S_PERMISSION_DENIED:
        return Result<void>::Err("permission denied: " + reason, ErrorKind::Protocol);
    case MUX_S_FAILURE:
        return Result<void>::Err("request failed: " + reason, ErrorKind::Protocol);
    default:
        return Result<void>::Err(fmt::format("unexpected reply type {:#x}", type),
                                 ErrorKind::Protocol);
    }
}

Result<int> ControlClient::alive_check() {
    uint32_t id = next_request_id_++;
    MuxWriter msg(MUX_C_ALIVE_CHECK);
    msg.put_u32(id);
    if (!mux_write_packet(sock_, msg)) {
        return Result<int>::Err("send alive check failed", ErrorKind::Protocol);
    }

    auto reply = read_reply();
    if (reply.is_err()) return Result<int>::Err(reply.error, reply.kind);

    MuxReader r(std::move(reply.value));
    uint32_t type = 0;
    r.get_u32(type);
    auto checked = check_request_reply(r, type, id, MUX_S_ALIVE);
    if (checked.is_err()) return Result<int>::Err(checked.error, checked.kind);

    uint32_t pid = 0;
    if (!r.get_u32(pid)) return Result<int>::Err("truncated alive reply", ErrorKind::Protocol);
    master_pid_ = static_cast<int>(pid);
    return Result<int>::Ok(master_pid_);
}

Result<int> ControlClient::run(const SessionRequest& req) {
    if (master_pid_ < 0) {
        auto alive = alive_check();
        if (alive.is_err()) return alive;
    }

    uint32_t id = next_request_id_++;
    MuxWriter msg(MUX_C_NEW_SESSION);
    msg.put_u32(id)
       .put_string("")
       .put_u32(req.want_tty ? 1 : 0)
       .put_u32(0)                              // x11
       .put_u32(req.want_agent ? 1 : 0)
       .put_u32(0)                              // subsystem
       .put_u32(MUX_ESCAPE_NONE)
       .put_string(req.term)
       .put_string(req.command);
    for (const auto& env : req.env) {
        msg.put_string(env.name + "=" + env.value);
    }

    if (!mux_write_packet(sock_, msg)) {
        return Result<int>::Err("send new session failed", ErrorKind::Protocol);
    }
    for (int fd : {req.stdin_fd, req.stdout_fd, req.stderr_fd}) {
        if (!platform::send_fd(sock_, fd)) {
            return Result<int>::Err(fmt::format("pass fd {} failed", fd), ErrorKind::Protocol);
        }
    }

    auto reply = read_reply();
    if (reply.is_err()) return Result<int>::Err(reply.error, reply.kind);

    MuxReader r(std::move(reply.value));
    uint32_t type = 0;
    r.get_u32(type);
    auto checked = check_request_reply(r, type, id, MUX_S_SESSION_OPENED);
    if (checked.is_err()) return Result<int>::Err(checked.error, checked.kind);

    uint32_t session_id = 0;
    if (!r.get_u32(session_id)) {
        return Result<int>::Err("truncated session reply", ErrorKind::Protocol);
    }
    debug(fmt::format("mux session {} opened on {}", session_id, path_));

    std::optional<platform::RawModeGuard> raw;
    std::optional<platform::ResizeWatcher> resize;
    if (req.want_tty) {
        raw.emplace(req.stdin_fd);
        resize.emplace();
    }
    return wait_exit(session_id, resize ? &*resize : nullptr);
}

Result<int> ControlClient::wait_exit(uint32_t session_id, platform::ResizeWatcher* resize) {
    while (true) {
        int revents = platform::poll_socket(sock_, POLLIN, EXPECT_POLL_MS);
        // The master reads window size from the passed tty on SIGWINCH.
        if (resize && resize->consume() && master_pid_ > 0) {
            kill(master_pid_, SIGWINCH);
        }
        if (revents == 0) continue;

        auto packet = read_reply();
        if (packet.is_err()) {
            return Result<int>::Err("control master closed the session without an exit status",
                                    ErrorKind::Protocol);
        }
        MuxReader r(std::move(packet.value));
        uint32_t type = 0, sid = 0, exitval = 0;
        r.get_u32(type);
        if (type != MUX_S_EXIT_MESSAGE) {
            debug(fmt::format("mux: ignoring message {:#x}", type));
            continue;
        }
        if (!r.get_u32(sid) || !r.get_u32(exitval)) {
            return Result<int>::Err("truncated exit message", ErrorKind::Protocol);
        }
        if (sid != session_id) {
            return Result<int>::Err(
                fmt::format("exit message for session {}, expected {}", sid, session_id),
                ErrorKind::Protocol);
        }
        return Result<int>::Ok(static_cast<int>(exitval));
    }
}
