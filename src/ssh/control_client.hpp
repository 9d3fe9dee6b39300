#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include <platform/terminal.hpp>
#include "channel.hpp"

// Client end of a control master's socket. Runs sessions over the master's
// existing connection by passing it our stdio descriptors.
class ControlClient : public RemoteSession {
public:
    // Takes ownership of sock, a connected control socket.
    ControlClient(socket_t sock, std::string path);
    ~ControlClient() override;

    ControlClient(const ControlClient&) = delete;
    ControlClient& operator=(const ControlClient&) = delete;

    // Exchange hello messages. Must succeed before any request.
    Result<void> hello();

    // Ask the master whether it is alive. Returns its pid.
    Result<int> alive_check();

    Result<int> run(const SessionRequest& req) override;

    std::string describe() const override;

    const std::string& path() const { return path_; }

private:
    socket_t sock_;
    std::string path_;
    uint32_t next_request_id_ = 0;
    int master_pid_ = -1;

    // Read packets until one arrives that is not a tty-alloc notice.
    Result<std::string> read_reply();
    Result<int> wait_exit(uint32_t session_id, platform::ResizeWatcher* resize);
};
