#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class HostConfig;
class AgentClientHolder;

// Serializes every libssh2 call on one session. alive turns false (under
// the mutex) when the session is freed; channel wrappers check it before
// touching libssh2.
struct SessionLock {
    std::recursive_mutex mutex;
    bool alive = true;
};

// A libssh2 connection made directly over TCP, used when no control master
// is available.
class DirectSession : public RemoteSession, public ForwardingSession {
public:
    DirectSession(const HostConfig& host, AgentClientHolder& agent);
    ~DirectSession() override;

    DirectSession(const DirectSession&) = delete;
    DirectSession& operator=(const DirectSession&) = delete;

    // TCP connect, handshake, host key check and user authentication.
    Result<void> connect(StatusCallback callback = nullptr);

    Result<int> run(const SessionRequest& req) override;

    std::shared_ptr<ChannelQueue> handle_channel_open(const std::string& type) override;

    std::string describe() const override;

    // Stop delivering channels, then disconnect and free the session.
    void close();

    bool is_active() const { return active_.load(); }

private:
    const HostConfig& host_;
    AgentClientHolder& agent_;
    std::string target_;
    int sock_ = -1;
    LIBSSH2_SESSION* session_ = nullptr;
    std::shared_ptr<SessionLock> lock_;
    std::atomic<bool> active_{false};

    std::mutex handlers_mutex_;
    std::map<std::string, std::shared_ptr<ChannelQueue>> handlers_;

    Result<void> open_socket();
    Result<void> verify_host_key();
    Result<void> authenticate(StatusCallback callback);
    bool auth_agent(const std::string& user);
    bool auth_key_file(const std::string& user, const std::string& path);

    void deliver_agent_channel(LIBSSH2_CHANNEL* channel);
    static void agent_channel_callback(LIBSSH2_SESSION* session,
                                       LIBSSH2_CHANNEL* channel, void** abstract);
};
