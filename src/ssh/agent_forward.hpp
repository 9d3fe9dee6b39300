#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "channel.hpp"

// Copy one forwarding channel to and from an agent connection until both
// directions finish, then close both. Takes ownership of agent.
Result<void> relay_agent_channel(ForwardChannel& channel, socket_t agent);

// Serves auth-agent@openssh.com channels of one session from a local agent.
//
// Each accepted channel gets a fresh agent connection and its own relay
// thread. Failures inside a relay are logged and stay with that channel.
class AgentForwarder {
public:
    AgentForwarder() = default;
    ~AgentForwarder();

    AgentForwarder(const AgentForwarder&) = delete;
    AgentForwarder& operator=(const AgentForwarder&) = delete;

    // Probe the agent at addr, then register for agent channels on session.
    // Dial error if the agent is unreachable, DuplicateHandler if the
    // session already has an agent handler.
    Result<void> enable(ForwardingSession& session, const std::string& addr);

    // Stop accepting and wait for running relays.
    void stop();

    bool enabled() const { return queue_ != nullptr; }
    size_t relays_started() const { return started_.load(); }
    // Relay threads not yet joined. Finished ones are reaped as new
    // channels arrive.
    size_t relays_held() const;

private:
    std::string addr_;
    std::shared_ptr<ChannelQueue> queue_;
    std::thread accept_thread_;
    struct Relay {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::atomic<size_t> started_{0};
    mutable std::mutex relay_mutex_;
    std::vector<Relay> relays_;

    void accept_loop();
    void reap_finished();
    void serve(std::unique_ptr<ForwardChannel> channel);
};
