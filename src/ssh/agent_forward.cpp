#include "agent_forward.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <iterator>
#include <cerrno>
#include <cstring>
#include <unistd.h>

// ── Relay ─────────────────────────────────────────────────────

Result<void> relay_agent_channel(ForwardChannel& channel, socket_t agent) {
    std::atomic<bool> failed{false};
    std::string first_error;
    std::mutex error_mutex;
    auto record = [&](const std::string& msg) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!failed.exchange(true)) first_error = msg;
    };

    // channel → agent, then half-close the agent side
    std::thread to_agent([&]() {
        char buf[RELAY_BUF_SIZE];
        while (true) {
            ssize_t n = channel.read(buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) {
                record("read agent channel failed");
                break;
            }
            if (!platform::write_all(agent, buf, static_cast<size_t>(n))) {
                record(fmt::format("write agent failed: {}", std::strerror(errno)));
                break;
            }
        }
        platform::shutdown_write(agent);
    });

    // agent → channel, then send EOF on the channel
    std::thread to_channel([&]() {
        char buf[RELAY_BUF_SIZE];
        while (true) {
            ssize_t n = ::read(agent, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n == 0) break;
            if (n < 0) {
                record(fmt::format("read agent failed: {}", std::strerror(errno)));
                break;
            }
            if (!channel.write(buf, static_cast<size_t>(n))) {
                record("write agent channel failed");
                break;
            }
        }
        channel.close_write();
    });

    to_agent.join();
    to_channel.join();
    platform::close_socket(agent);
    channel.close();

    if (failed.load()) return Result<void>::Err(first_error, ErrorKind::RelayIO);
    return Result<void>::Ok();
}

// ── AgentForwarder ────────────────────────────────────────────

AgentForwarder::~AgentForwarder() {
    stop();
}

Result<void> AgentForwarder::enable(ForwardingSession& session, const std::string& addr) {
    auto probe = platform::dial_unix(addr, AGENT_DIAL_TIMEOUT_MS);
    if (probe.is_err()) {
        return Result<void>::Err(
            fmt::format("agent {} not reachable: {}", addr, probe.error), ErrorKind::Dial);
    }
    platform::close_socket(probe.value);

    auto queue = session.handle_channel_open(AGENT_CHANNEL_TYPE);
    if (!queue) {
        return Result<void>::Err(
            fmt::format("agent forwarding: {} handler already registered", AGENT_CHANNEL_TYPE),
            ErrorKind::DuplicateHandler);
    }

    addr_ = addr;
    queue_ = std::move(queue);
    accept_thread_ = std::thread(&AgentForwarder::accept_loop, this);
    debug(fmt::format("agent forwarding enabled for {}", addr_));
    return Result<void>::Ok();
}

void AgentForwarder::accept_loop() {
    while (auto channel = queue_->next()) {
        reap_finished();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, done](std::unique_ptr<ForwardChannel> ch) {
            serve(std::move(ch));
            done->store(true);
        }, std::move(channel));
        started_.fetch_add(1);

        std::lock_guard<std::mutex> lock(relay_mutex_);
        relays_.push_back(Relay{std::move(t), std::move(done)});
    }
}

void AgentForwarder::reap_finished() {
    std::vector<Relay> finished;
    {
        std::lock_guard<std::mutex> lock(relay_mutex_);
        auto split = std::stable_partition(relays_.begin(), relays_.end(),
                                           [](const Relay& r) { return !r.done->load(); });
        std::move(split, relays_.end(), std::back_inserter(finished));
        relays_.erase(split, relays_.end());
    }
    for (auto& r : finished) {
        if (r.thread.joinable()) r.thread.join();
    }
}

void AgentForwarder::serve(std::unique_ptr<ForwardChannel> channel) {
    auto agent = platform::dial_unix(addr_, AGENT_DIAL_TIMEOUT_MS);
    if (agent.is_err()) {
        debug(fmt::format("agent forwarding: dial {} failed: {}", addr_, agent.error));
        channel->close();
        return;
    }
    auto result = relay_agent_channel(*channel, agent.value);
    if (result.is_err()) {
        debug(fmt::format("agent forwarding relay: {}", result.error));
    }
}

void AgentForwarder::stop() {
    if (queue_) queue_->close();
    if (accept_thread_.joinable()) accept_thread_.join();

    std::vector<Relay> relays;
    {
        std::lock_guard<std::mutex> lock(relay_mutex_);
        relays.swap(relays_);
    }
    for (auto& r : relays) {
        if (r.thread.joinable()) r.thread.join();
    }
}

size_t AgentForwarder::relays_held() const {
    std::lock_guard<std::mutex> lock(relay_mutex_);
    return relays_.size();
}
