#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>
#include <core/types.hpp>
#include <core/env_forward.hpp>

// One bidirectional byte stream opened by the remote side of a session.
class ForwardChannel {
public:
    virtual ~ForwardChannel() = default;

    // Blocking read. Returns bytes read, 0 on EOF, < 0 on error.
    virtual ssize_t read(char* buf, size_t len) = 0;

    // Write all of data. False on error.
    virtual bool write(const char* data, size_t len) = 0;

    // Send EOF; reads stay open.
    virtual void close_write() = 0;

    // Release the channel. Safe to call more than once.
    virtual void close() = 0;
};

// Hand-off of incoming channels from a session to their consumer.
// next() blocks; once closed it drains what is queued, then returns nullptr.
class ChannelQueue {
public:
    // Queue channel. If the queue is already closed the channel is handed
    // back untouched and the caller decides how to release it; nullptr
    // means it was queued.
    std::unique_ptr<ForwardChannel> push(std::unique_ptr<ForwardChannel> channel);

    std::unique_ptr<ForwardChannel> next();

    void close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<ForwardChannel>> pending_;
    bool closed_ = false;
};

// A session the remote side can open channels on.
class ForwardingSession {
public:
    virtual ~ForwardingSession() = default;

    // Register interest in channels of the given type. Returns the queue
    // they will arrive on, or nullptr if a handler for type already exists.
    virtual std::shared_ptr<ChannelQueue> handle_channel_open(const std::string& type) = 0;
};

struct SessionRequest {
    std::string command;        // empty = login shell
    bool want_tty = false;
    bool want_agent = false;
    std::string term = "xterm";
    std::vector<EnvVar> env;
    int stdin_fd = 0;
    int stdout_fd = 1;
    int stderr_fd = 2;
};

// A session that can run one remote command.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Run req to completion. Returns the remote exit status.
    virtual Result<int> run(const SessionRequest& req) = 0;

    virtual std::string describe() const = 0;
};
