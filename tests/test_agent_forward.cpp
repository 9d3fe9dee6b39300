#include <gtest/gtest.h>
#include <ssh/agent_forward.hpp>
#include <core/constants.hpp>
#include "echo_agent.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Channel whose remote end is a plain socket the test drives.
class SocketChannel : public ForwardChannel {
public:
    explicit SocketChannel(int fd, std::atomic<int>* closes = nullptr)
        : fd_(fd), closes_(closes) {}
    ~SocketChannel() override { close(); }

    ssize_t read(char* buf, size_t len) override { return ::read(fd_, buf, len); }
    bool write(const char* data, size_t len) override {
        return platform::write_all(fd_, data, len);
    }
    void close_write() override { shutdown(fd_, SHUT_WR); }
    void close() override {
        if (closed_.exchange(true)) return;
        if (closes_) closes_->fetch_add(1);
        ::close(fd_);
    }

private:
    int fd_;
    std::atomic<int>* closes_;
    std::atomic<bool> closed_{false};
};

class FakeSession : public ForwardingSession {
public:
    std::shared_ptr<ChannelQueue> handle_channel_open(const std::string& type) override {
        if (handlers.count(type)) return nullptr;
        auto queue = std::make_shared<ChannelQueue>();
        handlers[type] = queue;
        return queue;
    }

    // Simulate the remote side opening a channel; returns our end of it.
    int open_channel(const std::string& type, std::atomic<int>* closes = nullptr) {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) return -1;
        if (handlers.at(type)->push(std::make_unique<SocketChannel>(fds[0], closes))) {
            ::close(fds[1]);
            return -1;
        }
        return fds[1];
    }

    std::map<std::string, std::shared_ptr<ChannelQueue>> handlers;
};

static std::string read_until_eof(int fd) {
    std::string out;
    char buf[256];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) out.append(buf, n);
    return out;
}

// Write a request, half-close, and collect the reply.
static std::string round_trip(int fd, const std::string& request) {
    if (!platform::write_all(fd, request.data(), request.size())) return "<write failed>";
    shutdown(fd, SHUT_WR);
    auto reply = read_until_eof(fd);
    close(fd);
    return reply;
}

class AgentForwardTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        char tmpl[] = "/tmp/ctlssh-agent-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir_ = tmpl;
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string agent_path() const { return (dir_ / "agent.sock").string(); }
};

// ── relay_agent_channel ───────────────────────────────────────

TEST_F(AgentForwardTest, RelayCopiesBothDirections) {
    int chan[2], agent[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, chan), 0);
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, agent), 0);

    const std::string request = "sign this";
    ASSERT_TRUE(platform::write_all(chan[1], request.data(), request.size()));
    shutdown(chan[1], SHUT_WR);

    // The agent answers only after the request stream ends.
    std::string seen_by_agent;
    std::thread agent_side([&] {
        seen_by_agent = read_until_eof(agent[1]);
        const std::string reply = "signature";
        platform::write_all(agent[1], reply.data(), reply.size());
        close(agent[1]);
    });

    std::atomic<int> closes{0};
    SocketChannel channel(chan[0], &closes);
    auto result = relay_agent_channel(channel, agent[0]);
    agent_side.join();

    EXPECT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(seen_by_agent, request);
    EXPECT_EQ(read_until_eof(chan[1]), "signature");
    EXPECT_EQ(closes.load(), 1);
    close(chan[1]);
}

TEST_F(AgentForwardTest, RelayReportsWriteFailure) {
    int chan[2], agent[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, chan), 0);
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, agent), 0);

    // Agent gone before anything is relayed.
    close(agent[1]);
    const std::string request = "request";
    ASSERT_TRUE(platform::write_all(chan[1], request.data(), request.size()));
    shutdown(chan[1], SHUT_WR);

    SocketChannel channel(chan[0]);
    auto result = relay_agent_channel(channel, agent[0]);
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.kind, ErrorKind::RelayIO);
    close(chan[1]);
}

// ── ChannelQueue ──────────────────────────────────────────────

TEST_F(AgentForwardTest, QueueDrainsThenEnds) {
    ChannelQueue queue;
    std::atomic<int> closes{0};
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    EXPECT_EQ(queue.push(std::make_unique<SocketChannel>(fds[0], &closes)), nullptr);

    queue.close();
    EXPECT_TRUE(queue.closed());
    auto first = queue.next();
    EXPECT_NE(first, nullptr);
    EXPECT_EQ(queue.next(), nullptr);

    int late[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, late), 0);
    // A late channel comes back to the caller unreleased.
    auto rejected = queue.push(std::make_unique<SocketChannel>(late[0], &closes));
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(closes.load(), 0);
    rejected.reset();
    EXPECT_EQ(closes.load(), 1);

    close(fds[1]);
    close(late[1]);
}

// ── AgentForwarder ────────────────────────────────────────────

TEST_F(AgentForwardTest, ForwardsEachChannelToItsOwnConnection) {
    EchoAgent agent(agent_path());
    FakeSession session;
    AgentForwarder forwarder;

    auto enabled = forwarder.enable(session, agent_path());
    ASSERT_TRUE(enabled.is_ok()) << enabled.error;
    EXPECT_TRUE(forwarder.enabled());
    ASSERT_EQ(session.handlers.count(AGENT_CHANNEL_TYPE), 1u);

    int a = session.open_channel(AGENT_CHANNEL_TYPE);
    int b = session.open_channel(AGENT_CHANNEL_TYPE);
    ASSERT_GE(a, 0);
    ASSERT_GE(b, 0);

    std::string reply_b;
    std::thread tb([&] { reply_b = round_trip(b, "request-b"); });
    EXPECT_EQ(round_trip(a, "request-a"), "request-a");
    tb.join();
    EXPECT_EQ(reply_b, "request-b");

    EXPECT_EQ(forwarder.relays_started(), 2u);
    // Probe plus one connection per channel.
    EXPECT_EQ(agent.connections(), 3);
    forwarder.stop();
}

TEST_F(AgentForwardTest, FinishedRelaysAreReaped) {
    EchoAgent agent(agent_path());
    FakeSession session;
    AgentForwarder forwarder;
    ASSERT_TRUE(forwarder.enable(session, agent_path()).is_ok());

    for (int i = 0; i < 20; ++i) {
        int fd = session.open_channel(AGENT_CHANNEL_TYPE);
        ASSERT_GE(fd, 0);
        auto request = "sign-" + std::to_string(i);
        EXPECT_EQ(round_trip(fd, request), request);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // The next channel sweeps the finished relays before it is served.
    int fd = session.open_channel(AGENT_CHANNEL_TYPE);
    EXPECT_EQ(round_trip(fd, "last"), "last");
    EXPECT_EQ(forwarder.relays_started(), 21u);
    EXPECT_EQ(forwarder.relays_held(), 1u);

    forwarder.stop();
    EXPECT_EQ(forwarder.relays_held(), 0u);
}

TEST_F(AgentForwardTest, SecondHandlerRejected) {
    EchoAgent agent(agent_path());
    FakeSession session;
    AgentForwarder first, second;

    ASSERT_TRUE(first.enable(session, agent_path()).is_ok());
    auto dup = second.enable(session, agent_path());
    ASSERT_TRUE(dup.is_err());
    EXPECT_EQ(dup.kind, ErrorKind::DuplicateHandler);
    EXPECT_FALSE(second.enabled());

    // The first registration keeps working.
    int fd = session.open_channel(AGENT_CHANNEL_TYPE);
    EXPECT_EQ(round_trip(fd, "still here"), "still here");
}

TEST_F(AgentForwardTest, UnreachableAgent) {
    FakeSession session;
    AgentForwarder forwarder;
    auto r = forwarder.enable(session, (dir_ / "missing.sock").string());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Dial);
    EXPECT_TRUE(session.handlers.empty());
    EXPECT_FALSE(forwarder.enabled());
}

TEST_F(AgentForwardTest, AgentLostAfterEnableClosesOnlyThatChannel) {
    FakeSession session;
    AgentForwarder forwarder;
    {
        EchoAgent agent(agent_path());
        ASSERT_TRUE(forwarder.enable(session, agent_path()).is_ok());
    }

    std::atomic<int> closes{0};
    int fd = session.open_channel(AGENT_CHANNEL_TYPE, &closes);
    EXPECT_EQ(read_until_eof(fd), "");
    close(fd);
    EXPECT_EQ(closes.load(), 1);

    // A restarted agent serves later channels.
    EchoAgent agent(agent_path());
    int next = session.open_channel(AGENT_CHANNEL_TYPE);
    EXPECT_EQ(round_trip(next, "again"), "again");
}

TEST_F(AgentForwardTest, StopEndsAcceptLoop) {
    EchoAgent agent(agent_path());
    FakeSession session;
    AgentForwarder forwarder;
    ASSERT_TRUE(forwarder.enable(session, agent_path()).is_ok());
    forwarder.stop();

    auto& queue = session.handlers.at(AGENT_CHANNEL_TYPE);
    EXPECT_TRUE(queue->closed());
    std::atomic<int> closes{0};
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    auto rejected = queue->push(std::make_unique<SocketChannel>(fds[0], &closes));
    EXPECT_NE(rejected, nullptr);
    EXPECT_EQ(closes.load(), 0);
    close(fds[1]);
    forwarder.stop();
}
