#include <gtest/gtest.h>
#include <ssh/control_client.hpp>
#include <ssh/mux_message.hpp>
#include "fake_mux_master.hpp"
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

class ControlClientTest : public ::testing::Test {
protected:
    int fds_[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds_), 0);
    }

    // The client owns fds_[0]; the fake master owns fds_[1].
    int client_end() { return fds_[0]; }
    int master_end() { return fds_[1]; }
};

TEST_F(ControlClientTest, HelloAndAliveCheck) {
    FakeMuxMaster master(master_end());
    {
        ControlClient client(client_end(), "/tmp/ctl-test");
        ASSERT_TRUE(client.hello().is_ok());

        auto pid = client.alive_check();
        ASSERT_TRUE(pid.is_ok()) << pid.error;
        EXPECT_EQ(pid.value, getpid());
        EXPECT_EQ(client.describe(), "control master at /tmp/ctl-test");
    }
    EXPECT_EQ(master.hellos(), 1);
}

TEST_F(ControlClientTest, RunPassesRequestAndStdio) {
    FakeMuxMaster master(master_end());

    int out[2];
    ASSERT_EQ(pipe(out), 0);
    int devnull = open("/dev/null", O_RDWR);
    ASSERT_GE(devnull, 0);

    {
        ControlClient client(client_end(), "/tmp/ctl-test");
        ASSERT_TRUE(client.hello().is_ok());

        SessionRequest req;
        req.command = "uptime";
        req.want_agent = true;
        req.term = "xterm-256color";
        req.env = {{"LANG", "C"}, {"LC_ALL", "en_US.UTF-8"}};
        req.stdin_fd = devnull;
        req.stdout_fd = out[1];
        req.stderr_fd = devnull;

        auto status = client.run(req);
        ASSERT_TRUE(status.is_ok()) << status.error;
        EXPECT_EQ(status.value, 7);
    }

    char buf[64] = {};
    ssize_t n = read(out[0], buf, sizeof(buf) - 1);
    EXPECT_EQ(std::string(buf, n > 0 ? n : 0), "hello from master\n");

    auto sessions = master.sessions();
    ASSERT_EQ(sessions.size(), 1u);
    const auto& rec = sessions[0];
    EXPECT_EQ(rec.command, "uptime");
    EXPECT_EQ(rec.term, "xterm-256color");
    EXPECT_EQ(rec.want_tty, 0u);
    EXPECT_EQ(rec.want_agent, 1u);
    EXPECT_EQ(rec.escape, MUX_ESCAPE_NONE);
    EXPECT_EQ(rec.env, (std::vector<std::string>{"LANG=C", "LC_ALL=en_US.UTF-8"}));
    EXPECT_EQ(rec.fds_received, 3);

    close(out[0]);
    close(out[1]);
    close(devnull);
}

TEST_F(ControlClientTest, PermissionDenied) {
    FakeMuxOptions opts;
    opts.deny_sessions = true;
    FakeMuxMaster master(master_end(), opts);

    ControlClient client(client_end(), "/tmp/ctl-test");
    ASSERT_TRUE(client.hello().is_ok());

    SessionRequest req;
    req.command = "true";
    auto status = client.run(req);
    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.kind, ErrorKind::Protocol);
    EXPECT_NE(status.error.find("permission denied: sessions disabled"), std::string::npos);
}

TEST_F(ControlClientTest, RejectedHello) {
    FakeMuxOptions opts;
    opts.bad_hello = true;
    FakeMuxMaster master(master_end(), opts);

    ControlClient client(client_end(), "/tmp/ctl-test");
    auto hello = client.hello();
    ASSERT_TRUE(hello.is_err());
    EXPECT_EQ(hello.kind, ErrorKind::Protocol);
}

TEST_F(ControlClientTest, ClosedSocket) {
    close(master_end());
    ControlClient client(client_end(), "/tmp/ctl-test");
    auto hello = client.hello();
    ASSERT_TRUE(hello.is_err());
    EXPECT_EQ(hello.kind, ErrorKind::Protocol);
}

// ── Packet framing ────────────────────────────────────────────

TEST(MuxMessageTest, WriterEncodesBigEndian) {
    MuxWriter msg(MUX_MSG_HELLO);
    msg.put_u32(4).put_string("ab");
    EXPECT_EQ(msg.packet(), std::string("\0\0\0\x0e\0\0\0\x01\0\0\0\x04\0\0\0\x02" "ab", 18));
}

TEST(MuxMessageTest, ReaderStopsAtTruncatedString) {
    MuxReader r(std::string("\0\0\0\x05" "abc", 7));
    std::string s = "unchanged";
    EXPECT_FALSE(r.get_string(s));
    EXPECT_EQ(s, "unchanged");
    EXPECT_EQ(r.remaining(), 7u);
}

TEST(MuxMessageTest, OversizedPacketRejected) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    const unsigned char hdr[4] = {0x7f, 0xff, 0xff, 0xff};
    ASSERT_EQ(write(fds[1], hdr, sizeof(hdr)), 4);

    auto r = mux_read_packet(fds[0]);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("too large"), std::string::npos);
    close(fds[0]);
    close(fds[1]);
}
