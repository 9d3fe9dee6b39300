#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* SAMPLE = R"(
defaults:
  ControlMaster: auto
  ControlPath: ~/.ssh/ctlssh-%r@%h:%p
  User: fallback
hosts:
  - host: "prod-* !prod-db"
    options:
      HostName: 10.1.2.3
      User: deploy
      Port: 2222
      SendEnv: [LANG, "LC_*"]
    ctrl_expect:
      timeout: 30
      prompts:
        - pattern: "[Pp]assword:"
          send: "hunter2"
        - pattern: "code:"
          send: "1"
  - host: "*"
    options:
      SendEnv: TERM_PROGRAM
      User: everyone
)";

static SshArgs dest(const std::string& host) {
    SshArgs args;
    args.destination = host;
    return args;
}

class ConfigTest : public ::testing::Test {
protected:
    Config config;

    void SetUp() override {
        auto parsed = Config::parse(SAMPLE);
        ASSERT_TRUE(parsed.is_ok()) << parsed.error;
        config = parsed.value;
    }
};

TEST_F(ConfigTest, ParsesHostBlocks) {
    EXPECT_EQ(config.host_count(), 2u);
}

TEST_F(ConfigTest, FirstMatchingHostWins) {
    auto host = config.resolve(dest("prod-web"));
    EXPECT_EQ(host.get("HostName"), "10.1.2.3");
    EXPECT_EQ(host.user(), "deploy");
    EXPECT_EQ(host.port(), 2222);
    EXPECT_EQ(host.hostname(), "10.1.2.3");
}

TEST_F(ConfigTest, NegatedPatternSkipsBlock) {
    auto host = config.resolve(dest("prod-db"));
    EXPECT_EQ(host.get("HostName"), "");
    EXPECT_EQ(host.hostname(), "prod-db");
    EXPECT_EQ(host.user(), "everyone");
    EXPECT_EQ(host.port(), 22);
}

TEST_F(ConfigTest, DefaultsApplyLast) {
    auto host = config.resolve(dest("anything"));
    EXPECT_EQ(host.get("ControlMaster"), "auto");
    EXPECT_EQ(host.get("controlpath"), "~/.ssh/ctlssh-%r@%h:%p");
}

TEST_F(ConfigTest, CommandLineOverridesEverything) {
    auto args = dest("prod-web");
    args.options["user"] = {"cli-user"};
    args.options["controlmaster"] = {"no"};
    args.port = 2200;
    auto host = config.resolve(args);
    EXPECT_EQ(host.get("User"), "cli-user");
    EXPECT_EQ(host.get("ControlMaster"), "no");
    EXPECT_EQ(host.port(), 2200);

    args.login_name = "login";
    EXPECT_EQ(config.resolve(args).user(), "login");
}

TEST_F(ConfigTest, GetAllAccumulatesLayers) {
    auto host = config.resolve(dest("prod-web"));
    auto send = host.get_all("SendEnv");
    ASSERT_EQ(send.size(), 3u);
    EXPECT_EQ(send[0], "LANG");
    EXPECT_EQ(send[1], "LC_*");
    EXPECT_EQ(send[2], "TERM_PROGRAM");
}

TEST_F(ConfigTest, CtrlExpectFromHostBlock) {
    auto host = config.resolve(dest("prod-web"));
    const auto& expect = host.ctrl_expect();
    EXPECT_EQ(expect.count, 2);
    EXPECT_EQ(expect.timeout_secs, 30);
    ASSERT_EQ(expect.prompts.size(), 2u);
    EXPECT_EQ(expect.prompts[0].pattern, "[Pp]assword:");
    EXPECT_EQ(expect.prompts[0].send, "hunter2");

    EXPECT_EQ(config.resolve(dest("other")).ctrl_expect().count, 0);
}

TEST_F(ConfigTest, CtrlExpectCommandLineOverrides) {
    auto args = dest("prod-web");
    args.options["ctrlexpectcount"] = {"1"};
    args.options["ctrlexpecttimeout"] = {"0"};
    auto host = config.resolve(args);
    EXPECT_EQ(host.ctrl_expect().count, 1);
    EXPECT_EQ(host.ctrl_expect().timeout_secs, 0);
}

TEST_F(ConfigTest, ForwardAgentFlags) {
    auto args = dest("x");
    args.options["forwardagent"] = {"yes"};
    EXPECT_TRUE(config.resolve(args).forward_agent());

    args.no_forward_agent = true;
    EXPECT_FALSE(config.resolve(args).forward_agent());

    auto plain = dest("x");
    EXPECT_FALSE(config.resolve(plain).forward_agent());
    plain.forward_agent = true;
    EXPECT_TRUE(config.resolve(plain).forward_agent());
}

TEST_F(ConfigTest, RemoteCommand) {
    auto args = dest("x");
    args.options["remotecommand"] = {"uptime"};
    EXPECT_EQ(config.resolve(args).remote_command(), "uptime");

    args.options["remotecommand"] = {"none"};
    EXPECT_EQ(config.resolve(args).remote_command(), "");

    args.command = "ls -l";
    EXPECT_EQ(config.resolve(args).remote_command(), "ls -l");
}

TEST(ConfigParseTest, InvalidYamlIsConfigError) {
    auto parsed = Config::parse("hosts: [unclosed");
    EXPECT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.kind, ErrorKind::Config);
}

TEST(ConfigParseTest, EmptyDocumentIsEmptyConfig) {
    auto parsed = Config::parse("");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value.host_count(), 0u);
}

TEST(ConfigParseTest, LoadFile) {
    auto dir = fs::temp_directory_path() / "ctlssh_config_test";
    fs::create_directories(dir);
    auto file = dir / "config.yaml";
    std::ofstream(file) << "defaults:\n  Port: 2022\n";

    auto loaded = Config::load_file(file);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    SshArgs args;
    args.destination = "h";
    EXPECT_EQ(loaded.value.resolve(args).port(), 2022);

    fs::remove_all(dir);
}

TEST(HostMatchTest, Globs) {
    EXPECT_TRUE(host_matches("*", "anything"));
    EXPECT_TRUE(host_matches("web?", "web1"));
    EXPECT_FALSE(host_matches("web?", "web10"));
    EXPECT_TRUE(host_matches("db, web*", "web10"));
    EXPECT_FALSE(host_matches("", "web"));
}

TEST(HostMatchTest, NegationRejects) {
    EXPECT_FALSE(host_matches("* !bastion", "bastion"));
    EXPECT_TRUE(host_matches("* !bastion", "app"));
    EXPECT_FALSE(host_matches("!bastion", "app"));
}
