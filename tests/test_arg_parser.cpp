#include <gtest/gtest.h>
#include <cli/arg_parser.hpp>

TEST(ArgParserTest, DestinationOnly) {
    auto r = parse_args({"example.com"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.destination, "example.com");
    EXPECT_EQ(r.value.original_dest, "example.com");
    EXPECT_EQ(r.value.port, 0);
    EXPECT_TRUE(r.value.command.empty());
}

TEST(ArgParserTest, UserHostPort) {
    auto r = parse_args({"deploy@web:2222", "uptime", "-p"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.login_name, "deploy");
    EXPECT_EQ(r.value.destination, "web");
    EXPECT_EQ(r.value.port, 2222);
    EXPECT_EQ(r.value.command, "uptime -p");
}

TEST(ArgParserTest, FlagsWinOverDestinationParts) {
    auto r = parse_args({"-l", "root", "-p", "22", "deploy@web:2222"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.login_name, "root");
    EXPECT_EQ(r.value.port, 22);
}

TEST(ArgParserTest, Ipv6Destination) {
    auto r = parse_args({"[::1]:2022"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.destination, "::1");
    EXPECT_EQ(r.value.port, 2022);

    auto bare = parse_args({"fe80::1"});
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(bare.value.destination, "fe80::1");
    EXPECT_EQ(bare.value.port, 0);
}

TEST(ArgParserTest, GroupedAndAttachedFlags) {
    auto r = parse_args({"-vA", "-p2200", "-oControlMaster=auto", "-o", "ControlPath /tmp/s", "h"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.debug);
    EXPECT_TRUE(r.value.forward_agent);
    EXPECT_EQ(r.value.port, 2200);
    EXPECT_EQ(r.value.options["controlmaster"], std::vector<std::string>{"auto"});
    EXPECT_EQ(r.value.options["controlpath"], std::vector<std::string>{"/tmp/s"});
}

TEST(ArgParserTest, RepeatedForwardsAndIdentities) {
    auto r = parse_args({"-i", "k1", "-i", "k2", "-L", "8080:localhost:80", "-R", "9000:x:9000",
                         "-D", "1080", "-J", "jump", "-F", "/dev/null", "h"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.identities, (std::vector<std::string>{"k1", "k2"}));
    EXPECT_EQ(r.value.local_forwards.size(), 1u);
    EXPECT_EQ(r.value.remote_forwards.size(), 1u);
    EXPECT_EQ(r.value.dynamic_forwards.size(), 1u);
    EXPECT_EQ(r.value.proxy_jump, "jump");
    EXPECT_EQ(r.value.config_file, "/dev/null");
}

TEST(ArgParserTest, LastAgentFlagWins) {
    auto r = parse_args({"-A", "-a", "h"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.forward_agent);
    EXPECT_TRUE(r.value.no_forward_agent);
}

TEST(ArgParserTest, Errors) {
    EXPECT_TRUE(parse_args({}).is_err());
    EXPECT_TRUE(parse_args({"-p"}).is_err());
    EXPECT_TRUE(parse_args({"-p", "abc", "h"}).is_err());
    EXPECT_TRUE(parse_args({"-Z", "h"}).is_err());
    EXPECT_TRUE(parse_args({"-o", "NoValue", "h"}).is_err());
    EXPECT_TRUE(parse_args({"user@"}).is_err());
}
