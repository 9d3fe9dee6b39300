#include <gtest/gtest.h>
#include <core/tokens.hpp>
#include <core/constants.hpp>

static TokenContext sample_context() {
    TokenContext ctx;
    ctx.host = "10.0.0.5";
    ctx.original = "web";
    ctx.port = "2222";
    ctx.remote_user = "deploy";
    ctx.local_user = "alice";
    ctx.local_home = "/home/alice";
    ctx.local_uid = "1000";
    ctx.local_host = "laptop.example.com";
    return ctx;
}

TEST(TokensTest, NoTokensUnchanged) {
    auto r = expand_tokens("/tmp/ctl-sock", sample_context(), CONTROL_PATH_TOKENS);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "/tmp/ctl-sock");
}

TEST(TokensTest, ControlPathTokens) {
    auto r = expand_tokens("%d/.ssh/%r@%h:%p", sample_context(), CONTROL_PATH_TOKENS);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "/home/alice/.ssh/deploy@10.0.0.5:2222");
}

TEST(TokensTest, LocalTokens) {
    auto r = expand_tokens("%u-%i-%l-%L-%n", sample_context(), CONTROL_PATH_TOKENS);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "alice-1000-laptop.example.com-laptop-web");
}

TEST(TokensTest, PercentEscape) {
    auto r = expand_tokens("100%%-%h", sample_context(), CONTROL_PATH_TOKENS);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "100%-10.0.0.5");
}

TEST(TokensTest, DisallowedTokenIsError) {
    auto r = expand_tokens("%h-%p", sample_context(), "%h");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(TokensTest, HashTokensNotSupported) {
    EXPECT_TRUE(expand_tokens("~/.ssh/%C", sample_context(), CONTROL_PATH_TOKENS).is_err());
    EXPECT_TRUE(expand_tokens("~/.ssh/%k", sample_context(), CONTROL_PATH_TOKENS).is_err());
}

TEST(TokensTest, TrailingPercentIsError) {
    EXPECT_TRUE(expand_tokens("sock%", sample_context(), CONTROL_PATH_TOKENS).is_err());
}
