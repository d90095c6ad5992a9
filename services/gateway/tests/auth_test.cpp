#include <gtest/gtest.h>
#include "auth.hpp"

class AuthTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> signed_params(std::int64_t ts) {
        auto t = std::to_string(ts);
        return {{"ts", t}, {"sig", sign_timestamp(cfg.secret, t)}};
    }

    AuthConfig cfg{"s3cret", 300};
    const std::int64_t now = 1700000000;
};

TEST(SignTimestamp, ShouldBeLowerHexHmacSha256) {
    // RFC 4231 test case 2
    EXPECT_EQ(sign_timestamp("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(AuthTest, FreshValidSignature_ShouldPass) {
    EXPECT_EQ(authenticate(cfg, signed_params(now), now), AuthStatus::Ok);
    EXPECT_EQ(authenticate(cfg, signed_params(now - 300), now), AuthStatus::Ok);
    EXPECT_EQ(authenticate(cfg, signed_params(now + 120), now), AuthStatus::Ok);
}

TEST_F(AuthTest, ValidSignatureOutsideWindow_ShouldBeExpired) {
    EXPECT_EQ(authenticate(cfg, signed_params(now - 301), now), AuthStatus::Expired);
    EXPECT_EQ(authenticate(cfg, signed_params(now + 1000), now), AuthStatus::Expired);
}

TEST_F(AuthTest, MissingParameters_ShouldBeMissing) {
    EXPECT_EQ(authenticate(cfg, {}, now), AuthStatus::Missing);
    EXPECT_EQ(authenticate(cfg, {{"ts", std::to_string(now)}}, now), AuthStatus::Missing);
    EXPECT_EQ(authenticate(cfg, {{"sig", "abc"}}, now), AuthStatus::Missing);
}

TEST_F(AuthTest, WrongSignature_ShouldBeRejected) {
    auto params = signed_params(now);
    params["sig"][0] = params["sig"][0] == '0' ? '1' : '0';
    EXPECT_EQ(authenticate(cfg, params, now), AuthStatus::InvalidSignature);

    params["sig"] = "deadbeef";
    EXPECT_EQ(authenticate(cfg, params, now), AuthStatus::InvalidSignature);

    AuthConfig other{"other-secret", 300};
    EXPECT_EQ(authenticate(other, signed_params(now), now), AuthStatus::InvalidSignature);
}

TEST_F(AuthTest, UnparseableTimestamp_ShouldBeExpired) {
    std::map<std::string, std::string> params = {{"ts", "yesterday"}, {"sig", sign_timestamp(cfg.secret, "yesterday")}};
    EXPECT_EQ(authenticate(cfg, params, now), AuthStatus::Expired);
}

TEST_F(AuthTest, ExtremeTimestamps_ShouldBeExpiredNotWrapped) {
    for (const std::string t : {"-9223372036854775808", "-99999999999999999999", "9223372036854775807",
                                "99999999999999999999"}) {
        std::map<std::string, std::string> params = {{"ts", t}, {"sig", sign_timestamp(cfg.secret, t)}};
        EXPECT_EQ(authenticate(cfg, params, now), AuthStatus::Expired) << t;
    }
}

TEST_F(AuthTest, HeaderStyleAliases_ShouldBeAccepted) {
    auto t = std::to_string(now);
    std::map<std::string, std::string> params = {{"X-Api-Ts", t}, {"X-Api-Sign", sign_timestamp(cfg.secret, t)}};
    EXPECT_EQ(authenticate(cfg, params, now), AuthStatus::Ok);
}

TEST_F(AuthTest, EmptySecret_ShouldDisableAuthentication) {
    AuthConfig open{"", 300};
    EXPECT_EQ(authenticate(open, {}, now), AuthStatus::Ok);
}

TEST(AuthStatusText, ShouldMatchRejectionBodies) {
    EXPECT_STREQ(to_string(AuthStatus::Missing), "missing ts/sig");
    EXPECT_STREQ(to_string(AuthStatus::Expired), "timestamp out of range");
    EXPECT_STREQ(to_string(AuthStatus::InvalidSignature), "bad signature");
}

TEST(ParseQueryString, ShouldSplitAndDecode) {
    auto q = parse_query_string("/ws?ts=1700&sig=ab%2Fcd&x=a+b&flag#frag");
    EXPECT_EQ(q.at("ts"), "1700");
    EXPECT_EQ(q.at("sig"), "ab/cd");
    EXPECT_EQ(q.at("x"), "a b");
    EXPECT_EQ(q.at("flag"), "");
    EXPECT_EQ(q.size(), 4u);

    EXPECT_TRUE(parse_query_string("/ws").empty());
    EXPECT_EQ(parse_query_string("/?bad=%zz%4").at("bad"), "%zz%4");
}
