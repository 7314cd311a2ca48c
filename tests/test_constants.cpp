#include <gtest/gtest.h>
#include "Constants.hpp"

#include <string>

using namespace realtime_clientpp::lib;

class ConstantsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ConstantsTest, WireEnvelopeKeys) {
    EXPECT_STREQ(wire::EVENT, "event");
    EXPECT_STREQ(wire::PAYLOAD, "payload");
    EXPECT_STREQ(wire::ACTION, "action");
    EXPECT_STREQ(wire::TIMESTAMP, "timestamp");
}

TEST_F(ConstantsTest, HeartbeatConstants) {
    EXPECT_STREQ(heartbeat::EVENT, "heartbeat");
    EXPECT_STREQ(heartbeat::PING, "ping");
    EXPECT_STREQ(heartbeat::PONG, "pong");
}

TEST_F(ConstantsTest, QueryParameterNames) {
    EXPECT_STREQ(params::CLIENT_ID, "clientId");
    EXPECT_STREQ(params::QUERY_KEY, "key");
}

TEST_F(ConstantsTest, TimeoutDefaults) {
    EXPECT_EQ(timeouts::DEFAULT_STATUS_PERIOD, 5000);
    EXPECT_EQ(timeouts::DEFAULT_HEARTBEAT_INTERVAL, 15000);
    EXPECT_EQ(timeouts::DEFAULT_HEARTBEAT_TIMEOUT, 30000);
    EXPECT_EQ(timeouts::DEFAULT_REQUEST_TIMEOUT, 10000);

    // A pong must be able to arrive after at least one ping
    EXPECT_GT(timeouts::DEFAULT_HEARTBEAT_TIMEOUT, timeouts::DEFAULT_HEARTBEAT_INTERVAL);
}

TEST_F(ConstantsTest, CloseCodes) {
    EXPECT_EQ(close_code::NORMAL, 1000);
    EXPECT_EQ(close_code::GOING_AWAY, 1001);
    EXPECT_EQ(close_code::ABNORMAL, 1006);
    // Application range
    EXPECT_GE(close_code::HEARTBEAT_TIMEOUT, 4000);
    EXPECT_LE(close_code::HEARTBEAT_TIMEOUT, 4999);
}

TEST_F(ConstantsTest, Defaults) {
    EXPECT_EQ(std::string(defaults::PUSH_URL).rfind("ws://", 0), 0u);
    EXPECT_EQ(std::string(defaults::POLLING_BASE_URL).rfind("http://", 0), 0u);
    EXPECT_STREQ(defaults::FORCE_POLLING_ENV, "REALTIME_FORCE_POLLING");
    EXPECT_STREQ(defaults::HOSTED_MARKER_ENV, "REPL_ID");
}

TEST_F(ConstantsTest, HttpStatusClasses) {
    static_assert(http_status::is_success(http_status::OK), "200 is success");
    EXPECT_TRUE(http_status::is_success(http_status::NO_CONTENT));
    EXPECT_TRUE(http_status::is_success(299));
    EXPECT_FALSE(http_status::is_success(199));
    EXPECT_FALSE(http_status::is_success(304));
    EXPECT_FALSE(http_status::is_success(http_status::NOT_FOUND));
    EXPECT_FALSE(http_status::is_success(http_status::INTERNAL_ERROR));
    EXPECT_FALSE(http_status::is_success(0));
}
