#include <gtest/gtest.h>
#include "RealtimeConfig.hpp"
#include "realtime-clientpp.hpp"
#include "Constants.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace realtime_clientpp::lib;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::ERROR);
        clear_env();
    }

    void TearDown() override {
        clear_env();
        Logger::instance().set_level(LogLevel::INFO);
    }

    static void clear_env() {
        unsetenv("REALTIME_PUSH_URL");
        unsetenv("REALTIME_POLLING_BASE_URL");
        unsetenv("REALTIME_STATUS_PERIOD_MS");
        unsetenv("REALTIME_LOG_LEVEL");
        unsetenv("REALTIME_FORCE_POLLING");
    }

    static RealtimeErrorCode validate_error(const RealtimeConfig& config) {
        try {
            config.validate();
        } catch (const RealtimeException& e) {
            return e.error_code();
        }
        return RealtimeErrorCode::SUCCESS;
    }
};

TEST_F(ConfigTest, Defaults) {
    RealtimeConfig config;

    EXPECT_EQ(config.push.url, defaults::PUSH_URL);
    EXPECT_TRUE(config.push.alternate_path.empty());
    EXPECT_EQ(config.polling.base_url, defaults::POLLING_BASE_URL);
    EXPECT_EQ(config.polling.request_timeout_ms, 10000);
    EXPECT_EQ(config.heartbeat.interval_ms, 15000);
    EXPECT_EQ(config.heartbeat.timeout_ms, 30000);
    EXPECT_EQ(config.status_period_ms, 5000);
    EXPECT_FALSE(config.probe.force_polling);
    ASSERT_EQ(config.probe.marker_variables.size(), 1u);
    EXPECT_EQ(config.probe.marker_variables[0], "REPL_ID");
    EXPECT_TRUE(config.log_level.empty());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, FromJsonString) {
    auto config = RealtimeConfig::from_json_string(R"({
        "push": {"url": "ws://rt.example.com/ws", "alternate_path": "/ws-alt"},
        "polling": {"base_url": "http://api.example.com:8080/v1", "request_timeout_ms": 2500},
        "heartbeat": {"interval_ms": 0},
        "status_period_ms": 1000,
        "probe": {"force_polling": true, "marker_variables": ["CI", "SANDBOX"]},
        "log_level": "debug",
        "unknown": {"ignored": true}
    })");

    EXPECT_EQ(config.push.url, "ws://rt.example.com/ws");
    EXPECT_EQ(config.push.alternate_path, "/ws-alt");
    EXPECT_EQ(config.polling.base_url, "http://api.example.com:8080/v1");
    EXPECT_EQ(config.polling.request_timeout_ms, 2500);
    EXPECT_EQ(config.polling.user_agent, defaults::USER_AGENT);
    EXPECT_EQ(config.heartbeat.interval_ms, 0);
    EXPECT_EQ(config.heartbeat.timeout_ms, 30000);
    EXPECT_EQ(config.status_period_ms, 1000);
    EXPECT_TRUE(config.probe.force_polling);
    EXPECT_EQ(config.probe.marker_variables, (std::vector<std::string>{"CI", "SANDBOX"}));
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, MalformedJsonRejected) {
    try {
        RealtimeConfig::from_json_string("{\"push\": ");
        FAIL() << "Expected RealtimeException";
    } catch (const RealtimeException& e) {
        EXPECT_EQ(e.error_code(), RealtimeErrorCode::INVALID_CONFIG);
    }
    EXPECT_THROW(RealtimeConfig::from_json_string("[]"), RealtimeException);
}

TEST_F(ConfigTest, WrongTypesRejected) {
    EXPECT_THROW(RealtimeConfig::from_json_string(R"({"push": "ws://x"})"), RealtimeException);
    EXPECT_THROW(RealtimeConfig::from_json_string(R"({"push": {"url": 5}})"), RealtimeException);
    EXPECT_THROW(RealtimeConfig::from_json_string(R"({"status_period_ms": "fast"})"), RealtimeException);
    EXPECT_THROW(RealtimeConfig::from_json_string(R"({"probe": {"force_polling": "yes"}})"), RealtimeException);
    EXPECT_THROW(RealtimeConfig::from_json_string(R"({"probe": {"marker_variables": [1]}})"), RealtimeException);
}

TEST_F(ConfigTest, FromJsonFile) {
    const std::string path = ::testing::TempDir() + "realtime_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"polling": {"base_url": "http://10.0.0.2:9000"}})";
    }
    auto config = RealtimeConfig::from_json_file(path);
    EXPECT_EQ(config.polling.base_url, "http://10.0.0.2:9000");
    std::remove(path.c_str());

    EXPECT_THROW(RealtimeConfig::from_json_file(path), RealtimeException);
}

TEST_F(ConfigTest, ManagerFromFileAppliesEnvironment) {
    const std::string path = ::testing::TempDir() + "realtime_manager_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"push": {"url": "ws://file.example.com/ws"}, "status_period_ms": 2500})";
    }
    setenv("REALTIME_POLLING_BASE_URL", "http://env.example.com", 1);

    boost::asio::io_service io;
    auto manager = realtime_clientpp::create_manager_from_file(io, path);
    std::remove(path.c_str());

    ASSERT_TRUE(manager);
    EXPECT_EQ(manager->config().push.url, "ws://file.example.com/ws");
    EXPECT_EQ(manager->config().status_period_ms, 2500);
    EXPECT_EQ(manager->config().polling.base_url, "http://env.example.com");
    EXPECT_EQ(manager->subscription_count(), 0u);

    EXPECT_THROW(realtime_clientpp::create_manager_from_file(io, path), RealtimeException);
}

TEST_F(ConfigTest, ApplyEnvironment) {
    setenv("REALTIME_PUSH_URL", "ws://env.example.com/ws", 1);
    setenv("REALTIME_POLLING_BASE_URL", "http://env.example.com", 1);
    setenv("REALTIME_STATUS_PERIOD_MS", "750", 1);
    setenv("REALTIME_LOG_LEVEL", "trace", 1);
    setenv("REALTIME_FORCE_POLLING", "Yes", 1);

    RealtimeConfig config;
    config.apply_environment();

    EXPECT_EQ(config.push.url, "ws://env.example.com/ws");
    EXPECT_EQ(config.polling.base_url, "http://env.example.com");
    EXPECT_EQ(config.status_period_ms, 750);
    EXPECT_EQ(config.log_level, "trace");
    EXPECT_TRUE(config.probe.force_polling);
}

TEST_F(ConfigTest, ApplyEnvironmentRejectsBadNumber) {
    setenv("REALTIME_STATUS_PERIOD_MS", "soon", 1);
    RealtimeConfig config;
    EXPECT_THROW(config.apply_environment(), RealtimeException);
}

TEST_F(ConfigTest, ValidateRanges) {
    RealtimeConfig config;
    config.status_period_ms = 0;
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    config = RealtimeConfig();
    config.polling.request_timeout_ms = -1;
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    config = RealtimeConfig();
    config.heartbeat.interval_ms = -5;
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    // Disabled heartbeat does not need a timeout
    config = RealtimeConfig();
    config.heartbeat.interval_ms = 0;
    config.heartbeat.timeout_ms = 0;
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::SUCCESS);
}

TEST_F(ConfigTest, ValidateUrls) {
    RealtimeConfig config;
    config.push.url = "http://127.0.0.1/ws";
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    config = RealtimeConfig();
    config.polling.base_url = "localhost:5000";
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    config = RealtimeConfig();
    config.push.alternate_path = "ws-alt";
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::INVALID_CONFIG);

    config = RealtimeConfig();
    config.push.url = "wss://secure.example.com/ws";
    config.polling.base_url = "https://secure.example.com";
    EXPECT_EQ(validate_error(config), RealtimeErrorCode::SUCCESS);
}

TEST_F(ConfigTest, ParseFlag) {
    EXPECT_TRUE(parse_flag("1"));
    EXPECT_TRUE(parse_flag("TRUE"));
    EXPECT_TRUE(parse_flag("on"));
    EXPECT_FALSE(parse_flag("0"));
    EXPECT_FALSE(parse_flag("off"));
    EXPECT_FALSE(parse_flag(""));
}
