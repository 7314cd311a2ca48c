#include <gtest/gtest.h>
#include "engine/Heartbeat.hpp"

#include <chrono>
#include <vector>

using namespace realtime_clientpp::lib;
using namespace realtime_clientpp::lib::engine;

class HeartbeatTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::ERROR);
        config.interval_ms = 20;
        config.timeout_ms = 70;
    }

    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }

    std::shared_ptr<HeartbeatMonitor> make_monitor() {
        return std::make_shared<HeartbeatMonitor>(
            strand, config,
            [this](const std::string& text) {
                sent.push_back(text);
                return send_ok;
            },
            [this]() { ++timeouts; });
    }

    void run_for(int ms) {
        io.restart();
        io.run_for(std::chrono::milliseconds(ms));
    }

    asio::io_service io;
    Strand strand{asio::make_strand(io)};
    HeartbeatConfig config;
    std::vector<std::string> sent;
    bool send_ok = true;
    int timeouts = 0;
};

TEST_F(HeartbeatTest, PingFormat) {
    auto msg = PushMessage::decode(HeartbeatMonitor::make_ping(1700000000123));

    EXPECT_EQ(msg.event, "heartbeat");
    ASSERT_TRUE(msg.json->IsObject());
    EXPECT_STREQ((*msg.json)["action"].GetString(), "ping");
    EXPECT_EQ((*msg.json)["timestamp"].GetInt64(), 1700000000123);
}

TEST_F(HeartbeatTest, PongDetection) {
    EXPECT_TRUE(HeartbeatMonitor::is_pong(
        PushMessage::decode("{\"event\":\"heartbeat\",\"payload\":{\"action\":\"pong\",\"timestamp\":1}}")));
    EXPECT_FALSE(HeartbeatMonitor::is_pong(
        PushMessage::decode("{\"event\":\"heartbeat\",\"payload\":{\"action\":\"ping\"}}")));
    EXPECT_FALSE(HeartbeatMonitor::is_pong(
        PushMessage::decode("{\"event\":\"heartbeat\",\"payload\":\"pong\"}")));
    EXPECT_FALSE(HeartbeatMonitor::is_pong(
        PushMessage::decode("{\"event\":\"status\",\"payload\":{\"action\":\"pong\"}}")));
}

TEST_F(HeartbeatTest, SendsPingsEveryInterval) {
    auto monitor = make_monitor();
    asio::post(strand, [&] { monitor->start(); });
    run_for(55);

    EXPECT_GE(sent.size(), 2u);
    EXPECT_LE(sent.size(), 3u);
    EXPECT_EQ(monitor->pings_sent(), sent.size());
    EXPECT_TRUE(PushMessage::decode(sent.front()).is_heartbeat());
    EXPECT_EQ(timeouts, 0);
}

TEST_F(HeartbeatTest, TimesOutWithoutPong) {
    auto monitor = make_monitor();
    asio::post(strand, [&] { monitor->start(); });
    run_for(150);

    EXPECT_EQ(timeouts, 1);
    EXPECT_FALSE(monitor->running());
}

TEST_F(HeartbeatTest, PongKeepsConnectionAlive) {
    auto monitor = make_monitor();
    asio::post(strand, [&] { monitor->start(); });

    // Answer every 30ms, well inside the 70ms deadline
    asio::steady_timer responder(strand);
    std::function<void()> schedule = [&]() {
        responder.expires_after(std::chrono::milliseconds(30));
        responder.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            monitor->on_pong();
            schedule();
        });
    };
    asio::post(strand, schedule);
    run_for(200);

    EXPECT_EQ(timeouts, 0);
    EXPECT_TRUE(monitor->running());
    responder.cancel();
    asio::post(strand, [&] { monitor->stop(); });
    run_for(10);
}

TEST_F(HeartbeatTest, StopCancelsTimers) {
    auto monitor = make_monitor();
    asio::post(strand, [&] {
        monitor->start();
        monitor->stop();
    });
    run_for(120);

    EXPECT_TRUE(sent.empty());
    EXPECT_EQ(timeouts, 0);
    EXPECT_FALSE(monitor->running());
}

TEST_F(HeartbeatTest, DisabledMonitorNeverRuns) {
    config.interval_ms = 0;
    auto monitor = make_monitor();
    EXPECT_FALSE(monitor->enabled());

    asio::post(strand, [&] { monitor->start(); });
    run_for(100);

    EXPECT_FALSE(monitor->running());
    EXPECT_TRUE(sent.empty());
    EXPECT_EQ(timeouts, 0);
}

TEST_F(HeartbeatTest, FailedSendIsNotCounted) {
    send_ok = false;
    auto monitor = make_monitor();
    asio::post(strand, [&] { monitor->start(); });
    run_for(50);

    EXPECT_FALSE(sent.empty());
    EXPECT_EQ(monitor->pings_sent(), 0u);
}
