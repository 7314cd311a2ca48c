#include <gtest/gtest.h>
#include "Payload.hpp"
#include "Error.hpp"

#include <rapidjson/document.h>

using namespace realtime_clientpp::lib;

class PayloadTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(PayloadTest, StringPayloadConstructor) {
    Payload payload("stats", "plain text body");

    EXPECT_EQ(payload.name(), "stats");
    EXPECT_EQ(payload.data(), "plain text body");
    EXPECT_FALSE(payload.isJson());
    EXPECT_EQ(payload.size(), 15u);
    EXPECT_FALSE(payload.empty());
    EXPECT_EQ(payload.json(), nullptr);
    EXPECT_EQ(payload.source(), PayloadSource::POLLING);
}

TEST_F(PayloadTest, JsonPayloadConstructor) {
    auto doc = std::make_shared<rapidjson::Document>();
    doc->Parse("{\"key\":\"value\",\"number\":42}");

    Payload payload("json_event", doc, "{\"key\":\"value\",\"number\":42}");

    EXPECT_EQ(payload.name(), "json_event");
    EXPECT_TRUE(payload.isJson());
    EXPECT_EQ(payload.source(), PayloadSource::PUSH);
    ASSERT_NE(payload.json(), nullptr);
    EXPECT_EQ((*payload.json())["number"].GetInt(), 42);
}

TEST_F(PayloadTest, EmptyEventName) {
    EXPECT_THROW({
        Payload payload("", "data");
    }, RealtimeException);

    auto doc = std::make_shared<rapidjson::Document>();
    doc->Parse("{}");
    EXPECT_THROW({
        Payload payload("", doc, "{}");
    }, RealtimeException);
}

TEST_F(PayloadTest, FromPushMessage) {
    auto msg = PushMessage::decode("{\"event\":\"property-update\",\"payload\":{\"id\":1}}");
    auto payload = Payload::from_message(msg);

    EXPECT_EQ(payload.name(), "property-update");
    EXPECT_EQ(payload.data(), "{\"id\":1}");
    EXPECT_TRUE(payload.isJson());
    EXPECT_EQ(payload.source(), PayloadSource::PUSH);
    // Shares the decoded document
    EXPECT_EQ(payload.json(), msg.json.get());
}

TEST_F(PayloadTest, FromJsonBody) {
    auto payload = Payload::from_body("props", "[{\"id\":1},{\"id\":2}]");

    EXPECT_TRUE(payload.isJson());
    EXPECT_EQ(payload.source(), PayloadSource::POLLING);
    ASSERT_NE(payload.json(), nullptr);
    ASSERT_TRUE(payload.json()->IsArray());
    EXPECT_EQ(payload.json()->Size(), 2u);
    EXPECT_EQ(payload.data(), "[{\"id\":1},{\"id\":2}]");
}

TEST_F(PayloadTest, FromNonJsonBodyKeepsText) {
    auto payload = Payload::from_body("health", "OK");

    EXPECT_FALSE(payload.isJson());
    EXPECT_EQ(payload.data(), "OK");
    EXPECT_EQ(payload.json(), nullptr);
}

TEST_F(PayloadTest, FromEmptyBody) {
    auto payload = Payload::from_body("health", "");

    EXPECT_FALSE(payload.isJson());
    EXPECT_TRUE(payload.empty());
}

TEST_F(PayloadTest, CopiesShareDocument) {
    auto original = Payload::from_body("props", "{\"a\":1}");
    Payload copy = original;

    EXPECT_EQ(copy.json(), original.json());
    EXPECT_EQ(copy.data(), original.data());
}
