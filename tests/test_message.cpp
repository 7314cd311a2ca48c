#include <gtest/gtest.h>
#include "Message.hpp"
#include "Constants.hpp"

#include <rapidjson/document.h>

using namespace realtime_clientpp::lib;

class MessageTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static RealtimeErrorCode decode_error(const std::string& frame) {
        try {
            PushMessage::decode(frame);
        } catch (const RealtimeException& e) {
            return e.error_code();
        }
        return RealtimeErrorCode::SUCCESS;
    }
};

TEST_F(MessageTest, DefaultConstructor) {
    PushMessage msg;

    EXPECT_TRUE(msg.event.empty());
    EXPECT_TRUE(msg.data.empty());
    EXPECT_TRUE(msg.empty());
    EXPECT_EQ(msg.json, nullptr);
}

TEST_F(MessageTest, DecodeObjectPayload) {
    auto msg = PushMessage::decode("{\"event\":\"property-update\",\"payload\":{\"id\":1}}");

    EXPECT_EQ(msg.event, "property-update");
    EXPECT_EQ(msg.data, "{\"id\":1}");
    ASSERT_NE(msg.json, nullptr);
    ASSERT_TRUE(msg.json->IsObject());
    EXPECT_EQ((*msg.json)["id"].GetInt(), 1);
    EXPECT_FALSE(msg.empty());
    EXPECT_FALSE(msg.is_heartbeat());
}

TEST_F(MessageTest, DecodeScalarAndArrayPayloads) {
    auto text = PushMessage::decode("{\"event\":\"notice\",\"payload\":\"hello\"}");
    EXPECT_EQ(text.data, "\"hello\"");
    EXPECT_TRUE(text.json->IsString());

    auto list = PushMessage::decode("{\"payload\":[1,2,3],\"event\":\"list\"}");
    EXPECT_EQ(list.event, "list");
    EXPECT_TRUE(list.json->IsArray());
    EXPECT_EQ(list.json->Size(), 3u);
}

TEST_F(MessageTest, MissingPayloadDecodesAsNull) {
    auto msg = PushMessage::decode("{\"event\":\"refresh\"}");

    EXPECT_EQ(msg.event, "refresh");
    EXPECT_EQ(msg.data, "null");
    ASSERT_NE(msg.json, nullptr);
    EXPECT_TRUE(msg.json->IsNull());
    EXPECT_TRUE(msg.empty());
}

TEST_F(MessageTest, ExtraMembersIgnored) {
    auto msg = PushMessage::decode("{\"event\":\"a\",\"payload\":1,\"ts\":123}");
    EXPECT_EQ(msg.event, "a");
    EXPECT_EQ(msg.data, "1");
}

TEST_F(MessageTest, MalformedFramesRejected) {
    EXPECT_EQ(decode_error("not json"), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
    EXPECT_EQ(decode_error(""), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
    EXPECT_EQ(decode_error("[1,2]"), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
    EXPECT_EQ(decode_error("{\"payload\":{}}"), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
    EXPECT_EQ(decode_error("{\"event\":\"\",\"payload\":{}}"), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
    EXPECT_EQ(decode_error("{\"event\":7,\"payload\":{}}"), RealtimeErrorCode::MESSAGE_PARSE_ERROR);
}

TEST_F(MessageTest, EncodeEnvelope) {
    rapidjson::Document payload;
    payload.SetObject();
    payload.AddMember("id", 1, payload.GetAllocator());

    auto text = PushMessage::encode("property-update", payload);
    EXPECT_EQ(text, "{\"event\":\"property-update\",\"payload\":{\"id\":1}}");

    auto decoded = PushMessage::decode(text);
    EXPECT_EQ(decoded.event, "property-update");
    EXPECT_EQ(decoded.data, "{\"id\":1}");
}

TEST_F(MessageTest, HeartbeatDetection) {
    auto msg = PushMessage::decode("{\"event\":\"heartbeat\",\"payload\":{\"action\":\"pong\"}}");
    EXPECT_TRUE(msg.is_heartbeat());
}

TEST_F(MessageTest, JsonHelpers) {
    EXPECT_TRUE(json::is_valid("{\"a\":1}"));
    EXPECT_TRUE(json::is_valid("42"));
    EXPECT_TRUE(json::is_valid("\"text\""));
    EXPECT_FALSE(json::is_valid("hello"));
    EXPECT_FALSE(json::is_valid("{\"a\":"));

    EXPECT_EQ(json::quote("hello"), "\"hello\"");
    EXPECT_EQ(json::quote("say \"hi\""), "\"say \\\"hi\\\"\"");

    rapidjson::Document doc;
    doc.Parse("{ \"a\" : [ 1, 2 ] }");
    EXPECT_EQ(json::serialize(doc), "{\"a\":[1,2]}");
}
