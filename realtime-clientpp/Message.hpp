#ifndef REALTIME_CLIENTPP_MESSAGE_HPP
#define REALTIME_CLIENTPP_MESSAGE_HPP

#include "config.hpp"
#include "Constants.hpp"
#include "Error.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <memory>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

namespace json {

/**
 * @brief Serializes a JSON value to compact text
 */
inline string serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return string(buffer.GetString(), buffer.GetSize());
}

/**
 * @brief Encodes a plain string as a JSON string literal
 */
inline string quote(const string& text) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    return string(buffer.GetString(), buffer.GetSize());
}

/**
 * @brief Checks whether text parses as a single JSON value
 */
inline bool is_valid(const string& text) {
    rapidjson::Document doc;
    return !doc.Parse(text.c_str(), text.size()).HasParseError();
}

} // namespace json

/**
 * @brief One push envelope: {"event": <name>, "payload": <any JSON>}
 */
struct PushMessage {
    string event;                                        ///< Routing key
    string data;                                         ///< Payload as compact JSON text
    std::shared_ptr<const rapidjson::Document> json;     ///< Parsed payload (never null after decode)

    PushMessage() = default;

    PushMessage(const string& ev, const string& payload_json)
        : event(ev), data(payload_json) {}

    bool empty() const {
        return data.empty() || data == "null";
    }

    size_t size() const {
        return data.size();
    }

    bool is_heartbeat() const {
        return event == heartbeat::EVENT;
    }

    /**
     * @brief Decodes a text frame received on the push transport
     * @param frame Raw frame text
     * @return Decoded message; a missing payload member decodes as null
     * @throws RealtimeException with MESSAGE_PARSE_ERROR on malformed frames
     */
    static PushMessage decode(const string& frame) {
        rapidjson::Document envelope;
        envelope.Parse(frame.c_str(), frame.size());
        if (envelope.HasParseError()) {
            throw RealtimeException(string("Invalid JSON frame: ")
                                        + rapidjson::GetParseError_En(envelope.GetParseError()),
                                    RealtimeErrorCode::MESSAGE_PARSE_ERROR);
        }
        if (!envelope.IsObject()) {
            throw RealtimeException("Push frame is not a JSON object", RealtimeErrorCode::MESSAGE_PARSE_ERROR);
        }

        auto ev = envelope.FindMember(wire::EVENT);
        if (ev == envelope.MemberEnd() || !ev->value.IsString() || ev->value.GetStringLength() == 0) {
            throw RealtimeException("Push frame has no event name", RealtimeErrorCode::MESSAGE_PARSE_ERROR);
        }

        PushMessage msg;
        msg.event.assign(ev->value.GetString(), ev->value.GetStringLength());

        auto doc = std::make_shared<rapidjson::Document>();
        auto pl = envelope.FindMember(wire::PAYLOAD);
        if (pl != envelope.MemberEnd()) {
            doc->CopyFrom(pl->value, doc->GetAllocator());
        } else {
            doc->SetNull();
        }
        msg.data = json::serialize(*doc);
        msg.json = std::move(doc);
        return msg;
    }

    /**
     * @brief Encodes an envelope
     * @param ev Event name
     * @param payload Payload value
     */
    static string encode(const string& ev, const rapidjson::Value& payload) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        writer.StartObject();
        writer.Key(wire::EVENT);
        writer.String(ev.c_str(), static_cast<rapidjson::SizeType>(ev.size()));
        writer.Key(wire::PAYLOAD);
        payload.Accept(writer);
        writer.EndObject();
        return string(buffer.GetString(), buffer.GetSize());
    }
};

} // namespace lib

using lib::PushMessage;

} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_MESSAGE_HPP
