#ifndef REALTIME_CLIENTPP_PAYLOAD_HPP
#define REALTIME_CLIENTPP_PAYLOAD_HPP

#include "Error.hpp"
#include "Message.hpp"
#include "config.hpp"

#include <rapidjson/document.h>

#include <memory>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

/**
 * @brief Delivery path a payload arrived on
 */
enum class PayloadSource {
    PUSH,
    POLLING
};

/**
 * @brief Data handed to a subscription callback
 *
 * Copies share the parsed document, so handing a Payload to many
 * subscriptions does not re-parse or deep-copy it.
 */
class Payload {
public:
    /**
     * @brief Constructs a Payload with JSON data
     * @param event Event name the payload is keyed by
     * @param json Parsed JSON document
     * @param rawJson Compact JSON text of the document
     * @param source Delivery path
     */
    Payload(const string& event, std::shared_ptr<const rapidjson::Document> json, const string& rawJson,
            PayloadSource source = PayloadSource::PUSH)
        : m_isJson(true), m_event(event), m_json(std::move(json)), m_stringdata(rawJson), m_source(source) {
        if (event.empty()) {
            throw RealtimeException("Payload event name cannot be empty", RealtimeErrorCode::INVALID_SUBSCRIPTION);
        }
    }

    /**
     * @brief Constructs a Payload with string data
     * @param event Event name the payload is keyed by
     * @param data Verbatim body
     * @param source Delivery path
     */
    Payload(const string& event, const string& data, PayloadSource source = PayloadSource::POLLING)
        : m_isJson(false), m_event(event), m_stringdata(data), m_source(source) {
        if (event.empty()) {
            throw RealtimeException("Payload event name cannot be empty", RealtimeErrorCode::INVALID_SUBSCRIPTION);
        }
    }

    /**
     * @brief Builds the payload of a decoded push envelope
     */
    static Payload from_message(const PushMessage& msg) {
        return Payload(msg.event, msg.json, msg.data, PayloadSource::PUSH);
    }

    /**
     * @brief Decodes a polling response body
     *
     * Bodies that are valid JSON are parsed; anything else is kept verbatim
     * as a string payload.
     */
    static Payload from_body(const string& event, const string& body) {
        auto doc = std::make_shared<rapidjson::Document>();
        if (!body.empty() && !doc->Parse(body.c_str(), body.size()).HasParseError()) {
            return Payload(event, std::move(doc), body, PayloadSource::POLLING);
        }
        return Payload(event, body, PayloadSource::POLLING);
    }

    bool isJson() const {
        return m_isJson;
    }

    const string& name() const {
        return m_event;
    }

    /**
     * @brief Gets the raw data as string (compact JSON or verbatim body)
     */
    const string& data() const {
        return m_stringdata;
    }

    /**
     * @brief Gets the parsed JSON document (only valid if isJson() returns true)
     * @return Pointer to JSON document or nullptr
     */
    const rapidjson::Document* json() const {
        return m_json.get();
    }

    PayloadSource source() const {
        return m_source;
    }

    bool empty() const {
        return m_stringdata.empty();
    }

    size_t size() const {
        return m_stringdata.size();
    }

private:
    bool m_isJson;
    string m_event;
    std::shared_ptr<const rapidjson::Document> m_json;
    string m_stringdata;
    PayloadSource m_source;
};

}

using lib::Payload;

}

#endif // REALTIME_CLIENTPP_PAYLOAD_HPP
