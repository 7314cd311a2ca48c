#ifndef REALTIME_CLIENTPP_EVENT_SCHEMA_HPP
#define REALTIME_CLIENTPP_EVENT_SCHEMA_HPP

#include "config.hpp"
#include "Error.hpp"
#include "Payload.hpp"

#include <rapidjson/document.h>

#include <initializer_list>
#include <mutex>
#include <unordered_map>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

/**
 * @brief JSON kind a payload is expected to have
 */
enum class JsonKind {
    ANY,
    OBJECT,
    ARRAY,
    STRING,
    NUMBER,
    BOOLEAN,
    NULL_VALUE
};

inline const char* to_string(JsonKind kind) {
    switch (kind) {
        case JsonKind::ANY: return "any";
        case JsonKind::OBJECT: return "object";
        case JsonKind::ARRAY: return "array";
        case JsonKind::STRING: return "string";
        case JsonKind::NUMBER: return "number";
        case JsonKind::BOOLEAN: return "boolean";
        case JsonKind::NULL_VALUE: return "null";
        default: return "unknown";
    }
}

/**
 * @brief Expected shape of one event's payload
 */
struct PayloadShape {
    JsonKind kind = JsonKind::ANY;
    vector<string> required_members;     ///< Only checked when kind is OBJECT

    PayloadShape() = default;

    PayloadShape(JsonKind k, std::initializer_list<string> members = {})
        : kind(k), required_members(members) {}
};

/**
 * @brief Per-event payload validation
 *
 * Events without a registered shape always validate. Shapes can be
 * registered and removed while dispatch is running.
 */
class EventSchemaRegistry {
public:
    void register_shape(const EventName& event, const PayloadShape& shape) {
        if (event.empty()) {
            throw RealtimeException("Schema event name cannot be empty", RealtimeErrorCode::SCHEMA_MISMATCH);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shapes[event] = shape;
    }

    bool remove_shape(const EventName& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_shapes.erase(event) > 0;
    }

    bool has_shape(const EventName& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_shapes.find(event) != m_shapes.end();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_shapes.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shapes.clear();
    }

    /**
     * @brief Checks a payload against the shape registered for its event
     * @param payload Payload to check
     * @param reason Receives a description of the mismatch, if any
     * @return true if the payload may be delivered
     */
    bool validate(const Payload& payload, string* reason = nullptr) const {
        PayloadShape shape;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_shapes.find(payload.name());
            if (it == m_shapes.end()) {
                return true;
            }
            shape = it->second;
        }

        if (shape.kind == JsonKind::ANY) {
            return true;
        }

        if (!payload.isJson()) {
            // Non-JSON bodies can only satisfy a string shape
            if (shape.kind == JsonKind::STRING) {
                return true;
            }
            set_reason(reason, string("expected ") + to_string(shape.kind) + ", got non-JSON body");
            return false;
        }

        const rapidjson::Document& doc = *payload.json();
        if (!matches_kind(doc, shape.kind)) {
            set_reason(reason, string("expected ") + to_string(shape.kind) + ", got " + to_string(kind_of(doc)));
            return false;
        }

        if (shape.kind == JsonKind::OBJECT) {
            for (const auto& member : shape.required_members) {
                if (!doc.HasMember(member.c_str())) {
                    set_reason(reason, "missing member '" + member + "'");
                    return false;
                }
            }
        }
        return true;
    }

    /**
     * @brief Same as validate() but throws on mismatch
     * @throws RealtimeException with SCHEMA_MISMATCH
     */
    void require(const Payload& payload) const {
        string reason;
        if (!validate(payload, &reason)) {
            throw RealtimeException("Payload for '" + payload.name() + "' rejected: " + reason,
                                    RealtimeErrorCode::SCHEMA_MISMATCH);
        }
    }

    static JsonKind kind_of(const rapidjson::Value& value) {
        if (value.IsObject()) return JsonKind::OBJECT;
        if (value.IsArray()) return JsonKind::ARRAY;
        if (value.IsString()) return JsonKind::STRING;
        if (value.IsNumber()) return JsonKind::NUMBER;
        if (value.IsBool()) return JsonKind::BOOLEAN;
        return JsonKind::NULL_VALUE;
    }

private:
    static bool matches_kind(const rapidjson::Value& value, JsonKind kind) {
        return kind == JsonKind::ANY || kind_of(value) == kind;
    }

    static void set_reason(string* reason, const string& text) {
        if (reason) *reason = text;
    }

    mutable std::mutex m_mutex;
    std::unordered_map<EventName, PayloadShape> m_shapes;
};

}

using lib::EventSchemaRegistry;
using lib::PayloadShape;
using lib::JsonKind;

}

#endif // REALTIME_CLIENTPP_EVENT_SCHEMA_HPP
