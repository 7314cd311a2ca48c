#ifndef REALTIME_CLIENTPP_REALTIME_CONFIG_HPP
#define REALTIME_CLIENTPP_REALTIME_CONFIG_HPP

#include "config.hpp"
#include "Constants.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "Url.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

/**
 * @brief Interprets an on/off switch ("1", "true", "yes", "on"; case-insensitive)
 */
inline bool parse_flag(const string& value) {
    string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

/**
 * @brief Push transport settings
 */
struct PushConfig {
    string url = defaults::PUSH_URL;
    string alternate_path;                  ///< Empty disables the alternate attempt
    int connect_timeout_ms = timeouts::DEFAULT_CONNECT_TIMEOUT;
};

/**
 * @brief Polling transport settings
 */
struct PollingConfig {
    string base_url = defaults::POLLING_BASE_URL;
    int request_timeout_ms = timeouts::DEFAULT_REQUEST_TIMEOUT;
    string user_agent = defaults::USER_AGENT;
};

/**
 * @brief Heartbeat settings (interval_ms == 0 disables the monitor)
 */
struct HeartbeatConfig {
    int interval_ms = timeouts::DEFAULT_HEARTBEAT_INTERVAL;
    int timeout_ms = timeouts::DEFAULT_HEARTBEAT_TIMEOUT;
};

/**
 * @brief Transport probe settings
 */
struct ProbeConfig {
    bool force_polling = false;
    vector<string> marker_variables{defaults::HOSTED_MARKER_ENV};
};

/**
 * @brief Realtime manager configuration
 */
struct RealtimeConfig {
    PushConfig push;
    PollingConfig polling;
    HeartbeatConfig heartbeat;
    int status_period_ms = timeouts::DEFAULT_STATUS_PERIOD;
    ProbeConfig probe;
    string log_level;                       ///< Empty leaves the logger untouched

    RealtimeConfig() = default;

    /**
     * @brief Loads a configuration from a JSON document
     *
     * Missing keys keep their defaults and unknown keys are ignored.
     * @throws RealtimeException with INVALID_CONFIG on malformed JSON or wrong types
     */
    static RealtimeConfig from_json_string(const string& text) {
        rapidjson::Document doc;
        doc.Parse(text.c_str(), text.size());
        if (doc.HasParseError()) {
            throw RealtimeException(string("Invalid configuration JSON at offset ")
                                        + std::to_string(doc.GetErrorOffset()) + ": "
                                        + rapidjson::GetParseError_En(doc.GetParseError()),
                                    RealtimeErrorCode::INVALID_CONFIG);
        }
        if (!doc.IsObject()) {
            throw RealtimeException("Configuration root must be a JSON object", RealtimeErrorCode::INVALID_CONFIG);
        }

        RealtimeConfig config;
        if (auto* push = section(doc, "push")) {
            read_string(*push, "url", config.push.url);
            read_string(*push, "alternate_path", config.push.alternate_path);
            read_int(*push, "connect_timeout_ms", config.push.connect_timeout_ms);
        }
        if (auto* polling = section(doc, "polling")) {
            read_string(*polling, "base_url", config.polling.base_url);
            read_int(*polling, "request_timeout_ms", config.polling.request_timeout_ms);
            read_string(*polling, "user_agent", config.polling.user_agent);
        }
        if (auto* heartbeat = section(doc, "heartbeat")) {
            read_int(*heartbeat, "interval_ms", config.heartbeat.interval_ms);
            read_int(*heartbeat, "timeout_ms", config.heartbeat.timeout_ms);
        }
        read_int(doc, "status_period_ms", config.status_period_ms);
        if (auto* probe = section(doc, "probe")) {
            read_bool(*probe, "force_polling", config.probe.force_polling);
            auto it = probe->FindMember("marker_variables");
            if (it != probe->MemberEnd()) {
                if (!it->value.IsArray()) {
                    throw RealtimeException("'marker_variables' must be an array of strings",
                                            RealtimeErrorCode::INVALID_CONFIG);
                }
                config.probe.marker_variables.clear();
                for (const auto& v : it->value.GetArray()) {
                    if (!v.IsString()) {
                        throw RealtimeException("'marker_variables' must be an array of strings",
                                                RealtimeErrorCode::INVALID_CONFIG);
                    }
                    config.probe.marker_variables.emplace_back(v.GetString(), v.GetStringLength());
                }
            }
        }
        read_string(doc, "log_level", config.log_level);
        return config;
    }

    /**
     * @brief Loads a configuration file
     * @throws RealtimeException with INVALID_CONFIG if the file cannot be read or parsed
     */
    static RealtimeConfig from_json_file(const string& path) {
        std::ifstream in(path);
        if (!in) {
            throw RealtimeException("Cannot open configuration file: " + path, RealtimeErrorCode::INVALID_CONFIG);
        }
        std::ostringstream content;
        content << in.rdbuf();
        LOG_DEBUG("Loaded configuration file: ", path);
        return from_json_string(content.str());
    }

    /**
     * @brief Overrides fields from REALTIME_* environment variables
     */
    RealtimeConfig& apply_environment() {
        if (const char* v = std::getenv("REALTIME_PUSH_URL")) {
            push.url = v;
        }
        if (const char* v = std::getenv("REALTIME_POLLING_BASE_URL")) {
            polling.base_url = v;
        }
        if (const char* v = std::getenv("REALTIME_STATUS_PERIOD_MS")) {
            try {
                status_period_ms = std::stoi(v);
            } catch (const std::exception&) {
                throw RealtimeException(string("REALTIME_STATUS_PERIOD_MS is not a number: ") + v,
                                        RealtimeErrorCode::INVALID_CONFIG);
            }
        }
        if (const char* v = std::getenv("REALTIME_LOG_LEVEL")) {
            log_level = v;
        }
        if (const char* v = std::getenv(defaults::FORCE_POLLING_ENV)) {
            probe.force_polling = parse_flag(v);
        }
        return *this;
    }

    /**
     * @brief Checks ranges and URLs
     * @throws RealtimeException with INVALID_CONFIG
     */
    void validate() const {
        if (status_period_ms <= 0) {
            throw RealtimeException("status_period_ms must be positive", RealtimeErrorCode::INVALID_CONFIG);
        }
        if (push.connect_timeout_ms <= 0) {
            throw RealtimeException("push.connect_timeout_ms must be positive", RealtimeErrorCode::INVALID_CONFIG);
        }
        if (polling.request_timeout_ms <= 0) {
            throw RealtimeException("polling.request_timeout_ms must be positive", RealtimeErrorCode::INVALID_CONFIG);
        }
        if (heartbeat.interval_ms < 0) {
            throw RealtimeException("heartbeat.interval_ms cannot be negative", RealtimeErrorCode::INVALID_CONFIG);
        }
        if (heartbeat.interval_ms > 0 && heartbeat.timeout_ms <= 0) {
            throw RealtimeException("heartbeat.timeout_ms must be positive", RealtimeErrorCode::INVALID_CONFIG);
        }

        Url url;
        if (!Url::try_parse(push.url, url) || (url.scheme != "ws" && url.scheme != "wss")) {
            throw RealtimeException("push.url must be a ws:// or wss:// URL: '" + push.url + "'",
                                    RealtimeErrorCode::INVALID_CONFIG);
        }
        if (!Url::try_parse(polling.base_url, url) || (url.scheme != "http" && url.scheme != "https")) {
            throw RealtimeException("polling.base_url must be an http:// or https:// URL: '" + polling.base_url + "'",
                                    RealtimeErrorCode::INVALID_CONFIG);
        }
        if (!push.alternate_path.empty() && push.alternate_path[0] != '/') {
            throw RealtimeException("push.alternate_path must start with '/'", RealtimeErrorCode::INVALID_CONFIG);
        }
    }

private:
    static const rapidjson::Value* section(const rapidjson::Value& parent, const char* name) {
        auto it = parent.FindMember(name);
        if (it == parent.MemberEnd()) return nullptr;
        if (!it->value.IsObject()) {
            throw RealtimeException(string("'") + name + "' must be an object", RealtimeErrorCode::INVALID_CONFIG);
        }
        return &it->value;
    }

    static void read_string(const rapidjson::Value& obj, const char* name, string& out) {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd()) return;
        if (!it->value.IsString()) {
            throw RealtimeException(string("'") + name + "' must be a string", RealtimeErrorCode::INVALID_CONFIG);
        }
        out.assign(it->value.GetString(), it->value.GetStringLength());
    }

    static void read_int(const rapidjson::Value& obj, const char* name, int& out) {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd()) return;
        if (!it->value.IsInt()) {
            throw RealtimeException(string("'") + name + "' must be an integer", RealtimeErrorCode::INVALID_CONFIG);
        }
        out = it->value.GetInt();
    }

    static void read_bool(const rapidjson::Value& obj, const char* name, bool& out) {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd()) return;
        if (!it->value.IsBool()) {
            throw RealtimeException(string("'") + name + "' must be a boolean", RealtimeErrorCode::INVALID_CONFIG);
        }
        out = it->value.GetBool();
    }
};

}

using lib::RealtimeConfig;

}

#endif // REALTIME_CLIENTPP_REALTIME_CONFIG_HPP
