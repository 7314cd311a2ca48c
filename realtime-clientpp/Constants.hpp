#ifndef REALTIME_CLIENTPP_CONSTANTS_HPP
#define REALTIME_CLIENTPP_CONSTANTS_HPP

#include "config.hpp"

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace constants {

// Push envelope: {"event": "...", "payload": ...}
namespace wire {
    constexpr const char* EVENT = "event";
    constexpr const char* PAYLOAD = "payload";
    constexpr const char* ACTION = "action";
    constexpr const char* TIMESTAMP = "timestamp";
}

// Application-level heartbeat carried over the push envelope
namespace heartbeat {
    constexpr const char* EVENT = "heartbeat";
    constexpr const char* PING = "ping";
    constexpr const char* PONG = "pong";
}

// Query parameter names
namespace params {
    constexpr const char* CLIENT_ID = "clientId";
    constexpr const char* QUERY_KEY = "key";
}

// Default timeout values (milliseconds)
namespace timeouts {
    constexpr int DEFAULT_STATUS_PERIOD = 5000;
    constexpr int DEFAULT_HEARTBEAT_INTERVAL = 15000;
    constexpr int DEFAULT_HEARTBEAT_TIMEOUT = 30000;
    constexpr int DEFAULT_REQUEST_TIMEOUT = 10000;
    constexpr int DEFAULT_CONNECT_TIMEOUT = 10000;
}

// WebSocket close codes
namespace close_code {
    constexpr int NORMAL = 1000;
    constexpr int GOING_AWAY = 1001;
    constexpr int ABNORMAL = 1006;
    constexpr int HEARTBEAT_TIMEOUT = 4000;
}

namespace defaults {
    constexpr const char* PUSH_URL = "ws://127.0.0.1:5000/ws";
    constexpr const char* POLLING_BASE_URL = "http://127.0.0.1:5000";
    constexpr const char* USER_AGENT = "realtime-clientpp/1.0";
    constexpr const char* FORCE_POLLING_ENV = "REALTIME_FORCE_POLLING";
    constexpr const char* HOSTED_MARKER_ENV = "REPL_ID";
}

// HTTP status classes
namespace http_status {
    constexpr int OK = 200;
    constexpr int NO_CONTENT = 204;
    constexpr int NOT_FOUND = 404;
    constexpr int INTERNAL_ERROR = 500;

    constexpr bool is_success(int status) {
        return status >= 200 && status < 300;
    }
}

} // namespace constants

// Bring constants into lib namespace for easier access
using namespace constants;

} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_CONSTANTS_HPP
