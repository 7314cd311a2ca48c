#ifndef REALTIME_CLIENTPP_ERROR_HPP
#define REALTIME_CLIENTPP_ERROR_HPP

#include "config.hpp"
#include <system_error>
#include <stdexcept>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

// Error codes for the realtime layer
enum class RealtimeErrorCode {
    SUCCESS = 0,
    INVALID_SUBSCRIPTION,
    INVALID_STATE,
    CONNECTION_FAILED,
    MESSAGE_PARSE_ERROR,
    SCHEMA_MISMATCH,
    TIMEOUT,
    FETCH_FAILED,
    INVALID_CONFIG
};

// Exception carrying a realtime error code
class RealtimeException : public std::runtime_error {
public:
    explicit RealtimeException(const string& message, RealtimeErrorCode code = RealtimeErrorCode::INVALID_STATE)
        : std::runtime_error(message), error_code_(code) {}

    RealtimeErrorCode error_code() const noexcept { return error_code_; }

private:
    RealtimeErrorCode error_code_;
};

// Error category for realtime error codes
class RealtimeErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "realtime";
    }

    string message(int ev) const override {
        switch (static_cast<RealtimeErrorCode>(ev)) {
            case RealtimeErrorCode::SUCCESS:
                return "Success";
            case RealtimeErrorCode::INVALID_SUBSCRIPTION:
                return "Invalid subscription";
            case RealtimeErrorCode::INVALID_STATE:
                return "Invalid state";
            case RealtimeErrorCode::CONNECTION_FAILED:
                return "Connection failed";
            case RealtimeErrorCode::MESSAGE_PARSE_ERROR:
                return "Message parse error";
            case RealtimeErrorCode::SCHEMA_MISMATCH:
                return "Payload does not match event schema";
            case RealtimeErrorCode::TIMEOUT:
                return "Operation timeout";
            case RealtimeErrorCode::FETCH_FAILED:
                return "Fetch failed";
            case RealtimeErrorCode::INVALID_CONFIG:
                return "Invalid configuration";
            default:
                return "Unknown error";
        }
    }
};

inline const RealtimeErrorCategory& realtime_category() {
    static RealtimeErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(RealtimeErrorCode e) {
    return {static_cast<int>(e), realtime_category()};
}

} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

namespace std {
template<>
struct is_error_code_enum<REALTIME_CLIENTPP_NAMESPACE::lib::RealtimeErrorCode> : true_type {};
}

#endif // REALTIME_CLIENTPP_ERROR_HPP
