#ifndef REALTIME_CLIENTPP_CONNECTION_STATE_HPP
#define REALTIME_CLIENTPP_CONNECTION_STATE_HPP

#include "../config.hpp"
#include "../Logger.hpp"

#include <atomic>
#include <cstdint>
#include <ostream>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace engine {

/**
 * @brief Active delivery path
 */
enum class ConnectionMethod {
    PUSH,
    POLLING
};

/**
 * @brief Connection status; POLLING is reported exactly when the method is POLLING
 */
enum class ConnectionStatus {
    CONNECTED,
    CONNECTING,
    DISCONNECTED,
    ERROR,
    POLLING
};

inline const char* to_string(ConnectionMethod method) {
    switch (method) {
        case ConnectionMethod::PUSH: return "push";
        case ConnectionMethod::POLLING: return "polling";
        default: return "unknown";
    }
}

inline const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::ERROR: return "error";
        case ConnectionStatus::POLLING: return "polling";
        default: return "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, ConnectionMethod method) {
    return os << to_string(method);
}

inline std::ostream& operator<<(std::ostream& os, ConnectionStatus status) {
    return os << to_string(status);
}

/**
 * @brief Consistent (method, status) pair
 */
struct ConnectionSnapshot {
    ConnectionMethod method;
    ConnectionStatus status;

    bool operator==(const ConnectionSnapshot& other) const {
        return method == other.method && status == other.status;
    }

    bool operator!=(const ConnectionSnapshot& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Transport mode and connection status of one manager
 *
 * Transitions are made by the owner's strand only. Readers on any thread
 * get a consistent (method, status) pair because both live in one atomic
 * word.
 *
 * Every push attempt opens a new epoch. Events tagged with an older epoch
 * belong to a superseded socket and fail is_current().
 */
class ConnectionStateMachine {
public:
    ConnectionStateMachine()
        : m_state(pack(ConnectionMethod::PUSH, ConnectionStatus::DISCONNECTED)),
          m_epoch(0) {}

    ConnectionMethod method() const {
        return snapshot().method;
    }

    ConnectionStatus status() const {
        return snapshot().status;
    }

    ConnectionSnapshot snapshot() const {
        return unpack(m_state.load(std::memory_order_acquire));
    }

    uint64_t epoch() const {
        return m_epoch.load(std::memory_order_acquire);
    }

    bool is_current(uint64_t epoch) const {
        return epoch != 0 && epoch == this->epoch();
    }

    /**
     * @brief True only in (PUSH, CONNECTED)
     */
    bool can_send() const {
        auto s = snapshot();
        return s.method == ConnectionMethod::PUSH && s.status == ConnectionStatus::CONNECTED;
    }

    /**
     * @brief Starts a push attempt from any state
     * @return Epoch of the new attempt
     */
    uint64_t begin_connecting() {
        auto epoch = m_epoch.fetch_add(1, std::memory_order_acq_rel) + 1;
        set(ConnectionMethod::PUSH, ConnectionStatus::CONNECTING);
        return epoch;
    }

    /**
     * @brief CONNECTING -> CONNECTED for the current epoch
     * @return false if rejected
     */
    bool mark_connected(uint64_t epoch) {
        auto s = snapshot();
        if (!is_current(epoch) || s.method != ConnectionMethod::PUSH
            || s.status != ConnectionStatus::CONNECTING) {
            LOG_WARN("Rejected transition ", s.method, "/", s.status, " -> connected (epoch ", epoch,
                     ", current ", this->epoch(), ")");
            return false;
        }
        set(ConnectionMethod::PUSH, ConnectionStatus::CONNECTED);
        return true;
    }

    /**
     * @brief CONNECTING or CONNECTED -> ERROR for the current epoch
     * @return false if rejected
     */
    bool mark_error(uint64_t epoch) {
        auto s = snapshot();
        if (!is_current(epoch) || s.method != ConnectionMethod::PUSH
            || (s.status != ConnectionStatus::CONNECTING && s.status != ConnectionStatus::CONNECTED)) {
            LOG_WARN("Rejected transition ", s.method, "/", s.status, " -> error (epoch ", epoch,
                     ", current ", this->epoch(), ")");
            return false;
        }
        set(ConnectionMethod::PUSH, ConnectionStatus::ERROR);
        return true;
    }

    /**
     * @brief Any state -> (POLLING, POLLING); invalidates the push epoch
     */
    void enter_polling() {
        m_epoch.fetch_add(1, std::memory_order_acq_rel);
        set(ConnectionMethod::POLLING, ConnectionStatus::POLLING);
    }

    /**
     * @brief Any state -> (PUSH, DISCONNECTED); invalidates the push epoch
     */
    void reset() {
        m_epoch.fetch_add(1, std::memory_order_acq_rel);
        set(ConnectionMethod::PUSH, ConnectionStatus::DISCONNECTED);
    }

private:
    void set(ConnectionMethod method, ConnectionStatus status) {
        m_state.store(pack(method, status), std::memory_order_release);
    }

    static uint32_t pack(ConnectionMethod method, ConnectionStatus status) {
        return (static_cast<uint32_t>(method) << 8) | static_cast<uint32_t>(status);
    }

    static ConnectionSnapshot unpack(uint32_t word) {
        return ConnectionSnapshot{static_cast<ConnectionMethod>(word >> 8),
                                  static_cast<ConnectionStatus>(word & 0xFF)};
    }

    std::atomic<uint32_t> m_state;
    std::atomic<uint64_t> m_epoch;
};

} // namespace engine
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_CONNECTION_STATE_HPP
