#ifndef REALTIME_CLIENTPP_FAILOVER_CONTROLLER_HPP
#define REALTIME_CLIENTPP_FAILOVER_CONTROLLER_HPP

#include "../config.hpp"
#include "../RealtimeConfig.hpp"
#include "../Url.hpp"

#include <atomic>
#include <cstdint>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

/**
 * @brief What to do after a push transport failure
 */
enum class FailoverAction {
    RETRY_ALTERNATE,    ///< One attempt on the alternate push path
    STAY,               ///< Push is pinned: remain in (push, error)
    DEMOTE              ///< Switch to polling
};

inline const char* to_string(FailoverAction action) {
    switch (action) {
        case FailoverAction::RETRY_ALTERNATE: return "retry-alternate";
        case FailoverAction::STAY: return "stay";
        case FailoverAction::DEMOTE: return "demote";
        default: return "unknown";
    }
}

struct FailoverStats {
    uint64_t failures = 0;
    uint64_t demotions = 0;
    uint64_t alternate_attempts = 0;
};

/**
 * @brief Push failure policy
 *
 * A connect cycle starts at connect() or force_websockets(). Within a
 * cycle the alternate path is tried at most once; after that a failure
 * demotes to polling unless push is pinned. There is no automatic retry
 * against the primary push URL.
 *
 * Called from the manager's strand only; stats() may be read anywhere.
 */
class FailoverController {
public:
    explicit FailoverController(const PushConfig& config);

    /**
     * @brief Starts a new connect cycle (alternate path becomes available again)
     */
    void begin_cycle();

    void pin_push();

    void clear_pin();

    bool pinned() const {
        return m_pinned;
    }

    bool alternate_available() const;

    bool on_alternate() const {
        return m_on_alternate;
    }

    /**
     * @brief Decides the reaction to a failure of the current push attempt
     */
    FailoverAction on_failure(const string& reason);

    /**
     * @brief URL for the next push attempt, with the client id appended
     */
    string push_url(const string& client_id) const;

    FailoverStats stats() const;

private:
    PushConfig m_config;
    bool m_pinned;
    bool m_alternate_used;
    bool m_on_alternate;

    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_demotions{0};
    std::atomic<uint64_t> m_alternate_attempts{0};
};

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_FAILOVER_CONTROLLER_HPP
