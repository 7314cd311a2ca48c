#ifndef REALTIME_CLIENTPP_STATUS_RECONCILER_HPP
#define REALTIME_CLIENTPP_STATUS_RECONCILER_HPP

#include "../config.hpp"
#include "../engine/ConnectionState.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/signals2.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

/**
 * @brief Connectivity as shown to observers
 */
struct StatusReport {
    engine::ConnectionMethod method = engine::ConnectionMethod::PUSH;
    engine::ConnectionStatus status = engine::ConnectionStatus::DISCONNECTED;
    bool push_disallowed = false;

    bool operator==(const StatusReport& other) const {
        return method == other.method && status == other.status && push_disallowed == other.push_disallowed;
    }

    bool operator!=(const StatusReport& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Republishes the manager's live status, only when it changed
 *
 * Runs a fixed-period timer on the owner's strand. The owner also calls
 * reconcile() directly after each transition it performs.
 */
class StatusReconciler : public std::enable_shared_from_this<StatusReconciler> {
public:
    typedef signal<void(const StatusReport&)> StatusSignal;
    typedef function<StatusReport()> StatusSource;

    StatusReconciler(Strand strand, int period_ms, StatusSource source);

    /**
     * @brief Attaches an observer
     */
    boost::signals2::connection connect(const StatusSignal::slot_type& slot) {
        return m_signal.connect(slot);
    }

    /**
     * @brief Starts the periodic check (no-op if running)
     */
    void start();

    void stop();

    bool running() const {
        return m_running;
    }

    /**
     * @brief Re-reads the source and publishes if the report changed
     * @return true if observers were notified
     */
    bool reconcile();

    std::optional<StatusReport> last_published() const;

    size_t publications() const {
        return m_publications;
    }

    int period_ms() const {
        return m_period_ms;
    }

private:
    void schedule();

    asio::steady_timer m_timer;
    int m_period_ms;
    StatusSource m_source;
    StatusSignal m_signal;

    std::atomic<bool> m_running;
    uint64_t m_generation;
    std::atomic<size_t> m_publications;

    mutable std::mutex m_last_mutex;
    std::optional<StatusReport> m_last;
};

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_STATUS_RECONCILER_HPP
