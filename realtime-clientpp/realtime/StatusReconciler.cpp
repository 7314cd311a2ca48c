#include "StatusReconciler.hpp"
#include "../Error.hpp"
#include "../Logger.hpp"

#include <chrono>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

StatusReconciler::StatusReconciler(Strand strand, int period_ms, StatusSource source)
    : m_timer(strand)
    , m_period_ms(period_ms)
    , m_source(std::move(source))
    , m_running(false)
    , m_generation(0)
    , m_publications(0) {
    if (m_period_ms <= 0) {
        throw RealtimeException("Status period must be positive", RealtimeErrorCode::INVALID_CONFIG);
    }
}

void StatusReconciler::start() {
    if (m_running) return;
    m_running = true;
    ++m_generation;
    schedule();
    LOG_DEBUG("Status reconciler started (period ", m_period_ms, "ms)");
}

void StatusReconciler::stop() {
    if (!m_running) return;
    m_running = false;
    ++m_generation;
    m_timer.cancel();
    LOG_DEBUG("Status reconciler stopped");
}

bool StatusReconciler::reconcile() {
    if (!m_source) return false;
    StatusReport current = m_source();
    {
        std::lock_guard<std::mutex> lock(m_last_mutex);
        if (m_last && *m_last == current) {
            return false;
        }
        m_last = current;
    }
    ++m_publications;

    LOG_INFO("Connection status: ", current.method, "/", current.status,
             current.push_disallowed ? " (push disallowed)" : "");
    try {
        m_signal(current);
    } catch (const std::exception& e) {
        LOG_ERROR("Status observer threw: ", e.what());
    }
    return true;
}

std::optional<StatusReport> StatusReconciler::last_published() const {
    std::lock_guard<std::mutex> lock(m_last_mutex);
    return m_last;
}

void StatusReconciler::schedule() {
    m_timer.expires_after(std::chrono::milliseconds(m_period_ms));
    std::weak_ptr<StatusReconciler> weak = shared_from_this();
    auto generation = m_generation;
    m_timer.async_wait([weak, generation](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self || generation != self->m_generation) {
            return;
        }
        self->reconcile();
        self->schedule();
    });
}

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE
