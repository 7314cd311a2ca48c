#include "FailoverController.hpp"
#include "../Constants.hpp"
#include "../Logger.hpp"

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

FailoverController::FailoverController(const PushConfig& config)
    : m_config(config)
    , m_pinned(false)
    , m_alternate_used(false)
    , m_on_alternate(false) {}

void FailoverController::begin_cycle() {
    m_alternate_used = false;
    m_on_alternate = false;
}

void FailoverController::pin_push() {
    if (!m_pinned) LOG_DEBUG("Push pinned, failures will not demote to polling");
    m_pinned = true;
}

void FailoverController::clear_pin() {
    if (m_pinned) LOG_DEBUG("Push pin cleared");
    m_pinned = false;
}

bool FailoverController::alternate_available() const {
    return !m_config.alternate_path.empty() && !m_alternate_used;
}

FailoverAction FailoverController::on_failure(const string& reason) {
    ++m_failures;

    FailoverAction action;
    if (alternate_available()) {
        m_alternate_used = true;
        m_on_alternate = true;
        ++m_alternate_attempts;
        action = FailoverAction::RETRY_ALTERNATE;
    } else if (m_pinned) {
        action = FailoverAction::STAY;
    } else {
        m_on_alternate = false;
        ++m_demotions;
        action = FailoverAction::DEMOTE;
    }

    LOG_INFO("Push failure (", reason, "): ", to_string(action));
    return action;
}

string FailoverController::push_url(const string& client_id) const {
    Url url = Url::parse(m_config.url);
    if (m_on_alternate) {
        auto pos_q = url.target.find('?');
        string query = (pos_q == string::npos) ? string() : url.target.substr(pos_q);
        url.target = m_config.alternate_path + query;
    }
    if (!client_id.empty()) {
        url.append_query(params::CLIENT_ID, client_id);
    }
    return url.to_string();
}

FailoverStats FailoverController::stats() const {
    FailoverStats s;
    s.failures = m_failures;
    s.demotions = m_demotions;
    s.alternate_attempts = m_alternate_attempts;
    return s;
}

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE
