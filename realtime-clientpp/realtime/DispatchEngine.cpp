#include "DispatchEngine.hpp"
#include "../Logger.hpp"
#include "../transport/PollingTransport.hpp"

#include <chrono>
#include <memory>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

DispatchEngine::DispatchEngine(Strand strand,
                               std::shared_ptr<SubscriptionRegistry> registry,
                               std::shared_ptr<EventSchemaRegistry> schemas,
                               std::shared_ptr<transport::HttpFetcher> fetcher,
                               const PollingConfig& config)
    : m_strand(strand)
    , m_registry(std::move(registry))
    , m_schemas(std::move(schemas))
    , m_fetcher(std::move(fetcher))
    , m_config(config)
    , m_next_token(1) {
    if (!m_registry || !m_schemas || !m_fetcher) {
        throw RealtimeException("DispatchEngine requires a registry, a schema registry and a fetcher",
                                RealtimeErrorCode::INVALID_STATE);
    }
}

bool DispatchEngine::arm(const SubscriptionEntryPtr& entry) {
    if (!entry) return false;
    disarm(entry->id);

    if (!entry->binding.polls()) {
        LOG_DEBUG("Subscription ", entry->id, " has no polling interval, inert while polling");
        return false;
    }

    PollTimer poll;
    poll.entry = entry;
    poll.timer = std::make_unique<asio::steady_timer>(m_strand);
    poll.token = m_next_token++;
    poll.in_flight = false;

    // First fetch does not wait a full interval
    poll.timer->expires_after(std::chrono::milliseconds(0));
    auto token = poll.token;
    m_timers.emplace(entry->id, std::move(poll));
    wait(entry->id, token);

    LOG_DEBUG("Polling armed for ", entry->id, " every ", *entry->binding.interval_ms, "ms on ",
              entry->binding.endpoint);
    return true;
}

void DispatchEngine::disarm(const SubscriptionId& id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) return;
    it->second.timer->cancel();
    m_timers.erase(it);
    LOG_TRACE("Polling disarmed for ", id);
}

size_t DispatchEngine::arm_all() {
    size_t armed = 0;
    for (const auto& entry : m_registry->snapshot()) {
        if (arm(entry)) ++armed;
    }
    LOG_DEBUG("Polling armed for ", armed, " of ", m_registry->size(), " subscriptions");
    return armed;
}

void DispatchEngine::disarm_all() {
    for (auto& kv : m_timers) {
        kv.second.timer->cancel();
    }
    m_timers.clear();
    m_fetcher->cancel_all();
}

bool DispatchEngine::is_armed(const SubscriptionId& id) const {
    return m_timers.find(id) != m_timers.end();
}

bool DispatchEngine::is_armed(const SubscriptionId& id, uint64_t generation) const {
    auto it = m_timers.find(id);
    return it != m_timers.end() && it->second.entry->generation == generation;
}

size_t DispatchEngine::armed_count() const {
    return m_timers.size();
}

size_t DispatchEngine::dispatch_push(const PushMessage& message) {
    ++m_push_dispatched;

    auto matches = m_registry->matching(message.event);
    if (matches.empty()) {
        LOG_TRACE("No subscription for event: ", message.event);
        return 0;
    }

    Payload payload = Payload::from_message(message);
    string reason;
    if (!m_schemas->validate(payload, &reason)) {
        m_deliveries_dropped += matches.size();
        LOG_WARN("Dropping '", message.event, "' payload: ", reason);
        return 0;
    }

    size_t delivered = 0;
    for (const auto& entry : matches) {
        if (deliver(entry, payload)) ++delivered;
    }
    LOG_TRACE("Event '", message.event, "' delivered to ", delivered, " subscriptions");
    return delivered;
}

DispatchStats DispatchEngine::stats() const {
    DispatchStats s;
    s.fetches_issued = m_fetches_issued;
    s.fetches_failed = m_fetches_failed;
    s.ticks_skipped = m_ticks_skipped;
    s.push_dispatched = m_push_dispatched;
    s.deliveries = m_deliveries;
    s.deliveries_dropped = m_deliveries_dropped;
    return s;
}

void DispatchEngine::wait(const SubscriptionId& id, uint64_t token) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) return;

    std::weak_ptr<DispatchEngine> weak = shared_from_this();
    it->second.timer->async_wait([weak, id, token](const boost::system::error_code& ec) {
        if (ec) return; // cancelled
        if (auto self = weak.lock()) {
            self->on_tick(id, token);
        }
    });
}

void DispatchEngine::on_tick(const SubscriptionId& id, uint64_t token) {
    auto it = m_timers.find(id);
    if (it == m_timers.end() || it->second.token != token) return;

    PollTimer& poll = it->second;
    auto entry = poll.entry;
    if (!m_registry->is_current(id, entry->generation)) {
        LOG_TRACE("Polling timer for ", id, " outlived its binding");
        poll.timer->cancel();
        m_timers.erase(it);
        return;
    }

    // Fixed rate: the next tick is measured from this tick's deadline
    poll.timer->expires_at(poll.timer->expiry() + std::chrono::milliseconds(*entry->binding.interval_ms));
    wait(id, token);

    if (poll.in_flight) {
        ++m_ticks_skipped;
        LOG_DEBUG("Skipping tick for ", id, ": previous fetch still outstanding");
        return;
    }

    transport::FetchRequest request;
    try {
        request = transport::make_fetch_request(m_config, entry->binding.endpoint, entry->binding.query_key);
    } catch (const RealtimeException& e) {
        ++m_fetches_failed;
        LOG_ERROR("Cannot build request for ", id, ": ", e.what());
        return;
    }

    poll.in_flight = true;
    ++m_fetches_issued;
    LOG_TRACE("Fetching ", request.url.target, " for ", id);

    std::weak_ptr<DispatchEngine> weak = shared_from_this();
    auto strand = m_strand;
    auto generation = entry->generation;
    m_fetcher->async_get(request, [weak, strand, id, token, generation](const transport::FetchResult& result) {
        asio::post(strand, [weak, id, token, generation, result] {
            if (auto self = weak.lock()) {
                self->on_fetch_complete(id, token, generation, result);
            }
        });
    });
}

void DispatchEngine::on_fetch_complete(const SubscriptionId& id, uint64_t token, uint64_t generation,
                                       const transport::FetchResult& result) {
    auto it = m_timers.find(id);
    bool armed = it != m_timers.end() && it->second.token == token;
    if (armed) it->second.in_flight = false;

    if (!armed || !m_registry->is_current(id, generation)) {
        ++m_deliveries_dropped;
        LOG_DEBUG("Discarding fetch result for ", id, ": subscription removed, replaced or disarmed");
        return;
    }

    auto entry = it->second.entry;
    if (!result.ok()) {
        ++m_fetches_failed;
        LOG_WARN("Fetch failed for ", id, " (", entry->binding.endpoint, "): ", result.describe());
        return;
    }

    Payload payload = Payload::from_body(entry->binding.payload_name(), result.body);
    string reason;
    if (!m_schemas->validate(payload, &reason)) {
        ++m_deliveries_dropped;
        LOG_WARN("Dropping polled payload for ", id, ": ", reason);
        return;
    }
    deliver(entry, payload);
}

bool DispatchEngine::deliver(const SubscriptionEntryPtr& entry, const Payload& payload) {
    try {
        entry->binding.callback(payload);
        ++m_deliveries;
        return true;
    } catch (const std::exception& e) {
        ++m_deliveries_dropped;
        LOG_ERROR("Subscription ", entry->id, " callback threw: ", e.what());
        return false;
    }
}

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE
