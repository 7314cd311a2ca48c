#ifndef REALTIME_CLIENTPP_DISPATCH_ENGINE_HPP
#define REALTIME_CLIENTPP_DISPATCH_ENGINE_HPP

#include "../config.hpp"
#include "../EventSchema.hpp"
#include "../Message.hpp"
#include "../Payload.hpp"
#include "../RealtimeConfig.hpp"
#include "../transport/Transport.hpp"
#include "SubscriptionRegistry.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

/**
 * @brief Delivery counters
 */
struct DispatchStats {
    uint64_t fetches_issued = 0;
    uint64_t fetches_failed = 0;
    uint64_t ticks_skipped = 0;         ///< Tick fell while the previous fetch was outstanding
    uint64_t push_dispatched = 0;       ///< Push messages fanned out
    uint64_t deliveries = 0;            ///< Callback invocations
    uint64_t deliveries_dropped = 0;    ///< Stale result, schema rejection or callback exception
};

/**
 * @brief Moves data from the active transport into subscription callbacks
 *
 * Push mode fans a decoded message out to every entry bound to its event.
 * Polling mode keeps one timer per interval-bearing entry: the first fetch
 * fires immediately, then one every interval, with a tick skipped while
 * the previous fetch for that entry is still outstanding.
 *
 * Every method runs on the owner's strand.
 */
class DispatchEngine : public std::enable_shared_from_this<DispatchEngine> {
public:
    DispatchEngine(Strand strand,
                   std::shared_ptr<SubscriptionRegistry> registry,
                   std::shared_ptr<EventSchemaRegistry> schemas,
                   std::shared_ptr<transport::HttpFetcher> fetcher,
                   const PollingConfig& config);

    /**
     * @brief Starts polling one entry
     * @return false if the entry has no interval (inert in polling mode)
     */
    bool arm(const SubscriptionEntryPtr& entry);

    /**
     * @brief Stops polling one id; an in-flight fetch completes into the void
     */
    void disarm(const SubscriptionId& id);

    /**
     * @brief Arms every registry entry
     * @return Number of armed entries
     */
    size_t arm_all();

    /**
     * @brief Cancels every timer and outstanding fetch
     */
    void disarm_all();

    bool is_armed(const SubscriptionId& id) const;
    /// True when a timer is already running for this exact binding generation
    bool is_armed(const SubscriptionId& id, uint64_t generation) const;

    size_t armed_count() const;

    /**
     * @brief Fans a push message out to matching subscriptions
     * @return Number of callbacks invoked
     */
    size_t dispatch_push(const PushMessage& message);

    DispatchStats stats() const;

private:
    struct PollTimer {
        SubscriptionEntryPtr entry;
        std::unique_ptr<asio::steady_timer> timer;
        uint64_t token;
        bool in_flight;
    };

    void wait(const SubscriptionId& id, uint64_t token);
    void on_tick(const SubscriptionId& id, uint64_t token);
    void on_fetch_complete(const SubscriptionId& id, uint64_t token, uint64_t generation,
                           const transport::FetchResult& result);
    bool deliver(const SubscriptionEntryPtr& entry, const Payload& payload);

    Strand m_strand;
    std::shared_ptr<SubscriptionRegistry> m_registry;
    std::shared_ptr<EventSchemaRegistry> m_schemas;
    std::shared_ptr<transport::HttpFetcher> m_fetcher;
    PollingConfig m_config;

    std::unordered_map<SubscriptionId, PollTimer> m_timers;
    uint64_t m_next_token;

    std::atomic<uint64_t> m_fetches_issued{0};
    std::atomic<uint64_t> m_fetches_failed{0};
    std::atomic<uint64_t> m_ticks_skipped{0};
    std::atomic<uint64_t> m_push_dispatched{0};
    std::atomic<uint64_t> m_deliveries{0};
    std::atomic<uint64_t> m_deliveries_dropped{0};
};

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_DISPATCH_ENGINE_HPP
