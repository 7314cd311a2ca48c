#ifndef REALTIME_CLIENTPP_SUBSCRIPTION_HPP
#define REALTIME_CLIENTPP_SUBSCRIPTION_HPP

#include "../config.hpp"
#include "../Error.hpp"
#include "../Payload.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

using SubscriptionCallback = function<void(const Payload&)>;

/**
 * @brief Ordered query key segments; a single-string key is a one-element key
 */
typedef vector<string> QueryKey;

/**
 * @brief What a subscription watches and where its data goes
 *
 * event routes push messages, endpoint/query_key/interval_ms drive polling.
 * A binding without interval_ms never fires in polling mode.
 */
struct SubscriptionBinding {
    EventName event;
    string endpoint;
    QueryKey query_key;
    std::optional<int> interval_ms;
    SubscriptionCallback callback;

    SubscriptionBinding() = default;

    SubscriptionBinding(const EventName& ev,
                        const string& ep,
                        const QueryKey& key,
                        std::optional<int> interval,
                        SubscriptionCallback cb)
        : event(ev), endpoint(ep), query_key(key), interval_ms(interval), callback(std::move(cb)) {}

    bool polls() const {
        return interval_ms.has_value() && !endpoint.empty();
    }

    bool routes_push() const {
        return !event.empty();
    }

    /**
     * @brief Name payloads of this binding are keyed by (event, else endpoint)
     */
    const string& payload_name() const {
        return event.empty() ? endpoint : event;
    }

    /**
     * @brief Rejects bindings that can never be valid
     * @throws RealtimeException with INVALID_SUBSCRIPTION
     */
    void validate(const SubscriptionId& id) const {
        if (id.empty()) {
            throw RealtimeException("Subscription id cannot be empty", RealtimeErrorCode::INVALID_SUBSCRIPTION);
        }
        if (!callback) {
            throw RealtimeException("Subscription '" + id + "' has no callback",
                                    RealtimeErrorCode::INVALID_SUBSCRIPTION);
        }
        if (interval_ms && *interval_ms <= 0) {
            throw RealtimeException("Subscription '" + id + "' has a non-positive interval",
                                    RealtimeErrorCode::INVALID_SUBSCRIPTION);
        }
    }
};

/**
 * @brief Registry entry; immutable once stored
 */
struct SubscriptionEntry {
    SubscriptionId id;
    SubscriptionBinding binding;
    uint64_t generation;

    SubscriptionEntry(const SubscriptionId& sid, SubscriptionBinding b, uint64_t gen)
        : id(sid), binding(std::move(b)), generation(gen) {}
};

typedef std::shared_ptr<const SubscriptionEntry> SubscriptionEntryPtr;

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_SUBSCRIPTION_HPP
