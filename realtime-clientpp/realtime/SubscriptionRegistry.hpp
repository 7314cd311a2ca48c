#ifndef REALTIME_CLIENTPP_SUBSCRIPTION_REGISTRY_HPP
#define REALTIME_CLIENTPP_SUBSCRIPTION_REGISTRY_HPP

#include "../config.hpp"
#include "Subscription.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

/**
 * @brief id -> binding map shared by the manager and the dispatch engine
 *
 * Writes are serialized by one mutex. Readers take snapshots of immutable
 * entries, so a dispatch pass never observes a half-applied change.
 */
class SubscriptionRegistry {
public:
    typedef vector<SubscriptionEntryPtr> Snapshot;

    SubscriptionRegistry() : m_next_generation(1) {}

    /**
     * @brief Inserts or replaces the binding for id
     * @param replaced Set to true if an older binding was replaced
     * @return The stored entry
     */
    SubscriptionEntryPtr upsert(const SubscriptionId& id, SubscriptionBinding binding, bool* replaced = nullptr);

    /**
     * @brief Removes the binding for id
     * @return false if id was unknown
     */
    bool remove(const SubscriptionId& id);

    SubscriptionEntryPtr find(const SubscriptionId& id) const;

    /**
     * @brief Checks that id is still bound to the given generation
     */
    bool is_current(const SubscriptionId& id, uint64_t generation) const;

    bool contains(const SubscriptionId& id) const;

    size_t size() const;

    vector<SubscriptionId> ids() const;

    Snapshot snapshot() const;

    /**
     * @brief Entries routed by the given event name
     */
    Snapshot matching(const EventName& event) const;

    void clear();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<SubscriptionId, SubscriptionEntryPtr> m_entries;
    uint64_t m_next_generation;
};

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE

#endif // REALTIME_CLIENTPP_SUBSCRIPTION_REGISTRY_HPP
