#include "SubscriptionRegistry.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {
namespace realtime {

SubscriptionEntryPtr SubscriptionRegistry::upsert(const SubscriptionId& id, SubscriptionBinding binding,
                                                  bool* replaced) {
    SubscriptionEntryPtr entry;
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry = std::make_shared<const SubscriptionEntry>(id, std::move(binding), m_next_generation++);
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            it->second = entry;
            existed = true;
        } else {
            m_entries.emplace(id, entry);
        }
    }
    if (replaced) *replaced = existed;

    LOG_DEBUG(existed ? "Subscription replaced: " : "Subscription added: ", id,
              " (generation ", entry->generation, ")");
    return entry;
}

bool SubscriptionRegistry::remove(const SubscriptionId& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(id) > 0;
}

SubscriptionEntryPtr SubscriptionRegistry::find(const SubscriptionId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() ? it->second : nullptr;
}

bool SubscriptionRegistry::is_current(const SubscriptionId& id, uint64_t generation) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() && it->second->generation == generation;
}

bool SubscriptionRegistry::contains(const SubscriptionId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(id) != m_entries.end();
}

size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

vector<SubscriptionId> SubscriptionRegistry::ids() const {
    vector<SubscriptionId> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.reserve(m_entries.size());
        for (const auto& kv : m_entries) {
            out.push_back(kv.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

SubscriptionRegistry::Snapshot SubscriptionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Snapshot out;
    out.reserve(m_entries.size());
    for (const auto& kv : m_entries) {
        out.push_back(kv.second);
    }
    return out;
}

SubscriptionRegistry::Snapshot SubscriptionRegistry::matching(const EventName& event) const {
    Snapshot out;
    if (event.empty()) return out;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& kv : m_entries) {
        if (kv.second->binding.event == event) {
            out.push_back(kv.second);
        }
    }
    return out;
}

void SubscriptionRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

} // namespace realtime
} // namespace lib
} // namespace REALTIME_CLIENTPP_NAMESPACE
