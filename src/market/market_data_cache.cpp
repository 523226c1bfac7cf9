// ============================================================================
// ALGOSTREAM - Market Data Cache Implementation
// ============================================================================

#include "algostream/market/market_data_cache.hpp"

#include <mutex>

namespace algostream::market {

void MarketDataCache::put(SnapshotPtr snapshot) {
    if (!snapshot) return;

    std::string key = snapshot->key.to_string();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto previous_topic = topic_of_.find(key);
    if (previous_topic != topic_of_.end() &&
        (!snapshot->topic || *snapshot->topic != previous_topic->second)) {
        by_topic_.erase(previous_topic->second);
        topic_of_.erase(previous_topic);
    }

    if (snapshot->topic) {
        by_topic_[*snapshot->topic] = snapshot;
        topic_of_[key] = *snapshot->topic;
    }
    by_key_[key] = std::move(snapshot);
}

SnapshotPtr MarketDataCache::get(const SubscriptionKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_key_.find(key.to_string());
    return it != by_key_.end() ? it->second : nullptr;
}

SnapshotPtr MarketDataCache::get_by_topic(const std::string& topic) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_topic_.find(topic);
    return it != by_topic_.end() ? it->second : nullptr;
}

bool MarketDataCache::remove(const SubscriptionKey& key) {
    std::string key_str = key.to_string();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool removed = by_key_.erase(key_str) > 0;

    auto topic = topic_of_.find(key_str);
    if (topic != topic_of_.end()) {
        // The alias may since have been taken over by another key
        auto alias = by_topic_.find(topic->second);
        if (alias != by_topic_.end() && alias->second->key.to_string() == key_str) {
            by_topic_.erase(alias);
            removed = true;
        }
        topic_of_.erase(topic);
    }
    return removed;
}

void MarketDataCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_key_.clear();
    by_topic_.clear();
    topic_of_.clear();
}

size_t MarketDataCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_key_.size();
}

}  // namespace algostream::market
