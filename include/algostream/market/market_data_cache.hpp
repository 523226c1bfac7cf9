#pragma once
// ============================================================================
// ALGOSTREAM - Market Data Cache
// ============================================================================
// Concurrent last-value store: single dispatcher writer, many pollers
//
// Snapshots are published as shared_ptr<const ...>; a reader copies the
// pointer under a shared lock, so a poller never sees a half-written payload.
// ============================================================================

#include "algostream/core/types.hpp"
#include "algostream/market/market_data.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace algostream::market {

using SnapshotPtr = std::shared_ptr<const MarketDataSnapshot>;

class MarketDataCache {
public:
    MarketDataCache() = default;

    MarketDataCache(const MarketDataCache&) = delete;
    MarketDataCache& operator=(const MarketDataCache&) = delete;

    /// Overwrite the entry for snapshot->key; also indexed under its topic
    void put(SnapshotPtr snapshot);

    [[nodiscard]] SnapshotPtr get(const SubscriptionKey& key) const;

    /// Lookup by server topic string
    [[nodiscard]] SnapshotPtr get_by_topic(const std::string& topic) const;

    /// Remove the entry and its topic alias. Returns true if anything was removed.
    bool remove(const SubscriptionKey& key);

    void clear();

    /// Number of primary entries (aliases excluded)
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SnapshotPtr> by_key_;
    std::unordered_map<std::string, SnapshotPtr> by_topic_;
    std::unordered_map<std::string, std::string> topic_of_;  // key string -> topic
};

}  // namespace algostream::market
