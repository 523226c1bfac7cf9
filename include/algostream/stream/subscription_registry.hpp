#pragma once
// ============================================================================
// ALGOSTREAM - Subscription Registry
// ============================================================================
// Authoritative record of live subscriptions, in-flight subscribe requests
// and keys the caller explicitly unsubscribed (auto-subscribe suppressed)
//
// Lock order: registry mutex, then cache mutex. The cache never calls back.
// ============================================================================

#include "algostream/core/error.hpp"
#include "algostream/core/pending_request.hpp"
#include "algostream/core/types.hpp"
#include "algostream/market/market_data_cache.hpp"
#include "algostream/stream/connection.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace algostream::stream {

struct RegistryConfig {
    /// Confirmed: record on positive ack. Assumed: record right after send.
    AuthMode confirmation = AuthMode::Confirmed;
    std::chrono::milliseconds subscribe_timeout{30000};
    int default_depth_level = DEFAULT_DEPTH_LEVEL;
};

/// Result of the send half of a subscribe
struct SubscribeRequest {
    Status status;
    std::shared_ptr<PendingRequest> pending;  // Null in assumed mode or on failure
};

class SubscriptionRegistry {
public:
    SubscriptionRegistry(RegistryConfig config, Connection& connection, market::MarketDataCache& cache);

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    // ========================================================================
    // Commands
    // ========================================================================

    /// Subscribe and, in confirmed mode, wait for the server ack
    [[nodiscard]] Status subscribe(const SubscriptionKey& key, std::optional<int> depth_level = std::nullopt);

    /// Send the subscribe request without waiting for confirmation
    [[nodiscard]] SubscribeRequest begin_subscribe(const SubscriptionKey& key,
                                                   std::optional<int> depth_level = std::nullopt);

    /// Drop the subscription locally (no ack wait) and mark it manually unsubscribed
    [[nodiscard]] Status unsubscribe(const SubscriptionKey& key);

    /// Unsubscribe everything, then clear all markers and the whole cache
    [[nodiscard]] Status unsubscribe_all();

    /// Re-send subscribe requests for every record (after re-authentication)
    size_t resubscribe_active();

    /// Time out un-awaited pending acks older than subscribe_timeout
    size_t expire_stale_pending();

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] bool is_subscribed(const SubscriptionKey& key) const;
    [[nodiscard]] bool is_pending(const SubscriptionKey& key) const;
    [[nodiscard]] bool was_manually_unsubscribed(const SubscriptionKey& key) const;
    [[nodiscard]] std::optional<SubscriptionRecord> record(const SubscriptionKey& key) const;

    /// Canonical key strings ordered by subscription time, then key
    [[nodiscard]] std::vector<std::string> list_active() const;

    [[nodiscard]] size_t active_count() const;

    // ========================================================================
    // Dispatcher Hooks
    // ========================================================================

    /// Server ack for a subscribe request
    void on_subscription_ack(const SubscriptionKey& key, bool success, const std::string& detail);

    /// Run writer only while a record for key exists, holding the registry
    /// lock so a concurrent unsubscribe cannot interleave. Returns whether
    /// the writer ran.
    bool admit(const SubscriptionKey& key, const std::function<void()>& writer) const;

private:
    struct PendingSubscription {
        std::shared_ptr<PendingRequest> request;
        std::optional<int> depth_level;
    };

    [[nodiscard]] std::optional<int> effective_depth(const SubscriptionKey& key,
                                                     std::optional<int> depth_level) const noexcept;

    RegistryConfig config_;
    Connection& connection_;
    market::MarketDataCache& cache_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<SubscriptionKey, SubscriptionRecord> records_;
    std::unordered_map<SubscriptionKey, PendingSubscription> pending_;
    std::unordered_map<SubscriptionKey, Timestamp> manually_unsubscribed_;
};

}  // namespace algostream::stream
