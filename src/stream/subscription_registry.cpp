// ============================================================================
// ALGOSTREAM - Subscription Registry Implementation
// ============================================================================

#include "algostream/stream/subscription_registry.hpp"
#include "algostream/stream/protocol.hpp"
#include "algostream/utils/logger.hpp"

#include <algorithm>
#include <mutex>

namespace algostream::stream {

SubscriptionRegistry::SubscriptionRegistry(RegistryConfig config,
                                           Connection& connection,
                                           market::MarketDataCache& cache)
    : config_(std::move(config))
    , connection_(connection)
    , cache_(cache) {}

// ============================================================================
// Subscribe
// ============================================================================

Status SubscriptionRegistry::subscribe(const SubscriptionKey& key, std::optional<int> depth_level) {
    SubscribeRequest request = begin_subscribe(key, depth_level);
    if (!request.status.ok() || !request.pending) {
        return request.status;
    }

    const PendingOutcome outcome = request.pending->wait_for(config_.subscribe_timeout);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = pending_.find(key);
        if (it != pending_.end() && it->second.request == request.pending) {
            pending_.erase(it);
        }
    }

    switch (outcome) {
        case PendingOutcome::Confirmed:
            return Status::success("Subscribed: " + key.describe());
        case PendingOutcome::Rejected:
            return Status::error(ErrorCode::SubscriptionRejected,
                                 "Subscription failed: " + request.pending->detail());
        case PendingOutcome::TimedOut:
            LOG_WARN("[REG] no subscription ack for {} within {}ms",
                     key.to_string(), config_.subscribe_timeout.count());
            return Status::error(ErrorCode::SubscriptionTimeout,
                                 "Subscription timed out after " +
                                     std::to_string(config_.subscribe_timeout.count()) + "ms");
        case PendingOutcome::Cancelled:
            return Status::error(ErrorCode::Cancelled,
                                 "Subscription cancelled: " + request.pending->detail());
    }
    return Status::error(ErrorCode::Cancelled, "Subscription cancelled");
}

SubscribeRequest SubscriptionRegistry::begin_subscribe(const SubscriptionKey& key,
                                                       std::optional<int> depth_level) {
    if (!key.is_valid()) {
        return {Status::error(ErrorCode::InvalidArgument, "Symbol and exchange are required"), nullptr};
    }

    if (connection_.state() != ConnectionState::Open) {
        Status connected = connection_.connect();
        if (!connected.ok()) {
            return {connected, nullptr};
        }
    }
    if (!connection_.is_authenticated()) {
        return {Status::error(ErrorCode::NotAuthenticated, "Not authenticated"), nullptr};
    }

    const std::optional<int> depth = effective_depth(key, depth_level);

    std::shared_ptr<PendingRequest> pending;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        manually_unsubscribed_.erase(key);

        if (config_.confirmation == AuthMode::Confirmed) {
            auto it = pending_.find(key);
            if (it != pending_.end() && !it->second.request->is_resolved()) {
                // One request in flight per key
                return {Status::success("Subscription pending: " + key.describe()), it->second.request};
            }
            // Registered before the send so the ack cannot overtake it
            pending = std::make_shared<PendingRequest>(key.to_string());
            pending_.insert_or_assign(key, PendingSubscription{pending, depth});
        }
    }

    Status sent = connection_.send(protocol::make_subscribe(key, depth));
    if (!sent.ok()) {
        if (pending) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = pending_.find(key);
            if (it != pending_.end() && it->second.request == pending) {
                pending_.erase(it);
            }
            pending->cancel(sent.message());
        }
        LOG_WARN("[REG] subscribe {} not sent: {}", key.to_string(), sent.message());
        return {sent, nullptr};
    }

    LOG_DEBUG("[REG] subscribe sent for {}", key.to_string());

    if (pending) {
        return {Status::success("Subscription requested: " + key.describe()), pending};
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = records_.find(key);
        if (it != records_.end()) {
            it->second.depth_level = depth;
        } else {
            records_.emplace(key, SubscriptionRecord{key, depth, now()});
        }
    }
    LOG_INFO("[REG] subscribed {}", key.to_string());
    return {Status::success("Subscribed: " + key.describe()), nullptr};
}

// ============================================================================
// Unsubscribe
// ============================================================================

Status SubscriptionRegistry::unsubscribe(const SubscriptionKey& key) {
    if (!key.is_valid()) {
        return Status::error(ErrorCode::InvalidArgument, "Symbol and exchange are required");
    }

    std::shared_ptr<PendingRequest> pending;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        records_.erase(key);
        auto it = pending_.find(key);
        if (it != pending_.end()) {
            pending = std::move(it->second.request);
            pending_.erase(it);
        }
        cache_.remove(key);
        manually_unsubscribed_.insert_or_assign(key, now());
    }

    if (pending) {
        pending->cancel("superseded by unsubscribe");
    }

    // Local state is already gone; a failed send only means the server
    // keeps streaming a feed the gate now drops
    if (connection_.state() == ConnectionState::Open) {
        Status sent = connection_.send(protocol::make_unsubscribe(key));
        if (!sent.ok()) {
            LOG_WARN("[REG] unsubscribe {} not sent: {}", key.to_string(), sent.message());
        }
    }

    LOG_INFO("[REG] unsubscribed {}", key.to_string());
    return Status::success("Unsubscribed: " + key.describe());
}

Status SubscriptionRegistry::unsubscribe_all() {
    std::vector<SubscriptionKey> keys;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        keys.reserve(records_.size() + pending_.size());
        for (const auto& [key, record] : records_) {
            keys.push_back(key);
        }
        for (const auto& [key, entry] : pending_) {
            if (records_.find(key) == records_.end()) {
                keys.push_back(key);
            }
        }
    }

    for (const auto& key : keys) {
        Status status = unsubscribe(key);
        if (!status.ok()) {
            LOG_WARN("[REG] {}", status.message());
        }
    }

    // Full reset: markers and every cache entry, including strays
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        manually_unsubscribed_.clear();
        cache_.clear();
    }

    LOG_INFO("[REG] unsubscribe_all removed {} subscription(s)", keys.size());

    if (keys.empty()) {
        return Status::success("No active subscriptions");
    }
    return Status::success("Unsubscribed from " + std::to_string(keys.size()) + " subscription(s)");
}

// ============================================================================
// Maintenance
// ============================================================================

size_t SubscriptionRegistry::resubscribe_active() {
    std::vector<SubscriptionRecord> records;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        records.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            records.push_back(record);
        }
    }

    size_t sent_count = 0;
    for (const auto& record : records) {
        Status sent = connection_.send(protocol::make_subscribe(record.key, record.depth_level));
        if (!sent.ok()) {
            LOG_WARN("[REG] re-subscribe {} failed: {}", record.key.to_string(), sent.message());
            continue;
        }
        ++sent_count;
    }

    if (sent_count > 0) {
        LOG_INFO("[REG] re-subscribed {} active subscription(s)", sent_count);
    }
    return sent_count;
}

size_t SubscriptionRegistry::expire_stale_pending() {
    std::vector<std::shared_ptr<PendingRequest>> expired;
    const Timestamp at = now();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            const auto& request = it->second.request;
            if (request->is_resolved() || request->is_older_than(config_.subscribe_timeout, at)) {
                expired.push_back(request);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t count = 0;
    for (const auto& request : expired) {
        if (request->expire()) {
            LOG_WARN("[REG] subscription {} expired without ack", request->id());
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Queries
// ============================================================================

bool SubscriptionRegistry::is_subscribed(const SubscriptionKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.find(key) != records_.end();
}

bool SubscriptionRegistry::is_pending(const SubscriptionKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = pending_.find(key);
    return it != pending_.end() && !it->second.request->is_resolved();
}

bool SubscriptionRegistry::was_manually_unsubscribed(const SubscriptionKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return manually_unsubscribed_.find(key) != manually_unsubscribed_.end();
}

std::optional<SubscriptionRecord> SubscriptionRegistry::record(const SubscriptionKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> SubscriptionRegistry::list_active() const {
    std::vector<std::pair<Timestamp, std::string>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        entries.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            entries.emplace_back(record.subscribed_at, key.to_string());
        }
    }

    std::sort(entries.begin(), entries.end());

    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (auto& entry : entries) {
        keys.push_back(std::move(entry.second));
    }
    return keys;
}

size_t SubscriptionRegistry::active_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// Dispatcher Hooks
// ============================================================================

void SubscriptionRegistry::on_subscription_ack(const SubscriptionKey& key,
                                               bool success,
                                               const std::string& detail) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = pending_.find(key);
    if (it != pending_.end()) {
        PendingSubscription entry = std::move(it->second);
        pending_.erase(it);

        // The record appears only if the waiter has not already given up
        if (entry.request->resolve(success, detail) && success) {
            auto record = records_.find(key);
            if (record != records_.end()) {
                record->second.depth_level = entry.depth_level;
            } else {
                records_.emplace(key, SubscriptionRecord{key, entry.depth_level, now()});
            }
            LOG_INFO("[REG] subscription confirmed for {}", key.to_string());
        } else if (!success) {
            LOG_WARN("[REG] subscription rejected for {}: {}", key.to_string(), detail);
        }
        return;
    }

    if (success) {
        LOG_DEBUG("[REG] ack for {} with no request in flight", key.to_string());
        return;
    }

    // Rejection of a request we already recorded (assumed mode, re-subscribe)
    if (records_.erase(key) > 0) {
        cache_.remove(key);
        LOG_WARN("[REG] server rejected {}: {}; subscription removed", key.to_string(), detail);
    } else {
        LOG_DEBUG("[REG] rejection for unknown subscription {}: {}", key.to_string(), detail);
    }
}

bool SubscriptionRegistry::admit(const SubscriptionKey& key, const std::function<void()>& writer) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (records_.find(key) == records_.end()) {
        return false;
    }
    writer();
    return true;
}

std::optional<int> SubscriptionRegistry::effective_depth(const SubscriptionKey& key,
                                                         std::optional<int> depth_level) const noexcept {
    if (key.mode() != DataMode::Depth) {
        return std::nullopt;
    }
    return depth_level.value_or(config_.default_depth_level);
}

}  // namespace algostream::stream
