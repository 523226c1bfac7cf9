// ============================================================================
// ALGOSTREAM - Auto-Subscribe Feed Implementation
// ============================================================================

#include "algostream/stream/auto_subscribe_feed.hpp"
#include "algostream/utils/logger.hpp"

namespace algostream::stream {

namespace {

Table single_cell(CellValue value) {
    Table table;
    table.push_back({std::move(value)});
    return table;
}

/// Sentinel for a read that produced no data
CellValue sentinel(const ReadResult& result) {
    return result.to_display_string();
}

}  // namespace

std::string ReadResult::to_display_string() const {
    switch (status) {
        case ReadStatus::Data:
            return snapshot ? snapshot->raw : std::string("Waiting for data...");
        case ReadStatus::Error:
            return "Error: " + message;
        default:
            return std::string(to_string(status));
    }
}

AutoSubscribeFeed::AutoSubscribeFeed(SubscriptionRegistry& registry, market::MarketDataCache& cache)
    : registry_(registry)
    , cache_(cache) {}

// ============================================================================
// Core Read
// ============================================================================

ReadResult AutoSubscribeFeed::read(const SubscriptionKey& key, std::optional<int> depth_level) {
    if (!key.is_valid()) {
        return {ReadStatus::Error, nullptr, "Symbol and Exchange are required"};
    }

    registry_.expire_stale_pending();

    if (registry_.was_manually_unsubscribed(key)) {
        return {ReadStatus::Unsubscribed, nullptr, {}};
    }

    if (!registry_.is_subscribed(key)) {
        if (registry_.is_pending(key)) {
            return {ReadStatus::Subscribing, nullptr, {}};
        }

        SubscribeRequest request = registry_.begin_subscribe(key, depth_level);
        if (!request.status.ok()) {
            // Another poller is mid-connect; the next poll retries
            if (request.status.code() == ErrorCode::ConnectInProgress) {
                return {ReadStatus::Subscribing, nullptr, {}};
            }
            LOG_WARN("[FEED] auto-subscribe {} failed: {}", key.to_string(), request.status.message());
            return {ReadStatus::Error, nullptr, request.status.message()};
        }

        LOG_DEBUG("[FEED] auto-subscribed {}", key.to_string());
        return {ReadStatus::Subscribing, nullptr, {}};
    }

    market::SnapshotPtr snapshot = cache_.get(key);
    if (!snapshot) {
        return {ReadStatus::WaitingForData, nullptr, {}};
    }
    return {ReadStatus::Data, std::move(snapshot), {}};
}

// ============================================================================
// Typed Readers
// ============================================================================

CellValue AutoSubscribeFeed::read_ltp(const std::string& symbol, const std::string& exchange) {
    ReadResult result = read(SubscriptionKey{symbol, exchange, DataMode::LTP});
    if (!result.has_data()) {
        return sentinel(result);
    }
    if (!result.snapshot->ltp) {
        return std::string("N/A");
    }
    return *result.snapshot->ltp;
}

CellValue AutoSubscribeFeed::read_field(const std::string& symbol,
                                        const std::string& exchange,
                                        const std::string& field,
                                        DataMode mode) {
    ReadResult result = read(SubscriptionKey{symbol, exchange, mode});
    if (!result.has_data()) {
        return sentinel(result);
    }

    const market::FieldValue* value = result.snapshot->field(field);
    if (!value) {
        return std::string("Field not found");
    }
    if (value->number) {
        return *value->number;
    }
    return value->text;
}

Table AutoSubscribeFeed::read_quote(const std::string& symbol, const std::string& exchange) {
    ReadResult result = read(SubscriptionKey{symbol, exchange, DataMode::Quote});
    if (!result.has_data()) {
        return single_cell(sentinel(result));
    }

    Table table;
    table.reserve(result.snapshot->fields.size() + 1);
    table.push_back({symbol + " (" + exchange + ")", std::string("Value")});
    for (const auto& [name, value] : result.snapshot->fields) {
        table.push_back({name, value.text.empty() ? std::string("N/A") : value.text});
    }
    return table;
}

Table AutoSubscribeFeed::read_depth(const std::string& symbol, const std::string& exchange, int depth_level) {
    ReadResult result = read(SubscriptionKey{symbol, exchange, DataMode::Depth}, depth_level);
    if (!result.has_data()) {
        return single_cell(sentinel(result));
    }

    const auto& snapshot = *result.snapshot;
    if (!snapshot.depth) {
        return single_cell(std::string("No depth data available"));
    }

    const market::DepthBook& book = *snapshot.depth;
    const std::string blank;

    Table table;
    table.reserve(book.rows() + 2);
    table.push_back({symbol + " (" + exchange + ")", blank, blank, std::string("LTP"),
                     snapshot.ltp.value_or(0.0), blank, blank});
    table.push_back({std::string("Bid Orders"), std::string("Bid Qty"), std::string("Bid Price"), blank,
                     std::string("Ask Price"), std::string("Ask Qty"), std::string("Ask Orders")});

    const market::DepthLevel empty;
    for (size_t i = 0; i < book.rows(); ++i) {
        const market::DepthLevel& bid = i < book.buy.size() ? book.buy[i] : empty;
        const market::DepthLevel& ask = i < book.sell.size() ? book.sell[i] : empty;
        table.push_back({static_cast<double>(bid.orders), static_cast<double>(bid.quantity), bid.price,
                         blank,
                         ask.price, static_cast<double>(ask.quantity), static_cast<double>(ask.orders)});
    }
    return table;
}

// ============================================================================
// Diagnostics
// ============================================================================

Table AutoSubscribeFeed::debug_info(const SubscriptionKey& key) const {
    const auto flag = [](bool value) { return std::string(value ? "true" : "false"); };

    Table table;
    table.push_back({std::string("Debug Information"), std::string("Value")});
    table.push_back({std::string("Symbol"), key.symbol()});
    table.push_back({std::string("Exchange"), key.exchange()});
    table.push_back({std::string("Mode"), static_cast<double>(to_int(key.mode()))});
    table.push_back({std::string("Expected Key"), key.to_string()});
    table.push_back({std::string("Is Subscribed"), flag(registry_.is_subscribed(key))});
    table.push_back({std::string("Is Pending"), flag(registry_.is_pending(key))});
    table.push_back({std::string("Manually Unsubscribed"), flag(registry_.was_manually_unsubscribed(key))});

    market::SnapshotPtr snapshot = cache_.get(key);
    table.push_back({std::string("Has Data"), flag(snapshot != nullptr)});
    if (snapshot) {
        table.push_back({std::string("Data Mode"), static_cast<double>(to_int(snapshot->key.mode()))});
        table.push_back({std::string("Data Topic"), snapshot->topic.value_or("N/A")});
        table.push_back({std::string("Received At (ms)"), static_cast<double>(to_epoch_ms(snapshot->received_at))});
    }

    table.push_back({std::string(), std::string()});
    table.push_back({std::string("Active Subscriptions:"), std::string()});
    for (auto& active : registry_.list_active()) {
        table.push_back({std::move(active), std::string()});
    }
    return table;
}

}  // namespace algostream::stream
