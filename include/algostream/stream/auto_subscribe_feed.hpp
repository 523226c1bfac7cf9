#pragma once
// ============================================================================
// ALGOSTREAM - Auto-Subscribe Feed
// ============================================================================
// Read-side API for pollers (spreadsheet cells). A read of an unknown key
// subscribes it and returns a "pending" sentinel; later reads hit the cache.
// ============================================================================

#include "algostream/core/types.hpp"
#include "algostream/market/market_data_cache.hpp"
#include "algostream/stream/subscription_registry.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace algostream::stream {

enum class ReadStatus : uint8_t {
    Data = 0,
    Unsubscribed = 1,    // Explicitly unsubscribed; no auto-subscribe
    Subscribing = 2,     // Request sent, ack or record pending
    WaitingForData = 3,  // Subscribed, nothing cached yet
    Error = 4
};

[[nodiscard]] constexpr std::string_view to_string(ReadStatus status) noexcept {
    switch (status) {
        case ReadStatus::Data: return "Data";
        case ReadStatus::Unsubscribed: return "Unsubscribed";
        case ReadStatus::Subscribing: return "Subscribing...";
        case ReadStatus::WaitingForData: return "Waiting for data...";
        case ReadStatus::Error: return "Error";
    }
    return "Unknown";
}

struct ReadResult {
    ReadStatus status = ReadStatus::WaitingForData;
    market::SnapshotPtr snapshot;  // Set only for Data
    std::string message;           // Error detail

    [[nodiscard]] bool has_data() const noexcept { return status == ReadStatus::Data && snapshot; }

    /// Sentinel text, "Error: <message>", or the raw payload for Data
    [[nodiscard]] std::string to_display_string() const;
};

/// Number or text, as a worksheet cell would hold it
using CellValue = std::variant<double, std::string>;
using Table = std::vector<std::vector<CellValue>>;

class AutoSubscribeFeed {
public:
    AutoSubscribeFeed(SubscriptionRegistry& registry, market::MarketDataCache& cache);

    AutoSubscribeFeed(const AutoSubscribeFeed&) = delete;
    AutoSubscribeFeed& operator=(const AutoSubscribeFeed&) = delete;

    /// Core auto-subscribe read. depth_level applies to Depth mode only.
    [[nodiscard]] ReadResult read(const SubscriptionKey& key, std::optional<int> depth_level = std::nullopt);

    /// LTP mode: last traded price, or a sentinel / "N/A"
    [[nodiscard]] CellValue read_ltp(const std::string& symbol, const std::string& exchange);

    /// Single field of the data object; numeric when it parses as a number
    [[nodiscard]] CellValue read_field(const std::string& symbol,
                                       const std::string& exchange,
                                       const std::string& field,
                                       DataMode mode = DataMode::Quote);

    /// Quote mode: header row, then one (name, value) row per data field
    [[nodiscard]] Table read_quote(const std::string& symbol, const std::string& exchange);

    /// Depth mode ladder:
    ///   row 0: "SYM (EXCH)", "", "", "LTP", ltp, "", ""
    ///   row 1: Bid Orders | Bid Qty | Bid Price | "" | Ask Price | Ask Qty | Ask Orders
    ///   rows 2..: one per level, zero-filled where one side is shorter
    [[nodiscard]] Table read_depth(const std::string& symbol,
                                   const std::string& exchange,
                                   int depth_level = DEFAULT_DEPTH_LEVEL);

    /// Label/value rows describing registry and cache state for a key
    [[nodiscard]] Table debug_info(const SubscriptionKey& key) const;

private:
    SubscriptionRegistry& registry_;
    market::MarketDataCache& cache_;
};

}  // namespace algostream::stream
