#pragma once
// ============================================================================
// ALGOSTREAM - Market Data Snapshot
// ============================================================================
// Immutable decoded form of the latest market_data message for one key
// ============================================================================

#include "algostream/core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace algostream::market {

/// Single order book level as published in data.depth.buy / data.depth.sell
struct DepthLevel {
    double price = 0.0;
    int64_t quantity = 0;
    int64_t orders = 0;
};

struct DepthBook {
    std::vector<DepthLevel> buy;
    std::vector<DepthLevel> sell;

    [[nodiscard]] size_t rows() const noexcept { return std::max(buy.size(), sell.size()); }
};

/// One member of the message's "data" object
struct FieldValue {
    std::string text;               // Unquoted for strings, minified JSON otherwise
    std::optional<double> number;   // Set for JSON numbers and numeric strings
};

struct MarketDataSnapshot {
    SubscriptionKey key;
    std::optional<std::string> topic;
    Timestamp received_at;

    std::optional<double> ltp;
    std::vector<std::pair<std::string, FieldValue>> fields;  // Document order
    std::optional<DepthBook> depth;

    std::string raw;  // Full inbound message text

    /// Linear lookup; data objects hold a few dozen members at most
    [[nodiscard]] const FieldValue* field(std::string_view name) const noexcept {
        for (const auto& [field_name, value] : fields) {
            if (field_name == name) return &value;
        }
        return nullptr;
    }
};

}  // namespace algostream::market
