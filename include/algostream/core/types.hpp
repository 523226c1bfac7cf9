#pragma once
// ============================================================================
// ALGOSTREAM - Core Types
// ============================================================================
// Fundamental type definitions for the streaming session
// Subscription identity, data modes and connection states
// ============================================================================

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace algostream {

// ============================================================================
// Time Types
// ============================================================================

/// Wall-clock receive time, nanosecond resolution
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Elapsed time between two Timestamps
using Duration = std::chrono::nanoseconds;

/// Current wall-clock time
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// ============================================================================
// Market Data Mode
// ============================================================================

/// Granularity of a market data feed (wire values 1..3)
enum class DataMode : uint8_t {
    LTP = 1,    // Last traded price
    Quote = 2,  // OHLC / volume quote
    Depth = 3   // Order book depth
};

/// Default order book depth requested when none is given
inline constexpr int DEFAULT_DEPTH_LEVEL = 5;

[[nodiscard]] constexpr int to_int(DataMode mode) noexcept {
    return static_cast<int>(mode);
}

/// Map a wire integer to a mode; nullopt outside 1..3
[[nodiscard]] constexpr std::optional<DataMode> mode_from_int(int64_t value) noexcept {
    switch (value) {
        case 1: return DataMode::LTP;
        case 2: return DataMode::Quote;
        case 3: return DataMode::Depth;
        default: return std::nullopt;
    }
}

[[nodiscard]] constexpr std::string_view to_string(DataMode mode) noexcept {
    switch (mode) {
        case DataMode::LTP: return "LTP";
        case DataMode::Quote: return "Quote";
        case DataMode::Depth: return "Depth";
    }
    return "Unknown";
}

// ============================================================================
// Connection State
// ============================================================================

enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Open = 2,
    Closing = 3
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open: return "Open";
        case ConnectionState::Closing: return "Closing";
    }
    return "Unknown";
}

/// Authentication confirmation policy
enum class AuthMode : uint8_t {
    Confirmed = 0,  // Wait for an explicit server acknowledgment
    Assumed = 1     // Short grace period, then assume success
};

[[nodiscard]] constexpr std::string_view to_string(AuthMode mode) noexcept {
    return mode == AuthMode::Confirmed ? "confirmed" : "assumed";
}

// ============================================================================
// Subscription Key
// ============================================================================

/// Identity of one live feed: (symbol, exchange, mode)
/// Equality is exact, case-sensitive, as received from the caller/server
class SubscriptionKey {
public:
    SubscriptionKey(std::string symbol, std::string exchange, DataMode mode)
        : symbol_(std::move(symbol)), exchange_(std::move(exchange)), mode_(mode) {}

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] const std::string& exchange() const noexcept { return exchange_; }
    [[nodiscard]] DataMode mode() const noexcept { return mode_; }

    /// Both symbol and exchange present
    [[nodiscard]] bool is_valid() const noexcept {
        return !symbol_.empty() && !exchange_.empty();
    }

    /// Canonical "SYMBOL|EXCHANGE|MODE" form, used as the cache index
    [[nodiscard]] std::string to_string() const {
        return symbol_ + '|' + exchange_ + '|' + std::to_string(to_int(mode_));
    }

    /// "SYMBOL (EXCHANGE) - Mode N" for status messages
    [[nodiscard]] std::string describe() const {
        return symbol_ + " (" + exchange_ + ") - Mode " + std::to_string(to_int(mode_));
    }

    bool operator==(const SubscriptionKey& other) const noexcept {
        return mode_ == other.mode_ && symbol_ == other.symbol_ && exchange_ == other.exchange_;
    }

    bool operator!=(const SubscriptionKey& other) const noexcept {
        return !(*this == other);
    }

private:
    std::string symbol_;
    std::string exchange_;
    DataMode mode_;
};

// ============================================================================
// Subscription Record
// ============================================================================

struct SubscriptionRecord {
    SubscriptionKey key;
    std::optional<int> depth_level;
    Timestamp subscribed_at;
};

}  // namespace algostream

// ============================================================================
// std::hash for SubscriptionKey
// ============================================================================
template <>
struct std::hash<algostream::SubscriptionKey> {
    size_t operator()(const algostream::SubscriptionKey& k) const noexcept {
        size_t h = std::hash<std::string_view>{}(k.symbol());
        h ^= std::hash<std::string_view>{}(k.exchange()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(k.mode()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
