#pragma once
// ============================================================================
// ALGOSTREAM - Inbound Dispatcher
// ============================================================================
// Routes every inbound frame: heartbeat, authentication verdict,
// subscription ack, market data, server error
// Runs on the receive thread; never lets an exception escape
// ============================================================================

#include "algostream/core/types.hpp"
#include "algostream/market/market_data_cache.hpp"
#include "algostream/stream/connection.hpp"
#include "algostream/stream/protocol.hpp"
#include "algostream/stream/subscription_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string_view>

namespace algostream::stream {

struct DispatcherStats {
    uint64_t heartbeats = 0;
    uint64_t admitted = 0;    // Market data written to the cache
    uint64_t dropped = 0;     // Market data for keys with no record
    uint64_t malformed = 0;
    uint64_t auth_messages = 0;
    uint64_t acks = 0;
    uint64_t server_errors = 0;
    uint64_t unknown = 0;
};

class InboundDispatcher {
public:
    using DataCallback = std::function<void(const SubscriptionKey&)>;

    InboundDispatcher(Connection& connection,
                      SubscriptionRegistry& registry,
                      market::MarketDataCache& cache);

    InboundDispatcher(const InboundDispatcher&) = delete;
    InboundDispatcher& operator=(const InboundDispatcher&) = delete;

    /// Handle one inbound text frame
    void dispatch(std::string_view message) noexcept;

    /// Notified with the key after each admitted update (set before connect)
    void on_data(DataCallback callback) { on_data_ = std::move(callback); }

    [[nodiscard]] DispatcherStats stats() const noexcept;

private:
    void handle(protocol::AuthenticationResult& message);
    void handle(protocol::SubscriptionAck& message);
    void handle(protocol::MarketDataUpdate& message);
    void handle(protocol::ServerError& message);
    void handle(protocol::UnknownMessage& message);

    Connection& connection_;
    SubscriptionRegistry& registry_;
    market::MarketDataCache& cache_;
    protocol::MessageParser parser_;

    DataCallback on_data_;

    std::atomic<uint64_t> heartbeats_{0};
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> auth_messages_{0};
    std::atomic<uint64_t> acks_{0};
    std::atomic<uint64_t> server_errors_{0};
    std::atomic<uint64_t> unknown_{0};
};

}  // namespace algostream::stream
