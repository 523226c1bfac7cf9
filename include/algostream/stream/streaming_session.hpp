#pragma once
// ============================================================================
// ALGOSTREAM - Streaming Session
// ============================================================================
// One long-lived object owning the connection, registry, cache, dispatcher
// and feed. The host constructs it once and passes it by reference.
//
//   [I/O thread] --frame--> InboundDispatcher --> Registry / Cache
//   [pollers]    --read-->  AutoSubscribeFeed --> Registry / Cache / Connection
// ============================================================================

#include "algostream/config/session_config.hpp"
#include "algostream/market/market_data_cache.hpp"
#include "algostream/network/websocket_client.hpp"
#include "algostream/stream/auto_subscribe_feed.hpp"
#include "algostream/stream/connection.hpp"
#include "algostream/stream/inbound_dispatcher.hpp"
#include "algostream/stream/subscription_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace algostream::stream {

class StreamingSession {
public:
    using DataCallback = InboundDispatcher::DataCallback;

    /// Production session over a Boost.Beast WebSocket client
    explicit StreamingSession(config::SessionConfig config);

    /// Session over a caller-supplied transport
    StreamingSession(config::SessionConfig config, std::unique_ptr<network::IWebSocketClient> transport);

    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Connect to the configured URL
    [[nodiscard]] Status open();

    /// Close the socket. Subscriptions and cached data are kept.
    void close();

    // ========================================================================
    // Host Interface (display strings)
    // ========================================================================

    /// "Connected and authenticated", "Already connected" or "Error: ..."
    [[nodiscard]] std::string connect(const std::string& url = {});

    [[nodiscard]] std::string connection_state() const;

    [[nodiscard]] std::string subscribe(const std::string& symbol,
                                        const std::string& exchange,
                                        int64_t mode,
                                        std::optional<int> depth_level = std::nullopt);

    [[nodiscard]] std::string unsubscribe(const std::string& symbol, const std::string& exchange, int64_t mode);

    /// "Unsubscribed from N subscription(s)" or "No active subscriptions"
    [[nodiscard]] std::string unsubscribe_all();

    [[nodiscard]] ReadResult read(const std::string& symbol, const std::string& exchange, int64_t mode);

    [[nodiscard]] std::vector<std::string> list_active_subscriptions() const;

    /// Notified with the key after every admitted update (set before open)
    void on_data(DataCallback callback);

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] Connection& connection() noexcept { return *connection_; }
    [[nodiscard]] SubscriptionRegistry& registry() noexcept { return *registry_; }
    [[nodiscard]] market::MarketDataCache& cache() noexcept { return cache_; }
    [[nodiscard]] InboundDispatcher& dispatcher() noexcept { return *dispatcher_; }
    [[nodiscard]] AutoSubscribeFeed& feed() noexcept { return *feed_; }
    [[nodiscard]] const config::SessionConfig& config() const noexcept { return config_; }

private:
    /// Validate host arguments; error status on empty symbol/exchange or bad mode
    [[nodiscard]] static Status make_key(const std::string& symbol,
                                         const std::string& exchange,
                                         int64_t mode,
                                         std::optional<SubscriptionKey>& key);

    config::SessionConfig config_;

    market::MarketDataCache cache_;
    std::unique_ptr<Connection> connection_;
    std::unique_ptr<SubscriptionRegistry> registry_;
    std::unique_ptr<InboundDispatcher> dispatcher_;
    std::unique_ptr<AutoSubscribeFeed> feed_;
};

}  // namespace algostream::stream
