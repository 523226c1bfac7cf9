#pragma once
// ============================================================================
// ALGOSTREAM - Wire Protocol
// ============================================================================
// Outbound request builders and inbound message decoding
//
// Outbound:  authenticate / subscribe / unsubscribe actions, "pong"
// Inbound:   "ping", authentication, subscription, market_data, error
// ============================================================================

#include "algostream/core/types.hpp"
#include "algostream/market/market_data.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace algostream::stream::protocol {

inline constexpr std::string_view PING = "ping";
inline constexpr std::string_view PONG = "pong";

// ============================================================================
// Outbound
// ============================================================================

[[nodiscard]] std::string make_authenticate(std::string_view api_key);

/// depth_level is emitted only for DataMode::Depth
[[nodiscard]] std::string make_subscribe(const SubscriptionKey& key,
                                         std::optional<int> depth_level = std::nullopt);

[[nodiscard]] std::string make_unsubscribe(const SubscriptionKey& key);

/// Escape a string for embedding inside a JSON string literal
[[nodiscard]] std::string json_escape(std::string_view text);

// ============================================================================
// Inbound
// ============================================================================

/// Trimmed, case-insensitive match against the heartbeat token
[[nodiscard]] bool is_heartbeat(std::string_view message) noexcept;

struct AuthenticationResult {
    bool success = false;
    std::string status;
    std::string message;
};

struct SubscriptionAck {
    std::optional<SubscriptionKey> key;  // Absent when the ack names no feed
    bool success = false;
    std::string status;
    std::string message;
};

struct MarketDataUpdate {
    std::shared_ptr<const market::MarketDataSnapshot> snapshot;
};

struct ServerError {
    std::string message;
};

struct UnknownMessage {
    std::string type;
};

using InboundMessage = std::variant<AuthenticationResult,
                                    SubscriptionAck,
                                    MarketDataUpdate,
                                    ServerError,
                                    UnknownMessage>;

/// Raised for unparseable JSON or a known message type missing required fields
class MalformedMessageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Parse a wire mode: JSON integer, numeric string or mode name ("LTP", "Quote", "Depth")
[[nodiscard]] std::optional<DataMode> parse_mode(std::string_view text) noexcept;

/// Decodes inbound JSON documents. Reuses its parser buffers, so one
/// instance must not be shared between threads.
class MessageParser {
public:
    MessageParser();
    ~MessageParser();

    MessageParser(const MessageParser&) = delete;
    MessageParser& operator=(const MessageParser&) = delete;

    /// Throws MalformedMessageError
    [[nodiscard]] InboundMessage parse(std::string_view message);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace algostream::stream::protocol
