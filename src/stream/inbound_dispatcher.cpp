// ============================================================================
// ALGOSTREAM - Inbound Dispatcher Implementation
// ============================================================================

#include "algostream/stream/inbound_dispatcher.hpp"
#include "algostream/utils/logger.hpp"

#include <exception>
#include <variant>

namespace algostream::stream {

InboundDispatcher::InboundDispatcher(Connection& connection,
                                     SubscriptionRegistry& registry,
                                     market::MarketDataCache& cache)
    : connection_(connection)
    , registry_(registry)
    , cache_(cache) {}

void InboundDispatcher::dispatch(std::string_view message) noexcept {
    try {
        if (protocol::is_heartbeat(message)) {
            Status sent = connection_.send_pong();
            if (!sent.ok()) {
                LOG_WARN("[DISPATCH] pong not sent: {}", sent.message());
            }
            connection_.record_heartbeat();
            heartbeats_.fetch_add(1, std::memory_order_relaxed);
            LOG_TRACE("[DISPATCH] heartbeat answered");
            return;
        }

        protocol::InboundMessage parsed = parser_.parse(message);
        std::visit([this](auto& decoded) { handle(decoded); }, parsed);

    } catch (const protocol::MalformedMessageError& e) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("[DISPATCH] malformed message dropped: {}", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[DISPATCH] failed to handle message: {}", e.what());
    }
}

void InboundDispatcher::handle(protocol::AuthenticationResult& message) {
    auth_messages_.fetch_add(1, std::memory_order_relaxed);
    const std::string& detail = message.message.empty() ? message.status : message.message;
    connection_.resolve_authentication(message.success, detail);
}

void InboundDispatcher::handle(protocol::SubscriptionAck& message) {
    acks_.fetch_add(1, std::memory_order_relaxed);
    if (!message.key) {
        LOG_DEBUG("[DISPATCH] subscription ack without feed identity ({}): {}",
                  message.status, message.message);
        return;
    }
    const std::string& detail = message.message.empty() ? message.status : message.message;
    registry_.on_subscription_ack(*message.key, message.success, detail);
}

void InboundDispatcher::handle(protocol::MarketDataUpdate& message) {
    const SubscriptionKey& key = message.snapshot->key;

    // Checked and written under the registry lock
    const bool admitted = registry_.admit(key, [&]() { cache_.put(message.snapshot); });

    if (!admitted) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("[DISPATCH] market data for {} without subscription dropped", key.to_string());
        return;
    }

    admitted_.fetch_add(1, std::memory_order_relaxed);
    if (on_data_) {
        on_data_(key);
    }
}

void InboundDispatcher::handle(protocol::ServerError& message) {
    server_errors_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN("[DISPATCH] server error: {}", message.message);
}

void InboundDispatcher::handle(protocol::UnknownMessage& message) {
    unknown_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("[DISPATCH] ignoring message of type '{}'", message.type);
}

DispatcherStats InboundDispatcher::stats() const noexcept {
    DispatcherStats stats;
    stats.heartbeats = heartbeats_.load(std::memory_order_relaxed);
    stats.admitted = admitted_.load(std::memory_order_relaxed);
    stats.dropped = dropped_.load(std::memory_order_relaxed);
    stats.malformed = malformed_.load(std::memory_order_relaxed);
    stats.auth_messages = auth_messages_.load(std::memory_order_relaxed);
    stats.acks = acks_.load(std::memory_order_relaxed);
    stats.server_errors = server_errors_.load(std::memory_order_relaxed);
    stats.unknown = unknown_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace algostream::stream
