// ============================================================================
// ALGOSTREAM - Streaming Session Implementation
// ============================================================================

#include "algostream/stream/streaming_session.hpp"
#include "algostream/utils/logger.hpp"

namespace algostream::stream {

namespace {

ConnectionConfig connection_config(const config::SessionConfig& config) {
    ConnectionConfig out;
    out.url = config.url;
    out.api_key = config.api_key;
    out.auth_mode = config.auth_mode;
    out.auth_timeout = config.auth_timeout;
    out.assumed_auth_grace = config.assumed_auth_grace;
    out.connect_timeout = config.connect_timeout;
    return out;
}

RegistryConfig registry_config(const config::SessionConfig& config) {
    RegistryConfig out;
    out.confirmation = config.auth_mode;
    out.subscribe_timeout = config.subscribe_timeout;
    out.default_depth_level = config.default_depth_level;
    return out;
}

}  // namespace

StreamingSession::StreamingSession(config::SessionConfig config)
    : StreamingSession(config, std::make_unique<network::WebSocketClient>(config.websocket)) {}

StreamingSession::StreamingSession(config::SessionConfig config,
                                   std::unique_ptr<network::IWebSocketClient> transport)
    : config_(std::move(config)) {

    connection_ = std::make_unique<Connection>(connection_config(config_), std::move(transport));
    registry_ = std::make_unique<SubscriptionRegistry>(registry_config(config_), *connection_, cache_);
    dispatcher_ = std::make_unique<InboundDispatcher>(*connection_, *registry_, cache_);
    feed_ = std::make_unique<AutoSubscribeFeed>(*registry_, cache_);

    connection_->on_message([this](std::string_view message) { dispatcher_->dispatch(message); });

    if (config_.resubscribe_on_reconnect) {
        connection_->on_authenticated([this]() { registry_->resubscribe_active(); });
    }
}

StreamingSession::~StreamingSession() {
    // The connection joins the I/O thread before the dispatcher goes away
    close();
    connection_.reset();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status StreamingSession::open() {
    return connection_->connect();
}

void StreamingSession::close() {
    if (connection_) {
        connection_->close();
    }
}

// ============================================================================
// Host Interface
// ============================================================================

std::string StreamingSession::connect(const std::string& url) {
    std::optional<std::string> target;
    if (!url.empty()) {
        target = url;
    }
    // Open but unauthenticated: retry authentication on the same socket
    if (connection_->state() == ConnectionState::Open && !connection_->is_authenticated()) {
        if (target && *target != connection_->url()) {
            connection_->close();
        } else {
            return connection_->authenticate().to_string();
        }
    }
    return connection_->connect(target).to_string();
}

std::string StreamingSession::connection_state() const {
    return std::string(connection_->state_name());
}

std::string StreamingSession::subscribe(const std::string& symbol,
                                        const std::string& exchange,
                                        int64_t mode,
                                        std::optional<int> depth_level) {
    std::optional<SubscriptionKey> key;
    if (Status valid = make_key(symbol, exchange, mode, key); !valid.ok()) {
        return valid.to_string();
    }
    if (depth_level && *depth_level <= 0) {
        return Status::error(ErrorCode::InvalidArgument, "Depth level must be positive").to_string();
    }
    return registry_->subscribe(*key, depth_level).to_string();
}

std::string StreamingSession::unsubscribe(const std::string& symbol, const std::string& exchange, int64_t mode) {
    std::optional<SubscriptionKey> key;
    if (Status valid = make_key(symbol, exchange, mode, key); !valid.ok()) {
        return valid.to_string();
    }
    return registry_->unsubscribe(*key).to_string();
}

std::string StreamingSession::unsubscribe_all() {
    return registry_->unsubscribe_all().to_string();
}

ReadResult StreamingSession::read(const std::string& symbol, const std::string& exchange, int64_t mode) {
    std::optional<SubscriptionKey> key;
    if (Status valid = make_key(symbol, exchange, mode, key); !valid.ok()) {
        return {ReadStatus::Error, nullptr, valid.message()};
    }
    return feed_->read(*key);
}

std::vector<std::string> StreamingSession::list_active_subscriptions() const {
    return registry_->list_active();
}

void StreamingSession::on_data(DataCallback callback) {
    dispatcher_->on_data(std::move(callback));
}

Status StreamingSession::make_key(const std::string& symbol,
                                  const std::string& exchange,
                                  int64_t mode,
                                  std::optional<SubscriptionKey>& key) {
    if (symbol.empty() || exchange.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Symbol and Exchange are required");
    }
    auto data_mode = mode_from_int(mode);
    if (!data_mode) {
        return Status::error(ErrorCode::InvalidArgument, "Mode must be 1 (LTP), 2 (Quote), or 3 (Depth)");
    }
    key.emplace(symbol, exchange, *data_mode);
    return Status::success("ok");
}

}  // namespace algostream::stream
