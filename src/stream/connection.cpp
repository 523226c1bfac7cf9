// ============================================================================
// ALGOSTREAM - Connection Implementation
// ============================================================================

#include "algostream/stream/connection.hpp"
#include "algostream/stream/protocol.hpp"
#include "algostream/utils/logger.hpp"

namespace algostream::stream {

Connection::Connection(ConnectionConfig config, std::unique_ptr<network::IWebSocketClient> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {

    network::TransportHandlers handlers;
    handlers.on_open = [this]() { handle_transport_connected(); };
    handlers.on_failure = [this](const std::string& error) { handle_transport_error(error); };
    handlers.on_closed = [this]() { handle_transport_closed(); };
    handlers.on_frame = [this](std::string_view frame) {
        if (on_message_) {
            on_message_(frame);
        }
    };
    transport_->set_handlers(std::move(handlers));
}

Connection::~Connection() {
    close();
    // Joins the receive loop before the handlers it calls are destroyed
    transport_.reset();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status Connection::connect(std::optional<std::string> url) {
    ConnectionState expected = ConnectionState::Disconnected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Connecting)) {
        if (expected == ConnectionState::Open) {
            return Status::success("Already connected");
        }
        return Status::error(ErrorCode::ConnectInProgress, "Connection already in progress");
    }

    if (config_.api_key.empty()) {
        state_ = ConnectionState::Disconnected;
        return Status::error(ErrorCode::MissingCredentials, "API Key not set");
    }

    std::string target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (url && !url->empty()) {
            config_.url = *url;
        }
        target = config_.url;
    }

    auto endpoint = network::WebSocketEndpoint::parse(target);
    if (!endpoint) {
        state_ = ConnectionState::Disconnected;
        return Status::error(ErrorCode::InvalidArgument, "Invalid WebSocket URL: " + target);
    }

    LOG_INFO("[CONN] connecting to {}", target);

    auto pending = std::make_shared<PendingRequest>("open");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_pending_ = pending;
    }

    transport_->open(*endpoint);
    PendingOutcome outcome = pending->wait_for(config_.connect_timeout);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_pending_ == pending) open_pending_.reset();
    }

    if (outcome != PendingOutcome::Confirmed) {
        if (outcome == PendingOutcome::TimedOut) {
            transport_->close();
        }
        state_ = ConnectionState::Disconnected;
        LOG_ERROR("[CONN] connection to {} failed: {}", target, pending->detail());
        return Status::error(ErrorCode::ConnectFailed, "Connection failed: " + pending->detail());
    }

    Status auth = authenticate();

    expected = ConnectionState::Connecting;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Open)) {
        authenticated_ = false;
        return Status::error(ErrorCode::TransportClosed, "Connection closed during authentication");
    }

    LOG_INFO("[CONN] open ({}), authenticated={}", target, authenticated_.load());

    if (auth.ok() && on_authenticated_) {
        on_authenticated_();
    }
    return auth;
}

Status Connection::authenticate() {
    const ConnectionState current = state_.load();
    if (current != ConnectionState::Connecting && current != ConnectionState::Open) {
        return Status::error(ErrorCode::NotConnected, "Not connected");
    }
    if (config_.api_key.empty()) {
        return Status::error(ErrorCode::MissingCredentials, "API Key not set");
    }

    authenticated_ = false;

    auto pending = std::make_shared<PendingRequest>("authenticate");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auth_pending_) auth_pending_->cancel("superseded by a new authentication");
        auth_pending_ = pending;
    }

    send_raw(protocol::make_authenticate(config_.api_key));

    // Assumed mode waits only the grace period; silence counts as success
    const auto wait = config_.auth_mode == AuthMode::Confirmed ? config_.auth_timeout
                                                               : config_.assumed_auth_grace;
    PendingOutcome outcome = pending->wait_for(wait);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auth_pending_ == pending) auth_pending_.reset();
    }

    Status status;
    switch (outcome) {
        case PendingOutcome::Confirmed:
            authenticated_ = true;
            status = Status::success("Connected and authenticated");
            break;
        case PendingOutcome::Rejected:
            status = Status::error(ErrorCode::AuthenticationRejected,
                                   "Authentication failed: " + pending->detail());
            break;
        case PendingOutcome::TimedOut:
            if (config_.auth_mode == AuthMode::Assumed) {
                authenticated_ = true;
                status = Status::success("Connected and authenticated");
            } else {
                status = Status::error(ErrorCode::AuthenticationTimeout,
                                       "Authentication timed out after " +
                                           std::to_string(config_.auth_timeout.count()) + "ms");
            }
            break;
        case PendingOutcome::Cancelled:
            status = Status::error(ErrorCode::TransportClosed,
                                   "Authentication interrupted: " + pending->detail());
            break;
    }

    if (status.ok()) {
        LOG_INFO("[CONN] authenticated ({} mode)", to_string(config_.auth_mode));
    } else {
        LOG_WARN("[CONN] {}", status.message());
    }

    if (status.ok() && current == ConnectionState::Open && on_authenticated_) {
        on_authenticated_();
    }
    return status;
}

void Connection::resolve_authentication(bool success, const std::string& detail) {
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = take_pending(auth_pending_);
    }

    if (pending) {
        pending->resolve(success, detail);
        return;
    }

    // Late or unsolicited verdict, e.g. a rejection after the assumed-mode grace
    if (!success && authenticated_.exchange(false)) {
        LOG_WARN("[CONN] server revoked authentication: {}", detail);
    } else {
        LOG_DEBUG("[CONN] unsolicited authentication message (success={})", success);
    }
}

Status Connection::send(std::string_view message) {
    if (state_.load() != ConnectionState::Open) {
        return Status::error(ErrorCode::NotConnected, "Not connected");
    }
    if (!transport_->is_open()) {
        return Status::error(ErrorCode::TransportClosed, "WebSocket is not connected");
    }
    transport_->write(message);
    return Status::success("Sent");
}

Status Connection::send_pong() {
    const ConnectionState current = state_.load();
    if (current != ConnectionState::Connecting && current != ConnectionState::Open) {
        return Status::error(ErrorCode::NotConnected, "Not connected");
    }
    if (!transport_->is_open()) {
        return Status::error(ErrorCode::TransportClosed, "WebSocket is not connected");
    }
    transport_->write(protocol::PONG);
    return Status::success("Sent");
}

void Connection::close() {
    const ConnectionState current = state_.load();
    if (current == ConnectionState::Disconnected || current == ConnectionState::Closing) {
        return;
    }

    ConnectionState expected = current;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Closing)) {
        return;
    }
    authenticated_ = false;

    std::shared_ptr<PendingRequest> open;
    std::shared_ptr<PendingRequest> auth;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open = take_pending(open_pending_);
        auth = take_pending(auth_pending_);
    }
    if (open) open->cancel("Connection closed");
    if (auth) auth->cancel("Connection closed");

    // Wait for the close handshake so a stale close event cannot hit a later connect
    std::shared_ptr<PendingRequest> closed;
    if (transport_->is_open()) {
        closed = std::make_shared<PendingRequest>("close");
        std::lock_guard<std::mutex> lock(mutex_);
        close_pending_ = closed;
    }

    transport_->close();
    if (closed && closed->wait_for(config_.connect_timeout) == PendingOutcome::TimedOut) {
        LOG_WARN("[CONN] close handshake timed out");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_pending_.reset();
    }

    // A connect() that began after the close event owns the state now
    expected = ConnectionState::Closing;
    if (state_.compare_exchange_strong(expected, ConnectionState::Disconnected) ||
        expected == ConnectionState::Disconnected) {
        LOG_INFO("[CONN] closed");
    } else {
        LOG_DEBUG("[CONN] reopened during close ({})", to_string(expected));
    }
}

// ============================================================================
// Transport Events
// ============================================================================

void Connection::handle_transport_connected() {
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = take_pending(open_pending_);
    }
    if (pending) {
        pending->resolve(true);
    }
}

void Connection::handle_transport_error(const std::string& error) {
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = take_pending(open_pending_);
    }
    if (pending) {
        pending->resolve(false, error);
    }
}

void Connection::handle_transport_closed() {
    authenticated_ = false;
    const ConnectionState previous = state_.exchange(ConnectionState::Disconnected);

    std::shared_ptr<PendingRequest> open;
    std::shared_ptr<PendingRequest> auth;
    std::shared_ptr<PendingRequest> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open = take_pending(open_pending_);
        auth = take_pending(auth_pending_);
        closed = take_pending(close_pending_);
    }
    if (open) open->resolve(false, "Transport closed");
    if (auth) auth->cancel("Transport closed");
    if (closed) closed->resolve(true);

    if (previous == ConnectionState::Open) {
        LOG_WARN("[CONN] connection closed by server; subscriptions are kept until unsubscribe_all");
    }
}

void Connection::send_raw(std::string_view message) {
    transport_->write(message);
}

std::shared_ptr<PendingRequest> Connection::take_pending(std::shared_ptr<PendingRequest>& slot) {
    std::shared_ptr<PendingRequest> taken;
    taken.swap(slot);
    return taken;
}

// ============================================================================
// Observers
// ============================================================================

std::optional<Timestamp> Connection::last_heartbeat() const noexcept {
    const int64_t ns = last_heartbeat_ns_.load();
    if (ns == 0) return std::nullopt;
    return Timestamp{Duration{ns}};
}

std::string Connection::url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.url;
}

}  // namespace algostream::stream
