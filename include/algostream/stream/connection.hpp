#pragma once
// ============================================================================
// ALGOSTREAM - Connection
// ============================================================================
// Owns the single streaming socket, its lifecycle and the API-key handshake
//
// State machine:
//   Disconnected --connect--> Connecting --transport open + auth--> Open
//   Open --close--> Closing --> Disconnected
//   Open --server close / transport error--> Disconnected
// ============================================================================

#include "algostream/core/error.hpp"
#include "algostream/core/pending_request.hpp"
#include "algostream/core/types.hpp"
#include "algostream/network/websocket_client.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace algostream::stream {

struct ConnectionConfig {
    std::string url = "ws://127.0.0.1:8765";
    std::string api_key;

    AuthMode auth_mode = AuthMode::Confirmed;
    std::chrono::milliseconds auth_timeout{30000};
    std::chrono::milliseconds assumed_auth_grace{500};
    std::chrono::milliseconds connect_timeout{10000};
};

class Connection {
public:
    using MessageHandler = std::function<void(std::string_view)>;
    using AuthenticatedHandler = std::function<void()>;

    Connection(ConnectionConfig config, std::unique_ptr<network::IWebSocketClient> transport);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Open the transport and authenticate. Blocks until authenticated,
    /// rejected, or timed out. An empty url keeps the current one.
    [[nodiscard]] Status connect(std::optional<std::string> url = std::nullopt);

    /// Send the authenticate action and apply the configured confirmation policy
    [[nodiscard]] Status authenticate();

    /// Send a text message; NotConnected unless Open
    [[nodiscard]] Status send(std::string_view message);

    /// Heartbeat reply; allowed from Connecting on, once the transport is open
    [[nodiscard]] Status send_pong();

    /// Close the socket. Pending completions are cancelled.
    void close();

    /// Inbound messages from the receive loop (set once, before connect)
    void on_message(MessageHandler handler) { on_message_ = std::move(handler); }

    /// Fired after every successful authentication
    void on_authenticated(AuthenticatedHandler handler) { on_authenticated_ = std::move(handler); }

    /// Called by the dispatcher for an inbound authentication message
    void resolve_authentication(bool success, const std::string& detail);

    /// Called by the dispatcher after answering a heartbeat
    void record_heartbeat() noexcept { last_heartbeat_ns_ = now().time_since_epoch().count(); }

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::string_view state_name() const noexcept { return to_string(state()); }
    [[nodiscard]] bool is_authenticated() const noexcept { return authenticated_.load(); }
    [[nodiscard]] AuthMode auth_mode() const noexcept { return config_.auth_mode; }
    [[nodiscard]] std::optional<Timestamp> last_heartbeat() const noexcept;
    [[nodiscard]] std::string url() const;

private:
    void handle_transport_connected();
    void handle_transport_error(const std::string& error);
    void handle_transport_closed();

    /// Raw send used during the handshake, before the state reaches Open
    void send_raw(std::string_view message);

    [[nodiscard]] std::shared_ptr<PendingRequest> take_pending(std::shared_ptr<PendingRequest>& slot);

    ConnectionConfig config_;
    std::unique_ptr<network::IWebSocketClient> transport_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> authenticated_{false};
    std::atomic<int64_t> last_heartbeat_ns_{0};

    mutable std::mutex mutex_;  // Guards url, pending slots
    std::shared_ptr<PendingRequest> open_pending_;
    std::shared_ptr<PendingRequest> auth_pending_;
    std::shared_ptr<PendingRequest> close_pending_;

    MessageHandler on_message_;
    AuthenticatedHandler on_authenticated_;
};

}  // namespace algostream::stream
