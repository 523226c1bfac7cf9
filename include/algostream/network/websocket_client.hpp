#pragma once
// ============================================================================
// ALGOSTREAM - WebSocket Transport
// ============================================================================
// Text-frame transport under the streaming Connection.
// WebSocketClient runs Boost.Beast over plain TCP (ws://) or TLS (wss://)
// on one I/O thread; every handler is invoked on that thread.
// ============================================================================

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace algostream::network {

// ============================================================================
// Endpoint
// ============================================================================

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target = "/";
    bool tls = false;

    /// Parse "ws://host[:port][/target]" or "wss://..."; nullopt on bad scheme/host
    [[nodiscard]] static std::optional<WebSocketEndpoint> parse(std::string_view url);

    [[nodiscard]] std::string to_string() const;
};

struct WebSocketConfig {
    std::chrono::seconds connect_timeout{10};  // TCP connect + TLS handshake
    std::string user_agent = "AlgoStream/1.0";
    bool verify_tls = true;
    size_t read_buffer_size = 65536;           // Largest accepted frame
};

// ============================================================================
// Transport Interface
// ============================================================================

/// Events raised by a transport. Install before open().
struct TransportHandlers {
    std::function<void()> on_open;                          // Handshake complete
    std::function<void(std::string_view)> on_frame;         // One inbound text frame
    std::function<void(const std::string&)> on_failure;     // Open failed, or read/write error
    std::function<void()> on_closed;                        // Was open, now closed (either side)
};

class IWebSocketClient {
public:
    virtual ~IWebSocketClient() = default;

    virtual void set_handlers(TransportHandlers handlers) = 0;

    /// Begin opening; the outcome arrives as on_open or on_failure
    virtual void open(const WebSocketEndpoint& endpoint) = 0;

    /// Send a normal close frame, or abort an open still in progress
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Queue one text frame. Dropped when not open.
    virtual void write(std::string_view text) = 0;
};

// ============================================================================
// Boost.Beast Transport
// ============================================================================

class WebSocketClient final : public IWebSocketClient {
public:
    explicit WebSocketClient(const WebSocketConfig& config = WebSocketConfig{});
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void set_handlers(TransportHandlers handlers) override { handlers_ = std::move(handlers); }
    void open(const WebSocketEndpoint& endpoint) override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return open_.load(); }
    void write(std::string_view text) override;

private:
    struct Impl;

    void ensure_io_thread();
    void join_io_thread();

    std::unique_ptr<Impl> impl_;
    TransportHandlers handlers_;

    std::atomic<bool> open_{false};
    std::atomic<bool> io_running_{false};
    std::thread io_thread_;
};

}  // namespace algostream::network
