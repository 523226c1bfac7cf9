// ============================================================================
// ALGOSTREAM - WebSocket Client Implementation
// ============================================================================
// Every stream operation runs on the one I/O thread. write() and close()
// post onto it, so the outbound queue is touched by that thread alone.
// ============================================================================

#include "algostream/network/websocket_client.hpp"
#include "algostream/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <deque>

namespace algostream::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// WebSocket Endpoint
// ============================================================================

std::optional<WebSocketEndpoint> WebSocketEndpoint::parse(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;

    std::string scheme(url.substr(0, scheme_end));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    WebSocketEndpoint endpoint;
    if (scheme == "ws") {
        endpoint.tls = false;
    } else if (scheme == "wss") {
        endpoint.tls = true;
    } else {
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        endpoint.target = std::string(rest.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view port = authority.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        endpoint.host = std::string(authority.substr(0, colon));
        endpoint.port = std::string(port);
    } else {
        endpoint.host = std::string(authority);
        endpoint.port = endpoint.tls ? "443" : "80";
    }

    if (endpoint.host.empty()) return std::nullopt;
    return endpoint;
}

std::string WebSocketEndpoint::to_string() const {
    return (tls ? "wss://" : "ws://") + host + ':' + port + target;
}

// ============================================================================
// Beast Session
// ============================================================================

struct WebSocketClient::Impl {
    using plain_stream = websocket::stream<beast::tcp_stream>;
    using tls_stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    Impl(WebSocketClient& owner, const WebSocketConfig& config)
        : owner(owner)
        , config(config)
        , ioc(1)
        , tls_ctx(ssl::context::tlsv12_client)
        , resolver(net::make_strand(ioc)) {
        tls_ctx.set_default_verify_paths();
        tls_ctx.set_verify_mode(config.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    template <typename Fn>
    void visit(Fn&& fn) {
        if (secure) {
            fn(*secure);
        } else if (plain) {
            fn(*plain);
        }
    }

    // ------------------------------------------------------------------------
    // Open sequence: resolve -> tcp -> [tls] -> upgrade -> read loop
    // ------------------------------------------------------------------------

    void begin(const WebSocketEndpoint& target) {
        LOG_DEBUG("[WS] opening {}", target.to_string());

        endpoint = target;
        closing = false;
        inbound.consume(inbound.size());
        outbound.clear();

        plain.reset();
        secure.reset();
        if (endpoint.tls) {
            secure = std::make_unique<tls_stream>(net::make_strand(ioc), tls_ctx);
        } else {
            plain = std::make_unique<plain_stream>(net::make_strand(ioc));
        }

        resolver.async_resolve(endpoint.host, endpoint.port,
            [this](beast::error_code ec, tcp::resolver::results_type hosts) {
                if (ec) return open_failed("Resolve failed", ec);
                visit([&](auto& ws) {
                    auto& socket = beast::get_lowest_layer(ws);
                    socket.expires_after(config.connect_timeout);
                    socket.async_connect(hosts,
                        [this](beast::error_code ec, const tcp::endpoint&) { tcp_ready(ec); });
                });
            });
    }

    void tcp_ready(beast::error_code ec) {
        if (ec) return open_failed("Connect failed", ec);
        if (!secure) return upgrade();

        auto* native = secure->next_layer().native_handle();
        if (!SSL_set_tlsext_host_name(native, endpoint.host.c_str())) {
            beast::error_code sni(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return open_failed("TLS SNI setup failed", sni);
        }
        if (config.verify_tls) {
            secure->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
        }

        beast::get_lowest_layer(*secure).expires_after(config.connect_timeout);
        secure->next_layer().async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
            if (ec) return open_failed("TLS handshake failed", ec);
            upgrade();
        });
    }

    void upgrade() {
        visit([&](auto& ws) {
            // websocket keepalive timeouts take over from the connect deadline
            beast::get_lowest_layer(ws).expires_never();
            ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws.set_option(websocket::stream_base::decorator(
                [agent = config.user_agent](websocket::request_type& req) {
                    req.set(http::field::user_agent, agent);
                }));
            ws.read_message_max(config.read_buffer_size);
            ws.text(true);

            ws.async_handshake(endpoint.host + ':' + endpoint.port, endpoint.target,
                [this](beast::error_code ec) {
                    if (ec) return open_failed("WebSocket upgrade failed", ec);
                    LOG_INFO("[WS] open: {}", endpoint.to_string());
                    owner.open_ = true;
                    if (owner.handlers_.on_open) owner.handlers_.on_open();
                    read_next();
                });
        });
    }

    void read_next() {
        visit([&](auto& ws) {
            ws.async_read(inbound, [this](beast::error_code ec, std::size_t n) { frame_read(ec, n); });
        });
    }

    void frame_read(beast::error_code ec, std::size_t n) {
        if (ec) {
            read_ended(ec);
            return;
        }
        const std::string frame = beast::buffers_to_string(inbound.data());
        inbound.consume(n);
        if (owner.handlers_.on_frame) owner.handlers_.on_frame(frame);
        read_next();
    }

    void read_ended(beast::error_code ec) {
        const bool was_open = owner.open_.exchange(false);
        outbound.clear();

        if (ec == websocket::error::closed) {
            LOG_INFO("[WS] closed by {}", closing ? "us" : "peer");
        } else if (!closing || ec != net::error::operation_aborted) {
            report("Read error: " + ec.message());
        }

        if (was_open && owner.handlers_.on_closed) owner.handlers_.on_closed();
    }

    // ------------------------------------------------------------------------
    // Outbound queue, one async_write in flight
    // ------------------------------------------------------------------------

    void enqueue(std::string text) {
        if (!owner.open_) return;
        outbound.push_back(std::move(text));
        if (outbound.size() == 1) flush_front();
    }

    void flush_front() {
        visit([&](auto& ws) {
            ws.async_write(net::buffer(outbound.front()), [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    outbound.clear();
                    report("Write error: " + ec.message());
                    return;
                }
                outbound.pop_front();
                if (!outbound.empty()) flush_front();
            });
        });
    }

    void shutdown() {
        closing = true;
        visit([&](auto& ws) {
            if (!owner.open_) {
                // Abort an open still in progress
                beast::error_code ignored;
                beast::get_lowest_layer(ws).socket().close(ignored);
                return;
            }
            ws.async_close(websocket::close_code::normal, [](beast::error_code ec) {
                if (ec) LOG_DEBUG("[WS] close frame: {}", ec.message());
            });
        });
    }

    void open_failed(const char* stage, beast::error_code ec) {
        owner.open_ = false;
        report(std::string(stage) + ": " + ec.message());
    }

    void report(const std::string& error) {
        LOG_ERROR("[WS] {}", error);
        if (owner.handlers_.on_failure) owner.handlers_.on_failure(error);
    }

    WebSocketClient& owner;
    WebSocketConfig config;
    net::io_context ioc;
    ssl::context tls_ctx;
    tcp::resolver resolver;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> keep_alive;

    WebSocketEndpoint endpoint;
    std::unique_ptr<plain_stream> plain;
    std::unique_ptr<tls_stream> secure;
    beast::flat_buffer inbound;
    std::deque<std::string> outbound;
    bool closing = false;
};

// ============================================================================
// WebSocketClient
// ============================================================================

WebSocketClient::WebSocketClient(const WebSocketConfig& config)
    : impl_(std::make_unique<Impl>(*this, config)) {}

WebSocketClient::~WebSocketClient() {
    join_io_thread();
}

void WebSocketClient::open(const WebSocketEndpoint& endpoint) {
    ensure_io_thread();
    net::post(impl_->ioc, [this, endpoint]() { impl_->begin(endpoint); });
}

void WebSocketClient::close() {
    net::post(impl_->ioc, [this]() { impl_->shutdown(); });
}

void WebSocketClient::write(std::string_view text) {
    if (!open_) return;
    net::post(impl_->ioc, [this, frame = std::string(text)]() mutable { impl_->enqueue(std::move(frame)); });
}

void WebSocketClient::ensure_io_thread() {
    if (io_running_.exchange(true)) return;
    impl_->ioc.restart();
    impl_->keep_alive.emplace(net::make_work_guard(impl_->ioc));
    io_thread_ = std::thread([this]() { impl_->ioc.run(); });
}

void WebSocketClient::join_io_thread() {
    io_running_ = false;
    open_ = false;
    impl_->keep_alive.reset();
    impl_->ioc.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

}  // namespace algostream::network
