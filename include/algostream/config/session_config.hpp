#pragma once
// ============================================================================
// ALGOSTREAM - Configuration
// ============================================================================
// Session settings and the YAML loader used by hosts
//
// connection:  url, api_key, user_agent, verify_tls, connect_timeout_ms
// session:     auth_mode, auth_timeout_ms, assumed_auth_grace_ms,
//              subscribe_timeout_ms, default_depth_level, resubscribe_on_reconnect
// logging:     level, file, pattern, async, queue_size, flush_interval_ms
// watch:       ["SYMBOL:EXCHANGE:MODE", ...], poll_interval_ms
// ============================================================================

#include "algostream/core/types.hpp"
#include "algostream/network/websocket_client.hpp"
#include "algostream/utils/logger.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace algostream::config {

/// Environment variable consulted when the YAML carries no api_key
inline constexpr const char* API_KEY_ENV = "ALGOSTREAM_API_KEY";

struct SessionConfig {
    std::string url = "ws://127.0.0.1:8765";
    std::string api_key;

    AuthMode auth_mode = AuthMode::Confirmed;
    std::chrono::milliseconds auth_timeout{30000};
    std::chrono::milliseconds assumed_auth_grace{500};
    std::chrono::milliseconds subscribe_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};

    int default_depth_level = DEFAULT_DEPTH_LEVEL;
    bool resubscribe_on_reconnect = true;

    network::WebSocketConfig websocket;
};

struct AppConfig {
    SessionConfig session;
    utils::LogConfig logging;

    std::vector<SubscriptionKey> watch;
    std::chrono::milliseconds poll_interval{1000};
};

/// Parse "auth_mode" values: "confirmed" or "assumed"
[[nodiscard]] std::optional<AuthMode> parse_auth_mode(std::string_view name);

/// Parse "SYMBOL:EXCHANGE:MODE" (mode 1..3 or ltp/quote/depth)
[[nodiscard]] std::optional<SubscriptionKey> parse_watch_entry(std::string_view entry);

/// Load a YAML file. Missing keys keep their defaults. Throws ConfigError.
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Same as load_config, from YAML text
[[nodiscard]] AppConfig load_config_from_string(const std::string& yaml);

}  // namespace algostream::config
