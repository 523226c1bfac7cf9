// ============================================================================
// ALGOSTREAM - Configuration Loader
// ============================================================================

#include "algostream/config/session_config.hpp"
#include "algostream/core/error.hpp"
#include "algostream/stream/protocol.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace algostream::config {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::chrono::milliseconds millis(const YAML::Node& node, std::chrono::milliseconds fallback) {
    if (!node) return fallback;
    const int64_t value = node.as<int64_t>();
    if (value < 0) {
        throw ConfigError("negative duration: " + std::to_string(value));
    }
    return std::chrono::milliseconds{value};
}

void load_connection(const YAML::Node& node, SessionConfig& session) {
    if (!node) return;
    session.url = node["url"].as<std::string>(session.url);
    session.api_key = node["api_key"].as<std::string>(session.api_key);
    session.connect_timeout = millis(node["connect_timeout_ms"], session.connect_timeout);

    auto& ws = session.websocket;
    ws.user_agent = node["user_agent"].as<std::string>(ws.user_agent);
    ws.verify_tls = node["verify_tls"].as<bool>(ws.verify_tls);
    ws.read_buffer_size = node["max_message_bytes"].as<size_t>(ws.read_buffer_size);
    ws.connect_timeout = std::chrono::duration_cast<std::chrono::seconds>(session.connect_timeout);
    if (ws.connect_timeout.count() == 0) {
        ws.connect_timeout = std::chrono::seconds{1};
    }
}

void load_session(const YAML::Node& node, SessionConfig& session) {
    if (!node) return;

    if (node["auth_mode"]) {
        const auto name = node["auth_mode"].as<std::string>();
        auto mode = parse_auth_mode(name);
        if (!mode) {
            throw ConfigError("session.auth_mode must be 'confirmed' or 'assumed', got '" + name + "'");
        }
        session.auth_mode = *mode;
    }

    session.auth_timeout = millis(node["auth_timeout_ms"], session.auth_timeout);
    session.assumed_auth_grace = millis(node["assumed_auth_grace_ms"], session.assumed_auth_grace);
    session.subscribe_timeout = millis(node["subscribe_timeout_ms"], session.subscribe_timeout);
    session.default_depth_level = node["default_depth_level"].as<int>(session.default_depth_level);
    session.resubscribe_on_reconnect = node["resubscribe_on_reconnect"].as<bool>(session.resubscribe_on_reconnect);

    if (session.default_depth_level <= 0) {
        throw ConfigError("session.default_depth_level must be positive");
    }
}

void load_logging(const YAML::Node& node, utils::LogConfig& logging) {
    if (!node) return;
    if (node["level"]) {
        logging.level = utils::parse_log_level(node["level"].as<std::string>(), logging.level);
    }
    logging.log_file = node["file"].as<std::string>(logging.log_file);
    logging.pattern = node["pattern"].as<std::string>(logging.pattern);
    logging.async = node["async"].as<bool>(logging.async);
    logging.queue_size = node["queue_size"].as<size_t>(logging.queue_size);
    logging.flush_interval_ms = node["flush_interval_ms"].as<size_t>(logging.flush_interval_ms);
    logging.max_file_size_mb = node["max_file_size_mb"].as<size_t>(logging.max_file_size_mb);
    logging.max_files = node["max_files"].as<size_t>(logging.max_files);
}

AppConfig from_yaml(const YAML::Node& yaml) {
    AppConfig config;

    load_connection(yaml["connection"], config.session);
    load_session(yaml["session"], config.session);
    load_logging(yaml["logging"], config.logging);

    if (yaml["watch"]) {
        for (const auto& entry : yaml["watch"]) {
            const auto text = entry.as<std::string>();
            auto key = parse_watch_entry(text);
            if (!key) {
                throw ConfigError("invalid watch entry '" + text + "' (expected SYMBOL:EXCHANGE:MODE)");
            }
            config.watch.push_back(std::move(*key));
        }
    }
    config.poll_interval = millis(yaml["poll_interval_ms"], config.poll_interval);

    if (config.session.api_key.empty()) {
        if (const char* env = std::getenv(API_KEY_ENV)) {
            config.session.api_key = env;
        }
    }

    return config;
}

}  // namespace

std::optional<AuthMode> parse_auth_mode(std::string_view name) {
    const std::string value = lower(name);
    if (value == "confirmed") return AuthMode::Confirmed;
    if (value == "assumed") return AuthMode::Assumed;
    return std::nullopt;
}

std::optional<SubscriptionKey> parse_watch_entry(std::string_view entry) {
    const auto first = entry.find(':');
    if (first == std::string_view::npos) return std::nullopt;
    const auto second = entry.find(':', first + 1);
    if (second == std::string_view::npos) return std::nullopt;

    std::string symbol(entry.substr(0, first));
    std::string exchange(entry.substr(first + 1, second - first - 1));
    auto mode = stream::protocol::parse_mode(entry.substr(second + 1));
    if (!mode || symbol.empty() || exchange.empty()) return std::nullopt;

    return SubscriptionKey{std::move(symbol), std::move(exchange), *mode};
}

AppConfig load_config(const std::string& path) {
    try {
        return from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load " + path + ": " + e.what());
    }
}

AppConfig load_config_from_string(const std::string& yaml) {
    try {
        return from_yaml(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

}  // namespace algostream::config
