// ============================================================================
// ALGOSTREAM - Wire Protocol Implementation
// ============================================================================
// Outbound messages are assembled directly as JSON text; inbound documents
// are decoded with the simdjson DOM API
// ============================================================================

#include "algostream/stream/protocol.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace algostream::stream::protocol {

namespace dom = simdjson::dom;

// ============================================================================
// Outbound
// ============================================================================

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string make_authenticate(std::string_view api_key) {
    return R"({"action":"authenticate","api_key":")" + json_escape(api_key) + R"("})";
}

static std::string feed_fields(const SubscriptionKey& key) {
    return R"("symbol":")" + json_escape(key.symbol()) +
           R"(","exchange":")" + json_escape(key.exchange()) +
           R"(","mode":)" + std::to_string(to_int(key.mode()));
}

std::string make_subscribe(const SubscriptionKey& key, std::optional<int> depth_level) {
    std::string msg = R"({"action":"subscribe",)" + feed_fields(key);
    if (key.mode() == DataMode::Depth && depth_level) {
        msg += R"(,"depth_level":)" + std::to_string(*depth_level);
    }
    msg += '}';
    return msg;
}

std::string make_unsubscribe(const SubscriptionKey& key) {
    return R"({"action":"unsubscribe",)" + feed_fields(key) + '}';
}

// ============================================================================
// Inbound Helpers
// ============================================================================

static std::string_view trim(std::string_view text) noexcept {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool is_heartbeat(std::string_view message) noexcept {
    return iequals(trim(message), PING);
}

static std::optional<double> parse_number(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    std::string buffer(text);
    char* end = nullptr;
    double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) return std::nullopt;
    return value;
}

std::optional<DataMode> parse_mode(std::string_view text) noexcept {
    text = trim(text);
    if (iequals(text, "ltp")) return DataMode::LTP;
    if (iequals(text, "quote")) return DataMode::Quote;
    if (iequals(text, "depth")) return DataMode::Depth;
    if (text.size() == 1 && text[0] >= '1' && text[0] <= '3') {
        return mode_from_int(text[0] - '0');
    }
    return std::nullopt;
}

static std::optional<std::string_view> string_member(dom::object object, std::string_view name) {
    std::string_view value;
    if (object[name].get_string().get(value) != simdjson::SUCCESS) return std::nullopt;
    return value;
}

/// Numeric value of a JSON number or numeric string
static std::optional<double> number_of(dom::element element) {
    switch (element.type()) {
        case dom::element_type::INT64:
        case dom::element_type::UINT64:
        case dom::element_type::DOUBLE: {
            double value = 0.0;
            if (element.get_double().get(value) != simdjson::SUCCESS) return std::nullopt;
            return value;
        }
        case dom::element_type::STRING: {
            std::string_view text;
            if (element.get_string().get(text) != simdjson::SUCCESS) return std::nullopt;
            return parse_number(text);
        }
        default:
            return std::nullopt;
    }
}

static std::optional<double> number_member(dom::object object, std::string_view name) {
    dom::element element;
    if (object[name].get(element) != simdjson::SUCCESS) return std::nullopt;
    return number_of(element);
}

/// nullopt when absent; throws when present but not a mode
static std::optional<DataMode> mode_member(dom::object object) {
    dom::element element;
    if (object["mode"].get(element) != simdjson::SUCCESS) return std::nullopt;

    std::optional<DataMode> mode;
    if (element.type() == dom::element_type::STRING) {
        std::string_view text;
        if (element.get_string().get(text) == simdjson::SUCCESS) mode = parse_mode(text);
    } else if (auto number = number_of(element)) {
        // Range check before the cast; 1.9 or 1e300 is not a mode
        const double value = *number;
        if (std::isfinite(value) && value >= 1.0 && value <= 3.0 && std::floor(value) == value) {
            mode = mode_from_int(static_cast<int>(value));
        }
    }
    if (!mode) {
        throw MalformedMessageError("invalid mode: " + std::string(simdjson::minify(element)));
    }
    return mode;
}

/// Non-negative count; out-of-range values saturate
static int64_t to_count(double value) {
    constexpr double kMax = 9.2e18;
    if (!std::isfinite(value)) return value > 0 ? static_cast<int64_t>(kMax) : 0;
    if (value <= 0.0) return 0;
    if (value >= kMax) return static_cast<int64_t>(kMax);
    return static_cast<int64_t>(value);
}

static market::FieldValue to_field_value(dom::element element) {
    market::FieldValue field;
    switch (element.type()) {
        case dom::element_type::STRING: {
            std::string_view text;
            if (element.get_string().get(text) == simdjson::SUCCESS) {
                field.text = std::string(text);
                field.number = parse_number(text);
            }
            break;
        }
        case dom::element_type::INT64:
        case dom::element_type::UINT64:
        case dom::element_type::DOUBLE:
            field.text = simdjson::minify(element);
            field.number = number_of(element);
            break;
        default:
            field.text = simdjson::minify(element);
            break;
    }
    return field;
}

static std::vector<market::DepthLevel> parse_depth_side(dom::object depth, std::string_view side) {
    std::vector<market::DepthLevel> levels;
    dom::array array;
    if (depth[side].get_array().get(array) != simdjson::SUCCESS) return levels;

    for (dom::element entry : array) {
        dom::object level;
        if (entry.get_object().get(level) != simdjson::SUCCESS) continue;

        market::DepthLevel parsed;
        parsed.price = number_member(level, "price").value_or(0.0);
        parsed.quantity = to_count(number_member(level, "quantity").value_or(0.0));
        parsed.orders = to_count(number_member(level, "orders").value_or(0.0));
        levels.push_back(parsed);
    }
    return levels;
}

// ============================================================================
// MessageParser
// ============================================================================

struct MessageParser::Impl {
    dom::parser parser_;

    InboundMessage parse(std::string_view message) {
        simdjson::padded_string padded(message);

        dom::element doc;
        if (auto error = parser_.parse(padded).get(doc); error != simdjson::SUCCESS) {
            throw MalformedMessageError(std::string("invalid JSON: ") + simdjson::error_message(error));
        }

        dom::object root;
        if (doc.get_object().get(root) != simdjson::SUCCESS) {
            throw MalformedMessageError("top-level value is not an object");
        }

        auto type = string_member(root, "type").value_or("");

        if (type == "authentication") {
            return parse_authentication(root);
        }
        if (type == "subscription" || type == "subscribe") {
            return parse_subscription(root);
        }
        if (type == "market_data") {
            return parse_market_data(root, message);
        }
        if (type == "error") {
            return ServerError{std::string(string_member(root, "message").value_or(""))};
        }
        return UnknownMessage{std::string(type)};
    }

    static AuthenticationResult parse_authentication(dom::object root) {
        AuthenticationResult result;
        result.status = std::string(string_member(root, "status").value_or(""));
        result.message = std::string(string_member(root, "message").value_or(""));
        result.success = result.status == "success";
        return result;
    }

    static SubscriptionAck parse_subscription(dom::object root) {
        SubscriptionAck ack;
        ack.status = std::string(string_member(root, "status").value_or(""));
        ack.message = std::string(string_member(root, "message").value_or(""));
        ack.success = ack.status == "success";

        auto symbol = string_member(root, "symbol");
        auto exchange = string_member(root, "exchange");
        auto mode = mode_member(root);
        if (symbol && exchange && mode) {
            ack.key.emplace(std::string(*symbol), std::string(*exchange), *mode);
        }
        return ack;
    }

    static MarketDataUpdate parse_market_data(dom::object root, std::string_view raw) {
        dom::object data;
        if (root["data"].get_object().get(data) != simdjson::SUCCESS) {
            throw MalformedMessageError("market_data without data object");
        }

        auto symbol = string_member(data, "symbol");
        auto exchange = string_member(data, "exchange");
        auto mode = mode_member(root);
        if (!mode) mode = mode_member(data);

        if (!symbol || !exchange || !mode || symbol->empty() || exchange->empty()) {
            throw MalformedMessageError("market_data without symbol/exchange/mode");
        }

        auto snapshot = std::make_shared<market::MarketDataSnapshot>(market::MarketDataSnapshot{
            SubscriptionKey{std::string(*symbol), std::string(*exchange), *mode},
            std::nullopt,
            now(),
            number_member(data, "ltp"),
            {},
            std::nullopt,
            std::string(raw)});

        if (auto topic = string_member(root, "topic")) {
            snapshot->topic = std::string(*topic);
        }

        for (auto [name, value] : data) {
            snapshot->fields.emplace_back(std::string(name), to_field_value(value));
        }

        dom::object depth;
        if (data["depth"].get_object().get(depth) == simdjson::SUCCESS) {
            snapshot->depth = market::DepthBook{parse_depth_side(depth, "buy"),
                                                parse_depth_side(depth, "sell")};
        }

        return MarketDataUpdate{std::move(snapshot)};
    }
};

MessageParser::MessageParser() : impl_(std::make_unique<Impl>()) {}

MessageParser::~MessageParser() = default;

InboundMessage MessageParser::parse(std::string_view message) {
    return impl_->parse(message);
}

}  // namespace algostream::stream::protocol
