#pragma once
// ============================================================================
// ALGOSTREAM - Error Taxonomy
// ============================================================================
// Operation results are returned as Status values, never thrown at callers
// ============================================================================

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace algostream {

enum class ErrorCode : uint8_t {
    Ok = 0,
    NotConnected,
    ConnectInProgress,
    ConnectFailed,
    NotAuthenticated,
    AuthenticationTimeout,
    AuthenticationRejected,
    SubscriptionTimeout,
    SubscriptionRejected,
    MalformedMessage,
    TransportClosed,
    MissingCredentials,
    InvalidArgument,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::ConnectInProgress: return "ConnectInProgress";
        case ErrorCode::ConnectFailed: return "ConnectFailed";
        case ErrorCode::NotAuthenticated: return "NotAuthenticated";
        case ErrorCode::AuthenticationTimeout: return "AuthenticationTimeout";
        case ErrorCode::AuthenticationRejected: return "AuthenticationRejected";
        case ErrorCode::SubscriptionTimeout: return "SubscriptionTimeout";
        case ErrorCode::SubscriptionRejected: return "SubscriptionRejected";
        case ErrorCode::MalformedMessage: return "MalformedMessage";
        case ErrorCode::TransportClosed: return "TransportClosed";
        case ErrorCode::MissingCredentials: return "MissingCredentials";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// ============================================================================
// Status
// ============================================================================

/// Outcome of a session operation with a host-displayable message
class Status {
public:
    Status() = default;

    [[nodiscard]] static Status success(std::string message) {
        return Status{ErrorCode::Ok, std::move(message)};
    }

    [[nodiscard]] static Status error(ErrorCode code, std::string message) {
        return Status{code, std::move(message)};
    }

    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// Success message verbatim, errors as "Error: <message>"
    [[nodiscard]] std::string to_string() const {
        return ok() ? message_ : "Error: " + message_;
    }

private:
    Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    ErrorCode code_ = ErrorCode::Ok;
    std::string message_;
};

/// Raised only while loading configuration, before a session exists
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace algostream
