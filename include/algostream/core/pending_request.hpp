#pragma once
// ============================================================================
// ALGOSTREAM - Pending Request
// ============================================================================
// One-shot completion correlating an outbound request with its server ack
// ============================================================================

#include "algostream/core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace algostream {

enum class PendingOutcome : uint8_t {
    Confirmed = 0,
    Rejected = 1,
    TimedOut = 2,
    Cancelled = 3
};

[[nodiscard]] constexpr std::string_view to_string(PendingOutcome outcome) noexcept {
    switch (outcome) {
        case PendingOutcome::Confirmed: return "Confirmed";
        case PendingOutcome::Rejected: return "Rejected";
        case PendingOutcome::TimedOut: return "TimedOut";
        case PendingOutcome::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// Thread-safe one-shot completion. The first outcome wins; later
/// resolutions are ignored and report false.
class PendingRequest {
public:
    explicit PendingRequest(std::string id);

    PendingRequest(const PendingRequest&) = delete;
    PendingRequest& operator=(const PendingRequest&) = delete;

    /// Resolve with a server verdict
    bool resolve(bool success, std::string detail = {});

    /// Resolve as cancelled (connection closed, superseded by unsubscribe)
    bool cancel(std::string reason);

    /// Resolve as timed out (used by expiry sweeps)
    bool expire();

    /// Block until resolved or the timeout elapses. On timeout the request
    /// itself is marked TimedOut so a late ack cannot flip it.
    [[nodiscard]] PendingOutcome wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<PendingOutcome> outcome() const;
    [[nodiscard]] bool is_resolved() const;
    [[nodiscard]] std::string detail() const;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] Timestamp created_at() const noexcept { return created_at_; }

    /// Older than the given age
    [[nodiscard]] bool is_older_than(Duration age, Timestamp at = now()) const noexcept {
        return at - created_at_ >= age;
    }

private:
    bool complete(PendingOutcome outcome, std::string detail);

    std::string id_;
    Timestamp created_at_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<PendingOutcome> outcome_;
    std::string detail_;
};

}  // namespace algostream
