// ============================================================================
// ALGOSTREAM - Pending Request Implementation
// ============================================================================

#include "algostream/core/pending_request.hpp"

namespace algostream {

PendingRequest::PendingRequest(std::string id)
    : id_(std::move(id)), created_at_(now()) {}

bool PendingRequest::resolve(bool success, std::string detail) {
    return complete(success ? PendingOutcome::Confirmed : PendingOutcome::Rejected,
                    std::move(detail));
}

bool PendingRequest::cancel(std::string reason) {
    return complete(PendingOutcome::Cancelled, std::move(reason));
}

bool PendingRequest::expire() {
    return complete(PendingOutcome::TimedOut, "no acknowledgment received");
}

bool PendingRequest::complete(PendingOutcome outcome, std::string detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_) return false;
        outcome_ = outcome;
        detail_ = std::move(detail);
    }
    cv_.notify_all();
    return true;
}

PendingOutcome PendingRequest::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return outcome_.has_value(); })) {
        outcome_ = PendingOutcome::TimedOut;
        detail_ = "no acknowledgment within " + std::to_string(timeout.count()) + "ms";
    }
    return *outcome_;
}

std::optional<PendingOutcome> PendingRequest::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

bool PendingRequest::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_.has_value();
}

std::string PendingRequest::detail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detail_;
}

}  // namespace algostream
