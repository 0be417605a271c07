#include <embedded_mcp/core/cancellation.hpp>

#include <algorithm>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
CancellationToken::CancellationToken()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancelState> state)
    : state_(std::move(state)) {}

bool CancellationToken::DeadlineExpired() const {
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

bool CancellationToken::IsCancelled() const {
    if (DeadlineExpired()) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    const auto wake_at = Clock::now() + duration;
    const auto until = deadline_.has_value() ? std::min(wake_at, *deadline_)
                                             : wake_at;

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    if (state_->cancelled) return false;
    return Clock::now() >= wake_at;
}

CancellationToken CancellationToken::WithTimeout(
    std::chrono::milliseconds timeout) const {
    CancellationToken copy(*this);
    const auto candidate = Clock::now() + timeout;
    if (!copy.deadline_.has_value() || candidate < *copy.deadline_) {
        copy.deadline_ = candidate;
    }
    return copy;
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

void CancellationSource::Cancel() {
    std::shared_ptr<detail::CancelState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = state_;
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cancelled = true;
    }
    state->cv.notify_all();
}

void CancellationSource::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::make_shared<detail::CancelState>();
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::lock_guard<std::mutex> state_lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CancellationToken(state_);
}

} // namespace embedded_mcp
