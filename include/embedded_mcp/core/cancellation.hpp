#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace embedded_mcp {

namespace detail {

struct CancelState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

} // namespace detail

// ---------------------------------------------------------------------------
// CancellationToken — read side of a cancel flag, optionally with a
// deadline. Copies share the flag. A default-constructed token is never
// cancelled and has no deadline.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    /// True once the source was cancelled or the deadline has passed.
    [[nodiscard]] bool IsCancelled() const;

    [[nodiscard]] bool DeadlineExpired() const;

    /// Sleep for `duration` unless cancelled first. Returns true if the
    /// whole duration elapsed, false if the token was cancelled or its
    /// deadline fell inside the wait.
    [[nodiscard]] bool WaitFor(std::chrono::milliseconds duration) const;

    /// Copy of this token whose deadline is the earlier of the current one
    /// and now + timeout.
    [[nodiscard]] CancellationToken WithTimeout(
        std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state);

    std::shared_ptr<detail::CancelState> state_;
    std::optional<Clock::time_point> deadline_;
};

// ---------------------------------------------------------------------------
// CancellationSource — owner side. Cancel() wakes every waiting token of the
// current generation; Reset() starts a new generation so tokens handed out
// afterwards are live again (used across stop/start cycles).
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();

    void Cancel();
    void Reset();

    [[nodiscard]] bool IsCancelled() const;
    [[nodiscard]] CancellationToken Token() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace embedded_mcp
