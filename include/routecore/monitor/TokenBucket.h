#pragma once

#include <chrono>
#include <mutex>

namespace routecore {
namespace monitor {

// Token bucket rate limiter.
// - capacity: maximum tokens in bucket (burst)
// - refill_rate: tokens added per second
// Refill and deduction happen under one lock with one timestamp.
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double refill_rate_tokens_per_sec, double capacity_tokens);
    // Starts full at `start` (deterministic tests, lazily created keys).
    TokenBucket(double refill_rate_tokens_per_sec, double capacity_tokens, Clock::time_point start);

    // Returns true if at least `tokens` are available and consumed.
    // All-or-nothing: a refusal deducts nothing.
    bool Allow(double tokens = 1.0);

    // Same as Allow(), but caller provides time point (useful for tests).
    bool AllowAt(Clock::time_point now, double tokens = 1.0);

    // Tokens left after refilling to `now`.
    double AvailableAt(Clock::time_point now);
    // Same, without moving the refill clock.
    double PeekAt(Clock::time_point now) const;

    // Seconds until `tokens` could be taken; 0 if available now, infinity if
    // never (more than capacity, or no refill).
    double SecondsUntilAt(Clock::time_point now, double tokens = 1.0);

    double refill_rate() const { return refill_rate_tokens_per_sec_; }
    double capacity() const { return capacity_tokens_; }

private:
    void RefillLocked(Clock::time_point now);
    double WaitLocked(double tokens) const;

    const double refill_rate_tokens_per_sec_;
    const double capacity_tokens_;

    mutable std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

} // namespace monitor
} // namespace routecore
