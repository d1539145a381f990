#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace routecore {
namespace monitor {

// Sliding-window log limiter: at most `limit` admissions in any `window`.
// Keeps one timestamp per admission; older ones are pruned on each call.
class SlidingWindow {
public:
    using Clock = std::chrono::steady_clock;

    SlidingWindow(size_t limit, double window_sec);

    bool Allow(size_t n = 1);
    // Admits `n` at once or nothing.
    bool AllowAt(Clock::time_point now, size_t n = 1);

    // Admissions still possible in the window ending at `now`.
    size_t RemainingAt(Clock::time_point now);
    // Same, without pruning.
    size_t PeekAt(Clock::time_point now) const;

    // Seconds until `n` more admissions fit; infinity when n > limit.
    double SecondsUntilAt(Clock::time_point now, size_t n = 1);

    size_t limit() const { return limit_; }
    Clock::duration window() const { return window_; }

private:
    void PruneLocked(Clock::time_point now);

    const size_t limit_;
    const Clock::duration window_;

    mutable std::mutex mutex_;
    std::deque<Clock::time_point> admitted_; // oldest first
};

} // namespace monitor
} // namespace routecore
