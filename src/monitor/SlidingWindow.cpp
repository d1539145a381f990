#include "routecore/monitor/SlidingWindow.h"

#include <limits>
#include <stdexcept>

namespace routecore {
namespace monitor {

SlidingWindow::SlidingWindow(size_t limit, double window_sec)
    : limit_(limit),
      window_(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(window_sec))) {
    if (limit_ == 0) {
        throw std::invalid_argument("SlidingWindow limit must be > 0");
    }
    if (window_sec <= 0.0) {
        throw std::invalid_argument("SlidingWindow window must be > 0");
    }
}

bool SlidingWindow::Allow(size_t n) {
    return AllowAt(Clock::now(), n);
}

void SlidingWindow::PruneLocked(Clock::time_point now) {
    // A timestamp exactly `window` old has left the window.
    while (!admitted_.empty() && now - admitted_.front() >= window_) {
        admitted_.pop_front();
    }
}

bool SlidingWindow::AllowAt(Clock::time_point now, size_t n) {
    if (n == 0) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    // size() never exceeds limit_, so this cannot wrap for any n.
    if (n > limit_ - admitted_.size()) return false;
    for (size_t i = 0; i < n; ++i) admitted_.push_back(now);
    return true;
}

size_t SlidingWindow::RemainingAt(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    return limit_ - admitted_.size();
}

size_t SlidingWindow::PeekAt(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t live = 0;
    for (const auto& ts : admitted_) {
        if (now - ts < window_) ++live;
    }
    return live >= limit_ ? 0 : limit_ - live;
}

double SlidingWindow::SecondsUntilAt(Clock::time_point now, size_t n) {
    if (n > limit_) return std::numeric_limits<double>::infinity();

    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    if (n <= limit_ - admitted_.size()) return 0.0;
    // The admission that must age out before `n` more fit.
    const size_t k = admitted_.size() + n - limit_ - 1;
    const std::chrono::duration<double> wait = admitted_[k] + window_ - now;
    return wait.count();
}

} // namespace monitor
} // namespace routecore
