#include "routecore/monitor/TokenBucket.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace routecore {
namespace monitor {

TokenBucket::TokenBucket(double refill_rate_tokens_per_sec, double capacity_tokens)
    : TokenBucket(refill_rate_tokens_per_sec, capacity_tokens, Clock::now()) {}

TokenBucket::TokenBucket(double refill_rate_tokens_per_sec, double capacity_tokens, Clock::time_point start)
    : refill_rate_tokens_per_sec_(refill_rate_tokens_per_sec),
      capacity_tokens_(capacity_tokens),
      tokens_(capacity_tokens),
      last_refill_(start) {
    if (refill_rate_tokens_per_sec_ < 0.0) {
        throw std::invalid_argument("TokenBucket refill_rate must be >= 0");
    }
    if (capacity_tokens_ <= 0.0) {
        throw std::invalid_argument("TokenBucket capacity must be > 0");
    }
}

bool TokenBucket::Allow(double tokens) {
    return AllowAt(Clock::now(), tokens);
}

void TokenBucket::RefillLocked(Clock::time_point now) {
    if (now <= last_refill_) return;
    const std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(capacity_tokens_, tokens_ + elapsed.count() * refill_rate_tokens_per_sec_);
    last_refill_ = now;
}

bool TokenBucket::AllowAt(Clock::time_point now, double tokens) {
    if (tokens <= 0.0) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }
    return false;
}

double TokenBucket::AvailableAt(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    return tokens_;
}

double TokenBucket::PeekAt(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now <= last_refill_) return tokens_;
    const std::chrono::duration<double> elapsed = now - last_refill_;
    return std::min(capacity_tokens_, tokens_ + elapsed.count() * refill_rate_tokens_per_sec_);
}

double TokenBucket::WaitLocked(double tokens) const {
    if (tokens <= tokens_) return 0.0;
    if (tokens > capacity_tokens_ || refill_rate_tokens_per_sec_ <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return (tokens - tokens_) / refill_rate_tokens_per_sec_;
}

double TokenBucket::SecondsUntilAt(Clock::time_point now, double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    return WaitLocked(tokens);
}

} // namespace monitor
} // namespace routecore
