#include "routecore/monitor/PerKeyRateLimiter.h"
#include "routecore/common/Logger.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace routecore {
namespace monitor {

const char* ToString(RateLimitError err) {
    switch (err) {
        case RateLimitError::InsufficientTokens: return "InsufficientTokens";
        default: return "Unknown";
    }
}

const char* ToString(PerKeyRateLimiter::Algorithm algorithm) {
    switch (algorithm) {
        case PerKeyRateLimiter::Algorithm::TokenBucket: return "token_bucket";
        case PerKeyRateLimiter::Algorithm::SlidingWindow: return "sliding_window";
        default: return "unknown";
    }
}

PerKeyRateLimiter::PerKeyRateLimiter(Config cfg) : cfg_(cfg) {
    if (cfg_.algorithm == Algorithm::TokenBucket && cfg_.refillPerSec < 0.0) {
        throw std::invalid_argument("PerKeyRateLimiter refillPerSec must be >= 0");
    }
    if (cfg_.algorithm == Algorithm::SlidingWindow && cfg_.limit > 0 && cfg_.windowSec <= 0.0) {
        throw std::invalid_argument("PerKeyRateLimiter windowSec must be > 0");
    }
}

bool PerKeyRateLimiter::Enabled() const {
    if (cfg_.algorithm == Algorithm::SlidingWindow) return cfg_.limit > 0;
    return cfg_.capacity > 0.0;
}

double PerKeyRateLimiter::FullAmount() const {
    if (cfg_.algorithm == Algorithm::SlidingWindow) return static_cast<double>(cfg_.limit);
    return cfg_.capacity;
}

PerKeyRateLimiter::Entry& PerKeyRateLimiter::GetOrCreateLocked(Shard& shard,
                                                               const std::string& key,
                                                               Clock::time_point now) {
    auto it = shard.entries.find(key);
    if (it != shard.entries.end()) return it->second;

    Entry e;
    if (cfg_.algorithm == Algorithm::SlidingWindow) {
        e.window = std::make_unique<SlidingWindow>(cfg_.limit, cfg_.windowSec);
    } else {
        e.bucket = std::make_unique<TokenBucket>(cfg_.refillPerSec, cfg_.capacity, now);
    }
    e.lastActive = now;
    return shard.entries.emplace(key, std::move(e)).first->second;
}

AdmissionDecision PerKeyRateLimiter::TakeAt(const std::string& key, double n, Clock::time_point now) {
    AdmissionDecision d;
    if (!Enabled() || n <= 0.0) {
        d.allowed = true;
        d.remaining = Enabled() ? PeekAt(key, now) : std::numeric_limits<double>::infinity();
        admitted_.fetch_add(1, std::memory_order_relaxed);
        return d;
    }

    auto& shard = shards_.For(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    Entry& e = GetOrCreateLocked(shard, key, now);
    e.lastActive = now;

    if (e.bucket) {
        d.allowed = e.bucket->AllowAt(now, n);
        d.remaining = e.bucket->AvailableAt(now);
        if (!d.allowed) d.retryAfterSec = e.bucket->SecondsUntilAt(now, n);
    } else if (!(n <= static_cast<double>(cfg_.limit))) {
        // More than a full window (or NaN) can never be admitted; also keeps
        // the conversion below in range.
        d.allowed = false;
        d.remaining = static_cast<double>(e.window->RemainingAt(now));
        d.retryAfterSec = std::numeric_limits<double>::infinity();
    } else {
        const size_t units = static_cast<size_t>(std::ceil(n));
        d.allowed = e.window->AllowAt(now, units);
        d.remaining = static_cast<double>(e.window->RemainingAt(now));
        if (!d.allowed) d.retryAfterSec = e.window->SecondsUntilAt(now, units);
    }

    if (d.allowed) {
        admitted_.fetch_add(1, std::memory_order_relaxed);
    } else {
        denied_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG << "Rate limited key " << key << " (retry after " << d.retryAfterSec << "s)";
    }
    return d;
}

AdmissionDecision PerKeyRateLimiter::Check(const std::string& key) {
    return CheckAt(key, Clock::now());
}

AdmissionDecision PerKeyRateLimiter::CheckAt(const std::string& key, Clock::time_point now) {
    return TakeAt(key, 1.0, now);
}

common::Status<RateLimitError> PerKeyRateLimiter::Consume(const std::string& key, double n) {
    return ConsumeAt(key, n, Clock::now());
}

common::Status<RateLimitError> PerKeyRateLimiter::ConsumeAt(const std::string& key, double n, Clock::time_point now) {
    if (TakeAt(key, n, now).allowed) return common::Status<RateLimitError>::Ok();
    return common::Status<RateLimitError>::Err(RateLimitError::InsufficientTokens);
}

double PerKeyRateLimiter::Peek(const std::string& key) const {
    return PeekAt(key, Clock::now());
}

double PerKeyRateLimiter::PeekAt(const std::string& key, Clock::time_point now) const {
    if (!Enabled()) return std::numeric_limits<double>::infinity();

    const auto& shard = shards_.For(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) return FullAmount();
    const Entry& e = it->second;
    if (e.bucket) return e.bucket->PeekAt(now);
    return static_cast<double>(e.window->PeekAt(now));
}

size_t PerKeyRateLimiter::Sweep() {
    return SweepAt(Clock::now());
}

size_t PerKeyRateLimiter::SweepAt(Clock::time_point now) {
    if (cfg_.idleTtlSec <= 0.0) return 0;
    const auto ttl = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.idleTtlSec));

    size_t removed = 0;
    shards_.ForEach([&](Shard& shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (now - it->second.lastActive > ttl) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    });
    if (removed > 0) {
        swept_.fetch_add(removed, std::memory_order_relaxed);
        LOG_DEBUG << "Rate limiter sweep removed " << removed << " idle keys";
    }
    return removed;
}

size_t PerKeyRateLimiter::Size() const {
    size_t n = 0;
    shards_.ForEach([&n](const Shard& shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        n += shard.entries.size();
    });
    return n;
}

PerKeyRateLimiter::LimiterStats PerKeyRateLimiter::Stats() const {
    LimiterStats s;
    s.enabled = Enabled();
    s.algorithm = cfg_.algorithm;
    s.trackedKeys = Size();
    s.admitted = admitted_.load(std::memory_order_relaxed);
    s.denied = denied_.load(std::memory_order_relaxed);
    s.swept = swept_.load(std::memory_order_relaxed);
    return s;
}

} // namespace monitor
} // namespace routecore
