#pragma once

#include "routecore/common/Result.h"
#include "routecore/common/Sharded.h"
#include "routecore/common/noncopyable.h"
#include "routecore/monitor/SlidingWindow.h"
#include "routecore/monitor/TokenBucket.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace routecore {
namespace monitor {

enum class RateLimitError {
    InsufficientTokens
};

const char* ToString(RateLimitError err);

struct AdmissionDecision {
    bool allowed{false};
    double remaining{0.0};     // tokens (or window slots) left after this decision
    double retryAfterSec{0.0}; // 0 when allowed
};

// Thread-safe limiter per arbitrary key (API key, tenant, ...). Each key owns a
// token bucket or a sliding window, chosen once at construction. Keys live in
// a striped map; a check touches exactly one shard.
class PerKeyRateLimiter : common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    enum class Algorithm {
        TokenBucket,
        SlidingWindow
    };

    struct Config {
        Algorithm algorithm{Algorithm::TokenBucket};
        double capacity{0.0};      // token bucket burst; <=0 disables
        double refillPerSec{0.0};  // token bucket refill
        size_t limit{0};           // sliding window admissions; 0 disables
        double windowSec{60.0};    // sliding window length
        double idleTtlSec{300.0};  // keys idle longer are removed by Sweep; <=0 keeps them
    };

    struct LimiterStats {
        bool enabled{false};
        Algorithm algorithm{Algorithm::TokenBucket};
        size_t trackedKeys{0};
        uint64_t admitted{0};
        uint64_t denied{0};
        uint64_t swept{0};
    };

    explicit PerKeyRateLimiter(Config cfg);

    bool Enabled() const;
    const Config& config() const { return cfg_; }

    // One unit for `key`. Never blocks.
    AdmissionDecision Check(const std::string& key);
    AdmissionDecision CheckAt(const std::string& key, Clock::time_point now);

    // `n` units at once or none; InsufficientTokens leaves the key untouched.
    common::Status<RateLimitError> Consume(const std::string& key, double n);
    common::Status<RateLimitError> ConsumeAt(const std::string& key, double n, Clock::time_point now);

    // Remaining units without consuming or refreshing the key's activity.
    double Peek(const std::string& key) const;
    double PeekAt(const std::string& key, Clock::time_point now) const;

    // Removes keys idle longer than idleTtlSec. Returns how many were removed.
    size_t Sweep();
    size_t SweepAt(Clock::time_point now);

    size_t Size() const;
    LimiterStats Stats() const;

private:
    struct Entry {
        std::unique_ptr<TokenBucket> bucket;
        std::unique_ptr<SlidingWindow> window;
        Clock::time_point lastActive;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    Entry& GetOrCreateLocked(Shard& shard, const std::string& key, Clock::time_point now);
    AdmissionDecision TakeAt(const std::string& key, double n, Clock::time_point now);
    double FullAmount() const;

    Config cfg_;
    common::Sharded<Shard> shards_;
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> denied_{0};
    std::atomic<uint64_t> swept_{0};
};

const char* ToString(PerKeyRateLimiter::Algorithm algorithm);

} // namespace monitor
} // namespace routecore
