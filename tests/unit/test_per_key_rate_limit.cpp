#include "routecore/monitor/PerKeyRateLimiter.h"
#include "routecore/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

using routecore::monitor::PerKeyRateLimiter;
using routecore::monitor::RateLimitError;

static PerKeyRateLimiter::Config BucketConfig(double capacity, double refill) {
    PerKeyRateLimiter::Config cfg;
    cfg.algorithm = PerKeyRateLimiter::Algorithm::TokenBucket;
    cfg.capacity = capacity;
    cfg.refillPerSec = refill;
    cfg.idleTtlSec = 60.0;
    return cfg;
}

// Capacity 5, one token per second: five pass, the sixth is denied, one more after a second.
static void testBucketScenario() {
    PerKeyRateLimiter limiter(BucketConfig(5.0, 1.0));
    const auto t0 = PerKeyRateLimiter::Clock::now();
    for (int i = 0; i < 5; ++i) {
        auto d = limiter.CheckAt("tenant-a", t0);
        assert(d.allowed);
        assert(d.remaining == 4.0 - i);
    }
    auto denied = limiter.CheckAt("tenant-a", t0);
    assert(!denied.allowed);
    assert(std::fabs(denied.retryAfterSec - 1.0) < 1e-9);

    assert(limiter.CheckAt("tenant-a", t0 + std::chrono::seconds(1)).allowed);
    assert(!limiter.CheckAt("tenant-a", t0 + std::chrono::seconds(1)).allowed);

    // Other keys are independent and start full.
    assert(limiter.PeekAt("tenant-b", t0) == 5.0);
    assert(limiter.CheckAt("tenant-b", t0).allowed);

    const auto stats = limiter.Stats();
    assert(stats.enabled);
    assert(stats.trackedKeys == 2);
    assert(stats.admitted == 7);
    assert(stats.denied == 2);
}

static void testConsumeAllOrNothing() {
    PerKeyRateLimiter limiter(BucketConfig(5.0, 0.0));
    const auto t0 = PerKeyRateLimiter::Clock::now();

    auto st = limiter.ConsumeAt("k", 10.0, t0);
    assert(!st.ok());
    assert(st.error() == RateLimitError::InsufficientTokens);
    assert(limiter.PeekAt("k", t0) == 5.0);

    assert(limiter.ConsumeAt("k", 3.0, t0).ok());
    assert(limiter.PeekAt("k", t0) == 2.0);
    assert(!limiter.ConsumeAt("k", 3.0, t0).ok());
    assert(limiter.PeekAt("k", t0) == 2.0);
    assert(limiter.ConsumeAt("k", 2.0, t0).ok());
    assert(limiter.PeekAt("k", t0) == 0.0);
}

static void testSlidingWindowMode() {
    PerKeyRateLimiter::Config cfg;
    cfg.algorithm = PerKeyRateLimiter::Algorithm::SlidingWindow;
    cfg.limit = 3;
    cfg.windowSec = 1.0;
    PerKeyRateLimiter limiter(cfg);
    const auto t0 = PerKeyRateLimiter::Clock::now();

    assert(limiter.PeekAt("k", t0) == 3.0);
    for (int i = 0; i < 3; ++i) assert(limiter.CheckAt("k", t0).allowed);
    auto d = limiter.CheckAt("k", t0 + std::chrono::milliseconds(500));
    assert(!d.allowed);
    assert(d.remaining == 0.0);
    assert(std::fabs(d.retryAfterSec - 0.5) < 1e-6);
    assert(limiter.CheckAt("k", t0 + std::chrono::seconds(1)).allowed);

    assert(!limiter.ConsumeAt("k", 3.0, t0 + std::chrono::seconds(1)).ok());
    assert(limiter.ConsumeAt("k", 2.0, t0 + std::chrono::seconds(1)).ok());
}

// Huge or non-finite counts are denied without touching the key's state.
static void testOversizedConsumeDenied() {
    PerKeyRateLimiter::Config cfg;
    cfg.algorithm = PerKeyRateLimiter::Algorithm::SlidingWindow;
    cfg.limit = 5;
    cfg.windowSec = 60.0;
    PerKeyRateLimiter window(cfg);
    const auto t0 = PerKeyRateLimiter::Clock::now();

    auto st = window.ConsumeAt("k", 1e30, t0);
    assert(!st.ok());
    assert(st.error() == RateLimitError::InsufficientTokens);
    assert(!window.ConsumeAt("k", 6.0, t0).ok());
    assert(!window.ConsumeAt("k", std::nan(""), t0).ok());
    assert(window.PeekAt("k", t0) == 5.0);
    auto d = window.CheckAt("k", t0);
    assert(d.allowed);
    assert(d.remaining == 4.0);

    PerKeyRateLimiter bucket(BucketConfig(5.0, 1.0));
    assert(!bucket.ConsumeAt("k", 1e30, t0).ok());
    assert(bucket.PeekAt("k", t0) == 5.0);
    assert(bucket.ConsumeAt("k", 5.0, t0).ok());
}

static void testSweep() {
    PerKeyRateLimiter::Config cfg = BucketConfig(5.0, 1.0);
    cfg.idleTtlSec = 10.0;
    PerKeyRateLimiter limiter(cfg);
    const auto t0 = PerKeyRateLimiter::Clock::now();

    assert(limiter.CheckAt("old", t0).allowed);
    assert(limiter.CheckAt("fresh", t0 + std::chrono::seconds(8)).allowed);
    assert(limiter.Size() == 2);

    assert(limiter.SweepAt(t0 + std::chrono::seconds(5)) == 0);
    assert(limiter.SweepAt(t0 + std::chrono::seconds(11)) == 1);
    assert(limiter.Size() == 1);
    // Idempotent.
    assert(limiter.SweepAt(t0 + std::chrono::seconds(11)) == 0);
    assert(limiter.Stats().swept == 1);

    // A swept key comes back at full capacity.
    assert(limiter.PeekAt("old", t0 + std::chrono::seconds(11)) == 5.0);
    // Peek never creates state.
    assert(limiter.Size() == 1);
}

static void testDisabledAdmitsEverything() {
    PerKeyRateLimiter limiter(BucketConfig(0.0, 0.0));
    assert(!limiter.Enabled());
    for (int i = 0; i < 100; ++i) assert(limiter.Check("k").allowed);
    assert(limiter.Consume("k", 1e9).ok());
    assert(limiter.Size() == 0);

    PerKeyRateLimiter::Config sw;
    sw.algorithm = PerKeyRateLimiter::Algorithm::SlidingWindow;
    sw.limit = 0;
    PerKeyRateLimiter off(sw);
    assert(!off.Enabled());
    assert(off.Check("k").allowed);
}

static void testConcurrentSameKey() {
    PerKeyRateLimiter limiter(BucketConfig(100.0, 0.0));
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (limiter.Check("shared").allowed) admitted.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(admitted.load() == 100);
    assert(limiter.Stats().denied == 300);
}

int main() {
    routecore::common::Logger::Instance().SetLevel(routecore::common::LogLevel::INFO);
    testBucketScenario();
    testConsumeAllOrNothing();
    testSlidingWindowMode();
    testOversizedConsumeDenied();
    testSweep();
    testDisabledAdmitsEverything();
    testConcurrentSameKey();
    return 0;
}
