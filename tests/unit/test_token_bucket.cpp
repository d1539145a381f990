#include "routecore/monitor/TokenBucket.h"
#include "routecore/common/Logger.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <stdexcept>

using routecore::common::Logger;
using routecore::monitor::TokenBucket;

static void testBurstAndRefill() {
    TokenBucket bucket(/*qps*/ 10.0, /*burst*/ 5.0);

    auto t0 = TokenBucket::Clock::now();

    // Burst: allow 5 immediately.
    for (int i = 0; i < 5; ++i) {
        assert(bucket.AllowAt(t0, 1.0));
    }
    assert(!bucket.AllowAt(t0, 1.0));

    // After 100ms at 10 qps -> +1 token.
    auto t1 = t0 + std::chrono::milliseconds(100);
    assert(bucket.AllowAt(t1, 1.0));
    assert(!bucket.AllowAt(t1, 1.0));

    // After 5s more -> +50 tokens, capped by capacity 5.
    auto t2 = t1 + std::chrono::seconds(5);
    int allowed = 0;
    for (int i = 0; i < 10; ++i) {
        if (bucket.AllowAt(t2, 1.0)) ++allowed;
    }
    assert(allowed == 5);
}

// Capacity 5, one token per second.
static void testFivePerSecondScenario() {
    const auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(1.0, 5.0, t0);
    for (int i = 0; i < 5; ++i) assert(bucket.AllowAt(t0));
    assert(!bucket.AllowAt(t0));
    assert(!bucket.AllowAt(t0 + std::chrono::milliseconds(500)));
    assert(bucket.AllowAt(t0 + std::chrono::seconds(1)));
    assert(!bucket.AllowAt(t0 + std::chrono::seconds(1)));
}

static void testAllOrNothing() {
    const auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(0.0, 5.0, t0);
    assert(bucket.AllowAt(t0, 3.0));
    assert(!bucket.AllowAt(t0, 3.0));
    assert(bucket.AvailableAt(t0) == 2.0);
    assert(bucket.AllowAt(t0, 2.0));
    assert(bucket.AvailableAt(t0) == 0.0);
}

static void testRetryHint() {
    const auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(2.0, 4.0, t0);
    assert(bucket.SecondsUntilAt(t0, 1.0) == 0.0);
    assert(bucket.AllowAt(t0, 4.0));
    assert(std::fabs(bucket.SecondsUntilAt(t0, 1.0) - 0.5) < 1e-9);
    assert(std::isinf(bucket.SecondsUntilAt(t0, 5.0)));

    // Peek does not move the refill clock.
    const auto t1 = t0 + std::chrono::seconds(1);
    assert(bucket.PeekAt(t1) == 2.0);
    assert(bucket.PeekAt(t1) == 2.0);
    assert(bucket.AvailableAt(t1) == 2.0);

    TokenBucket frozen(0.0, 1.0, t0);
    assert(frozen.AllowAt(t0));
    assert(std::isinf(frozen.SecondsUntilAt(t0 + std::chrono::hours(1))));
}

static void testNonPositiveCostAllowed() {
    TokenBucket bucket(/*qps*/ 1.0, /*burst*/ 1.0);
    assert(bucket.AllowAt(TokenBucket::Clock::now(), 0.0));
    assert(bucket.AllowAt(TokenBucket::Clock::now(), -1.0));
}

static void testInvalidArguments() {
    bool threw = false;
    try {
        TokenBucket bad(1.0, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        TokenBucket bad(-1.0, 5.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    Logger::Instance().SetLevel(routecore::common::LogLevel::INFO);
    testBurstAndRefill();
    testFivePerSecondScenario();
    testAllOrNothing();
    testRetryHint();
    testNonPositiveCostAllowed();
    testInvalidArguments();
    return 0;
}
