#include "routecore/balancer/BackendConnectionPool.h"
#include "routecore/common/CancellationToken.h"
#include "routecore/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using routecore::balancer::BackendConnectionPool;
using routecore::balancer::ConnectionSlot;
using routecore::balancer::PoolError;
using routecore::common::CancellationToken;

static BackendConnectionPool::Config SmallPool(size_t max, double idleTtlSec = 90.0) {
    BackendConnectionPool::Config cfg;
    cfg.maxConnectionsPerBackend = max;
    cfg.idleTtlSec = idleTtlSec;
    return cfg;
}

// Copy of one backend's counters; empty backendId when the pool does not know it.
static BackendConnectionPool::BackendStats BackendOf(const BackendConnectionPool::PoolStats& s, const std::string& id) {
    for (const auto& b : s.perBackend) {
        if (b.backendId == id) return b;
    }
    return BackendConnectionPool::BackendStats();
}

static void testAcquireReleaseReuse() {
    BackendConnectionPool pool(SmallPool(4));
    const auto t0 = BackendConnectionPool::Clock::now();
    auto a = pool.AcquireAt("eu", t0);
    assert(a.ok());
    assert(a->backendId == "eu");
    assert(a->inUse);
    assert(a->healthy);
    const uint64_t id = a->id;

    const auto t1 = t0 + std::chrono::seconds(3);
    assert(pool.ReleaseAt(a.value(), t1).ok());

    auto b = pool.AcquireAt("eu", t1);
    assert(b.ok());
    assert(b->id == id);
    assert(b->lastUsedAt == t1);
    assert(b->createdAt == t0);

    const auto stats = pool.Stats();
    assert(stats.created == 1);
    assert(stats.reused == 1);
    assert(stats.totalInUse == 1);
    assert(stats.totalAvailable == 0);
}

static void testExhaustion() {
    BackendConnectionPool pool(SmallPool(2));
    auto a = pool.Acquire("eu");
    auto b = pool.Acquire("eu");
    assert(a.ok() && b.ok());
    assert(a->id != b->id);

    auto c = pool.Acquire("eu");
    assert(!c.ok());
    assert(c.error() == PoolError::PoolExhausted);

    // Other backends have their own budget.
    auto other = pool.Acquire("us");
    assert(other.ok());

    assert(pool.Release(a.value()).ok());
    auto d = pool.Acquire("eu");
    assert(d.ok());
    assert(d->id == a->id);

    const auto stats = pool.Stats();
    assert(stats.exhausted == 1);
    assert(stats.backends == 2);
    const auto eu = BackendOf(stats, "eu");
    assert(eu.inUse == 2 && eu.available == 0 && eu.maxConnections == 2);
}

static void testUnhealthyNotReused() {
    BackendConnectionPool pool(SmallPool(1));
    auto a = pool.Acquire("eu");
    assert(a.ok());
    assert(pool.MarkUnhealthy(a.value()).ok());
    assert(pool.Release(a.value()).ok());

    auto b = pool.Acquire("eu");
    assert(b.ok());
    assert(b->id != a->id);
    assert(pool.Stats().destroyed == 1);
}

static void testUnknownSlotAndClose() {
    BackendConnectionPool pool(SmallPool(2));
    auto a = pool.Acquire("eu");
    assert(a.ok());
    assert(pool.Release(a.value()).ok());
    auto again = pool.Release(a.value());
    assert(!again.ok());
    assert(again.error() == PoolError::UnknownSlot);
    assert(!pool.MarkUnhealthy(a.value()).ok());

    ConnectionSlot stray;
    stray.id = 999;
    stray.backendId = "nowhere";
    assert(pool.Release(stray).error() == PoolError::UnknownSlot);

    auto b = pool.Acquire("eu");
    assert(b.ok());
    assert(pool.Close(b.value()).ok());
    assert(pool.Close(b.value()).error() == PoolError::UnknownSlot);
    const auto eu = BackendOf(pool.Stats(), "eu");
    assert(eu.backendId == "eu" && eu.inUse == 0 && eu.available == 0);
}

static void testCleanupExpired() {
    BackendConnectionPool pool(SmallPool(4, /*idleTtlSec*/ 10.0));
    const auto t0 = BackendConnectionPool::Clock::now();
    auto a = pool.AcquireAt("eu", t0);
    auto b = pool.AcquireAt("eu", t0);
    assert(a.ok() && b.ok());
    assert(pool.ReleaseAt(a.value(), t0).ok());

    assert(pool.CleanupExpiredAt(t0 + std::chrono::seconds(5)) == 0);
    // Only free slots expire; the checked-out one stays.
    assert(pool.CleanupExpiredAt(t0 + std::chrono::seconds(11)) == 1);
    assert(pool.CleanupExpiredAt(t0 + std::chrono::seconds(11)) == 0);
    const auto eu = BackendOf(pool.Stats(), "eu");
    assert(eu.inUse == 1 && eu.available == 0);

    // Once everything is gone the backend itself is forgotten.
    assert(pool.ReleaseAt(b.value(), t0 + std::chrono::seconds(12)).ok());
    assert(pool.CleanupExpiredAt(t0 + std::chrono::seconds(30)) == 1);
    assert(pool.Stats().backends == 0);

    // And comes back on demand.
    assert(pool.AcquireAt("eu", t0 + std::chrono::seconds(31)).ok());
}

static void testWaitTimeout() {
    BackendConnectionPool pool(SmallPool(1));
    auto held = pool.Acquire("eu");
    assert(held.ok());

    const auto start = std::chrono::steady_clock::now();
    auto r = pool.AcquireWait("eu", std::chrono::milliseconds(50));
    const auto waited = std::chrono::steady_clock::now() - start;
    assert(!r.ok());
    assert(r.error() == PoolError::Timeout);
    assert(waited >= std::chrono::milliseconds(50));

    const auto stats = pool.Stats();
    assert(stats.timeouts == 1);
    assert(stats.totalInUse == 1);
    assert(BackendOf(stats, "eu").waiters == 0);
}

static void testWaitCancelled() {
    BackendConnectionPool pool(SmallPool(1));
    auto held = pool.Acquire("eu");
    assert(held.ok());

    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto r = pool.AcquireWait("eu", std::chrono::seconds(10), &token);
    const auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    assert(!r.ok());
    assert(r.error() == PoolError::Cancelled);
    assert(waited < std::chrono::seconds(5));
    assert(pool.Stats().totalInUse == 1);
}

static void testWaitSucceedsOnRelease() {
    BackendConnectionPool::Config cfg = SmallPool(1);
    cfg.policy = BackendConnectionPool::AcquirePolicy::Wait;
    cfg.acquireTimeoutSec = 5.0;
    BackendConnectionPool pool(cfg);
    auto held = pool.Acquire("eu");
    assert(held.ok());

    std::thread releaser([&pool, &held]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(pool.Release(held.value()).ok());
    });
    auto r = pool.Acquire("eu");
    releaser.join();
    assert(r.ok());
    assert(r->id == held->id);
}

static void testBackendLimitOverride() {
    BackendConnectionPool pool(SmallPool(4));
    pool.SetBackendLimit("tiny", 1);
    auto a = pool.Acquire("tiny");
    assert(a.ok());
    assert(pool.Acquire("tiny").error() == PoolError::PoolExhausted);

    // Lowering below what is checked out: surplus is destroyed on release.
    auto x = pool.Acquire("eu");
    auto y = pool.Acquire("eu");
    assert(x.ok() && y.ok());
    pool.SetBackendLimit("eu", 1);
    assert(pool.Release(x.value()).ok());
    assert(pool.Release(y.value()).ok());
    const auto eu = BackendOf(pool.Stats(), "eu");
    assert(eu.available == 1 && eu.inUse == 0 && eu.maxConnections == 1);

    // Overridden backends survive cleanup even when empty.
    assert(pool.Release(a.value()).ok());
    pool.CleanupExpiredAt(BackendConnectionPool::Clock::now() + std::chrono::hours(1));
    const auto tiny = BackendOf(pool.Stats(), "tiny");
    assert(tiny.backendId == "tiny" && tiny.maxConnections == 1);
}

static void testConcurrentInvariant() {
    const size_t kMax = 4;
    BackendConnectionPool pool(SmallPool(kMax));
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<bool> violated{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 500; ++i) {
                auto s = pool.Acquire("eu");
                if (!s) continue;
                const int now = active.fetch_add(1) + 1;
                int p = peak.load();
                while (now > p && !peak.compare_exchange_weak(p, now)) {
                }
                const auto b = BackendOf(pool.Stats(), "eu");
                if (b.inUse == 0 || b.inUse + b.available > kMax) violated.store(true);
                active.fetch_sub(1);
                if (i % 7 == 0) {
                    if (!pool.MarkUnhealthy(s.value()).ok()) violated.store(true);
                }
                if (!pool.Release(s.value()).ok()) violated.store(true);
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(!violated.load());
    assert(peak.load() <= static_cast<int>(kMax));
    const auto stats = pool.Stats();
    assert(stats.totalInUse == 0);
    assert(stats.totalAvailable <= kMax);
    assert(stats.created - stats.destroyed == stats.totalAvailable);
}

static void testInvalidConfig() {
    bool threw = false;
    try {
        BackendConnectionPool pool(SmallPool(0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    routecore::common::Logger::Instance().SetLevel(routecore::common::LogLevel::ERROR);
    testAcquireReleaseReuse();
    testExhaustion();
    testUnhealthyNotReused();
    testUnknownSlotAndClose();
    testCleanupExpired();
    testWaitTimeout();
    testWaitCancelled();
    testWaitSucceedsOnRelease();
    testBackendLimitOverride();
    testConcurrentInvariant();
    testInvalidConfig();
    return 0;
}
