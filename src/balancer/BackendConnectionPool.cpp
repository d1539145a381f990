#include "routecore/balancer/BackendConnectionPool.h"
#include "routecore/common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace routecore {
namespace balancer {

namespace {

// Waiters wake at least this often to observe their cancellation token.
constexpr auto kCancelPollInterval = std::chrono::milliseconds(10);

BackendConnectionPool::Clock::duration SecondsToDuration(double sec) {
    return std::chrono::duration_cast<BackendConnectionPool::Clock::duration>(std::chrono::duration<double>(sec));
}

} // namespace

const char* ToString(PoolError err) {
    switch (err) {
        case PoolError::PoolExhausted: return "PoolExhausted";
        case PoolError::Timeout: return "Timeout";
        case PoolError::Cancelled: return "Cancelled";
        case PoolError::UnknownSlot: return "UnknownSlot";
        default: return "Unknown";
    }
}

BackendConnectionPool::BackendConnectionPool() : BackendConnectionPool(Config()) {}

BackendConnectionPool::BackendConnectionPool(Config cfg) : cfg_(cfg) {
    if (cfg_.maxConnectionsPerBackend == 0) {
        throw std::invalid_argument("BackendConnectionPool maxConnectionsPerBackend must be > 0");
    }
    if (cfg_.acquireTimeoutSec < 0.0) cfg_.acquireTimeoutSec = 0.0;
}

std::shared_ptr<BackendConnectionPool::Backend> BackendConnectionPool::GetOrCreate(const std::string& backendId) {
    auto& shard = shards_.For(backendId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& b = shard.backends[backendId];
    if (!b) {
        b = std::make_shared<Backend>();
        b->maxConnections = cfg_.maxConnectionsPerBackend;
    }
    return b;
}

std::shared_ptr<BackendConnectionPool::Backend> BackendConnectionPool::Find(const std::string& backendId) const {
    const auto& shard = shards_.For(backendId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.backends.find(backendId);
    return it == shard.backends.end() ? nullptr : it->second;
}

bool BackendConnectionPool::TryTakeLocked(Backend& b,
                                          const std::string& backendId,
                                          Clock::time_point now,
                                          ConnectionSlot* out) {
    // Fast path: reuse the most recently returned slot.
    if (!b.free.empty()) {
        ConnectionSlot slot = std::move(b.free.back());
        b.free.pop_back();
        slot.inUse = true;
        b.checkedOut.emplace(slot.id, slot);
        *out = std::move(slot);
        reused_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (b.Total() >= b.maxConnections) return false;

    ConnectionSlot slot;
    slot.id = nextSlotId_.fetch_add(1, std::memory_order_relaxed);
    slot.backendId = backendId;
    slot.createdAt = now;
    slot.lastUsedAt = now;
    slot.inUse = true;
    slot.healthy = true;
    b.checkedOut.emplace(slot.id, slot);
    *out = std::move(slot);
    created_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void BackendConnectionPool::DestroyLocked(Backend& b, uint64_t slotId) {
    b.checkedOut.erase(slotId);
    destroyed_.fetch_add(1, std::memory_order_relaxed);
    b.cv.notify_one();
}

common::Result<ConnectionSlot, PoolError> BackendConnectionPool::Acquire(const std::string& backendId) {
    if (cfg_.policy == AcquirePolicy::Wait) {
        return AcquireWait(backendId, SecondsToDuration(cfg_.acquireTimeoutSec));
    }
    return AcquireAt(backendId, Clock::now());
}

common::Result<ConnectionSlot, PoolError> BackendConnectionPool::AcquireAt(const std::string& backendId,
                                                                           Clock::time_point now) {
    using R = common::Result<ConnectionSlot, PoolError>;
    while (true) {
        auto b = GetOrCreate(backendId);
        std::lock_guard<std::mutex> lock(b->mutex);
        if (b->retired) continue;

        ConnectionSlot slot;
        if (TryTakeLocked(*b, backendId, now, &slot)) return R::Ok(std::move(slot));

        exhausted_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG << "Pool exhausted for " << backendId << " (" << b->checkedOut.size() << "/" << b->maxConnections << " in use)";
        return R::Err(PoolError::PoolExhausted);
    }
}

common::Result<ConnectionSlot, PoolError> BackendConnectionPool::AcquireWait(const std::string& backendId,
                                                                             Clock::duration timeout,
                                                                             const common::CancellationToken* cancel) {
    using R = common::Result<ConnectionSlot, PoolError>;
    const auto deadline = Clock::now() + timeout;
    while (true) {
        auto b = GetOrCreate(backendId);
        std::unique_lock<std::mutex> lock(b->mutex);
        if (b->retired) continue;

        // A backend with waiters is never retired, so `b` stays valid while we wait.
        while (true) {
            if (cancel && cancel->IsCancelled()) {
                LOG_DEBUG << "Pool wait cancelled for " << backendId;
                return R::Err(PoolError::Cancelled);
            }
            const auto now = Clock::now();
            ConnectionSlot slot;
            if (TryTakeLocked(*b, backendId, now, &slot)) return R::Ok(std::move(slot));
            if (now >= deadline) {
                timeouts_.fetch_add(1, std::memory_order_relaxed);
                LOG_WARN << "Pool wait timed out for " << backendId << " (" << b->checkedOut.size() << "/"
                         << b->maxConnections << " in use)";
                return R::Err(PoolError::Timeout);
            }
            b->waiters += 1;
            b->cv.wait_until(lock, std::min<Clock::time_point>(deadline, now + kCancelPollInterval));
            b->waiters -= 1;
        }
    }
}

common::Status<PoolError> BackendConnectionPool::Release(const ConnectionSlot& slot) {
    return ReleaseAt(slot, Clock::now());
}

common::Status<PoolError> BackendConnectionPool::ReleaseAt(const ConnectionSlot& slot, Clock::time_point now) {
    using S = common::Status<PoolError>;
    auto b = Find(slot.backendId);
    if (!b) return S::Err(PoolError::UnknownSlot);

    std::lock_guard<std::mutex> lock(b->mutex);
    auto it = b->checkedOut.find(slot.id);
    if (it == b->checkedOut.end()) {
        LOG_WARN << "Release of slot " << slot.id << " not checked out from " << slot.backendId;
        return S::Err(PoolError::UnknownSlot);
    }

    // Unhealthy slots and surplus after a lowered limit are not reused.
    if (!it->second.healthy || b->Total() > b->maxConnections) {
        DestroyLocked(*b, slot.id);
        return S::Ok();
    }

    ConnectionSlot rec = std::move(it->second);
    b->checkedOut.erase(it);
    rec.inUse = false;
    rec.lastUsedAt = now;
    b->free.push_back(std::move(rec));
    b->cv.notify_one();
    return S::Ok();
}

common::Status<PoolError> BackendConnectionPool::MarkUnhealthy(const ConnectionSlot& slot) {
    using S = common::Status<PoolError>;
    auto b = Find(slot.backendId);
    if (!b) return S::Err(PoolError::UnknownSlot);

    std::lock_guard<std::mutex> lock(b->mutex);
    auto it = b->checkedOut.find(slot.id);
    if (it == b->checkedOut.end()) return S::Err(PoolError::UnknownSlot);
    it->second.healthy = false;
    LOG_DEBUG << "Slot " << slot.id << " of " << slot.backendId << " marked unhealthy";
    return S::Ok();
}

common::Status<PoolError> BackendConnectionPool::Close(const ConnectionSlot& slot) {
    using S = common::Status<PoolError>;
    auto b = Find(slot.backendId);
    if (!b) return S::Err(PoolError::UnknownSlot);

    std::lock_guard<std::mutex> lock(b->mutex);
    if (!b->checkedOut.count(slot.id)) return S::Err(PoolError::UnknownSlot);
    DestroyLocked(*b, slot.id);
    return S::Ok();
}

size_t BackendConnectionPool::CleanupExpired() {
    return CleanupExpiredAt(Clock::now());
}

size_t BackendConnectionPool::CleanupExpiredAt(Clock::time_point now) {
    const bool expire = cfg_.idleTtlSec > 0.0;
    const auto ttl = SecondsToDuration(cfg_.idleTtlSec);
    size_t removed = 0;
    size_t forgotten = 0;

    shards_.ForEach([&](Shard& shard) {
        std::lock_guard<std::mutex> shardLock(shard.mutex);
        for (auto it = shard.backends.begin(); it != shard.backends.end();) {
            Backend& b = *it->second;
            std::lock_guard<std::mutex> lock(b.mutex);
            if (expire) {
                const size_t before = b.free.size();
                b.free.erase(std::remove_if(b.free.begin(), b.free.end(),
                                            [&](const ConnectionSlot& s) { return now - s.lastUsedAt > ttl; }),
                             b.free.end());
                const size_t n = before - b.free.size();
                if (n > 0) {
                    removed += n;
                    destroyed_.fetch_add(n, std::memory_order_relaxed);
                    b.cv.notify_all();
                }
            }
            if (b.Total() == 0 && b.waiters == 0 && !b.limitOverridden) {
                b.retired = true;
                it = shard.backends.erase(it);
                ++forgotten;
            } else {
                ++it;
            }
        }
    });

    if (removed > 0 || forgotten > 0) {
        LOG_DEBUG << "Pool cleanup: " << removed << " idle slots destroyed, " << forgotten << " backends dropped";
    }
    return removed;
}

void BackendConnectionPool::SetBackendLimit(const std::string& backendId, size_t maxConnections) {
    if (maxConnections == 0) maxConnections = 1;
    while (true) {
        auto b = GetOrCreate(backendId);
        std::lock_guard<std::mutex> lock(b->mutex);
        if (b->retired) continue;
        b->maxConnections = maxConnections;
        b->limitOverridden = true;
        // Trim idle surplus right away; checked-out surplus goes on release.
        while (!b->free.empty() && b->Total() > b->maxConnections) {
            b->free.erase(b->free.begin());
            destroyed_.fetch_add(1, std::memory_order_relaxed);
        }
        b->cv.notify_all();
        LOG_INFO << "Pool limit for " << backendId << " set to " << maxConnections;
        return;
    }
}

BackendConnectionPool::PoolStats BackendConnectionPool::Stats() const {
    PoolStats out;
    shards_.ForEach([&out](const Shard& shard) {
        std::lock_guard<std::mutex> shardLock(shard.mutex);
        for (const auto& kv : shard.backends) {
            Backend& b = *kv.second;
            std::lock_guard<std::mutex> lock(b.mutex);
            BackendStats s;
            s.backendId = kv.first;
            s.available = b.free.size();
            s.inUse = b.checkedOut.size();
            s.maxConnections = b.maxConnections;
            s.waiters = b.waiters;
            out.totalAvailable += s.available;
            out.totalInUse += s.inUse;
            out.perBackend.push_back(std::move(s));
        }
    });
    out.backends = out.perBackend.size();
    out.created = created_.load(std::memory_order_relaxed);
    out.reused = reused_.load(std::memory_order_relaxed);
    out.destroyed = destroyed_.load(std::memory_order_relaxed);
    out.exhausted = exhausted_.load(std::memory_order_relaxed);
    out.timeouts = timeouts_.load(std::memory_order_relaxed);
    std::sort(out.perBackend.begin(), out.perBackend.end(),
              [](const BackendStats& a, const BackendStats& b) { return a.backendId < b.backendId; });
    return out;
}

} // namespace balancer
} // namespace routecore
