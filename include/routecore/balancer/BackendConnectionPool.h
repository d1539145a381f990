#pragma once

#include "routecore/common/CancellationToken.h"
#include "routecore/common/Result.h"
#include "routecore/common/Sharded.h"
#include "routecore/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace routecore {
namespace balancer {

enum class PoolError {
    PoolExhausted, // no free slot and the backend is at its maximum
    Timeout,       // bounded wait expired
    Cancelled,     // wait abandoned through the cancellation token
    UnknownSlot    // slot is not checked out from this pool
};

const char* ToString(PoolError err);

// One pooled connection. The pool keeps the authoritative record; the caller
// holds a copy while the slot is checked out and hands it back to Release,
// MarkUnhealthy or Close.
struct ConnectionSlot {
    uint64_t id{0};
    std::string backendId;
    std::chrono::steady_clock::time_point createdAt{};
    std::chrono::steady_clock::time_point lastUsedAt{};
    bool inUse{false};
    bool healthy{true};
};

// Per-backend pool of reusable connection slots (one in-flight call per slot).
// Tracks identity and lifecycle only; the transport lives outside.
//
// Each backend has its own mutex and condition variable; backends are found
// through a striped map, so traffic to different backends never shares a lock.
class BackendConnectionPool : common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    enum class AcquirePolicy {
        FailFast, // PoolExhausted immediately when at the maximum
        Wait      // block up to acquireTimeoutSec for a slot to come back
    };

    struct Config {
        size_t maxConnectionsPerBackend{32};
        double idleTtlSec{90.0};       // free slots idle longer are destroyed by CleanupExpired
        AcquirePolicy policy{AcquirePolicy::FailFast};
        double acquireTimeoutSec{1.0}; // used by AcquirePolicy::Wait
    };

    struct BackendStats {
        std::string backendId;
        size_t available{0};
        size_t inUse{0};
        size_t maxConnections{0};
        size_t waiters{0};
    };

    struct PoolStats {
        size_t backends{0};
        size_t totalAvailable{0};
        size_t totalInUse{0};
        uint64_t created{0};
        uint64_t reused{0};
        uint64_t destroyed{0};
        uint64_t exhausted{0};
        uint64_t timeouts{0};
        std::vector<BackendStats> perBackend; // sorted by backend id
    };

    BackendConnectionPool();
    explicit BackendConnectionPool(Config cfg);
    ~BackendConnectionPool() = default;

    // Reuses a free slot, else creates one below the backend maximum, else
    // applies the configured policy.
    common::Result<ConnectionSlot, PoolError> Acquire(const std::string& backendId);
    // Non-blocking acquire at an explicit time (tests, FailFast path).
    common::Result<ConnectionSlot, PoolError> AcquireAt(const std::string& backendId, Clock::time_point now);
    // Blocking acquire bounded by `timeout`; `cancel` may be null. On Timeout or
    // Cancelled nothing is left checked out.
    common::Result<ConnectionSlot, PoolError> AcquireWait(const std::string& backendId,
                                                          Clock::duration timeout,
                                                          const common::CancellationToken* cancel = nullptr);

    // Back to the free list with a fresh last-used time, or destroyed if the
    // slot was marked unhealthy.
    common::Status<PoolError> Release(const ConnectionSlot& slot);
    common::Status<PoolError> ReleaseAt(const ConnectionSlot& slot, Clock::time_point now);

    // The slot stays checked out but will be destroyed on Release.
    common::Status<PoolError> MarkUnhealthy(const ConnectionSlot& slot);

    // Destroys a checked-out slot immediately.
    common::Status<PoolError> Close(const ConnectionSlot& slot);

    // Destroys free slots idle longer than idleTtlSec and forgets backends with
    // nothing left in them. Returns the number of slots destroyed.
    size_t CleanupExpired();
    size_t CleanupExpiredAt(Clock::time_point now);

    // Per-backend maximum, overriding Config::maxConnectionsPerBackend. Lowering
    // it never destroys checked-out slots; surplus is destroyed on release.
    void SetBackendLimit(const std::string& backendId, size_t maxConnections);

    PoolStats Stats() const;

    const Config& config() const { return cfg_; }

private:
    struct Backend {
        std::mutex mutex;
        std::condition_variable cv;
        size_t maxConnections{0};
        bool limitOverridden{false};
        bool retired{false}; // dropped from the map by CleanupExpired
        std::vector<ConnectionSlot> free; // most recently used at the back
        std::unordered_map<uint64_t, ConnectionSlot> checkedOut;
        size_t waiters{0};

        size_t Total() const { return free.size() + checkedOut.size(); }
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<Backend>> backends;
    };

    std::shared_ptr<Backend> GetOrCreate(const std::string& backendId);
    std::shared_ptr<Backend> Find(const std::string& backendId) const;
    bool TryTakeLocked(Backend& b, const std::string& backendId, Clock::time_point now, ConnectionSlot* out);
    void DestroyLocked(Backend& b, uint64_t slotId);

    Config cfg_;
    common::Sharded<Shard> shards_;
    std::atomic<uint64_t> nextSlotId_{1};

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> reused_{0};
    std::atomic<uint64_t> destroyed_{0};
    std::atomic<uint64_t> exhausted_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace balancer
} // namespace routecore
