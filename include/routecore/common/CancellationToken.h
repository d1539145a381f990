#pragma once

#include <atomic>

namespace routecore {
namespace common {

// Shared flag a caller flips to abandon a blocking wait (e.g. pool acquire).
// Waiters poll it, so cancellation is observed within one poll interval.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }
    void Reset() { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace common
} // namespace routecore
