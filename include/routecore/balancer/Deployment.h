#pragma once

#include "routecore/common/noncopyable.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace routecore {
namespace balancer {

// Static identity of one backend deployment.
struct DeploymentSpec {
    std::string id;       // unique, stable
    std::string model;    // model name it serves
    std::string endpoint; // e.g. "https://eu.api.example.com/v1"
    int weight{1};
    double cost{0.0};     // relative cost per request; lower is cheaper
    int priority{0};
    uint64_t rpmLimit{0}; // usage-based-routing-v2 capacity; 0 = router default
    uint64_t tpmLimit{0};
};

enum class HealthState {
    Healthy,
    Cooling
};

const char* ToString(HealthState state);

struct HealthPolicy {
    int failureThreshold{3};                  // consecutive failures before cooldown; <=0 disables
    std::chrono::steady_clock::duration cooldown{std::chrono::seconds(60)};
};

// What an outcome did to the health state machine.
enum class HealthTransition {
    None,
    EnteredCooldown
};

// Requests and tokens finished during the last minute.
struct UsageWindow {
    uint64_t rpm{0};
    uint64_t tpm{0};
};

// One deployment plus its live state. Counters are atomics so the router can
// read them without locking; the latency window and health transitions are
// serialized by a per-deployment mutex.
class Deployment : common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    Deployment(DeploymentSpec spec, size_t latencyWindow);

    const DeploymentSpec& spec() const { return spec_; }
    const std::string& id() const { return spec_.id; }
    const std::string& model() const { return spec_.model; }

    // In-flight accounting. EndDispatch never takes the count below zero.
    void BeginDispatch();
    void EndDispatch();
    int64_t InFlight() const { return inFlight_.load(std::memory_order_acquire); }

    // Records a finished call: latency sample, counters, usage and health.
    HealthTransition RecordOutcomeAt(Clock::time_point now,
                                     bool success,
                                     double latencyMs,
                                     uint64_t tokens,
                                     const HealthPolicy& policy);

    // Passive failover: enter cooldown now, whatever the failure counter says.
    // Returns false if the deployment was already cooling.
    bool ForceCooldownAt(Clock::time_point now, Clock::duration cooldown);

    // Lazy expiry: a read past the cooldown end flips the deployment back to
    // Healthy and clears the consecutive failure counter.
    bool IsHealthyAt(Clock::time_point now);

    // Read-only view of the state at `now`; never applies the transition.
    HealthState StateAt(Clock::time_point now) const;
    Clock::time_point CooldownUntil() const;

    // Mean of the latency window; false when the window is empty.
    bool MeanLatencyMs(double* out) const;
    // Oldest sample first.
    std::vector<double> LatencySamples() const;
    size_t LatencyWindowSize() const { return window_.size(); }

    // Sliding 60 s usage, kept in one-second buckets.
    UsageWindow UsageAt(Clock::time_point now) const;

    int ConsecutiveFailures() const { return consecutiveFailures_.load(std::memory_order_acquire); }
    uint64_t TotalRequests() const { return totalRequests_.load(std::memory_order_relaxed); }
    uint64_t Successes() const { return successes_.load(std::memory_order_relaxed); }
    uint64_t Failures() const { return failures_.load(std::memory_order_relaxed); }
    uint64_t TokensServed() const { return tokens_.load(std::memory_order_relaxed); }

private:
    static constexpr size_t kUsageBuckets = 60;

    struct UsageBucket {
        int64_t second{0};
        uint64_t requests{0};
        uint64_t tokens{0};
    };

    void ExpireCooldownLocked(Clock::time_point now);
    void RecordUsageLocked(Clock::time_point now, uint64_t tokens);

    const DeploymentSpec spec_;

    std::atomic<int64_t> inFlight_{0};
    std::atomic<int> consecutiveFailures_{0};
    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> tokens_{0};
    std::atomic<bool> cooling_{false};

    mutable std::mutex mutex_;
    Clock::time_point cooldownUntil_{};

    // Ring buffer of the last N latencies.
    std::vector<double> window_;
    size_t windowNext_{0};
    size_t windowCount_{0};

    std::array<UsageBucket, kUsageBuckets> usage_{};
};

// Handle returned by the router. Keeps the record alive after deregistration
// so in-flight calls can still report their outcome.
using DeploymentRef = std::shared_ptr<Deployment>;

} // namespace balancer
} // namespace routecore
