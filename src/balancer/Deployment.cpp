#include "routecore/balancer/Deployment.h"
#include "routecore/common/Logger.h"

#include <stdexcept>
#include <utility>

namespace routecore {
namespace balancer {

namespace {

int64_t SecondOf(Deployment::Clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

} // namespace

const char* ToString(HealthState state) {
    switch (state) {
        case HealthState::Healthy: return "healthy";
        case HealthState::Cooling: return "cooling";
        default: return "unknown";
    }
}

Deployment::Deployment(DeploymentSpec spec, size_t latencyWindow)
    : spec_(std::move(spec)),
      window_(latencyWindow, 0.0) {
    if (latencyWindow == 0) {
        throw std::invalid_argument("Deployment latency window must be > 0");
    }
}

void Deployment::BeginDispatch() {
    inFlight_.fetch_add(1, std::memory_order_acq_rel);
}

void Deployment::EndDispatch() {
    int64_t cur = inFlight_.load(std::memory_order_acquire);
    while (cur > 0) {
        if (inFlight_.compare_exchange_weak(cur, cur - 1, std::memory_order_acq_rel)) return;
    }
}

void Deployment::ExpireCooldownLocked(Clock::time_point now) {
    if (!cooling_.load(std::memory_order_acquire)) return;
    if (now < cooldownUntil_) return;
    cooling_.store(false, std::memory_order_release);
    consecutiveFailures_.store(0, std::memory_order_release);
    LOG_INFO << "Deployment " << spec_.id << " recovered from cooldown";
}

HealthTransition Deployment::RecordOutcomeAt(Clock::time_point now,
                                             bool success,
                                             double latencyMs,
                                             uint64_t tokens,
                                             const HealthPolicy& policy) {
    EndDispatch();
    totalRequests_.fetch_add(1, std::memory_order_relaxed);
    if (tokens > 0) tokens_.fetch_add(tokens, std::memory_order_relaxed);
    if (success) {
        successes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failures_.fetch_add(1, std::memory_order_relaxed);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (latencyMs >= 0.0) {
        window_[windowNext_] = latencyMs;
        windowNext_ = (windowNext_ + 1) % window_.size();
        if (windowCount_ < window_.size()) ++windowCount_;
    }
    RecordUsageLocked(now, tokens);

    ExpireCooldownLocked(now);
    if (success) {
        consecutiveFailures_.store(0, std::memory_order_release);
        return HealthTransition::None;
    }

    const int failures = consecutiveFailures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (policy.failureThreshold <= 0) return HealthTransition::None;
    if (cooling_.load(std::memory_order_acquire)) return HealthTransition::None;
    if (failures < policy.failureThreshold) return HealthTransition::None;

    cooldownUntil_ = now + policy.cooldown;
    cooling_.store(true, std::memory_order_release);
    return HealthTransition::EnteredCooldown;
}

void Deployment::RecordUsageLocked(Clock::time_point now, uint64_t tokens) {
    const int64_t sec = SecondOf(now);
    const int64_t n = static_cast<int64_t>(kUsageBuckets);
    auto& b = usage_[static_cast<size_t>(((sec % n) + n) % n)];
    if (b.second != sec) {
        b.second = sec;
        b.requests = 0;
        b.tokens = 0;
    }
    b.requests += 1;
    b.tokens += tokens;
}

UsageWindow Deployment::UsageAt(Clock::time_point now) const {
    const int64_t sec = SecondOf(now);
    UsageWindow u;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& b : usage_) {
        // Buckets from the current second and the 59 before it.
        if (b.requests == 0 || b.second > sec || sec - b.second >= static_cast<int64_t>(kUsageBuckets)) continue;
        u.rpm += b.requests;
        u.tpm += b.tokens;
    }
    return u;
}

bool Deployment::ForceCooldownAt(Clock::time_point now, Clock::duration cooldown) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireCooldownLocked(now);
    if (cooling_.load(std::memory_order_acquire)) return false;
    cooldownUntil_ = now + cooldown;
    cooling_.store(true, std::memory_order_release);
    return true;
}

bool Deployment::IsHealthyAt(Clock::time_point now) {
    // Fast path: most deployments are healthy most of the time.
    if (!cooling_.load(std::memory_order_acquire)) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    ExpireCooldownLocked(now);
    return !cooling_.load(std::memory_order_acquire);
}

HealthState Deployment::StateAt(Clock::time_point now) const {
    if (!cooling_.load(std::memory_order_acquire)) return HealthState::Healthy;
    std::lock_guard<std::mutex> lock(mutex_);
    if (cooling_.load(std::memory_order_acquire) && now < cooldownUntil_) return HealthState::Cooling;
    return HealthState::Healthy;
}

Deployment::Clock::time_point Deployment::CooldownUntil() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooldownUntil_;
}

bool Deployment::MeanLatencyMs(double* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (windowCount_ == 0) return false;
    double sum = 0.0;
    for (size_t i = 0; i < windowCount_; ++i) sum += window_[i];
    if (out) *out = sum / static_cast<double>(windowCount_);
    return true;
}

std::vector<double> Deployment::LatencySamples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<double> out;
    out.reserve(windowCount_);
    // Until the ring wraps, the oldest sample sits at index 0.
    const size_t start = (windowCount_ < window_.size()) ? 0 : windowNext_;
    for (size_t i = 0; i < windowCount_; ++i) {
        out.push_back(window_[(start + i) % window_.size()]);
    }
    return out;
}

} // namespace balancer
} // namespace routecore
