#pragma once

#include "routecore/balancer/Deployment.h"
#include "routecore/common/Result.h"
#include "routecore/common/Sharded.h"
#include "routecore/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace routecore {
namespace balancer {

enum class RegistryError {
    DuplicateId,
    NotFound
};

const char* ToString(RegistryError err);

// Authoritative set of deployments and their live state.
//
// Two striped indexes: id -> deployment, and model -> copy-on-write list of
// deployments serving it. Register/Deregister lock the id shard first, then
// the model shard. Snapshot only touches the model shard and copies a
// shared_ptr, so routing reads never block on each other.
class DeploymentRegistry : common::noncopyable {
public:
    using Clock = Deployment::Clock;

    struct Config {
        size_t latencyWindow{32};
        int failureThreshold{3};  // <=0 disables automatic cooldown
        double cooldownSec{60.0};
    };

    struct DeploymentStats {
        std::string id;
        std::string model;
        std::string endpoint;
        int weight{1};
        double cost{0.0};
        int priority{0};
        HealthState state{HealthState::Healthy};
        double cooldownRemainingSec{0.0};
        int64_t inFlight{0};
        int consecutiveFailures{0};
        uint64_t totalRequests{0};
        uint64_t successes{0};
        uint64_t failures{0};
        uint64_t tokensServed{0};
        UsageWindow usage;
        bool hasLatency{false};
        double meanLatencyMs{0.0};
    };

    struct RegistryStats {
        size_t totalDeployments{0};
        size_t healthyDeployments{0};
        size_t coolingDeployments{0};
        int64_t totalInFlight{0};
        uint64_t totalRequests{0};
        uint64_t successes{0};
        uint64_t failures{0};
        uint64_t cooldownsEntered{0};
        std::vector<DeploymentStats> deployments; // sorted by id
    };

    DeploymentRegistry();
    explicit DeploymentRegistry(Config cfg);

    common::Status<RegistryError> Register(DeploymentSpec spec);
    common::Status<RegistryError> Deregister(const std::string& id);

    // Must be called exactly once per dispatched call. Decrements in-flight,
    // records the latency sample and drives the health state machine.
    // The id overloads resolve the record at report time: after Deregister and
    // a fresh Register of the same id they hit the new record. Calls that may
    // span registry changes should report through the DeploymentRef overloads.
    common::Status<RegistryError> ReportOutcome(const std::string& id, bool success, double latencyMs, uint64_t tokens = 0);
    common::Status<RegistryError> ReportOutcomeAt(const std::string& id,
                                                  bool success,
                                                  double latencyMs,
                                                  Clock::time_point now,
                                                  uint64_t tokens = 0);
    // Same, through the router's handle. Always lands on the record that was
    // selected, even after deregistration or re-registration of its id.
    void ReportOutcome(const DeploymentRef& d, bool success, double latencyMs, uint64_t tokens = 0);
    void ReportOutcomeAt(const DeploymentRef& d, bool success, double latencyMs, Clock::time_point now, uint64_t tokens = 0);

    // Correction path for a caller that selected a deployment but never
    // dispatched (or gave up on) the call: releases the in-flight slot without
    // touching health or latency.
    void AbandonDispatch(const DeploymentRef& d);
    common::Status<RegistryError> AbandonDispatch(const std::string& id);

    // Passive failover: cool the deployment down immediately.
    common::Status<RegistryError> MarkCooldown(const std::string& id);
    common::Status<RegistryError> MarkCooldownAt(const std::string& id, Clock::time_point now);

    // Healthy deployments serving `model`, in registration order. Applies lazy
    // cooldown expiry. Advisory: state may move on before the caller acts.
    std::vector<DeploymentRef> Snapshot(const std::string& model);
    std::vector<DeploymentRef> SnapshotAt(const std::string& model, Clock::time_point now);

    DeploymentRef Find(const std::string& id) const;
    std::vector<std::string> Ids() const;
    size_t Size() const { return size_.load(std::memory_order_acquire); }

    void SetHealthPolicy(int failureThreshold, double cooldownSec);
    HealthPolicy GetHealthPolicy() const;

    // Read-only; never applies lazy expiry.
    RegistryStats Stats() const;
    RegistryStats StatsAt(Clock::time_point now) const;

private:
    using DeploymentList = std::vector<DeploymentRef>;

    struct IdShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, DeploymentRef> byId;
    };

    struct ModelShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<const DeploymentList>> byModel;
    };

    void AddToModelIndex(const DeploymentRef& d);
    void RemoveFromModelIndex(const DeploymentRef& d);
    void OnTransition(const DeploymentRef& d, HealthTransition t, Clock::time_point now);

    const size_t latencyWindow_;
    std::atomic<int> failureThreshold_;
    std::atomic<int64_t> cooldownNs_;

    common::Sharded<IdShard> ids_;
    common::Sharded<ModelShard> models_;
    std::atomic<size_t> size_{0};
    std::atomic<uint64_t> cooldownsEntered_{0};
};

} // namespace balancer
} // namespace routecore
