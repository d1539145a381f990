#pragma once

#include "routecore/balancer/Balancer.h"
#include "routecore/balancer/DeploymentRegistry.h"
#include "routecore/balancer/RetryBudget.h"
#include "routecore/balancer/RouterConfig.h"
#include "routecore/common/Result.h"
#include "routecore/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>

namespace routecore {
namespace balancer {

enum class RoutingError {
    NoAvailableDeployment,
    Timeout
};

const char* ToString(RoutingError err);

// Picks a deployment for a model using the configured strategy over a
// registry snapshot, and counts the pick as in-flight before returning it.
// The caller owns the rest of the lifecycle: exactly one
// DeploymentRegistry::ReportOutcome (or AbandonDispatch) per successful Select.
class Router : common::noncopyable {
public:
    using Clock = DeploymentRegistry::Clock;
    using ExcludeSet = std::unordered_set<std::string>;

    struct RouterStats {
        std::string strategy;
        uint64_t requests{0};
        uint64_t selected{0};
        uint64_t noAvailable{0};
        uint64_t configUpdates{0};
    };

    Router(DeploymentRegistry& registry, RouterConfig cfg);

    common::Result<DeploymentRef, RoutingError> Select(const std::string& model);
    common::Result<DeploymentRef, RoutingError> Select(const std::string& model, const ExcludeSet& excludeIds);
    common::Result<DeploymentRef, RoutingError> SelectAt(const std::string& model,
                                                         const ExcludeSet& excludeIds,
                                                         Clock::time_point now);

    // Re-selection for a retry: excludes everything already tried and records
    // the new attempt. Fails NoAvailableDeployment once the budget is spent.
    common::Result<DeploymentRef, RoutingError> SelectWithBudget(const std::string& model, RetryBudget& budget);

    RetryBudget NewRetryBudget() const;

    // Atomically replaces configuration and strategy. Calls already inside
    // Select finish with the configuration they started with.
    void UpdateConfig(RouterConfig cfg);
    RouterConfig GetConfig() const;

    RouterStats GetStats() const;

    DeploymentRegistry& registry() { return registry_; }

private:
    struct Active {
        RouterConfig cfg;
        std::shared_ptr<Balancer> balancer;
    };

    std::shared_ptr<const Active> Current() const;

    DeploymentRegistry& registry_;
    std::shared_ptr<const Active> active_; // accessed through std::atomic_load/store

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> selected_{0};
    std::atomic<uint64_t> noAvailable_{0};
    std::atomic<uint64_t> configUpdates_{0};
};

} // namespace balancer
} // namespace routecore
