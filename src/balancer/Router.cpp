#include "routecore/balancer/Router.h"
#include "routecore/common/Logger.h"

#include <utility>
#include <vector>

namespace routecore {
namespace balancer {

const char* ToString(RoutingError err) {
    switch (err) {
        case RoutingError::NoAvailableDeployment: return "NoAvailableDeployment";
        case RoutingError::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

Router::Router(DeploymentRegistry& registry, RouterConfig cfg)
    : registry_(registry) {
    registry_.SetHealthPolicy(cfg.failureThreshold, cfg.cooldownSec);
    auto active = std::make_shared<Active>();
    active->balancer = MakeBalancer(cfg);
    active->cfg = std::move(cfg);
    std::atomic_store(&active_, std::shared_ptr<const Active>(std::move(active)));
    LOG_INFO << "Router strategy: " << StrategyName(GetConfig().strategy);
}

std::shared_ptr<const Router::Active> Router::Current() const {
    return std::atomic_load(&active_);
}

common::Result<DeploymentRef, RoutingError> Router::Select(const std::string& model) {
    static const ExcludeSet kNone;
    return SelectAt(model, kNone, Clock::now());
}

common::Result<DeploymentRef, RoutingError> Router::Select(const std::string& model, const ExcludeSet& excludeIds) {
    return SelectAt(model, excludeIds, Clock::now());
}

common::Result<DeploymentRef, RoutingError> Router::SelectAt(const std::string& model,
                                                             const ExcludeSet& excludeIds,
                                                             Clock::time_point now) {
    using R = common::Result<DeploymentRef, RoutingError>;
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto active = Current();

    std::vector<Candidate> candidates;
    for (auto& d : registry_.SnapshotAt(model, now)) {
        if (!excludeIds.empty() && excludeIds.count(d->id())) continue;
        Candidate c;
        c.inFlight = d->InFlight();
        c.hasLatency = d->MeanLatencyMs(&c.meanLatencyMs);
        c.cost = d->spec().cost;
        c.usage = d->UsageAt(now);
        c.deployment = std::move(d);
        candidates.push_back(std::move(c));
    }

    if (candidates.empty()) {
        noAvailable_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG << "No available deployment for model " << model << " (excluded " << excludeIds.size() << ")";
        return R::Err(RoutingError::NoAvailableDeployment);
    }

    const size_t idx = active->balancer->Pick(candidates);
    DeploymentRef chosen = candidates[idx < candidates.size() ? idx : 0].deployment;
    chosen->BeginDispatch();
    selected_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG << "Selected " << chosen->id() << " for " << model << " via " << StrategyName(active->balancer->strategy());
    return R::Ok(std::move(chosen));
}

common::Result<DeploymentRef, RoutingError> Router::SelectWithBudget(const std::string& model, RetryBudget& budget) {
    if (!budget.CanAttempt()) {
        noAvailable_.fetch_add(1, std::memory_order_relaxed);
        return common::Result<DeploymentRef, RoutingError>::Err(RoutingError::NoAvailableDeployment);
    }
    auto res = Select(model, budget.Tried());
    if (res) budget.RecordAttempt(res.value()->id());
    return res;
}

RetryBudget Router::NewRetryBudget() const {
    return RetryBudget(Current()->cfg.maxRetries);
}

void Router::UpdateConfig(RouterConfig cfg) {
    auto next = std::make_shared<Active>();
    next->balancer = MakeBalancer(cfg);
    next->cfg = std::move(cfg);
    registry_.SetHealthPolicy(next->cfg.failureThreshold, next->cfg.cooldownSec);
    const Strategy s = next->cfg.strategy;
    std::atomic_store(&active_, std::shared_ptr<const Active>(std::move(next)));
    configUpdates_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO << "Router config updated, strategy: " << StrategyName(s);
}

RouterConfig Router::GetConfig() const {
    return Current()->cfg;
}

Router::RouterStats Router::GetStats() const {
    RouterStats s;
    s.strategy = StrategyName(Current()->cfg.strategy);
    s.requests = requests_.load(std::memory_order_relaxed);
    s.selected = selected_.load(std::memory_order_relaxed);
    s.noAvailable = noAvailable_.load(std::memory_order_relaxed);
    s.configUpdates = configUpdates_.load(std::memory_order_relaxed);
    return s;
}

} // namespace balancer
} // namespace routecore
