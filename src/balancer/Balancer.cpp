#include "routecore/balancer/Balancer.h"
#include "routecore/balancer/CostBasedBalancer.h"
#include "routecore/balancer/LatencyBasedBalancer.h"
#include "routecore/balancer/LeastBusyBalancer.h"
#include "routecore/balancer/LeastBusyWithPenaltyBalancer.h"
#include "routecore/balancer/SimpleShuffleBalancer.h"
#include "routecore/balancer/UsageBasedBalancer.h"

#include <random>

namespace routecore {
namespace balancer {

size_t Balancer::RandomBelow(size_t n) {
    if (n <= 1) return 0;
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng);
}

size_t Balancer::PickRandom(const std::vector<size_t>& indices) {
    return indices[RandomBelow(indices.size())];
}

std::unique_ptr<Balancer> MakeBalancer(const RouterConfig& cfg) {
    switch (cfg.strategy) {
        case Strategy::SimpleShuffle:
            return std::make_unique<SimpleShuffleBalancer>();
        case Strategy::LatencyBased:
            return std::make_unique<LatencyBasedBalancer>(cfg.coldStartLatencyMs);
        case Strategy::CostBased:
            return std::make_unique<CostBasedBalancer>(cfg.costLatencyToleranceMs, cfg.coldStartLatencyMs);
        case Strategy::LeastBusyWithPenalty:
            return std::make_unique<LeastBusyWithPenaltyBalancer>(cfg.latencyPenaltyDivisorMs);
        case Strategy::UsageBased:
            return std::make_unique<UsageBasedBalancer>();
        case Strategy::UsageBasedV2:
            return std::make_unique<UsageBasedBalancer>(cfg.usageRpmCapacity, cfg.usageTpmCapacity);
        case Strategy::LeastBusy:
        default:
            return std::make_unique<LeastBusyBalancer>();
    }
}

} // namespace balancer
} // namespace routecore
