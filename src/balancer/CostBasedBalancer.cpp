#include "routecore/balancer/CostBasedBalancer.h"
#include "routecore/balancer/LeastBusyBalancer.h"

#include <algorithm>
#include <limits>

namespace routecore {
namespace balancer {

CostBasedBalancer::CostBasedBalancer(double latencyToleranceMs, double coldStartLatencyMs)
    : toleranceMs_(latencyToleranceMs),
      coldStartMs_(coldStartLatencyMs >= 0.0 ? coldStartLatencyMs : 0.0) {}

size_t CostBasedBalancer::Pick(const std::vector<Candidate>& candidates) {
    auto latencyOf = [this](const Candidate& c) { return c.hasLatency ? c.meanLatencyMs : coldStartMs_; };

    double fastest = std::numeric_limits<double>::infinity();
    for (const auto& c : candidates) fastest = std::min(fastest, latencyOf(c));

    double bestCost = std::numeric_limits<double>::infinity();
    std::vector<size_t> cheapest;
    cheapest.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (toleranceMs_ >= 0.0 && latencyOf(c) > fastest + toleranceMs_) continue;
        if (c.cost < bestCost) {
            bestCost = c.cost;
            cheapest.clear();
            cheapest.push_back(i);
        } else if (c.cost == bestCost) {
            cheapest.push_back(i);
        }
    }
    // Only possible with non-finite latencies or costs.
    if (cheapest.empty()) return LeastBusyBalancer().Pick(candidates);
    return LeastBusyBalancer::PickAmong(candidates, cheapest);
}

} // namespace balancer
} // namespace routecore
