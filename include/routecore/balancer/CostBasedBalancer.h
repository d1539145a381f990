#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Cost-based balancer:
// - candidates slower than (fastest mean latency + latencyToleranceMs) are
//   dropped; a negative tolerance keeps everyone
// - lowest static cost wins among the rest
// - equal cost falls back to least-busy (random among equally busy)
class CostBasedBalancer : public Balancer {
public:
    explicit CostBasedBalancer(double latencyToleranceMs = -1.0, double coldStartLatencyMs = 0.0);
    ~CostBasedBalancer() override = default;

    Strategy strategy() const override { return Strategy::CostBased; }
    size_t Pick(const std::vector<Candidate>& candidates) override;

private:
    const double toleranceMs_;
    const double coldStartMs_;
};

} // namespace balancer
} // namespace routecore
