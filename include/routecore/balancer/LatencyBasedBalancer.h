#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Latency-based balancer:
// - score = mean of the deployment's latency window (ms)
// - an empty window scores `coldStartLatencyMs` (0 by default, so new or
//   recovered deployments get probed before known ones)
// - lowest score wins, ties broken at random
class LatencyBasedBalancer : public Balancer {
public:
    explicit LatencyBasedBalancer(double coldStartLatencyMs = 0.0);
    ~LatencyBasedBalancer() override = default;

    Strategy strategy() const override { return Strategy::LatencyBased; }
    size_t Pick(const std::vector<Candidate>& candidates) override;

    double coldStartLatencyMs() const { return coldStartMs_; }

private:
    const double coldStartMs_;
};

} // namespace balancer
} // namespace routecore
