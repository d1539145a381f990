#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Least-busy with a latency penalty:
// score = in_flight + mean_latency_ms / divisorMs (empty window counts as 0)
class LeastBusyWithPenaltyBalancer : public Balancer {
public:
    explicit LeastBusyWithPenaltyBalancer(double divisorMs = 100.0);
    ~LeastBusyWithPenaltyBalancer() override = default;

    Strategy strategy() const override { return Strategy::LeastBusyWithPenalty; }
    size_t Pick(const std::vector<Candidate>& candidates) override;

private:
    const double divisorMs_;
};

} // namespace balancer
} // namespace routecore
