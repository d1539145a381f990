#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Uniform random pick; ignores load and latency.
class SimpleShuffleBalancer : public Balancer {
public:
    SimpleShuffleBalancer() = default;
    ~SimpleShuffleBalancer() override = default;

    Strategy strategy() const override { return Strategy::SimpleShuffle; }
    size_t Pick(const std::vector<Candidate>& candidates) override;
};

} // namespace balancer
} // namespace routecore
