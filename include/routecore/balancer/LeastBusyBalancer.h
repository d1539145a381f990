#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Least-busy balancer: smallest in-flight count wins, ties are broken
// uniformly at random so concurrent callers do not herd onto one node.
class LeastBusyBalancer : public Balancer {
public:
    LeastBusyBalancer() = default;
    ~LeastBusyBalancer() override = default;

    Strategy strategy() const override { return Strategy::LeastBusy; }
    size_t Pick(const std::vector<Candidate>& candidates) override;

    // Least-busy pick restricted to `indices` (non-empty). Used as the
    // tie-break of other strategies.
    static size_t PickAmong(const std::vector<Candidate>& candidates, const std::vector<size_t>& indices);
};

} // namespace balancer
} // namespace routecore
