#include "routecore/balancer/SimpleShuffleBalancer.h"

namespace routecore {
namespace balancer {

size_t SimpleShuffleBalancer::Pick(const std::vector<Candidate>& candidates) {
    return RandomBelow(candidates.size());
}

} // namespace balancer
} // namespace routecore
