#include "routecore/balancer/LeastBusyBalancer.h"

#include <limits>
#include <numeric>

namespace routecore {
namespace balancer {

size_t LeastBusyBalancer::Pick(const std::vector<Candidate>& candidates) {
    std::vector<size_t> all(candidates.size());
    std::iota(all.begin(), all.end(), size_t{0});
    return PickAmong(candidates, all);
}

size_t LeastBusyBalancer::PickAmong(const std::vector<Candidate>& candidates, const std::vector<size_t>& indices) {
    int64_t best = std::numeric_limits<int64_t>::max();
    std::vector<size_t> ties;
    ties.reserve(indices.size());

    for (size_t i : indices) {
        const int64_t active = candidates[i].inFlight;
        if (active < best) {
            best = active;
            ties.clear();
            ties.push_back(i);
        } else if (active == best) {
            ties.push_back(i);
        }
    }
    return PickRandom(ties);
}

} // namespace balancer
} // namespace routecore
