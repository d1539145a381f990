#include "routecore/balancer/LatencyBasedBalancer.h"

#include <limits>

namespace routecore {
namespace balancer {

LatencyBasedBalancer::LatencyBasedBalancer(double coldStartLatencyMs)
    : coldStartMs_(coldStartLatencyMs >= 0.0 ? coldStartLatencyMs : 0.0) {}

size_t LatencyBasedBalancer::Pick(const std::vector<Candidate>& candidates) {
    double bestScore = std::numeric_limits<double>::infinity();
    std::vector<size_t> best;
    best.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        const double score = c.hasLatency ? c.meanLatencyMs : coldStartMs_;
        if (score < bestScore) {
            bestScore = score;
            best.clear();
            best.push_back(i);
        } else if (score == bestScore) {
            best.push_back(i);
        }
    }
    if (best.empty()) return 0;
    return PickRandom(best);
}

} // namespace balancer
} // namespace routecore
