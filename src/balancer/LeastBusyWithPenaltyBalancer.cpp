#include "routecore/balancer/LeastBusyWithPenaltyBalancer.h"

#include <limits>

namespace routecore {
namespace balancer {

LeastBusyWithPenaltyBalancer::LeastBusyWithPenaltyBalancer(double divisorMs)
    : divisorMs_(divisorMs > 0.0 ? divisorMs : 100.0) {}

size_t LeastBusyWithPenaltyBalancer::Pick(const std::vector<Candidate>& candidates) {
    double bestScore = std::numeric_limits<double>::infinity();
    std::vector<size_t> best;
    best.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        const double latency = c.hasLatency ? c.meanLatencyMs : 0.0;
        const double score = static_cast<double>(c.inFlight) + latency / divisorMs_;
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
