#include "routecore/balancer/UsageBasedBalancer.h"
#include "routecore/balancer/LeastBusyBalancer.h"

#include <limits>

namespace routecore {
namespace balancer {

UsageBasedBalancer::UsageBasedBalancer()
    : relative_(false), defaultRpmLimit_(0.0), defaultTpmLimit_(0.0) {}

UsageBasedBalancer::UsageBasedBalancer(double defaultRpmLimit, double defaultTpmLimit)
    : relative_(true),
      defaultRpmLimit_(defaultRpmLimit > 0.0 ? defaultRpmLimit : 1000.0),
      defaultTpmLimit_(defaultTpmLimit > 0.0 ? defaultTpmLimit : 100000.0) {}

double UsageBasedBalancer::Score(const Candidate& c) const {
    const double rpm = static_cast<double>(c.usage.rpm);
    const double tpm = static_cast<double>(c.usage.tpm);
    if (!relative_) return rpm + tpm;

    const auto& spec = c.deployment->spec();
    const double rpmLimit = spec.rpmLimit > 0 ? static_cast<double>(spec.rpmLimit) : defaultRpmLimit_;
    const double tpmLimit = spec.tpmLimit > 0 ? static_cast<double>(spec.tpmLimit) : defaultTpmLimit_;
    return rpm / rpmLimit + tpm / tpmLimit;
}

size_t UsageBasedBalancer::Pick(const std::vector<Candidate>& candidates) {
    double bestScore = std::numeric_limits<double>::infinity();
    std::vector<size_t> best;
    best.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const double score = Score(candidates[i]);
        if (score < bestScore) {
            bestScore = score;
            best.clear();
            best.push_back(i);
        } else if (score == bestScore) {
            best.push_back(i);
        }
    }
    if (best.empty()) return 0;
    return LeastBusyBalancer::PickAmong(candidates, best);
}

} // namespace balancer
} // namespace routecore
