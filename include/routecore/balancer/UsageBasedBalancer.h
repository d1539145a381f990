#pragma once

#include "routecore/balancer/Balancer.h"

namespace routecore {
namespace balancer {

// Usage-based balancer over each deployment's last-minute usage:
// - v1: score = rpm + tpm
// - v2: score = rpm / rpm_limit + tpm / tpm_limit, limits from the deployment
//   spec or the router defaults
// Lowest score wins, ties go to the least busy.
class UsageBasedBalancer : public Balancer {
public:
    UsageBasedBalancer();
    UsageBasedBalancer(double defaultRpmLimit, double defaultTpmLimit);
    ~UsageBasedBalancer() override = default;

    Strategy strategy() const override { return relative_ ? Strategy::UsageBasedV2 : Strategy::UsageBased; }
    size_t Pick(const std::vector<Candidate>& candidates) override;

    double Score(const Candidate& c) const;

private:
    const bool relative_;
    const double defaultRpmLimit_;
    const double defaultTpmLimit_;
};

} // namespace balancer
} // namespace routecore
