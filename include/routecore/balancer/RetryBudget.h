#pragma once

#include <string>
#include <unordered_set>

namespace routecore {
namespace balancer {

// Caller-side bookkeeping for one logical request: which deployments were
// already tried and how many re-selections remain. The router never retries
// on its own; only the caller knows whether a failure is retryable.
class RetryBudget {
public:
    explicit RetryBudget(int maxRetries) : maxRetries_(maxRetries < 0 ? 0 : maxRetries) {}

    void RecordAttempt(const std::string& deploymentId) {
        tried_.insert(deploymentId);
        ++attempts_;
    }

    // True while another selection is allowed: the first attempt plus up to
    // maxRetries re-selections.
    bool CanAttempt() const { return attempts_ <= maxRetries_; }

    const std::unordered_set<std::string>& Tried() const { return tried_; }
    int Attempts() const { return attempts_; }
    int MaxRetries() const { return maxRetries_; }

private:
    const int maxRetries_;
    int attempts_{0};
    std::unordered_set<std::string> tried_;
};

} // namespace balancer
} // namespace routecore
