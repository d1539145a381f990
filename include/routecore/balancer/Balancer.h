#pragma once

#include "routecore/balancer/Deployment.h"
#include "routecore/balancer/RouterConfig.h"
#include "routecore/common/noncopyable.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace routecore {
namespace balancer {

// Per-selection view of one eligible deployment, read once from the live
// counters so a strategy scores a consistent set of numbers.
struct Candidate {
    DeploymentRef deployment;
    int64_t inFlight{0};
    bool hasLatency{false};
    double meanLatencyMs{0.0};
    double cost{0.0};
    UsageWindow usage;
};

// Selection strategy. Implementations are stateless apart from their policy
// knobs and may be called from many threads at once.
class Balancer : common::noncopyable {
public:
    virtual ~Balancer() = default;

    virtual Strategy strategy() const = 0;

    // Index of the chosen candidate. `candidates` is never empty.
    virtual size_t Pick(const std::vector<Candidate>& candidates) = 0;

protected:
    // Uniform pick among `indices` (non-empty), thread-local RNG.
    static size_t PickRandom(const std::vector<size_t>& indices);
    static size_t RandomBelow(size_t n);
};

std::unique_ptr<Balancer> MakeBalancer(const RouterConfig& cfg);

} // namespace balancer
} // namespace routecore
