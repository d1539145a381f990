#pragma once

#include <optional>
#include <string>

namespace routecore {
namespace balancer {

enum class Strategy {
    SimpleShuffle,
    LeastBusy,
    LatencyBased,
    CostBased,
    LeastBusyWithPenalty,
    UsageBased,
    UsageBasedV2
};

// "simple-shuffle", "least-busy", "latency-based-routing", "cost-based-routing",
// "least-busy-with-penalty", "usage-based-routing", "usage-based-routing-v2".
const char* StrategyName(Strategy s);
std::optional<Strategy> ParseStrategy(const std::string& name);

// Immutable once handed to a Router; Router::UpdateConfig swaps in a new copy.
struct RouterConfig {
    Strategy strategy{Strategy::LeastBusy};

    // Health state machine.
    double cooldownSec{60.0};
    int failureThreshold{3};

    // Caller-side retry orchestration.
    int maxRetries{2};
    double timeoutSec{30.0};            // per attempt
    double healthCheckIntervalSec{5.0}; // period of the external TTL sweeps

    // Strategy policy.
    double coldStartLatencyMs{0.0};       // LatencyBased: score of an empty latency window
    double costLatencyToleranceMs{-1.0};  // CostBased: max distance from the fastest; <0 = no limit
    double latencyPenaltyDivisorMs{100.0}; // LeastBusyWithPenalty: in_flight + latency / divisor
    double usageRpmCapacity{1000.0};       // UsageBasedV2: per-deployment defaults when the
    double usageTpmCapacity{100000.0};     // spec carries no rpm/tpm limit
};

} // namespace balancer
} // namespace routecore
