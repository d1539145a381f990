#include "routecore/balancer/RouterConfig.h"

namespace routecore {
namespace balancer {

const char* StrategyName(Strategy s) {
    switch (s) {
        case Strategy::SimpleShuffle: return "simple-shuffle";
        case Strategy::LeastBusy: return "least-busy";
        case Strategy::LatencyBased: return "latency-based-routing";
        case Strategy::CostBased: return "cost-based-routing";
        case Strategy::LeastBusyWithPenalty: return "least-busy-with-penalty";
        case Strategy::UsageBased: return "usage-based-routing";
        case Strategy::UsageBasedV2: return "usage-based-routing-v2";
        default: return "unknown";
    }
}

std::optional<Strategy> ParseStrategy(const std::string& name) {
    if (name == "simple-shuffle" || name == "shuffle") return Strategy::SimpleShuffle;
    if (name == "least-busy" || name == "leastbusy") return Strategy::LeastBusy;
    if (name == "latency-based-routing" || name == "latency") return Strategy::LatencyBased;
    if (name == "cost-based-routing" || name == "cost") return Strategy::CostBased;
    if (name == "least-busy-with-penalty") return Strategy::LeastBusyWithPenalty;
    if (name == "usage-based-routing" || name == "usage") return Strategy::UsageBased;
    if (name == "usage-based-routing-v2") return Strategy::UsageBasedV2;
    return std::nullopt;
}

} // namespace balancer
} // namespace routecore
