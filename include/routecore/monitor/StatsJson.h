#pragma once

#include "routecore/balancer/BackendConnectionPool.h"
#include "routecore/balancer/DeploymentRegistry.h"
#include "routecore/balancer/Router.h"
#include "routecore/monitor/PerKeyRateLimiter.h"

#include <string>

namespace routecore {
namespace monitor {

// JSON rendering of the component Stats() snapshots, for whatever scrapes or
// prints them. Each section is optional; pass nullptr to leave it out.
class StatsJson {
public:
    struct Sources {
        const balancer::Router::RouterStats* router{nullptr};
        const balancer::DeploymentRegistry::RegistryStats* registry{nullptr};
        const PerKeyRateLimiter::LimiterStats* limiter{nullptr};
        const balancer::BackendConnectionPool::PoolStats* pool{nullptr};
    };

    static std::string ToJson(const Sources& src);

    static std::string RouterSection(const balancer::Router::RouterStats& s, int indent = 0);
    static std::string RegistrySection(const balancer::DeploymentRegistry::RegistryStats& s, int indent = 0);
    static std::string LimiterSection(const PerKeyRateLimiter::LimiterStats& s, int indent = 0);
    static std::string PoolSection(const balancer::BackendConnectionPool::PoolStats& s, int indent = 0);

    static std::string Escape(const std::string& in);
};

} // namespace monitor
} // namespace routecore
