#pragma once

#include "routecore/balancer/BackendConnectionPool.h"
#include "routecore/balancer/Deployment.h"
#include "routecore/balancer/RouterConfig.h"
#include "routecore/common/Config.h"
#include "routecore/monitor/PerKeyRateLimiter.h"

#include <cstddef>
#include <string>
#include <vector>

namespace routecore {
namespace common {

// Maps INI sections onto the component configuration objects:
//   [global]            log_level
//   [router]            RouterConfig + latency_window
//   [rate_limit]        PerKeyRateLimiter::Config
//   [pool]              BackendConnectionPool::Config
//   [deployment:<id>]   one DeploymentSpec per section
// Missing keys keep the struct defaults. Bad names log WARN and keep the default.
struct DeploymentEntry {
    balancer::DeploymentSpec spec;
    size_t maxConnections{0}; // per-backend pool limit; 0 = pool default
};

struct RuntimeSettings {
    std::string logLevel{"INFO"};
    balancer::RouterConfig router;
    size_t latencyWindow{32};
    monitor::PerKeyRateLimiter::Config rateLimit;
    balancer::BackendConnectionPool::Config pool;
    std::vector<DeploymentEntry> deployments; // in section-name order
};

class ConfigLoader {
public:
    static constexpr const char* kDeploymentPrefix = "deployment:";

    static RuntimeSettings Load(const Config& conf);

    static balancer::RouterConfig LoadRouter(const Config& conf);
    static monitor::PerKeyRateLimiter::Config LoadRateLimit(const Config& conf);
    static balancer::BackendConnectionPool::Config LoadPool(const Config& conf);
    static std::vector<DeploymentEntry> LoadDeployments(const Config& conf);

    // Section name for a deployment id.
    static std::string DeploymentSection(const std::string& id);
};

} // namespace common
} // namespace routecore
