#include "routecore/common/ConfigLoader.h"
#include "routecore/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace routecore {
namespace common {

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t NonNegative(int v) {
    return v < 0 ? 0 : static_cast<size_t>(v);
}

} // namespace

std::string ConfigLoader::DeploymentSection(const std::string& id) {
    return std::string(kDeploymentPrefix) + id;
}

balancer::RouterConfig ConfigLoader::LoadRouter(const Config& conf) {
    balancer::RouterConfig rc;
    const std::string strategy = conf.GetString("router", "strategy", "");
    if (!strategy.empty()) {
        auto parsed = balancer::ParseStrategy(strategy);
        if (parsed) {
            rc.strategy = *parsed;
        } else {
            LOG_WARN << "Unknown routing strategy '" << strategy << "', using " << balancer::StrategyName(rc.strategy);
        }
    }
    rc.cooldownSec = conf.GetDouble("router", "cooldown_sec", rc.cooldownSec);
    rc.failureThreshold = conf.GetInt("router", "failure_threshold", rc.failureThreshold);
    rc.maxRetries = conf.GetInt("router", "max_retries", rc.maxRetries);
    rc.timeoutSec = conf.GetDouble("router", "timeout_sec", rc.timeoutSec);
    rc.healthCheckIntervalSec = conf.GetDouble("router", "health_check_interval_sec", rc.healthCheckIntervalSec);
    rc.coldStartLatencyMs = conf.GetDouble("router", "cold_start_latency_ms", rc.coldStartLatencyMs);
    rc.costLatencyToleranceMs = conf.GetDouble("router", "cost_latency_tolerance_ms", rc.costLatencyToleranceMs);
    rc.latencyPenaltyDivisorMs = conf.GetDouble("router", "latency_penalty_divisor_ms", rc.latencyPenaltyDivisorMs);
    rc.usageRpmCapacity = conf.GetDouble("router", "usage_rpm_capacity", rc.usageRpmCapacity);
    rc.usageTpmCapacity = conf.GetDouble("router", "usage_tpm_capacity", rc.usageTpmCapacity);

    if (rc.cooldownSec < 0.0) {
        LOG_WARN << "router.cooldown_sec < 0, using 0";
        rc.cooldownSec = 0.0;
    }
    if (rc.maxRetries < 0) {
        LOG_WARN << "router.max_retries < 0, using 0";
        rc.maxRetries = 0;
    }
    if (rc.latencyPenaltyDivisorMs <= 0.0) {
        LOG_WARN << "router.latency_penalty_divisor_ms must be > 0, using 100";
        rc.latencyPenaltyDivisorMs = 100.0;
    }
    if (rc.usageRpmCapacity <= 0.0) {
        LOG_WARN << "router.usage_rpm_capacity must be > 0, using 1000";
        rc.usageRpmCapacity = 1000.0;
    }
    if (rc.usageTpmCapacity <= 0.0) {
        LOG_WARN << "router.usage_tpm_capacity must be > 0, using 100000";
        rc.usageTpmCapacity = 100000.0;
    }
    return rc;
}

monitor::PerKeyRateLimiter::Config ConfigLoader::LoadRateLimit(const Config& conf) {
    using Algorithm = monitor::PerKeyRateLimiter::Algorithm;
    monitor::PerKeyRateLimiter::Config rl;
    const std::string algo = Lower(conf.GetString("rate_limit", "algorithm", ""));
    if (algo == "token_bucket" || algo == "token-bucket") {
        rl.algorithm = Algorithm::TokenBucket;
    } else if (algo == "sliding_window" || algo == "sliding-window") {
        rl.algorithm = Algorithm::SlidingWindow;
    } else if (!algo.empty()) {
        LOG_WARN << "Unknown rate_limit.algorithm '" << algo << "', using " << monitor::ToString(rl.algorithm);
    }
    rl.capacity = conf.GetDouble("rate_limit", "capacity", rl.capacity);
    rl.refillPerSec = conf.GetDouble("rate_limit", "refill_per_sec", rl.refillPerSec);
    rl.limit = NonNegative(conf.GetInt("rate_limit", "limit", static_cast<int>(rl.limit)));
    rl.windowSec = conf.GetDouble("rate_limit", "window_sec", rl.windowSec);
    rl.idleTtlSec = conf.GetDouble("rate_limit", "idle_ttl_sec", rl.idleTtlSec);

    if (rl.refillPerSec < 0.0) {
        LOG_WARN << "rate_limit.refill_per_sec < 0, using 0";
        rl.refillPerSec = 0.0;
    }
    if (rl.windowSec <= 0.0) {
        LOG_WARN << "rate_limit.window_sec must be > 0, using 60";
        rl.windowSec = 60.0;
    }
    return rl;
}

balancer::BackendConnectionPool::Config ConfigLoader::LoadPool(const Config& conf) {
    using Policy = balancer::BackendConnectionPool::AcquirePolicy;
    balancer::BackendConnectionPool::Config pc;
    const int maxConn = conf.GetInt("pool", "max_connections", static_cast<int>(pc.maxConnectionsPerBackend));
    if (maxConn > 0) {
        pc.maxConnectionsPerBackend = static_cast<size_t>(maxConn);
    } else {
        LOG_WARN << "pool.max_connections must be > 0, using " << pc.maxConnectionsPerBackend;
    }
    pc.idleTtlSec = conf.GetDouble("pool", "idle_ttl_sec", pc.idleTtlSec);
    const std::string policy = Lower(conf.GetString("pool", "policy", ""));
    if (policy == "fail_fast" || policy == "fail-fast") {
        pc.policy = Policy::FailFast;
    } else if (policy == "wait") {
        pc.policy = Policy::Wait;
    } else if (!policy.empty()) {
        LOG_WARN << "Unknown pool.policy '" << policy << "', using fail_fast";
    }
    pc.acquireTimeoutSec = conf.GetDouble("pool", "acquire_timeout_sec", pc.acquireTimeoutSec);
    if (pc.acquireTimeoutSec < 0.0) {
        LOG_WARN << "pool.acquire_timeout_sec < 0, using 0";
        pc.acquireTimeoutSec = 0.0;
    }
    return pc;
}

std::vector<DeploymentEntry> ConfigLoader::LoadDeployments(const Config& conf) {
    std::vector<DeploymentEntry> out;
    const size_t prefixLen = std::string(kDeploymentPrefix).size();
    for (const auto& kv : conf.GetSectionsWithPrefix(kDeploymentPrefix)) {
        const std::string& section = kv.first;
        DeploymentEntry e;
        e.spec.id = section.substr(prefixLen);
        if (e.spec.id.empty()) {
            LOG_WARN << "Skipping [" << section << "]: empty deployment id";
            continue;
        }
        e.spec.model = conf.GetString(section, "model", "");
        if (e.spec.model.empty()) {
            LOG_WARN << "Skipping [" << section << "]: no model";
            continue;
        }
        e.spec.endpoint = conf.GetString(section, "endpoint", "");
        e.spec.weight = conf.GetInt(section, "weight", e.spec.weight);
        e.spec.cost = conf.GetDouble(section, "cost", e.spec.cost);
        e.spec.priority = conf.GetInt(section, "priority", e.spec.priority);
        e.spec.rpmLimit = NonNegative(conf.GetInt(section, "rpm_limit", 0));
        e.spec.tpmLimit = NonNegative(conf.GetInt(section, "tpm_limit", 0));
        e.maxConnections = NonNegative(conf.GetInt(section, "max_connections", 0));
        out.push_back(std::move(e));
    }
    return out;
}

RuntimeSettings ConfigLoader::Load(const Config& conf) {
    RuntimeSettings s;
    s.logLevel = conf.GetString("global", "log_level", s.logLevel);
    s.router = LoadRouter(conf);
    const int window = conf.GetInt("router", "latency_window", static_cast<int>(s.latencyWindow));
    if (window > 0) {
        s.latencyWindow = static_cast<size_t>(window);
    } else {
        LOG_WARN << "router.latency_window must be > 0, using " << s.latencyWindow;
    }
    s.rateLimit = LoadRateLimit(conf);
    s.pool = LoadPool(conf);
    s.deployments = LoadDeployments(conf);
    LOG_DEBUG << "Loaded settings: strategy=" << balancer::StrategyName(s.router.strategy)
              << " deployments=" << s.deployments.size();
    return s;
}

} // namespace common
} // namespace routecore
