#include "routecore/monitor/StatsJson.h"

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <vector>

namespace routecore {
namespace monitor {

namespace {

std::string Pad(int n) {
    return std::string(static_cast<size_t>(n), ' ');
}

} // namespace

std::string StatsJson::Escape(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 2);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string StatsJson::RouterSection(const balancer::Router::RouterStats& s, int indent) {
    const std::string p = Pad(indent);
    std::stringstream ss;
    ss << "{\n";
    ss << p << "  \"strategy\": \"" << Escape(s.strategy) << "\",\n";
    ss << p << "  \"requests\": " << s.requests << ",\n";
    ss << p << "  \"selected\": " << s.selected << ",\n";
    ss << p << "  \"no_available\": " << s.noAvailable << ",\n";
    ss << p << "  \"config_updates\": " << s.configUpdates << "\n";
    ss << p << "}";
    return ss.str();
}

std::string StatsJson::RegistrySection(const balancer::DeploymentRegistry::RegistryStats& s, int indent) {
    const std::string p = Pad(indent);
    std::stringstream ss;
    ss << "{\n";
    ss << p << "  \"total_deployments\": " << s.totalDeployments << ",\n";
    ss << p << "  \"healthy_deployments\": " << s.healthyDeployments << ",\n";
    ss << p << "  \"cooling_deployments\": " << s.coolingDeployments << ",\n";
    ss << p << "  \"total_in_flight\": " << s.totalInFlight << ",\n";
    ss << p << "  \"total_requests\": " << s.totalRequests << ",\n";
    ss << p << "  \"successes\": " << s.successes << ",\n";
    ss << p << "  \"failures\": " << s.failures << ",\n";
    ss << p << "  \"cooldowns_entered\": " << s.cooldownsEntered << ",\n";
    ss << p << "  \"deployments\": [";
    for (size_t i = 0; i < s.deployments.size(); ++i) {
        const auto& d = s.deployments[i];
        ss << (i == 0 ? "\n" : ",\n");
        ss << p << "    {";
        ss << "\"id\": \"" << Escape(d.id) << "\", ";
        ss << "\"model\": \"" << Escape(d.model) << "\", ";
        ss << "\"endpoint\": \"" << Escape(d.endpoint) << "\", ";
        ss << "\"weight\": " << d.weight << ", ";
        ss << "\"cost\": " << std::fixed << std::setprecision(4) << d.cost << ", ";
        ss << "\"priority\": " << d.priority << ", ";
        ss << "\"state\": \"" << balancer::ToString(d.state) << "\", ";
        ss << "\"cooldown_remaining_sec\": " << std::fixed << std::setprecision(3) << d.cooldownRemainingSec << ", ";
        ss << "\"in_flight\": " << d.inFlight << ", ";
        ss << "\"consecutive_failures\": " << d.consecutiveFailures << ", ";
        ss << "\"total_requests\": " << d.totalRequests << ", ";
        ss << "\"successes\": " << d.successes << ", ";
        ss << "\"failures\": " << d.failures << ", ";
        ss << "\"tokens_served\": " << d.tokensServed << ", ";
        ss << "\"current_rpm\": " << d.usage.rpm << ", ";
        ss << "\"current_tpm\": " << d.usage.tpm << ", ";
        if (d.hasLatency) {
            ss << "\"mean_latency_ms\": " << std::fixed << std::setprecision(2) << d.meanLatencyMs;
        } else {
            ss << "\"mean_latency_ms\": null";
        }
        ss << "}";
    }
    if (!s.deployments.empty()) ss << "\n" << p << "  ";
    ss << "]\n";
    ss << p << "}";
    return ss.str();
}

std::string StatsJson::LimiterSection(const PerKeyRateLimiter::LimiterStats& s, int indent) {
    const std::string p = Pad(indent);
    std::stringstream ss;
    ss << "{\n";
    ss << p << "  \"enabled\": " << (s.enabled ? "true" : "false") << ",\n";
    ss << p << "  \"algorithm\": \"" << ToString(s.algorithm) << "\",\n";
    ss << p << "  \"tracked_keys\": " << s.trackedKeys << ",\n";
    ss << p << "  \"admitted\": " << s.admitted << ",\n";
    ss << p << "  \"denied\": " << s.denied << ",\n";
    ss << p << "  \"swept\": " << s.swept << "\n";
    ss << p << "}";
    return ss.str();
}

std::string StatsJson::PoolSection(const balancer::BackendConnectionPool::PoolStats& s, int indent) {
    const std::string p = Pad(indent);
    std::stringstream ss;
    ss << "{\n";
    ss << p << "  \"backends\": " << s.backends << ",\n";
    ss << p << "  \"total_available\": " << s.totalAvailable << ",\n";
    ss << p << "  \"total_in_use\": " << s.totalInUse << ",\n";
    ss << p << "  \"created\": " << s.created << ",\n";
    ss << p << "  \"reused\": " << s.reused << ",\n";
    ss << p << "  \"destroyed\": " << s.destroyed << ",\n";
    ss << p << "  \"exhausted\": " << s.exhausted << ",\n";
    ss << p << "  \"timeouts\": " << s.timeouts << ",\n";
    ss << p << "  \"per_backend\": [";
    for (size_t i = 0; i < s.perBackend.size(); ++i) {
        const auto& b = s.perBackend[i];
        ss << (i == 0 ? "\n" : ",\n");
        ss << p << "    {\"backend\": \"" << Escape(b.backendId) << "\", ";
        ss << "\"available\": " << b.available << ", ";
        ss << "\"in_use\": " << b.inUse << ", ";
        ss << "\"max_connections\": " << b.maxConnections << ", ";
        ss << "\"waiters\": " << b.waiters << "}";
    }
    if (!s.perBackend.empty()) ss << "\n" << p << "  ";
    ss << "]\n";
    ss << p << "}";
    return ss.str();
}

std::string StatsJson::ToJson(const Sources& src) {
    std::vector<std::string> sections;
    if (src.router) sections.push_back("  \"router\": " + RouterSection(*src.router, 2));
    if (src.registry) sections.push_back("  \"registry\": " + RegistrySection(*src.registry, 2));
    if (src.limiter) sections.push_back("  \"rate_limiter\": " + LimiterSection(*src.limiter, 2));
    if (src.pool) sections.push_back("  \"pool\": " + PoolSection(*src.pool, 2));

    std::stringstream ss;
    ss << "{";
    for (size_t i = 0; i < sections.size(); ++i) {
        ss << (i == 0 ? "\n" : ",\n") << sections[i];
    }
    if (!sections.empty()) ss << "\n";
    ss << "}\n";
    return ss.str();
}

} // namespace monitor
} // namespace routecore
