#include "routecore/balancer/BackendConnectionPool.h"
#include "routecore/balancer/DeploymentRegistry.h"
#include "routecore/balancer/Router.h"
#include "routecore/common/Config.h"
#include "routecore/common/ConfigLoader.h"
#include "routecore/common/Logger.h"
#include "routecore/monitor/PerKeyRateLimiter.h"
#include "routecore/monitor/StatsJson.h"

#include <getopt.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {

using namespace routecore;

// Simulated backend behaviour, read from the deployment sections.
struct SimProfile {
    double latencyMs{20.0};
    double failureRate{0.0};
};

struct SimCounters {
    std::atomic<uint64_t> rateLimited{0};
    std::atomic<uint64_t> noDeployment{0};
    std::atomic<uint64_t> poolRejected{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> retries{0};
};

void SleepSliced(const std::atomic<bool>& stop, double seconds) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                                                std::chrono::duration<double>(seconds));
    while (!stop.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace routecore;

    std::string configFile = "../config/routecore.conf";
    bool checkOnly = false;
    int requests = 1000;
    int threads = 4;
    int ch;
    while ((ch = getopt(argc, argv, "c:hCn:t:")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'n':
                requests = std::atoi(optarg);
                break;
            case 't':
                threads = std::atoi(optarg);
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C] [-n requests] [-t threads]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }
    if (requests < 0) requests = 0;
    if (threads < 1) threads = 1;

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    const common::RuntimeSettings settings = common::ConfigLoader::Load(conf);

    if (checkOnly) {
        if (settings.deployments.empty()) {
            printf("FAIL: no [deployment:<id>] sections\n");
            return 1;
        }
        printf("OK\n");
        return 0;
    }

    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(settings.logLevel));

    balancer::DeploymentRegistry::Config regCfg;
    regCfg.latencyWindow = settings.latencyWindow;
    regCfg.failureThreshold = settings.router.failureThreshold;
    regCfg.cooldownSec = settings.router.cooldownSec;
    balancer::DeploymentRegistry registry(regCfg);
    balancer::Router router(registry, settings.router);
    monitor::PerKeyRateLimiter limiter(settings.rateLimit);
    balancer::BackendConnectionPool pool(settings.pool);

    std::vector<std::string> models;
    std::unordered_map<std::string, SimProfile> profiles;
    for (const auto& e : settings.deployments) {
        auto st = registry.Register(e.spec);
        if (!st) {
            LOG_ERROR << "Cannot register " << e.spec.id << ": " << balancer::ToString(st.error());
            continue;
        }
        if (e.maxConnections > 0) pool.SetBackendLimit(e.spec.id, e.maxConnections);
        const std::string section = common::ConfigLoader::DeploymentSection(e.spec.id);
        SimProfile p;
        p.latencyMs = conf.GetDouble(section, "sim_latency_ms", p.latencyMs);
        p.failureRate = conf.GetDouble(section, "sim_failure_rate", p.failureRate);
        profiles[e.spec.id] = p;
        if (std::find(models.begin(), models.end(), e.spec.model) == models.end()) models.push_back(e.spec.model);
    }
    if (models.empty()) {
        LOG_ERROR << "No deployments registered, nothing to simulate";
        return 1;
    }

    const int tenants = std::max(1, conf.GetInt("sim", "tenants", 8));
    const double timeoutMs = settings.router.timeoutSec * 1000.0;
    const std::unordered_map<std::string, SimProfile>& simProfiles = profiles;
    SimCounters counters;
    std::atomic<int> next{0};
    std::atomic<bool> stop{false};

    // TTL sweeps run on their own cadence, outside the request path.
    std::thread sweeper([&]() {
        while (!stop.load()) {
            SleepSliced(stop, settings.router.healthCheckIntervalSec);
            limiter.Sweep();
            pool.CleanupExpired();
        }
    });

    auto worker = [&](int index) {
        std::mt19937_64 rng(static_cast<uint64_t>(index) * 7919 + 17);
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        while (next.fetch_add(1) < requests) {
            const std::string key = "tenant-" + std::to_string(rng() % static_cast<uint64_t>(tenants));
            const std::string& model = models[rng() % models.size()];

            const auto decision = limiter.Check(key);
            if (!decision.allowed) {
                counters.rateLimited.fetch_add(1);
                continue;
            }

            auto budget = router.NewRetryBudget();
            bool done = false;
            while (!done) {
                auto sel = router.SelectWithBudget(model, budget);
                if (!sel) {
                    counters.noDeployment.fetch_add(1);
                    break;
                }
                if (budget.Attempts() > 1) counters.retries.fetch_add(1);
                balancer::DeploymentRef d = sel.value();

                auto slot = pool.Acquire(d->id());
                if (!slot) {
                    counters.poolRejected.fetch_add(1);
                    registry.AbandonDispatch(d);
                    continue;
                }

                const SimProfile& prof = simProfiles.at(d->id());
                const double latency = prof.latencyMs * (0.5 + unit(rng));
                // One simulated millisecond per real microsecond.
                std::this_thread::sleep_for(std::chrono::microseconds(static_cast<int64_t>(latency)));
                const bool ok = unit(rng) >= prof.failureRate && latency <= timeoutMs;
                const uint64_t tokens = ok ? 50 + rng() % 500 : 0;

                registry.ReportOutcome(d, ok, latency, tokens);
                if (!ok) {
                    auto st = pool.MarkUnhealthy(slot.value());
                    if (!st) LOG_WARN << "MarkUnhealthy failed: " << balancer::ToString(st.error());
                }
                auto st = pool.Release(slot.value());
                if (!st) LOG_WARN << "Release failed: " << balancer::ToString(st.error());

                if (ok) {
                    counters.succeeded.fetch_add(1);
                    done = true;
                } else {
                    counters.failed.fetch_add(1);
                }
            }
        }
    };

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; ++i) workers.emplace_back(worker, i);
    for (auto& t : workers) t.join();
    stop.store(true);
    sweeper.join();
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

    LOG_INFO << "Simulated " << requests << " requests on " << threads << " threads in " << elapsed.count() << "s: "
             << counters.succeeded.load() << " ok, " << counters.failed.load() << " failed attempts, "
             << counters.retries.load() << " retries, " << counters.rateLimited.load() << " rate limited, "
             << counters.noDeployment.load() << " without deployment, " << counters.poolRejected.load()
             << " pool rejections";

    const auto routerStats = router.GetStats();
    const auto registryStats = registry.Stats();
    const auto limiterStats = limiter.Stats();
    const auto poolStats = pool.Stats();
    monitor::StatsJson::Sources src;
    src.router = &routerStats;
    src.registry = &registryStats;
    src.limiter = &limiterStats;
    src.pool = &poolStats;
    printf("%s", monitor::StatsJson::ToJson(src).c_str());
    return 0;
}
