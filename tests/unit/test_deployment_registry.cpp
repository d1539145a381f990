#include "routecore/balancer/DeploymentRegistry.h"
#include "routecore/common/Logger.h"

#include <cassert>
#include <chrono>
#include <stdexcept>

using namespace routecore;
using balancer::DeploymentRegistry;
using balancer::DeploymentSpec;
using balancer::HealthState;
using balancer::RegistryError;

static DeploymentSpec Spec(const std::string& id, const std::string& model) {
    DeploymentSpec s;
    s.id = id;
    s.model = model;
    s.endpoint = "https://" + id + ".example.com/v1";
    return s;
}

static void testRegisterDeregister() {
    DeploymentRegistry reg;
    assert(reg.Register(Spec("a", "gpt")).ok());
    assert(reg.Register(Spec("b", "gpt")).ok());
    assert(reg.Register(Spec("c", "claude")).ok());
    assert(reg.Size() == 3);

    auto dup = reg.Register(Spec("a", "other"));
    assert(!dup.ok());
    assert(dup.error() == RegistryError::DuplicateId);
    assert(reg.Size() == 3);

    auto snap = reg.Snapshot("gpt");
    assert(snap.size() == 2);
    // Registration order.
    assert(snap[0]->id() == "a");
    assert(snap[1]->id() == "b");

    assert(reg.Deregister("a").ok());
    assert(reg.Size() == 2);
    auto missing = reg.Deregister("a");
    assert(!missing.ok());
    assert(missing.error() == RegistryError::NotFound);

    snap = reg.Snapshot("gpt");
    assert(snap.size() == 1);
    assert(snap[0]->id() == "b");
    assert(reg.Snapshot("unknown-model").empty());

    const auto ids = reg.Ids();
    assert(ids.size() == 2);
    assert(ids[0] == "b" && ids[1] == "c");
    assert(reg.Find("a") == nullptr);
    assert(reg.Find("c") != nullptr);

    // Re-registering a removed id is allowed.
    assert(reg.Register(Spec("a", "gpt")).ok());
    assert(reg.Size() == 3);
}

static void testCooldownAndLazyRecovery() {
    DeploymentRegistry::Config cfg;
    cfg.failureThreshold = 3;
    cfg.cooldownSec = 60.0;
    DeploymentRegistry reg(cfg);
    assert(reg.Register(Spec("a", "gpt")).ok());
    assert(reg.Register(Spec("b", "gpt")).ok());

    const auto t0 = DeploymentRegistry::Clock::now();
    auto a = reg.Find("a");

    assert(reg.ReportOutcomeAt("a", false, 10.0, t0).ok());
    assert(reg.ReportOutcomeAt("a", false, 10.0, t0).ok());
    assert(a->ConsecutiveFailures() == 2);
    assert(reg.SnapshotAt("gpt", t0).size() == 2);

    assert(reg.ReportOutcomeAt("a", false, 10.0, t0).ok());
    assert(a->StateAt(t0) == HealthState::Cooling);

    auto snap = reg.SnapshotAt("gpt", t0 + std::chrono::seconds(30));
    assert(snap.size() == 1);
    assert(snap[0]->id() == "b");

    auto stats = reg.StatsAt(t0 + std::chrono::seconds(30));
    assert(stats.coolingDeployments == 1);
    assert(stats.healthyDeployments == 1);
    assert(stats.cooldownsEntered == 1);
    assert(stats.deployments[0].id == "a");
    assert(stats.deployments[0].cooldownRemainingSec > 29.0);

    // Past the cooldown end the next snapshot readmits it and clears the counter.
    snap = reg.SnapshotAt("gpt", t0 + std::chrono::seconds(61));
    assert(snap.size() == 2);
    assert(a->StateAt(t0 + std::chrono::seconds(61)) == HealthState::Healthy);
    assert(a->ConsecutiveFailures() == 0);
}

static void testSuccessResetsFailures() {
    DeploymentRegistry reg;
    assert(reg.Register(Spec("a", "gpt")).ok());
    const auto t0 = DeploymentRegistry::Clock::now();
    assert(reg.ReportOutcomeAt("a", false, 5.0, t0).ok());
    assert(reg.ReportOutcomeAt("a", false, 5.0, t0).ok());
    assert(reg.ReportOutcomeAt("a", true, 5.0, t0).ok());
    assert(reg.ReportOutcomeAt("a", false, 5.0, t0).ok());
    assert(reg.ReportOutcomeAt("a", false, 5.0, t0).ok());
    assert(reg.SnapshotAt("gpt", t0).size() == 1);
    assert(reg.Find("a")->ConsecutiveFailures() == 2);
}

static void testDisabledThreshold() {
    DeploymentRegistry::Config cfg;
    cfg.failureThreshold = 0;
    DeploymentRegistry reg(cfg);
    assert(reg.Register(Spec("a", "gpt")).ok());
    for (int i = 0; i < 50; ++i) assert(reg.ReportOutcome("a", false, 1.0).ok());
    assert(reg.Snapshot("gpt").size() == 1);
}

static void testInFlightAndOutcomes() {
    DeploymentRegistry reg;
    assert(reg.Register(Spec("a", "gpt")).ok());
    auto a = reg.Find("a");

    a->BeginDispatch();
    a->BeginDispatch();
    assert(a->InFlight() == 2);
    assert(reg.ReportOutcome("a", true, 100.0, 42).ok());
    assert(a->InFlight() == 1);
    reg.AbandonDispatch(a);
    assert(a->InFlight() == 0);

    // An unmatched report never drives in-flight below zero.
    assert(reg.ReportOutcome("a", true, 100.0).ok());
    assert(a->InFlight() == 0);
    assert(reg.AbandonDispatch("a").ok());
    assert(a->InFlight() == 0);

    assert(a->TotalRequests() == 2);
    assert(a->Successes() == 2);
    assert(a->TokensServed() == 42);

    auto unknown = reg.ReportOutcome("zzz", true, 1.0);
    assert(!unknown.ok());
    assert(unknown.error() == RegistryError::NotFound);

    // In-flight calls can still report through their handle after removal.
    a->BeginDispatch();
    assert(reg.Deregister("a").ok());
    reg.ReportOutcome(a, false, 20.0);
    assert(a->InFlight() == 0);
    assert(a->Failures() == 1);
}

// A call dispatched before its id was re-registered reports through its handle
// and leaves the new record's in-flight count alone.
static void testLateOutcomeAfterReRegister() {
    DeploymentRegistry reg;
    assert(reg.Register(Spec("a", "gpt")).ok());
    auto old = reg.Find("a");
    old->BeginDispatch();

    assert(reg.Deregister("a").ok());
    assert(reg.Register(Spec("a", "gpt")).ok());
    auto fresh = reg.Find("a");
    assert(fresh != old);
    fresh->BeginDispatch();

    reg.ReportOutcome(old, true, 50.0);
    assert(old->InFlight() == 0);
    assert(old->TotalRequests() == 1);
    assert(fresh->InFlight() == 1);
    assert(fresh->TotalRequests() == 0);

    assert(reg.ReportOutcome("a", true, 60.0).ok());
    assert(fresh->InFlight() == 0);
    assert(fresh->TotalRequests() == 1);
}

static void testLatencyWindow() {
    DeploymentRegistry::Config cfg;
    cfg.latencyWindow = 3;
    DeploymentRegistry reg(cfg);
    assert(reg.Register(Spec("a", "gpt")).ok());
    auto a = reg.Find("a");

    double mean = 0.0;
    assert(!a->MeanLatencyMs(&mean));
    assert(reg.ReportOutcome("a", true, 10.0).ok());
    assert(reg.ReportOutcome("a", true, 20.0).ok());
    assert(a->MeanLatencyMs(&mean));
    assert(mean == 15.0);

    assert(reg.ReportOutcome("a", true, 30.0).ok());
    assert(reg.ReportOutcome("a", true, 40.0).ok());
    const auto samples = a->LatencySamples();
    assert(samples.size() == 3);
    assert(samples[0] == 20.0 && samples[1] == 30.0 && samples[2] == 40.0);
    assert(a->MeanLatencyMs(&mean));
    assert(mean == 30.0);

    // Negative latency means "not measured": counted, not sampled.
    assert(reg.ReportOutcome("a", false, -1.0).ok());
    assert(a->LatencySamples().size() == 3);
    assert(a->Failures() == 1);
}

static void testInvalidConfig() {
    DeploymentRegistry::Config cfg;
    cfg.latencyWindow = 0;
    bool threw = false;
    try {
        DeploymentRegistry reg(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::WARN);
    testRegisterDeregister();
    testCooldownAndLazyRecovery();
    testSuccessResetsFailures();
    testDisabledThreshold();
    testInFlightAndOutcomes();
    testLateOutcomeAfterReRegister();
    testLatencyWindow();
    testInvalidConfig();
    return 0;
}
