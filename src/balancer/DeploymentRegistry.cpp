#include "routecore/balancer/DeploymentRegistry.h"
#include "routecore/common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace routecore {
namespace balancer {

namespace {

int64_t SecondsToNs(double sec) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(sec)).count();
}

} // namespace

const char* ToString(RegistryError err) {
    switch (err) {
        case RegistryError::DuplicateId: return "DuplicateId";
        case RegistryError::NotFound: return "NotFound";
        default: return "Unknown";
    }
}

DeploymentRegistry::DeploymentRegistry() : DeploymentRegistry(Config()) {}

DeploymentRegistry::DeploymentRegistry(Config cfg)
    : latencyWindow_(cfg.latencyWindow),
      failureThreshold_(cfg.failureThreshold),
      cooldownNs_(SecondsToNs(cfg.cooldownSec)) {
    if (cfg.latencyWindow == 0) {
        throw std::invalid_argument("DeploymentRegistry latencyWindow must be > 0");
    }
    if (cfg.cooldownSec < 0.0) {
        throw std::invalid_argument("DeploymentRegistry cooldownSec must be >= 0");
    }
}

common::Status<RegistryError> DeploymentRegistry::Register(DeploymentSpec spec) {
    using S = common::Status<RegistryError>;
    const std::string id = spec.id;
    auto& shard = ids_.For(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (shard.byId.count(id)) {
        LOG_WARN << "Register rejected, duplicate deployment id: " << id;
        return S::Err(RegistryError::DuplicateId);
    }
    auto d = std::make_shared<Deployment>(std::move(spec), latencyWindow_);
    shard.byId.emplace(id, d);
    AddToModelIndex(d);
    size_.fetch_add(1, std::memory_order_acq_rel);
    LOG_INFO << "Registered deployment " << id << " model=" << d->model() << " endpoint=" << d->spec().endpoint;
    return S::Ok();
}

common::Status<RegistryError> DeploymentRegistry::Deregister(const std::string& id) {
    using S = common::Status<RegistryError>;
    auto& shard = ids_.For(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.byId.find(id);
    if (it == shard.byId.end()) return S::Err(RegistryError::NotFound);
    DeploymentRef d = std::move(it->second);
    shard.byId.erase(it);
    RemoveFromModelIndex(d);
    size_.fetch_sub(1, std::memory_order_acq_rel);
    LOG_INFO << "Deregistered deployment " << id << " (in-flight " << d->InFlight() << ")";
    return S::Ok();
}

void DeploymentRegistry::AddToModelIndex(const DeploymentRef& d) {
    auto& shard = models_.For(d->model());
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& slot = shard.byModel[d->model()];
    auto next = slot ? std::make_shared<DeploymentList>(*slot) : std::make_shared<DeploymentList>();
    next->push_back(d);
    slot = std::move(next);
}

void DeploymentRegistry::RemoveFromModelIndex(const DeploymentRef& d) {
    auto& shard = models_.For(d->model());
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.byModel.find(d->model());
    if (it == shard.byModel.end() || !it->second) return;
    auto next = std::make_shared<DeploymentList>();
    next->reserve(it->second->size());
    for (const auto& x : *it->second) {
        if (x != d) next->push_back(x);
    }
    if (next->empty()) {
        shard.byModel.erase(it);
    } else {
        it->second = std::move(next);
    }
}

HealthPolicy DeploymentRegistry::GetHealthPolicy() const {
    HealthPolicy p;
    p.failureThreshold = failureThreshold_.load(std::memory_order_acquire);
    p.cooldown = std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(cooldownNs_.load(std::memory_order_acquire)));
    return p;
}

void DeploymentRegistry::SetHealthPolicy(int failureThreshold, double cooldownSec) {
    if (cooldownSec < 0.0) cooldownSec = 0.0;
    failureThreshold_.store(failureThreshold, std::memory_order_release);
    cooldownNs_.store(SecondsToNs(cooldownSec), std::memory_order_release);
}

void DeploymentRegistry::OnTransition(const DeploymentRef& d, HealthTransition t, Clock::time_point now) {
    if (t != HealthTransition::EnteredCooldown) return;
    cooldownsEntered_.fetch_add(1, std::memory_order_relaxed);
    const std::chrono::duration<double> left = d->CooldownUntil() - now;
    LOG_WARN << "Deployment " << d->id() << " cooling down for " << left.count()
             << "s after " << d->ConsecutiveFailures() << " consecutive failures";
}

common::Status<RegistryError> DeploymentRegistry::ReportOutcome(const std::string& id,
                                                                bool success,
                                                                double latencyMs,
                                                                uint64_t tokens) {
    return ReportOutcomeAt(id, success, latencyMs, Clock::now(), tokens);
}

common::Status<RegistryError> DeploymentRegistry::ReportOutcomeAt(const std::string& id,
                                                                  bool success,
                                                                  double latencyMs,
                                                                  Clock::time_point now,
                                                                  uint64_t tokens) {
    DeploymentRef d = Find(id);
    if (!d) {
        LOG_DEBUG << "ReportOutcome for unknown deployment " << id;
        return common::Status<RegistryError>::Err(RegistryError::NotFound);
    }
    ReportOutcomeAt(d, success, latencyMs, now, tokens);
    return common::Status<RegistryError>::Ok();
}

void DeploymentRegistry::ReportOutcome(const DeploymentRef& d, bool success, double latencyMs, uint64_t tokens) {
    ReportOutcomeAt(d, success, latencyMs, Clock::now(), tokens);
}

void DeploymentRegistry::ReportOutcomeAt(const DeploymentRef& d,
                                         bool success,
                                         double latencyMs,
                                         Clock::time_point now,
                                         uint64_t tokens) {
    if (!d) return;
    const HealthTransition t = d->RecordOutcomeAt(now, success, latencyMs, tokens, GetHealthPolicy());
    OnTransition(d, t, now);
}

void DeploymentRegistry::AbandonDispatch(const DeploymentRef& d) {
    if (!d) return;
    d->EndDispatch();
    LOG_DEBUG << "Abandoned dispatch on " << d->id();
}

common::Status<RegistryError> DeploymentRegistry::AbandonDispatch(const std::string& id) {
    DeploymentRef d = Find(id);
    if (!d) return common::Status<RegistryError>::Err(RegistryError::NotFound);
    AbandonDispatch(d);
    return common::Status<RegistryError>::Ok();
}

common::Status<RegistryError> DeploymentRegistry::MarkCooldown(const std::string& id) {
    return MarkCooldownAt(id, Clock::now());
}

common::Status<RegistryError> DeploymentRegistry::MarkCooldownAt(const std::string& id, Clock::time_point now) {
    DeploymentRef d = Find(id);
    if (!d) return common::Status<RegistryError>::Err(RegistryError::NotFound);
    if (d->ForceCooldownAt(now, GetHealthPolicy().cooldown)) {
        OnTransition(d, HealthTransition::EnteredCooldown, now);
    }
    return common::Status<RegistryError>::Ok();
}

std::vector<DeploymentRef> DeploymentRegistry::Snapshot(const std::string& model) {
    return SnapshotAt(model, Clock::now());
}

std::vector<DeploymentRef> DeploymentRegistry::SnapshotAt(const std::string& model, Clock::time_point now) {
    std::shared_ptr<const DeploymentList> list;
    {
        auto& shard = models_.For(model);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.byModel.find(model);
        if (it != shard.byModel.end()) list = it->second;
    }
    std::vector<DeploymentRef> out;
    if (!list) return out;
    out.reserve(list->size());
    for (const auto& d : *list) {
        if (d->IsHealthyAt(now)) out.push_back(d);
    }
    return out;
}

DeploymentRef DeploymentRegistry::Find(const std::string& id) const {
    const auto& shard = ids_.For(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.byId.find(id);
    return it == shard.byId.end() ? nullptr : it->second;
}

std::vector<std::string> DeploymentRegistry::Ids() const {
    std::vector<std::string> out;
    ids_.ForEach([&out](const IdShard& shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& kv : shard.byId) out.push_back(kv.first);
    });
    std::sort(out.begin(), out.end());
    return out;
}

DeploymentRegistry::RegistryStats DeploymentRegistry::Stats() const {
    return StatsAt(Clock::now());
}

DeploymentRegistry::RegistryStats DeploymentRegistry::StatsAt(Clock::time_point now) const {
    std::vector<DeploymentRef> all;
    ids_.ForEach([&all](const IdShard& shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& kv : shard.byId) all.push_back(kv.second);
    });

    RegistryStats out;
    out.cooldownsEntered = cooldownsEntered_.load(std::memory_order_relaxed);
    out.deployments.reserve(all.size());
    for (const auto& d : all) {
        DeploymentStats s;
        const auto& spec = d->spec();
        s.id = spec.id;
        s.model = spec.model;
        s.endpoint = spec.endpoint;
        s.weight = spec.weight;
        s.cost = spec.cost;
        s.priority = spec.priority;
        s.state = d->StateAt(now);
        if (s.state == HealthState::Cooling) {
            const std::chrono::duration<double> left = d->CooldownUntil() - now;
            s.cooldownRemainingSec = std::max(0.0, left.count());
        }
        s.inFlight = d->InFlight();
        s.consecutiveFailures = d->ConsecutiveFailures();
        s.totalRequests = d->TotalRequests();
        s.successes = d->Successes();
        s.failures = d->Failures();
        s.tokensServed = d->TokensServed();
        s.usage = d->UsageAt(now);
        s.hasLatency = d->MeanLatencyMs(&s.meanLatencyMs);

        out.totalDeployments += 1;
        if (s.state == HealthState::Healthy) {
            out.healthyDeployments += 1;
        } else {
            out.coolingDeployments += 1;
        }
        out.totalInFlight += s.inFlight;
        out.totalRequests += s.totalRequests;
        out.successes += s.successes;
        out.failures += s.failures;
        out.deployments.push_back(std::move(s));
    }
    std::sort(out.deployments.begin(), out.deployments.end(),
              [](const DeploymentStats& a, const DeploymentStats& b) { return a.id < b.id; });
    return out;
}

} // namespace balancer
} // namespace routecore
