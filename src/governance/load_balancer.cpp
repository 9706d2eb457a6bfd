#include <rpclb/governance/load_balancer.h>

#include <rpclb/core/log.h>

namespace rpclb::governance {

WeightedRoundRobinStrategy::WeightedRoundRobinStrategy(WeightTable weights) {
    std::lock_guard<std::mutex> lk(mu_);
    ResetLocked(std::move(weights));
}

rpclb::Result<std::shared_ptr<WeightedRoundRobinStrategy>> WeightedRoundRobinStrategy::FromDiscovery(
    std::string service, std::shared_ptr<IServiceDiscovery> discovery) {
    if (!discovery) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "service discovery is null");
    }

    auto strategy = std::make_shared<WeightedRoundRobinStrategy>(WeightTable{});
    auto st = strategy->DoReInit(service, *discovery);
    if (!st.ok()) {
        return st;
    }

    strategy->service_ = std::move(service);
    strategy->discovery_ = std::move(discovery);
    return strategy;
}

void WeightedRoundRobinStrategy::ResetLocked(WeightTable weights) {
    FixWeights(weights);
    active_ = std::move(weights);
    failed_.clear();
    RebuildLocked();
}

void WeightedRoundRobinStrategy::RebuildLocked() {
    cursor_ = 0;

    int factor = kMinWeight;
    auto r = BuildElectionSequence(active_, &factor);
    if (!r.ok()) {
        sequence_.clear();
        rpclb::log::debug("election sequence cleared: {}", r.status().message());
        return;
    }

    sequence_ = std::move(r).value();
    rpclb::log::debug("election sequence rebuilt: targets={} length={} factor={}",
                      active_.size(), sequence_.size(), factor);
}

rpclb::Result<std::string> WeightedRoundRobinStrategy::Elect() {
    std::lock_guard<std::mutex> lk(mu_);
    if (sequence_.empty()) {
        return rpclb::Status(rpclb::StatusCode::failed_precondition, "no target is available");
    }

    if (cursor_ >= sequence_.size()) {
        cursor_ = 0;
    }
    return sequence_[cursor_++];
}

std::set<std::string> WeightedRoundRobinStrategy::GetTargets() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::set<std::string>(sequence_.begin(), sequence_.end());
}

bool WeightedRoundRobinStrategy::HasTargets() const {
    return !GetTargets().empty();
}

void WeightedRoundRobinStrategy::RemoveTarget(std::string_view target) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(std::string(target));
    if (it == active_.end()) {
        return;
    }

    failed_[it->first] = it->second;
    active_.erase(it);
    RebuildLocked();
    rpclb::log::info("target {} removed from rotation, {} active", target, active_.size());
}

void WeightedRoundRobinStrategy::RecoverTarget(std::string_view target) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = failed_.find(std::string(target));
    if (it == failed_.end()) {
        return;
    }

    active_[it->first] = it->second;
    failed_.erase(it);
    RebuildLocked();
    rpclb::log::info("target {} recovered, {} active", target, active_.size());
}

std::set<std::string> WeightedRoundRobinStrategy::GetFailedTargets() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::set<std::string> out;
    for (const auto& kv : failed_) {
        out.insert(kv.first);
    }
    return out;
}

WeightTable WeightedRoundRobinStrategy::ActiveWeights() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

WeightTable WeightedRoundRobinStrategy::FailedWeights() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failed_;
}

std::vector<std::string> WeightedRoundRobinStrategy::Sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sequence_;
}

std::vector<Endpoint> WeightedRoundRobinStrategy::DiscoveredEndpoints() const {
    std::lock_guard<std::mutex> lk(mu_);
    return discovered_;
}

rpclb::Status WeightedRoundRobinStrategy::DoReInit(const std::string& service, const IServiceDiscovery& discovery) {
    // Lookup happens before mu_ is taken.
    auto r = discovery.List({service});
    if (!r.ok()) {
        return r.status();
    }

    std::vector<Endpoint> endpoints;
    auto it = r.value().find(service);
    if (it != r.value().end()) {
        endpoints = it->second;
    }

    ReInitialize(service, endpoints);
    return rpclb::Status::Ok();
}

void WeightedRoundRobinStrategy::ReInitialize(std::string_view service, const std::vector<Endpoint>& endpoints) {
    WeightTable weights;
    for (const auto& ep : endpoints) {
        weights[ToTargetKey(ep)] = kDefaultWeight;
    }

    std::lock_guard<std::mutex> lk(mu_);
    discovered_ = endpoints;
    ResetLocked(std::move(weights));
    rpclb::log::info("service '{}' re-initialized with {} endpoints", service, active_.size());
}

} // namespace rpclb::governance
