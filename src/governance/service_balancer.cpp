#include <rpclb/governance/service_balancer.h>

#include <rpclb/core/log.h>

namespace rpclb::governance {

ServiceBalancer::ServiceBalancer(PrivateTag, std::shared_ptr<WeightedRoundRobinStrategy> strategy)
    : strategy_(std::move(strategy)) {}

ServiceBalancer::~ServiceBalancer() {
    StopRefresh();
}

std::unique_ptr<ServiceBalancer> ServiceBalancer::FromWeights(WeightTable weights) {
    return std::make_unique<ServiceBalancer>(PrivateTag{},
                                             std::make_shared<WeightedRoundRobinStrategy>(std::move(weights)));
}

rpclb::Result<std::unique_ptr<ServiceBalancer>> ServiceBalancer::FromDiscovery(
    std::string service, std::shared_ptr<IServiceDiscovery> discovery) {
    auto r = WeightedRoundRobinStrategy::FromDiscovery(std::move(service), std::move(discovery));
    if (!r.ok()) {
        return r.status();
    }
    return std::make_unique<ServiceBalancer>(PrivateTag{}, std::move(r).value());
}

rpclb::Status ServiceBalancer::StartRefresh(RefreshOptions options) {
    const auto& discovery = strategy_->discovery();
    if (!discovery) {
        rpclb::log::info("no service discovery configured, refresh not started");
        return rpclb::Status::Ok();
    }

    ServiceMap snapshot;
    if (refresher_) {
        // Restarting: continue from the last list the refresher applied.
        snapshot = refresher_->Snapshot();
    } else {
        // Compare against what discovery returned, not against the clamped
        // and deduplicated weight table.
        snapshot.emplace(strategy_->service(), strategy_->DiscoveredEndpoints());
        auto strategy = strategy_;
        refresher_ = std::make_unique<DiscoveryRefresher>(
            discovery, [strategy](const std::string& service, const std::vector<Endpoint>& endpoints) {
                strategy->ReInitialize(service, endpoints);
            });
    }
    return refresher_->Start(snapshot, options);
}

void ServiceBalancer::StopRefresh() {
    if (refresher_) {
        refresher_->Stop();
    }
}

} // namespace rpclb::governance
