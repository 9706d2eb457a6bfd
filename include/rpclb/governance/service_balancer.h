#pragma once

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <rpclb/core/status.h>
#include <rpclb/governance/discovery_refresher.h>
#include <rpclb/governance/load_balancer.h>
#include <rpclb/governance/service_discovery.h>
#include <rpclb/governance/weighted_sequence.h>

namespace rpclb::governance {

// Per-service target selection as seen by an RPC client: a weighted
// round-robin strategy, optionally kept in sync with service discovery.
class ServiceBalancer {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::unique_ptr<ServiceBalancer> FromWeights(WeightTable weights);

    // Resolves service once; fails when the lookup fails.
    static rpclb::Result<std::unique_ptr<ServiceBalancer>> FromDiscovery(
        std::string service, std::shared_ptr<IServiceDiscovery> discovery);

    ServiceBalancer(PrivateTag, std::shared_ptr<WeightedRoundRobinStrategy> strategy);
    ~ServiceBalancer();

    ServiceBalancer(const ServiceBalancer&) = delete;
    ServiceBalancer& operator=(const ServiceBalancer&) = delete;

    // Thread-safe
    rpclb::Result<std::string> Elect() { return strategy_->Elect(); }
    bool HasTargets() const { return strategy_->HasTargets(); }
    std::set<std::string> GetTargets() const { return strategy_->GetTargets(); }
    void RemoveTarget(std::string_view target) { strategy_->RemoveTarget(target); }
    void RecoverTarget(std::string_view target) { strategy_->RecoverTarget(target); }
    std::set<std::string> GetFailedTargets() const { return strategy_->GetFailedTargets(); }

    // Starts polling discovery for changes. Without discovery this only logs.
    rpclb::Status StartRefresh(RefreshOptions options);
    // Idempotent
    void StopRefresh();

    bool refreshing() const { return refresher_ && refresher_->running(); }

    const std::string& service() const { return strategy_->service(); }
    WeightedRoundRobinStrategy& strategy() { return *strategy_; }

private:
    std::shared_ptr<WeightedRoundRobinStrategy> strategy_;
    // Declared after strategy_ so it goes first.
    std::unique_ptr<DiscoveryRefresher> refresher_;
};

} // namespace rpclb::governance
