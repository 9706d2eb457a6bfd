#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <rpclb/core/status.h>
#include <rpclb/governance/service_discovery.h>
#include <rpclb/governance/weighted_sequence.h>

namespace rpclb::governance {

class ILoadBalanceStrategy {
public:
    virtual ~ILoadBalanceStrategy() = default;

    // Thread-safe. Fails with failed_precondition when no target is available.
    virtual rpclb::Result<std::string> Elect() = 0;

    virtual std::set<std::string> GetTargets() const = 0;
    virtual bool HasTargets() const = 0;

    // Moves an active target out of rotation. No-op for unknown targets.
    virtual void RemoveTarget(std::string_view target) = 0;
    // Puts a removed target back at its recorded weight. No-op otherwise.
    virtual void RecoverTarget(std::string_view target) = 0;

    virtual std::set<std::string> GetFailedTargets() const = 0;
};

// A strategy whose target set can be (re)built from service discovery.
class IDiscoveryStrategy : public ILoadBalanceStrategy {
public:
    // Resolves service through discovery, then ReInitialize()s with the result.
    // Discovery errors are returned; the current targets are kept on failure.
    virtual rpclb::Status DoReInit(const std::string& service, const IServiceDiscovery& discovery) = 0;

    // Replaces every target with endpoints and forgets failed targets.
    virtual void ReInitialize(std::string_view service, const std::vector<Endpoint>& endpoints) = 0;
};

class WeightedRoundRobinStrategy final : public IDiscoveryStrategy {
public:
    // Weight given to endpoints that come from discovery.
    static constexpr int kDefaultWeight = 1;

    explicit WeightedRoundRobinStrategy(WeightTable weights);

    // Performs one synchronous lookup of service; lookup errors are returned.
    static rpclb::Result<std::shared_ptr<WeightedRoundRobinStrategy>> FromDiscovery(
        std::string service, std::shared_ptr<IServiceDiscovery> discovery);

    WeightedRoundRobinStrategy(const WeightedRoundRobinStrategy&) = delete;
    WeightedRoundRobinStrategy& operator=(const WeightedRoundRobinStrategy&) = delete;

    rpclb::Result<std::string> Elect() override;

    std::set<std::string> GetTargets() const override;
    bool HasTargets() const override;

    void RemoveTarget(std::string_view target) override;
    void RecoverTarget(std::string_view target) override;

    std::set<std::string> GetFailedTargets() const override;

    // Weights after clamping to kMinWeight.
    WeightTable ActiveWeights() const;
    WeightTable FailedWeights() const;

    // Copy of the current election sequence.
    std::vector<std::string> Sequence() const;

    // Endpoint list, in discovery order, of the last ReInitialize().
    std::vector<Endpoint> DiscoveredEndpoints() const;

    rpclb::Status DoReInit(const std::string& service, const IServiceDiscovery& discovery) override;
    void ReInitialize(std::string_view service, const std::vector<Endpoint>& endpoints) override;

    // Empty / null unless created by FromDiscovery().
    const std::string& service() const { return service_; }
    const std::shared_ptr<IServiceDiscovery>& discovery() const { return discovery_; }

private:
    void ResetLocked(WeightTable weights);
    void RebuildLocked();

    std::string service_;
    std::shared_ptr<IServiceDiscovery> discovery_;

    mutable std::mutex mu_;
    WeightTable active_;
    WeightTable failed_;
    std::vector<Endpoint> discovered_;
    std::vector<std::string> sequence_;
    std::size_t cursor_ = 0;
};

} // namespace rpclb::governance
