#include <rpclb/config/balancer_config.h>
#include <rpclb/config/config.h>
#include <rpclb/core/log.h>
#include <rpclb/governance/service_balancer.h>
#include <rpclb/governance/service_discovery.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using rpclb::governance::Endpoint;
using rpclb::governance::ServiceBalancer;

rpclb::Result<std::vector<Endpoint>> EndpointsOf(const rpclb::governance::WeightTable& targets) {
    std::vector<Endpoint> out;
    for (const auto& kv : targets) {
        auto ep = rpclb::governance::ParseEndpoint(kv.first);
        if (!ep.ok()) {
            return rpclb::Status(ep.status().code(), kv.first + ": " + ep.status().message());
        }
        out.push_back(std::move(ep).value());
    }
    return out;
}

void ElectMany(ServiceBalancer& balancer, int picks) {
    for (int i = 0; i < picks; ++i) {
        auto r = balancer.Elect();
        if (!r.ok()) {
            rpclb::log::error("elect failed: {}", r.status().ToString());
            return;
        }
        rpclb::log::info("pick #{} -> {}", i + 1, r.value());
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string log_level;
    int picks = 6;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (a == "--picks" && i + 1 < argc) {
            picks = std::atoi(argv[++i]);
        }
    }

    if (config_path.empty()) {
        std::cerr << "Usage: balance_demo --config <file> [--log <level>] [--picks N]\n";
        return 2;
    }

    auto loaded = rpclb::config::Config::LoadFile(config_path);
    if (!loaded.ok()) {
        std::cerr << "Failed to load config: " << loaded.status().ToString() << "\n";
        return 2;
    }
    auto cfg = rpclb::config::LoadBalancerConfig(loaded.value());
    if (!cfg.ok()) {
        std::cerr << "Invalid config: " << cfg.status().ToString() << "\n";
        return 2;
    }
    const auto& opt = cfg.value();

    auto log_options = opt.log;
    if (!log_level.empty()) {
        log_options.level = log_level;
    }
    rpclb::log::Init(log_options);

    std::shared_ptr<rpclb::governance::InMemoryServiceDiscovery> registry;
    std::unique_ptr<ServiceBalancer> balancer;

    if (opt.service.empty()) {
        balancer = ServiceBalancer::FromWeights(opt.targets);
    } else {
        auto endpoints = EndpointsOf(opt.targets);
        if (!endpoints.ok()) {
            rpclb::log::error("invalid target: {}", endpoints.status().ToString());
            return 2;
        }
        registry = std::make_shared<rpclb::governance::InMemoryServiceDiscovery>();
        registry->Set(opt.service, endpoints.value());

        auto r = ServiceBalancer::FromDiscovery(opt.service, registry);
        if (!r.ok()) {
            rpclb::log::error("discovery failed: {}", r.status().ToString());
            return 1;
        }
        balancer = std::move(r).value();

        auto st = balancer->StartRefresh(opt.refresh);
        if (!st.ok()) {
            rpclb::log::error("cannot start refresh: {}", st.ToString());
            return 1;
        }
    }

    if (!balancer->HasTargets()) {
        rpclb::log::error("no targets configured");
        return 1;
    }

    ElectMany(*balancer, picks);

    auto first = *balancer->GetTargets().begin();
    balancer->RemoveTarget(first);
    rpclb::log::info("after failing {}: {} targets, {} failed", first, balancer->GetTargets().size(),
                     balancer->GetFailedTargets().size());
    ElectMany(*balancer, picks);

    balancer->RecoverTarget(first);
    ElectMany(*balancer, picks);

    if (registry) {
        registry->Set(opt.service, {Endpoint{"127.0.0.1", 9000}});
        std::this_thread::sleep_for(opt.refresh.delay + opt.refresh.period * 2);
        ElectMany(*balancer, picks);
        balancer->StopRefresh();
    }

    return 0;
}
