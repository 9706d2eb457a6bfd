#include <chtest.hpp>

#include <rpclb/governance/load_balancer.h>
#include <rpclb/governance/service_discovery.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using rpclb::governance::Endpoint;
using rpclb::governance::InMemoryServiceDiscovery;
using rpclb::governance::WeightedRoundRobinStrategy;
using rpclb::governance::WeightTable;

TEST_CASE("Elect visits every target and wraps to the first pick") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 2}, {"c:1", 3}});
    auto n = s.Sequence().size();
    REQUIRE(n == 6);

    std::vector<std::string> picks;
    for (std::size_t i = 0; i < n; ++i) {
        auto r = s.Elect();
        REQUIRE(r.ok());
        picks.push_back(r.value());
    }
    REQUIRE(picks == s.Sequence());
    REQUIRE(std::set<std::string>(picks.begin(), picks.end()) == s.GetTargets());

    auto again = s.Elect();
    REQUIRE(again.ok());
    REQUIRE(again.value() == picks[0]);
}

TEST_CASE("Elect without targets fails as not initialized") {
    WeightedRoundRobinStrategy s(WeightTable{});
    auto r = s.Elect();
    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == rpclb::StatusCode::failed_precondition);
    REQUIRE(s.GetTargets().empty());
    REQUIRE(!s.HasTargets());
}

TEST_CASE("RemoveTarget moves a target to the failed set with its weight") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 2}, {"b:1", 4}});
    s.RemoveTarget("b:1");

    REQUIRE(s.GetTargets().count("b:1") == 0);
    REQUIRE(s.GetFailedTargets().count("b:1") == 1);
    REQUIRE(s.FailedWeights().at("b:1") == 4);

    for (int i = 0; i < 5; ++i) {
        auto r = s.Elect();
        REQUIRE(r.ok());
        REQUIRE(r.value() == "a:1");
    }
}

TEST_CASE("RecoverTarget restores the original weight") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 3}});
    auto before = s.Sequence();

    s.RemoveTarget("b:1");
    s.RecoverTarget("b:1");

    REQUIRE(s.GetFailedTargets().empty());
    REQUIRE(s.GetTargets().count("b:1") == 1);
    REQUIRE(s.ActiveWeights().at("b:1") == 3);
    REQUIRE(s.Sequence() == before);
}

TEST_CASE("Removing twice is the same as removing once") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 1}, {"c:1", 1}});
    s.RemoveTarget("b:1");
    auto targets = s.GetTargets();
    auto failed = s.FailedWeights();
    auto seq = s.Sequence();

    s.RemoveTarget("b:1");
    REQUIRE(s.GetTargets() == targets);
    REQUIRE(s.FailedWeights() == failed);
    REQUIRE(s.Sequence() == seq);
}

TEST_CASE("Unknown targets are ignored") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 1}});
    s.Elect();

    s.RemoveTarget("z:1");
    s.RecoverTarget("a:1");
    REQUIRE(s.GetFailedTargets().empty());
    REQUIRE(s.GetTargets().size() == 2);

    // Cursor is untouched by no-ops.
    auto r = s.Elect();
    REQUIRE(r.ok());
    REQUIRE(r.value() == "b:1");
}

TEST_CASE("Membership change restarts the rotation") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 1}, {"c:1", 1}});
    REQUIRE(s.Elect().value() == "a:1");
    REQUIRE(s.Elect().value() == "b:1");

    s.RemoveTarget("c:1");
    REQUIRE(s.Elect().value() == "a:1");
}

TEST_CASE("Removing every target disables election until one recovers") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}});
    s.RemoveTarget("a:1");
    REQUIRE(!s.HasTargets());
    REQUIRE(!s.Elect().ok());

    s.RecoverTarget("a:1");
    REQUIRE(s.HasTargets());
    REQUIRE(s.Elect().value() == "a:1");
}

TEST_CASE("Weights below one are stored clamped") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 0}, {"b:1", 2}});
    REQUIRE(s.ActiveWeights().at("a:1") == 1);

    s.RemoveTarget("a:1");
    REQUIRE(s.FailedWeights().at("a:1") == 1);
}

TEST_CASE("ReInitialize replaces targets and forgets failures") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 5}, {"b:1", 5}});
    s.RemoveTarget("a:1");

    s.ReInitialize("echo", {Endpoint{"10.0.0.1", 80}, Endpoint{"10.0.0.2", 80}});

    REQUIRE(s.GetFailedTargets().empty());
    WeightTable expected{{"10.0.0.1:80", 1}, {"10.0.0.2:80", 1}};
    REQUIRE(s.ActiveWeights() == expected);
    REQUIRE(s.Sequence().size() == 2);

    std::vector<Endpoint> discovered{Endpoint{"10.0.0.1", 80}, Endpoint{"10.0.0.2", 80}};
    REQUIRE(s.DiscoveredEndpoints() == discovered);
}

TEST_CASE("FromDiscovery resolves the service once") {
    auto registry = std::make_shared<InMemoryServiceDiscovery>();
    registry->Set("echo", {Endpoint{"10.0.0.1", 80}, Endpoint{"10.0.0.2", 81}});

    auto r = WeightedRoundRobinStrategy::FromDiscovery("echo", registry);
    REQUIRE(r.ok());
    auto& s = *r.value();
    REQUIRE(s.service() == "echo");
    REQUIRE(s.discovery() == registry);

    std::set<std::string> expected{"10.0.0.1:80", "10.0.0.2:81"};
    REQUIRE(s.GetTargets() == expected);
}

TEST_CASE("FromDiscovery propagates lookup failures") {
    auto registry = std::make_shared<InMemoryServiceDiscovery>();
    registry->Set("echo", {Endpoint{"10.0.0.1", 80}});
    registry->SetUnavailable(true);

    auto r = WeightedRoundRobinStrategy::FromDiscovery("echo", registry);
    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == rpclb::StatusCode::unavailable);

    auto null_discovery = WeightedRoundRobinStrategy::FromDiscovery("echo", nullptr);
    REQUIRE(!null_discovery.ok());
}

TEST_CASE("DoReInit keeps current targets when discovery fails") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}});
    InMemoryServiceDiscovery registry;
    registry.SetUnavailable(true);

    auto st = s.DoReInit("echo", registry);
    REQUIRE(!st.ok());
    REQUIRE(s.GetTargets().count("a:1") == 1);

    registry.SetUnavailable(false);
    st = s.DoReInit("echo", registry);
    REQUIRE(st.ok());
    REQUIRE(!s.HasTargets());
}

TEST_CASE("Concurrent elections never see a removed target after removal") {
    WeightedRoundRobinStrategy s(WeightTable{{"a:1", 1}, {"b:1", 2}, {"c:1", 3}});

    std::atomic<bool> removed{false};
    std::atomic<int> errors{0};
    std::atomic<int> stale{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5000; ++i) {
                bool after = removed.load(std::memory_order_acquire);
                auto r = s.Elect();
                if (!r.ok()) {
                    errors.fetch_add(1);
                    continue;
                }
                if (after && r.value() == "b:1") {
                    stale.fetch_add(1);
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    s.RemoveTarget("b:1");
    removed.store(true, std::memory_order_release);

    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(errors.load() == 0);
    REQUIRE(stale.load() == 0);
    REQUIRE(s.GetTargets().count("b:1") == 0);
}
