#include <chtest.hpp>

#include <rpclb/governance/service_discovery.h>

using rpclb::governance::Endpoint;
using rpclb::governance::InMemoryServiceDiscovery;

TEST_CASE("Endpoint keys are host:port") {
    REQUIRE(rpclb::governance::ToTargetKey(Endpoint{"10.0.0.1", 8080}) == "10.0.0.1:8080");

    auto ep = rpclb::governance::ParseEndpoint("backend.local:9000");
    REQUIRE(ep.ok());
    REQUIRE((ep.value() == Endpoint{"backend.local", 9000}));

    REQUIRE(!rpclb::governance::ParseEndpoint("backend.local").ok());
    REQUIRE(!rpclb::governance::ParseEndpoint(":80").ok());
    REQUIRE(!rpclb::governance::ParseEndpoint("h:0").ok());
    REQUIRE(!rpclb::governance::ParseEndpoint("h:70000").ok());
}

TEST_CASE("In-memory registry answers batched lookups") {
    InMemoryServiceDiscovery registry;
    registry.Set("echo", {Endpoint{"a", 1}, Endpoint{"b", 2}});
    registry.Set("kv", {Endpoint{"c", 3}});

    auto r = registry.List({"echo", "missing"});
    REQUIRE(r.ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value().at("echo").size() == 2);

    registry.Erase("echo");
    r = registry.List({"echo", "kv"});
    REQUIRE(r.ok());
    REQUIRE(r.value().count("echo") == 0);
    REQUIRE(r.value().count("kv") == 1);

    registry.SetUnavailable(true);
    REQUIRE(registry.List({"kv"}).status().code() == rpclb::StatusCode::unavailable);
}
