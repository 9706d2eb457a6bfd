#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <rpclb/core/status.h>

namespace rpclb::governance {

struct Endpoint {
    std::string host;
    std::uint16_t port = 0;

    friend bool operator==(const Endpoint&, const Endpoint&) = default;
};

// "host:port", the identifier the strategies elect.
std::string ToTargetKey(const Endpoint& endpoint);

rpclb::Result<Endpoint> ParseEndpoint(std::string_view text);

// "[a:1, b:2]", for logging.
std::string FormatEndpoints(const std::vector<Endpoint>& endpoints);

// service name -> ordered endpoint list
using ServiceMap = std::map<std::string, std::vector<Endpoint>>;

class IServiceDiscovery {
public:
    virtual ~IServiceDiscovery() = default;

    // Thread-safe. Batched lookup; a service missing from the returned map
    // has no endpoints.
    virtual rpclb::Result<ServiceMap> List(const std::set<std::string>& services) const = 0;
};

// A simple in-process registry. Useful for tests / single-process demos.
class InMemoryServiceDiscovery final : public IServiceDiscovery {
public:
    // Thread-safe
    void Set(std::string service, std::vector<Endpoint> endpoints);
    void Erase(std::string_view service);

    // While set, List() fails with StatusCode::unavailable.
    void SetUnavailable(bool unavailable);

    rpclb::Result<ServiceMap> List(const std::set<std::string>& services) const override;

private:
    mutable std::mutex mu_;
    ServiceMap table_;
    bool unavailable_ = false;
};

} // namespace rpclb::governance
