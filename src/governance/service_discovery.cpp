#include <rpclb/governance/service_discovery.h>

#include <charconv>

namespace rpclb::governance {

std::string ToTargetKey(const Endpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

rpclb::Result<Endpoint> ParseEndpoint(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "expected host:port");
    }
    auto host = text.substr(0, colon);
    auto port_sv = text.substr(colon + 1);
    if (host.empty() || port_sv.empty()) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "expected host:port");
    }

    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (ec != std::errc() || ptr != port_sv.data() + port_sv.size() || port == 0 || port > 65535) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "invalid port");
    }

    Endpoint ep;
    ep.host = std::string(host);
    ep.port = static_cast<std::uint16_t>(port);
    return ep;
}

std::string FormatEndpoints(const std::vector<Endpoint>& endpoints) {
    std::string out = "[";
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += ToTargetKey(endpoints[i]);
    }
    out += "]";
    return out;
}

void InMemoryServiceDiscovery::Set(std::string service, std::vector<Endpoint> endpoints) {
    std::lock_guard<std::mutex> lk(mu_);
    table_[std::move(service)] = std::move(endpoints);
}

void InMemoryServiceDiscovery::Erase(std::string_view service) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = table_.find(std::string(service));
    if (it != table_.end()) {
        table_.erase(it);
    }
}

void InMemoryServiceDiscovery::SetUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lk(mu_);
    unavailable_ = unavailable;
}

rpclb::Result<ServiceMap> InMemoryServiceDiscovery::List(const std::set<std::string>& services) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (unavailable_) {
        return rpclb::Status(rpclb::StatusCode::unavailable, "service registry unavailable");
    }

    ServiceMap out;
    for (const auto& service : services) {
        auto it = table_.find(service);
        if (it != table_.end()) {
            out.emplace(service, it->second);
        }
    }
    return out;
}

} // namespace rpclb::governance
