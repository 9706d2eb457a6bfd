#pragma once

#include <string>
#include <string_view>

#include <rpclb/config/config.h>
#include <rpclb/core/log.h>
#include <rpclb/core/status.h>
#include <rpclb/governance/discovery_refresher.h>
#include <rpclb/governance/weighted_sequence.h>

namespace rpclb::config {

// {
//   "log_level": "info",
//   "log_pattern": "[{time}][{lvl}] {msg}",     // optional
//   "service": "echo",                          // optional, enables discovery
//   "targets": "10.0.0.1:8000=3,10.0.0.2:8000", // host:port[=weight]
//   "refresh_delay_ms": 1000,
//   "refresh_period_ms": 1000
// }
struct BalancerConfig {
    rpclb::log::LogOptions log;
    std::string service;
    governance::WeightTable targets;
    governance::RefreshOptions refresh;
};

rpclb::Result<BalancerConfig> LoadBalancerConfig(const Config& config);

// "a:1=3,b:2" -> {a:1: 3, b:2: 1}. Whitespace around entries is ignored.
rpclb::Result<governance::WeightTable> ParseWeightTable(std::string_view text);

} // namespace rpclb::config
