#include <rpclb/config/balancer_config.h>

#include <charconv>
#include <chrono>

namespace rpclb::config {
namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

rpclb::Result<governance::WeightTable> ParseWeightTable(std::string_view text) {
    governance::WeightTable table;

    while (!text.empty()) {
        auto comma = text.find(',');
        auto entry = Trim(comma == std::string_view::npos ? text : text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        int weight = governance::kMinWeight;
        auto eq = entry.find('=');
        auto key = Trim(entry.substr(0, eq));
        if (eq != std::string_view::npos) {
            auto weight_sv = Trim(entry.substr(eq + 1));
            auto [ptr, ec] = std::from_chars(weight_sv.data(), weight_sv.data() + weight_sv.size(), weight);
            if (weight_sv.empty() || ec != std::errc() || ptr != weight_sv.data() + weight_sv.size()) {
                return rpclb::Status(rpclb::StatusCode::invalid_argument,
                                     "invalid weight in target entry: " + std::string(entry));
            }
        }
        if (key.empty()) {
            return rpclb::Status(rpclb::StatusCode::invalid_argument,
                                 "empty target in entry: " + std::string(entry));
        }

        table[std::string(key)] = weight;
    }
    return table;
}

rpclb::Result<BalancerConfig> LoadBalancerConfig(const Config& config) {
    BalancerConfig out;

    auto level = config.GetStringOr("log_level", out.log.level);
    if (!level.ok()) {
        return level.status();
    }
    if (!rpclb::log::IsKnownLevel(level.value())) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "unknown log_level: " + level.value());
    }
    out.log.level = std::move(level).value();

    auto pattern = config.GetStringOr("log_pattern", out.log.pattern);
    if (!pattern.ok()) {
        return pattern.status();
    }
    out.log.pattern = std::move(pattern).value();

    auto service = config.GetStringOr("service", "");
    if (!service.ok()) {
        return service.status();
    }
    out.service = std::move(service).value();

    auto targets = config.GetStringOr("targets", "");
    if (!targets.ok()) {
        return targets.status();
    }
    auto table = ParseWeightTable(targets.value());
    if (!table.ok()) {
        return table.status();
    }
    out.targets = std::move(table).value();

    auto delay = config.GetIntOr("refresh_delay_ms", static_cast<int>(out.refresh.delay.count()));
    if (!delay.ok()) {
        return delay.status();
    }
    auto period = config.GetIntOr("refresh_period_ms", static_cast<int>(out.refresh.period.count()));
    if (!period.ok()) {
        return period.status();
    }
    out.refresh.delay = std::chrono::milliseconds(delay.value());
    out.refresh.period = std::chrono::milliseconds(period.value());

    auto st = governance::ValidateRefreshOptions(out.refresh);
    if (!st.ok()) {
        return st;
    }

    return out;
}

} // namespace rpclb::config
