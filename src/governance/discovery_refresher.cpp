#include <rpclb/governance/discovery_refresher.h>

#include <rpclb/core/log.h>

#include <boost/asio/post.hpp>

#include <exception>
#include <set>

namespace rpclb::governance {

rpclb::Status ValidateRefreshOptions(const RefreshOptions& options) {
    if (options.delay <= std::chrono::milliseconds::zero()) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "refresh delay must be > 0");
    }
    if (options.period <= std::chrono::milliseconds::zero()) {
        return rpclb::Status(rpclb::StatusCode::invalid_argument, "refresh period must be > 0");
    }
    return rpclb::Status::Ok();
}

DiscoveryRefresher::DiscoveryRefresher(std::shared_ptr<IServiceDiscovery> discovery, ChangeCallback on_change)
    : discovery_(std::move(discovery)), on_change_(std::move(on_change)), timer_(io_) {}

DiscoveryRefresher::~DiscoveryRefresher() {
    Stop();
}

rpclb::Status DiscoveryRefresher::Start(const ServiceMap& snapshot, RefreshOptions options) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    if (!discovery_) {
        return rpclb::Status(rpclb::StatusCode::failed_precondition, "no service discovery configured");
    }
    auto st = ValidateRefreshOptions(options);
    if (!st.ok()) {
        return st;
    }
    if (running_.load(std::memory_order_acquire)) {
        return rpclb::Status::Ok();
    }

    {
        std::lock_guard<std::mutex> cycle_lk(cycle_mu_);
        snapshot_ = snapshot;
    }
    options_ = options;

    io_.restart();
    next_deadline_ = std::chrono::steady_clock::now() + options_.delay;
    Arm();

    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { io_.run(); });

    rpclb::log::info("discovery refresh started: services={} delay={}ms period={}ms",
                     snapshot.size(), options_.delay.count(), options_.period.count());
    return rpclb::Status::Ok();
}

void DiscoveryRefresher::Stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    if (running_.exchange(false, std::memory_order_acq_rel)) {
        // The timer belongs to the worker thread.
        boost::asio::post(io_, [this] { timer_.cancel(); });
        rpclb::log::info("discovery refresh stopping");
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

void DiscoveryRefresher::Arm() {
    timer_.expires_at(next_deadline_);
    timer_.async_wait([this](const boost::system::error_code& ec) { OnTimer(ec); });
}

void DiscoveryRefresher::OnTimer(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !running()) {
        return;
    }

    if (ec) {
        rpclb::log::warn("discovery refresh timer error: {}", ec.message());
    } else {
        (void)RunCycle(true);
    }

    if (!running()) {
        return;
    }

    // Fixed rate: the next deadline does not drift with cycle duration.
    next_deadline_ += options_.period;
    Arm();
}

rpclb::Status DiscoveryRefresher::RefreshOnce() {
    if (!discovery_) {
        return rpclb::Status(rpclb::StatusCode::failed_precondition, "no service discovery configured");
    }
    return RunCycle(false);
}

rpclb::Result<ServiceMap> DiscoveryRefresher::Query(const std::set<std::string>& services) const {
    // Collaborators report failures through Result, but a throwing one must
    // not take the refresh thread down.
    try {
        return discovery_->List(services);
    } catch (const std::exception& e) {
        return rpclb::Status(rpclb::StatusCode::internal_error, std::string("discovery threw: ") + e.what());
    } catch (...) {
        return rpclb::Status(rpclb::StatusCode::internal_error, "discovery threw an unknown exception");
    }
}

rpclb::Status DiscoveryRefresher::RunCycle(bool scheduled) {
    std::lock_guard<std::mutex> lk(cycle_mu_);

    std::set<std::string> services;
    for (const auto& kv : snapshot_) {
        services.insert(kv.first);
    }

    auto r = Query(services);
    if (!r.ok()) {
        rpclb::log::warn("discovery refresh failed: {}", r.status().ToString());
        return r.status();
    }
    const auto& latest = r.value();

    for (auto& [service, known] : snapshot_) {
        // A stop skips whatever this cycle has not applied yet.
        if (scheduled && !running()) {
            break;
        }

        std::vector<Endpoint> fresh;
        auto it = latest.find(service);
        if (it != latest.end()) {
            fresh = it->second;
        }
        if (fresh == known) {
            continue;
        }

        rpclb::log::warn("service discovery list changed: service='{}' value={}", service, FormatEndpoints(fresh));
        known = std::move(fresh);

        if (!on_change_) {
            continue;
        }
        try {
            on_change_(service, known);
        } catch (const std::exception& e) {
            rpclb::log::warn("re-initialization of service '{}' failed: {}", service, e.what());
        } catch (...) {
            rpclb::log::warn("re-initialization of service '{}' failed: unknown exception", service);
        }
    }
    return rpclb::Status::Ok();
}

ServiceMap DiscoveryRefresher::Snapshot() const {
    std::lock_guard<std::mutex> lk(cycle_mu_);
    return snapshot_;
}

} // namespace rpclb::governance
