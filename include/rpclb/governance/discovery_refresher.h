#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <rpclb/core/status.h>
#include <rpclb/governance/service_discovery.h>

namespace rpclb::governance {

struct RefreshOptions {
    // Before the first refresh cycle. Must be > 0.
    std::chrono::milliseconds delay{1000};
    // Between successive cycles (fixed rate). Must be > 0.
    std::chrono::milliseconds period{1000};
};

rpclb::Status ValidateRefreshOptions(const RefreshOptions& options);

// Polls service discovery on a dedicated thread and reports changed
// endpoint lists to its owner.
//
// A list counts as changed unless it is element-wise equal, in order, to the
// last one seen for that service. Failed cycles are logged and retried on
// the next period.
class DiscoveryRefresher {
public:
    using ChangeCallback = std::function<void(const std::string& service, const std::vector<Endpoint>& endpoints)>;

    DiscoveryRefresher(std::shared_ptr<IServiceDiscovery> discovery, ChangeCallback on_change);
    ~DiscoveryRefresher();

    DiscoveryRefresher(const DiscoveryRefresher&) = delete;
    DiscoveryRefresher& operator=(const DiscoveryRefresher&) = delete;

    // Tracks the services in snapshot (copied), starting from their lists.
    // No-op when already running.
    rpclb::Status Start(const ServiceMap& snapshot, RefreshOptions options);

    // Idempotent. Waits for a cycle in flight. Must not be called from the
    // change callback.
    void Stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // Runs one cycle on the calling thread, regardless of running().
    rpclb::Status RefreshOnce();

    ServiceMap Snapshot() const;

private:
    void Arm();
    void OnTimer(const boost::system::error_code& ec);
    rpclb::Result<ServiceMap> Query(const std::set<std::string>& services) const;
    rpclb::Status RunCycle(bool scheduled);

    std::shared_ptr<IServiceDiscovery> discovery_;
    ChangeCallback on_change_;
    RefreshOptions options_;

    std::mutex lifecycle_mu_; // Start / Stop

    mutable std::mutex cycle_mu_; // snapshot_, one cycle at a time
    ServiceMap snapshot_;

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::chrono::steady_clock::time_point next_deadline_{};
    std::thread worker_;
    std::atomic<bool> running_{false};
};

} // namespace rpclb::governance
