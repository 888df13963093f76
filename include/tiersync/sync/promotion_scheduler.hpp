#pragma once

/**
 * @file promotion_scheduler.hpp
 * @brief Timer loop moving healthy staging directories into production
 *
 * WHY THIS FILE EXISTS:
 * Fresh uploads land in the staging namespace while the store is still
 * repairing them. Once the store reports that a directory's worst-case
 * redundancy exceeds the threshold, the whole directory is renamed into the
 * production namespace.
 *
 * STATE MACHINE (per child directory):
 *   staging --[aggregate_min_redundancy > threshold]--> production
 *
 * FAILURE POLICY:
 * - Health fetch failure: that category is skipped for this tick
 * - Rename failure: that child is skipped, the others are still evaluated
 * - Nothing stops the loop except stop()
 */

#include "tiersync/events/event_bus.hpp"
#include "tiersync/remote/store_client.hpp"
#include "tiersync/sync/remote_path.hpp"
#include "tiersync/sync/state_index.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tiersync::sync {

struct PromotionOptions {
    std::chrono::milliseconds interval{5000};
    double threshold = 1.0;

    /// Top-level directories under staging to inspect; empty = staging itself
    std::vector<std::string> categories;
};

class PromotionScheduler {
public:
    PromotionScheduler(remote::RemoteStoreClient& store,
                       const NamespaceMap& namespaces,
                       LocalStateIndex& index,
                       events::EventBus& bus,
                       PromotionOptions options);

    ~PromotionScheduler();

    PromotionScheduler(const PromotionScheduler&) = delete;
    PromotionScheduler& operator=(const PromotionScheduler&) = delete;

    void start();

    /// Set the stop flag and wake the timer wait
    void request_stop();

    void join();

    void stop() {
        request_stop();
        join();
    }

    /**
     * @brief Run one evaluation pass on the caller's thread
     *
     * RETURNS: number of directories renamed into production
     */
    std::size_t tick();

    [[nodiscard]] std::size_t ticks() const noexcept { return ticks_.load(); }

private:
    void run();
    std::size_t promote_children(const std::string& staging_dir);

    remote::RemoteStoreClient& store_;
    const NamespaceMap& namespaces_;
    LocalStateIndex& index_;
    events::EventBus& bus_;
    PromotionOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> ticks_{0};
    std::thread worker_;
};

} // namespace tiersync::sync
