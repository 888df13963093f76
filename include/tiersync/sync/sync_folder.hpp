#pragma once

/**
 * @file sync_folder.hpp
 * @brief One synchronized root: owns the index, watcher and both loops
 *
 * WHY THIS FILE EXISTS:
 * Startup and shutdown have a strict order that no single component can
 * enforce on its own. SyncFolder is that order.
 *
 * STARTUP (open):
 * 1. Watch the root
 * 2. Reconcile (walk, upload missing, upload changed) on the caller's thread
 * 3. Start the event dispatcher and the promotion scheduler threads
 *
 * SHUTDOWN (close, idempotent):
 * 1. Raise both stop flags; no new remote call starts after this
 * 2. Close the watcher, which wakes the dispatcher
 * 3. Wake the scheduler and join both threads; in-flight calls are bounded
 *    by the remote timeout
 *
 * EXAMPLE:
 * auto folder = SyncFolder::open(config, client, std::move(watcher), bus);
 * if (folder.is_error()) { ... }
 * // ... run until signalled ...
 * folder.value()->close();
 */

#include "tiersync/core/config.hpp"
#include "tiersync/core/result.hpp"
#include "tiersync/events/event_bus.hpp"
#include "tiersync/remote/store_client.hpp"
#include "tiersync/sync/checksum.hpp"
#include "tiersync/sync/event_dispatcher.hpp"
#include "tiersync/sync/file_synchronizer.hpp"
#include "tiersync/sync/promotion_scheduler.hpp"
#include "tiersync/sync/reconciler.hpp"
#include "tiersync/sync/remote_path.hpp"
#include "tiersync/sync/state_index.hpp"
#include "tiersync/watch/directory_watcher.hpp"

#include <atomic>
#include <memory>

namespace tiersync::sync {

class SyncFolder {
public:
    static Result<std::unique_ptr<SyncFolder>> open(const SyncConfig& config,
                                                    remote::RemoteStoreClient& store,
                                                    std::unique_ptr<watch::DirectoryWatcher> watcher,
                                                    events::EventBus& bus);

    ~SyncFolder();

    SyncFolder(const SyncFolder&) = delete;
    SyncFolder& operator=(const SyncFolder&) = delete;

    void close();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const ReconcileReport& startup_report() const noexcept { return report_; }

    LocalStateIndex& index() { return index_; }
    EventDispatcher& dispatcher() { return dispatcher_; }
    PromotionScheduler& scheduler() { return scheduler_; }

private:
    SyncFolder(const SyncConfig& config,
               remote::RemoteStoreClient& store,
               std::unique_ptr<watch::DirectoryWatcher> watcher,
               events::EventBus& bus);

    std::filesystem::path root_;
    events::EventBus& bus_;
    std::unique_ptr<watch::DirectoryWatcher> watcher_;

    LocalStateIndex index_;
    NamespaceMap namespaces_;
    ChecksumProvider checksum_;
    FileSynchronizer synchronizer_;
    EventDispatcher dispatcher_;
    PromotionScheduler scheduler_;

    ReconcileReport report_;
    std::atomic<bool> closed_{false};
};

} // namespace tiersync::sync
