#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/events/event_bus.hpp"
#include "tiersync/remote/store_client.hpp"
#include "tiersync/sync/checksum.hpp"
#include "tiersync/sync/file_synchronizer.hpp"
#include "tiersync/sync/remote_path.hpp"
#include "tiersync/sync/state_index.hpp"
#include "tiersync/watch/directory_watcher.hpp"

#include <chrono>
#include <cstddef>

namespace tiersync::sync {

/**
 * @brief Outcome of one startup reconciliation
 */
struct ReconcileReport {
    std::size_t files_seen = 0;
    std::size_t dirs_seen = 0;
    std::size_t uploaded = 0;     ///< Missing from both namespaces
    std::size_t reuploaded = 0;   ///< Size differed from the staging copy
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Startup pass converging the index and the store from ground truth
 *
 * Nothing is persisted between runs, so every start walks the whole tree and
 * diffs it against the remote listing. Running it twice against an
 * unchanged tree and store uploads nothing the second time.
 *
 * Steps:
 * 1. walk          - seed the index and the watch set
 * 2. upload_missing - upload files absent from staging and production
 * 3. upload_changed - re-upload staging files whose size no longer matches
 *
 * Any failure aborts: a partially seeded index is never handed to the
 * live dispatcher.
 */
class Reconciler {
public:
    Reconciler(FileSynchronizer& synchronizer,
               LocalStateIndex& index,
               const NamespaceMap& namespaces,
               const ChecksumProvider& checksum,
               remote::RemoteStoreClient& store,
               watch::DirectoryWatcher& watcher,
               events::EventBus& bus);

    Result<ReconcileReport> reconcile();

private:
    Result<void> walk(ReconcileReport& report);
    Result<void> upload_missing(ReconcileReport& report);
    Result<void> upload_changed(ReconcileReport& report);

    FileSynchronizer& synchronizer_;
    LocalStateIndex& index_;
    const NamespaceMap& namespaces_;
    const ChecksumProvider& checksum_;
    remote::RemoteStoreClient& store_;
    watch::DirectoryWatcher& watcher_;
    events::EventBus& bus_;
};

} // namespace tiersync::sync
