#pragma once

/**
 * @file file_synchronizer.hpp
 * @brief Per-file remote mutations shared by reconciliation and live events
 *
 * WHY THIS FILE EXISTS:
 * Startup reconciliation and the event dispatcher apply the same three
 * operations (create, write, remove) to single files. Keeping them here
 * means the index update, the tier-aware remote mapping and the dry-run /
 * archive switches live in exactly one place.
 *
 * ORDERING GUARANTEE:
 * Uploads are recorded only after the remote call succeeded (or was skipped
 * by dry run), so a failed mutation never leaves the index claiming an object
 * the store does not hold. Removals drop the entry first: the local file is
 * already gone and a failed delete is reported, not retried.
 */

#include "tiersync/core/result.hpp"
#include "tiersync/events/event_bus.hpp"
#include "tiersync/remote/store_client.hpp"
#include "tiersync/sync/checksum.hpp"
#include "tiersync/sync/remote_path.hpp"
#include "tiersync/sync/state_index.hpp"
#include "tiersync/sync/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tiersync::sync {

struct SyncOptions {
    bool dry_run = false;   ///< Skip every remote mutation, only update the index
    bool archive = false;   ///< Never delete before re-uploading
    RedundancyConfig redundancy;
};

class FileSynchronizer {
public:
    FileSynchronizer(std::filesystem::path root,
                     LocalStateIndex& index,
                     const NamespaceMap& namespaces,
                     const ChecksumProvider& checksum,
                     remote::RemoteStoreClient& store,
                     events::EventBus& bus,
                     SyncOptions options);

    FileSynchronizer(const FileSynchronizer&) = delete;
    FileSynchronizer& operator=(const FileSynchronizer&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

    /**
     * @brief Upload a local file to its staging path and index it
     *
     * @p path may be absolute or relative to the root.
     */
    Result<void> handle_create(const std::filesystem::path& path);

    /**
     * @brief handle_create() with the race recovery for duplicate creates
     *
     * On failure: ask the store whether the staging object exists; if so and
     * archive mode is off, delete it; then retry once. A second failure is
     * reported as ErrorKind::Race. Local (Io) failures are not retried.
     */
    Result<void> create_with_retry(const std::filesystem::path& path);

    /**
     * @brief React to a content change of an indexed file
     *
     * Once the old object is deleted the entry is marked remote-missing, so a
     * failed re-upload is retried by the next write instead of deleting again.
     *
     * RETURNS:
     * true when the fingerprint differed and the file was re-uploaded,
     * false when the file is not indexed or unchanged.
     */
    Result<bool> handle_write(const std::filesystem::path& path);

    /**
     * @brief Drop an indexed file's entry and delete its remote object
     *
     * The entry is dropped even when the delete fails; the error is returned
     * so the caller can report it. Removing an unindexed path is a no-op.
     */
    Result<void> handle_remove(const std::filesystem::path& path);

    /**
     * @brief Prune a directory and every file indexed beneath it
     *
     * Files still indexed under the directory go through handle_remove()
     * first. RETURNS the relative paths whose remote delete failed; each of
     * those is also reported as a SyncFailedEvent.
     */
    Result<std::vector<std::string>> remove_directory(const std::filesystem::path& path);

private:
    Result<std::string> to_relative(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    LocalStateIndex& index_;
    const NamespaceMap& namespaces_;
    const ChecksumProvider& checksum_;
    remote::RemoteStoreClient& store_;
    events::EventBus& bus_;
    SyncOptions options_;
};

} // namespace tiersync::sync
