#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/events/event_queue.hpp"
#include "tiersync/sync/types.hpp"

#include <filesystem>
#include <string>

namespace tiersync::watch {

/**
 * @brief Source of filesystem change notifications for a directory tree
 *
 * Watches are not recursive: every subdirectory must be added explicitly,
 * which the reconciler does at startup and the event dispatcher does when a
 * new directory appears.
 *
 * LIFECYCLE:
 * - events() and errors() stay valid until the watcher is destroyed
 * - close() shuts both queues down; pop() on them then drains and returns nullopt
 */
class DirectoryWatcher {
public:
    virtual ~DirectoryWatcher() = default;

    virtual Result<void> add_watch(const std::filesystem::path& directory) = 0;

    virtual events::ThreadSafeQueue<sync::WatchEvent>& events() = 0;

    /// Watcher-internal faults (queue overflow, read failures); non-fatal
    virtual events::ThreadSafeQueue<std::string>& errors() = 0;

    /// Idempotent; releases the OS resources and wakes every consumer
    virtual void close() = 0;
};

} // namespace tiersync::watch
