#pragma once

#include "tiersync/events/event_bus.hpp"
#include "tiersync/sync/file_synchronizer.hpp"
#include "tiersync/sync/state_index.hpp"
#include "tiersync/sync/types.hpp"
#include "tiersync/watch/directory_watcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace tiersync::sync {

/**
 * @brief Long-running loop applying watcher events to the index and store
 *
 * Events are handled one at a time in arrival order: a write, remove and
 * re-create of the same path must reach the store in that order.
 *
 * DISPATCH TABLE:
 * - Create/Write naming a new directory -> watch, register, create its files
 * - Write  -> FileSynchronizer::handle_write
 * - Create -> FileSynchronizer::create_with_retry
 * - Remove -> remove_directory for registered dirs, handle_remove otherwise
 *
 * A failed event is reported as SyncFailedEvent and dropped; the loop only
 * ends on stop or when the watcher's queue shuts down.
 */
class EventDispatcher {
public:
    EventDispatcher(FileSynchronizer& synchronizer,
                    LocalStateIndex& index,
                    watch::DirectoryWatcher& watcher,
                    events::EventBus& bus);

    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();

    /// Stop accepting events; does not wait for the loop
    void request_stop();

    void join();

    void stop() {
        request_stop();
        join();
    }

    /**
     * @brief Apply one event synchronously on the caller's thread
     */
    void dispatch(const WatchEvent& event);

    [[nodiscard]] std::size_t processed() const noexcept { return processed_.load(); }

private:
    void run();
    void drain_errors();
    void handle_new_directory(const std::filesystem::path& path, const std::string& relative);
    void report_failure(const std::string& relative, const char* operation, const Error& error);

    FileSynchronizer& synchronizer_;
    LocalStateIndex& index_;
    watch::DirectoryWatcher& watcher_;
    events::EventBus& bus_;

    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> processed_{0};
    std::thread worker_;
};

} // namespace tiersync::sync
