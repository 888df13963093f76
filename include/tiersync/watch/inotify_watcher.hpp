#pragma once

/**
 * @file inotify_watcher.hpp
 * @brief Linux inotify implementation of DirectoryWatcher
 *
 * WHY THIS FILE EXISTS:
 * The dispatcher needs an ordered stream of create/write/remove events for
 * every watched directory. inotify delivers them per watch descriptor; this
 * class owns the descriptor table, runs one reader thread and translates raw
 * masks into WatchEvent values.
 *
 * THREADING:
 * - The reader thread blocks in poll() on the inotify fd and an eventfd
 * - close() writes the eventfd, joins the thread, then closes both fds
 * - add_watch() may be called from any thread
 *
 * MASK MAPPING:
 * IN_CREATE, IN_MOVED_TO        -> Create
 * IN_CLOSE_WRITE, IN_MODIFY     -> Write
 * IN_DELETE, IN_MOVED_FROM      -> Remove
 * IN_Q_OVERFLOW                 -> errors() queue
 */

#include "tiersync/watch/directory_watcher.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace tiersync::watch {

class InotifyWatcher : public DirectoryWatcher {
public:
    static Result<std::unique_ptr<InotifyWatcher>> create();

    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    Result<void> add_watch(const std::filesystem::path& directory) override;

    events::ThreadSafeQueue<sync::WatchEvent>& events() override { return events_; }
    events::ThreadSafeQueue<std::string>& errors() override { return errors_; }

    void close() override;

    std::size_t watch_count() const;

    /**
     * @brief Translate an inotify mask into an event kind
     *
     * nullopt for masks the dispatcher has no use for (IN_IGNORED,
     * IN_ATTRIB, IN_OPEN, ...).
     */
    static std::optional<sync::WatchEvent::Kind> classify(std::uint32_t mask);

private:
    InotifyWatcher(int inotify_fd, int wake_fd);

    void run();
    void drain_inotify();
    void handle_raw_event(int wd, std::uint32_t mask, const char* name, std::uint32_t len);

    int inotify_fd_;
    int wake_fd_;
    std::atomic<bool> closed_{false};
    std::thread reader_;

    mutable std::mutex watches_mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
    std::unordered_map<std::string, int> path_to_wd_;

    events::ThreadSafeQueue<sync::WatchEvent> events_;
    events::ThreadSafeQueue<std::string> errors_;
};

} // namespace tiersync::watch
