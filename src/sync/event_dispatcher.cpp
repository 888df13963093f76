#include "tiersync/sync/event_dispatcher.hpp"

#include "tiersync/events/events.hpp"
#include "tiersync/sync/remote_path.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace tiersync::sync {
namespace fs = std::filesystem;

namespace {

// Upper bound on how long a watcher error waits in its queue when no
// filesystem events arrive.
constexpr std::chrono::milliseconds kErrorDrainInterval{1000};

} // namespace

EventDispatcher::EventDispatcher(FileSynchronizer& synchronizer,
                                 LocalStateIndex& index,
                                 watch::DirectoryWatcher& watcher,
                                 events::EventBus& bus)
    : synchronizer_(synchronizer), index_(index), watcher_(watcher), bus_(bus) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    worker_ = std::thread([this]() { run(); });
}

void EventDispatcher::request_stop() {
    stopping_ = true;
}

void EventDispatcher::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void EventDispatcher::run() {
    auto& queue = watcher_.events();

    while (!stopping_.load()) {
        drain_errors();

        auto event = queue.pop_for(kErrorDrainInterval);
        if (!event) {
            if (queue.is_shutdown()) {
                break;
            }
            continue;
        }
        if (stopping_.load()) {
            break;
        }
        dispatch(*event);
    }

    drain_errors();
    spdlog::debug("Event dispatcher stopped after {} events", processed_.load());
}

void EventDispatcher::drain_errors() {
    while (auto message = watcher_.errors().try_pop()) {
        bus_.emit(events::WatcherErrorEvent{*message});
    }
}

void EventDispatcher::dispatch(const WatchEvent& event) {
    processed_++;

    auto rel = relative_key(synchronizer_.root(), event.path);
    if (rel.is_error()) {
        spdlog::debug("Ignoring {} event outside the root: {}", to_string(event.kind), event.path);
        return;
    }

    const fs::path path = synchronizer_.root() / rel.value();
    spdlog::debug("{} {}", to_string(event.kind), rel.value());

    if (event.kind == WatchEvent::Kind::Remove) {
        if (index_.has_dir(rel.value())) {
            auto pruned = synchronizer_.remove_directory(path);
            if (pruned.is_error()) {
                report_failure(rel.value(), "delete", pruned.error());
            }
            return;
        }
        auto removed = synchronizer_.handle_remove(path);
        if (removed.is_error()) {
            report_failure(rel.value(), "delete", removed.error());
        }
        return;
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        if (!index_.has_dir(rel.value())) {
            handle_new_directory(path, rel.value());
        }
        return;
    }

    if (event.kind == WatchEvent::Kind::Write) {
        auto written = synchronizer_.handle_write(path);
        if (written.is_error()) {
            report_failure(rel.value(), "write", written.error());
        }
        return;
    }

    auto created = synchronizer_.create_with_retry(path);
    if (created.is_error()) {
        report_failure(rel.value(), "upload", created.error());
    }
}

void EventDispatcher::handle_new_directory(const fs::path& path, const std::string& relative) {
    auto watched = watcher_.add_watch(path);
    if (watched.is_error()) {
        report_failure(relative, "watch", watched.error());
        return;
    }
    index_.set_dir_known(relative);
    bus_.emit(events::DirectoryRegisteredEvent{relative});

    // Anything created before the watch existed produced no event.
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        report_failure(relative, "watch", io_error("Failed to list " + path.string() + ": " + ec.message()));
        return;
    }

    const auto end = fs::directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec) {
            report_failure(relative, "watch", io_error("Failed to list " + path.string() + ": " + ec.message()));
            return;
        }
        if (stopping_.load()) {
            return;
        }

        const auto child = it->path();
        auto child_rel = relative_key(synchronizer_.root(), child);
        if (child_rel.is_error()) {
            continue;
        }

        const auto status = it->symlink_status(ec);
        if (ec) {
            continue;
        }
        if (fs::is_directory(status)) {
            if (!index_.has_dir(child_rel.value())) {
                handle_new_directory(child, child_rel.value());
            }
        } else if (fs::is_regular_file(status) && !index_.has_file(child_rel.value())) {
            auto created = synchronizer_.create_with_retry(child);
            if (created.is_error()) {
                report_failure(child_rel.value(), "upload", created.error());
            }
        }
    }
    if (ec) {
        report_failure(relative, "watch", io_error("Failed to list " + path.string() + ": " + ec.message()));
    }
}

void EventDispatcher::report_failure(const std::string& relative, const char* operation, const Error& error) {
    bus_.emit(events::SyncFailedEvent{relative, operation, error.kind, error.message});
}

} // namespace tiersync::sync
