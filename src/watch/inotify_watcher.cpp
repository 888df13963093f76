#include "tiersync/watch/inotify_watcher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstring>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace tiersync::watch {
namespace {

constexpr std::uint32_t kWatchMask =
    IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_ONLYDIR;

constexpr std::size_t kReadBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

Result<std::unique_ptr<InotifyWatcher>> InotifyWatcher::create() {
    const int inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd == -1) {
        return Err<std::unique_ptr<InotifyWatcher>>(io_error(errno_message("inotify_init1")));
    }

    const int wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd == -1) {
        auto error = io_error(errno_message("eventfd"));
        ::close(inotify_fd);
        return Err<std::unique_ptr<InotifyWatcher>>(error);
    }

    std::unique_ptr<InotifyWatcher> watcher(new InotifyWatcher(inotify_fd, wake_fd));
    watcher->reader_ = std::thread([w = watcher.get()]() { w->run(); });
    return Ok(std::move(watcher));
}

InotifyWatcher::InotifyWatcher(int inotify_fd, int wake_fd)
    : inotify_fd_(inotify_fd), wake_fd_(wake_fd) {}

InotifyWatcher::~InotifyWatcher() {
    close();
}

Result<void> InotifyWatcher::add_watch(const std::filesystem::path& directory) {
    // Held across the fd use so close() cannot release the descriptor in between
    std::lock_guard lock(watches_mutex_);
    if (closed_.load()) {
        return Err<void>(io_error("Watcher is closed"));
    }

    const int wd = inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask);
    if (wd == -1) {
        return Err<void>(io_error(errno_message("inotify_add_watch " + directory.string())));
    }

    wd_to_path_[wd] = directory;
    path_to_wd_[directory.string()] = wd;
    spdlog::debug("Watching {} (wd={})", directory.string(), wd);
    return Ok();
}

std::size_t InotifyWatcher::watch_count() const {
    std::lock_guard lock(watches_mutex_);
    return wd_to_path_.size();
}

void InotifyWatcher::close() {
    {
        std::lock_guard lock(watches_mutex_);
        if (closed_.exchange(true)) {
            return;
        }
    }

    const std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
        spdlog::warn("{}", errno_message("Failed to wake inotify reader"));
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    {
        std::lock_guard lock(watches_mutex_);
        ::close(inotify_fd_);
        ::close(wake_fd_);
        wd_to_path_.clear();
        path_to_wd_.clear();
    }

    events_.shutdown();
    errors_.shutdown();
}

std::optional<sync::WatchEvent::Kind> InotifyWatcher::classify(std::uint32_t mask) {
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        return sync::WatchEvent::Kind::Create;
    }
    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        return sync::WatchEvent::Kind::Remove;
    }
    if (mask & (IN_CLOSE_WRITE | IN_MODIFY)) {
        return sync::WatchEvent::Kind::Write;
    }
    return std::nullopt;
}

void InotifyWatcher::run() {
    pollfd fds[2];
    fds[0].fd = inotify_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fd_;
    fds[1].events = POLLIN;

    while (!closed_.load()) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        const int ready = ::poll(fds, 2, -1);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            errors_.push(errno_message("poll"));
            return;
        }

        if (fds[1].revents & POLLIN) {
            return;
        }
        if (fds[0].revents & POLLIN) {
            drain_inotify();
        }
    }
}

void InotifyWatcher::drain_inotify() {
    alignas(struct inotify_event) char buffer[kReadBufferSize];

    for (;;) {
        const ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            errors_.push(errno_message("read inotify"));
            return;
        }
        if (length == 0) {
            return;
        }

        ssize_t offset = 0;
        while (offset < length) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            handle_raw_event(event->wd, event->mask, event->name, event->len);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
        }
    }
}

void InotifyWatcher::handle_raw_event(int wd, std::uint32_t mask, const char* name, std::uint32_t len) {
    if (mask & IN_Q_OVERFLOW) {
        errors_.push("inotify event queue overflowed; changes may have been missed");
        return;
    }

    std::filesystem::path directory;
    {
        std::lock_guard lock(watches_mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) {
            return;
        }
        directory = it->second;

        // The kernel dropped the watch (directory deleted or unmounted)
        if (mask & IN_IGNORED) {
            path_to_wd_.erase(it->second.string());
            wd_to_path_.erase(it);
            return;
        }
    }

    auto kind = classify(mask);
    if (!kind || len == 0) {
        return;
    }

    sync::WatchEvent event;
    event.path = (directory / name).string();
    event.kind = *kind;
    events_.push(std::move(event));
}

} // namespace tiersync::watch
