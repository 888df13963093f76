#include "tiersync/sync/promotion_scheduler.hpp"

#include "tiersync/events/events.hpp"

#include <spdlog/spdlog.h>

namespace tiersync::sync {

PromotionScheduler::PromotionScheduler(remote::RemoteStoreClient& store,
                                       const NamespaceMap& namespaces,
                                       LocalStateIndex& index,
                                       events::EventBus& bus,
                                       PromotionOptions options)
    : store_(store),
      namespaces_(namespaces),
      index_(index),
      bus_(bus),
      options_(std::move(options)) {}

PromotionScheduler::~PromotionScheduler() {
    stop();
}

void PromotionScheduler::start() {
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    worker_ = std::thread([this]() { run(); });
}

void PromotionScheduler::request_stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

void PromotionScheduler::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PromotionScheduler::run() {
    spdlog::debug("Promotion scheduler running every {}ms", options_.interval.count());

    std::unique_lock lock(mutex_);
    while (!stopping_.load()) {
        if (cv_.wait_for(lock, options_.interval, [this]() { return stopping_.load(); })) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

std::size_t PromotionScheduler::tick() {
    ticks_++;
    std::size_t promoted = 0;

    if (options_.categories.empty()) {
        return promote_children(namespaces_.staging_prefix());
    }
    for (const auto& category : options_.categories) {
        if (stopping_.load()) {
            break;
        }
        promoted += promote_children(namespaces_.staging_path(category));
    }
    return promoted;
}

std::size_t PromotionScheduler::promote_children(const std::string& staging_dir) {
    auto health = store_.directory_health(staging_dir);
    if (health.is_error()) {
        bus_.emit(events::PromotionFailedEvent{staging_dir, health.error().message});
        return 0;
    }

    const auto& children = health.value();
    std::size_t promoted = 0;

    // Element 0 is the queried directory itself.
    for (std::size_t i = 1; i < children.size(); ++i) {
        if (stopping_.load()) {
            break;
        }

        const auto& child = children[i];
        if (!(child.aggregate_min_redundancy > options_.threshold)) {
            continue;
        }

        auto target = namespaces_.promote(child.remote_path);
        if (target.is_error()) {
            bus_.emit(events::PromotionFailedEvent{child.remote_path, target.error().message});
            continue;
        }

        auto renamed = store_.rename_path(child.remote_path, target.value());
        if (renamed.is_error()) {
            bus_.emit(events::PromotionFailedEvent{child.remote_path, renamed.error().message});
            continue;
        }

        if (auto relative = namespaces_.relative_of(child.remote_path, Tier::Staging)) {
            index_.mark_promoted(*relative);
        }
        bus_.emit(events::DirectoryPromotedEvent{
            clean_remote(child.remote_path), target.value(), child.aggregate_min_redundancy});
        promoted++;
    }
    return promoted;
}

} // namespace tiersync::sync
