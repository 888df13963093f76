/**
 * @file components.hpp
 * @brief Observers attached to the sync engine's event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // ... run the folder ...
 * metrics.print_stats();
 */

#pragma once

#include "tiersync/events/event_bus.hpp"
#include "tiersync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace tiersync::events {

/**
 * @brief Logger component - writes every sync event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileUploadedEvent>([](const FileUploadedEvent& e) {
            spdlog::info("[Uploaded{}] {} -> {} bytes={}",
                e.dry_run ? ":dry-run" : "", e.relative_path, e.remote_path, e.bytes);
        });

        bus_.subscribe<FileDeletedEvent>([](const FileDeletedEvent& e) {
            spdlog::info("[Deleted{}] {} ({})",
                e.dry_run ? ":dry-run" : "", e.remote_path, e.relative_path);
        });

        bus_.subscribe<FileChangedEvent>([](const FileChangedEvent& e) {
            spdlog::info("[Changed] {} fingerprint {} -> {}",
                e.relative_path, e.old_fingerprint, e.new_fingerprint);
        });

        bus_.subscribe<SyncFailedEvent>([](const SyncFailedEvent& e) {
            spdlog::error("[SyncFailed] {} path={} kind={} error={}",
                e.operation, e.relative_path, to_string(e.kind), e.error_message);
        });

        bus_.subscribe<DirectoryRegisteredEvent>([](const DirectoryRegisteredEvent& e) {
            spdlog::debug("[DirRegistered] {}", e.relative_path);
        });

        bus_.subscribe<DirectoryPromotedEvent>([](const DirectoryPromotedEvent& e) {
            spdlog::info("[Promoted] {} -> {} redundancy={:.2f}",
                e.staging_path, e.production_path, e.redundancy);
        });

        bus_.subscribe<PromotionFailedEvent>([](const PromotionFailedEvent& e) {
            spdlog::warn("[PromotionFailed] {} error={}", e.remote_path, e.error_message);
        });

        bus_.subscribe<ReconcileCompletedEvent>([](const ReconcileCompletedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Reconciled {}", e.root);
            spdlog::info("  files={} dirs={} uploaded={} reuploaded={} in {}ms",
                e.files_seen, e.dirs_seen, e.uploaded, e.reuploaded, e.duration.count());
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<WatcherErrorEvent>([](const WatcherErrorEvent& e) {
            spdlog::warn("[WatcherError] {}", e.error_message);
        });

        bus_.subscribe<FolderClosedEvent>([](const FolderClosedEvent& e) {
            spdlog::info("Stopped watching {}", e.root);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Metrics component - counts sync activity
 *
 * Counters are atomics; the dispatcher and scheduler threads update them
 * concurrently.
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<size_t> files_uploaded{0};
        std::atomic<size_t> bytes_uploaded{0};
        std::atomic<size_t> files_deleted{0};
        std::atomic<size_t> files_changed{0};
        std::atomic<size_t> sync_failures{0};
        std::atomic<size_t> directories_promoted{0};
        std::atomic<size_t> promotion_failures{0};
        std::atomic<size_t> watcher_errors{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileUploadedEvent>([this](const FileUploadedEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<FileDeletedEvent>([this](const FileDeletedEvent&) {
            stats_.files_deleted++;
        });

        bus_.subscribe<FileChangedEvent>([this](const FileChangedEvent&) {
            stats_.files_changed++;
        });

        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) {
            stats_.sync_failures++;
        });

        bus_.subscribe<DirectoryPromotedEvent>([this](const DirectoryPromotedEvent&) {
            stats_.directories_promoted++;
        });

        bus_.subscribe<PromotionFailedEvent>([this](const PromotionFailedEvent&) {
            stats_.promotion_failures++;
        });

        bus_.subscribe<WatcherErrorEvent>([this](const WatcherErrorEvent&) {
            stats_.watcher_errors++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Files uploaded:   {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:   {}", stats_.bytes_uploaded.load());
        spdlog::info("  Files deleted:    {}", stats_.files_deleted.load());
        spdlog::info("  Files changed:    {}", stats_.files_changed.load());
        spdlog::info("  Sync failures:    {}", stats_.sync_failures.load());
        spdlog::info("  Dirs promoted:    {}", stats_.directories_promoted.load());
        spdlog::info("  Promotion errors: {}", stats_.promotion_failures.load());
        spdlog::info("  Watcher errors:   {}", stats_.watcher_errors.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace tiersync::events
