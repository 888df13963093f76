/**
 * @file events.hpp
 * @brief Domain events emitted by the sync engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileUploadedEvent, DirectoryPromotedEvent
 * - Failure events carry the ErrorKind and message of the Result that failed
 */

#pragma once

#include "tiersync/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tiersync::events {

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a local file was uploaded to the staging namespace
 *
 * WHO EMITS:
 * - FileSynchronizer::handle_create (startup reconcile and live creates)
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent, MetricsComponent
 */
struct FileUploadedEvent {
    std::string relative_path;
    std::string remote_path;
    std::uint64_t bytes = 0;
    bool dry_run = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after a remote object was deleted for a local file
 *
 * WHO EMITS:
 * - FileSynchronizer::handle_remove (remove events, delete-before-reupload)
 */
struct FileDeletedEvent {
    std::string relative_path;
    std::string remote_path;
    bool dry_run = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a write changed an indexed file's fingerprint
 */
struct FileChangedEvent {
    std::string relative_path;
    std::string old_fingerprint;
    std::string new_fingerprint;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a remote mutation for a file failed and was dropped
 */
struct SyncFailedEvent {
    std::string relative_path;
    std::string operation;  // "upload", "delete", "write", "watch"
    ErrorKind kind = ErrorKind::Remote;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Directory Events
// ════════════════════════════════════════════════════════

struct DirectoryRegisteredEvent {
    std::string relative_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after a staging directory was renamed into production
 *
 * WHO EMITS: PromotionScheduler
 */
struct DirectoryPromotedEvent {
    std::string staging_path;
    std::string production_path;
    double redundancy = 0.0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PromotionFailedEvent {
    std::string remote_path;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once startup reconciliation finished
 */
struct ReconcileCompletedEvent {
    std::string root;
    std::size_t files_seen = 0;
    std::size_t dirs_seen = 0;
    std::size_t uploaded = 0;
    std::size_t reuploaded = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct WatcherErrorEvent {
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FolderClosedEvent {
    std::string root;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace tiersync::events
