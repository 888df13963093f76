#include "tiersync/sync/file_synchronizer.hpp"

#include "tiersync/events/events.hpp"

#include <spdlog/spdlog.h>

namespace tiersync::sync {
namespace fs = std::filesystem;

FileSynchronizer::FileSynchronizer(fs::path root,
                                   LocalStateIndex& index,
                                   const NamespaceMap& namespaces,
                                   const ChecksumProvider& checksum,
                                   remote::RemoteStoreClient& store,
                                   events::EventBus& bus,
                                   SyncOptions options)
    : root_(std::move(root)),
      index_(index),
      namespaces_(namespaces),
      checksum_(checksum),
      store_(store),
      bus_(bus),
      options_(options) {}

Result<std::string> FileSynchronizer::to_relative(const fs::path& path) const {
    return relative_key(root_, path);
}

Result<void> FileSynchronizer::handle_create(const fs::path& path) {
    auto rel = to_relative(path);
    if (rel.is_error()) {
        return Err<void>(rel.error());
    }
    const auto local = root_ / rel.value();

    auto fingerprint = checksum_.fingerprint(local);
    if (fingerprint.is_error()) {
        return Err<void>(fingerprint.error());
    }
    auto size = ChecksumProvider::file_size(local);
    if (size.is_error()) {
        return Err<void>(size.error());
    }

    const auto remote = namespaces_.staging_path(rel.value());
    if (!options_.dry_run) {
        auto uploaded = store_.upload_file(local, remote, options_.redundancy);
        if (uploaded.is_error()) {
            return uploaded;
        }
    }

    index_.set_file(rel.value(), std::move(fingerprint.value()), Tier::Staging);
    bus_.emit(events::FileUploadedEvent{rel.value(), remote, size.value(), options_.dry_run});
    return Ok();
}

Result<void> FileSynchronizer::create_with_retry(const fs::path& path) {
    auto first = handle_create(path);
    if (first.is_ok() || first.error().kind != ErrorKind::Remote) {
        return first;
    }

    auto rel = to_relative(path);
    if (rel.is_error()) {
        return Err<void>(rel.error());
    }
    const auto remote = namespaces_.staging_path(rel.value());
    spdlog::warn("Create of {} failed ({}), checking for an existing object", rel.value(), first.error().message);

    auto exists = store_.file_exists(remote);
    if (exists.is_error()) {
        spdlog::warn("Existence check for {} failed: {}", remote, exists.error().message);
    } else if (exists.value() && !options_.archive) {
        auto deleted = store_.delete_file(remote);
        if (deleted.is_error()) {
            spdlog::warn("Failed to clear stale object {}: {}", remote, deleted.error().message);
        } else {
            bus_.emit(events::FileDeletedEvent{rel.value(), remote, false});
        }
    }

    auto second = handle_create(path);
    if (second.is_error()) {
        return Err<void>(race_error("Create of " + rel.value() + " failed after retry: " + second.error().message));
    }
    return Ok();
}

Result<bool> FileSynchronizer::handle_write(const fs::path& path) {
    auto rel = to_relative(path);
    if (rel.is_error()) {
        return Err<bool>(rel.error());
    }

    auto entry = index_.get_file(rel.value());
    if (!entry) {
        return Ok(false);
    }

    auto fingerprint = checksum_.fingerprint(root_ / rel.value());
    if (fingerprint.is_error()) {
        return Err<bool>(fingerprint.error());
    }
    const bool changed = fingerprint.value() != entry->fingerprint;
    if (!changed && entry->remote_present) {
        return Ok(false);
    }
    if (changed) {
        bus_.emit(events::FileChangedEvent{rel.value(), entry->fingerprint, fingerprint.value()});
    }

    // A previous write already removed the old object; only the upload is owed.
    if (!options_.archive && entry->remote_present) {
        const auto remote = namespaces_.remote_path(rel.value(), entry->tier);
        if (!options_.dry_run) {
            auto deleted = store_.delete_file(remote);
            if (deleted.is_error()) {
                return Err<bool>(deleted.error());
            }
            index_.mark_remote_missing(rel.value(), fingerprint.value());
        }
        bus_.emit(events::FileDeletedEvent{rel.value(), remote, options_.dry_run});
    }

    auto created = handle_create(rel.value());
    if (created.is_error()) {
        return Err<bool>(created.error());
    }
    return Ok(true);
}

Result<void> FileSynchronizer::handle_remove(const fs::path& path) {
    auto rel = to_relative(path);
    if (rel.is_error()) {
        return Err<void>(rel.error());
    }

    auto entry = index_.get_file(rel.value());
    if (!entry) {
        return Ok();
    }

    // The local file is gone either way, so the entry never outlives this call.
    index_.remove_file(rel.value());
    if (!entry->remote_present) {
        return Ok();
    }

    const auto remote = namespaces_.remote_path(rel.value(), entry->tier);
    if (!options_.dry_run) {
        auto deleted = store_.delete_file(remote);
        if (deleted.is_error()) {
            return Err<void>(Error(deleted.error().kind, "Dropped " + rel.value() + " but could not delete " +
                                                         remote + ": " + deleted.error().message));
        }
    }

    bus_.emit(events::FileDeletedEvent{rel.value(), remote, options_.dry_run});
    return Ok();
}

Result<std::vector<std::string>> FileSynchronizer::remove_directory(const fs::path& path) {
    auto rel = to_relative(path);
    if (rel.is_error()) {
        return Err<std::vector<std::string>>(rel.error());
    }

    const auto prefix = rel.value() + "/";
    std::vector<std::string> failed;
    for (const auto& file : index_.file_paths()) {
        if (file.rfind(prefix, 0) != 0) {
            continue;
        }
        auto removed = handle_remove(file);
        if (removed.is_error()) {
            bus_.emit(events::SyncFailedEvent{file, "delete", removed.error().kind, removed.error().message});
            failed.push_back(file);
        }
    }

    index_.remove_dir(rel.value());
    if (!failed.empty()) {
        spdlog::warn("Pruned {} with {} file(s) whose remote delete failed", rel.value(), failed.size());
    }
    return Ok(failed);
}

} // namespace tiersync::sync
