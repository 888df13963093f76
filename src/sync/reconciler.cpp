#include "tiersync/sync/reconciler.hpp"

#include "tiersync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <unordered_set>

namespace tiersync::sync {
namespace fs = std::filesystem;

namespace {

Result<std::unordered_set<std::string>> list_relative(remote::RemoteStoreClient& store,
                                                      const NamespaceMap& namespaces,
                                                      Tier tier) {
    auto files = store.list_files(namespaces.remote_path("", tier));
    if (files.is_error()) {
        return Err<std::unordered_set<std::string>>(files.error());
    }

    std::unordered_set<std::string> relative;
    for (const auto& file : files.value()) {
        if (auto rel = namespaces.relative_of(file.remote_path, tier)) {
            relative.insert(*rel);
        }
    }
    return Ok(relative);
}

} // namespace

Reconciler::Reconciler(FileSynchronizer& synchronizer,
                       LocalStateIndex& index,
                       const NamespaceMap& namespaces,
                       const ChecksumProvider& checksum,
                       remote::RemoteStoreClient& store,
                       watch::DirectoryWatcher& watcher,
                       events::EventBus& bus)
    : synchronizer_(synchronizer),
      index_(index),
      namespaces_(namespaces),
      checksum_(checksum),
      store_(store),
      watcher_(watcher),
      bus_(bus) {}

Result<ReconcileReport> Reconciler::reconcile() {
    const auto started = std::chrono::steady_clock::now();
    ReconcileReport report;

    auto walked = walk(report);
    if (walked.is_error()) {
        return Err<ReconcileReport>(walked.error());
    }
    auto missing = upload_missing(report);
    if (missing.is_error()) {
        return Err<ReconcileReport>(missing.error());
    }
    auto changed = upload_changed(report);
    if (changed.is_error()) {
        return Err<ReconcileReport>(changed.error());
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    events::ReconcileCompletedEvent event;
    event.root = synchronizer_.root().string();
    event.files_seen = report.files_seen;
    event.dirs_seen = report.dirs_seen;
    event.uploaded = report.uploaded;
    event.reuploaded = report.reuploaded;
    event.duration = report.duration;
    bus_.emit(event);

    return Ok(report);
}

Result<void> Reconciler::walk(ReconcileReport& report) {
    const auto& root = synchronizer_.root();
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Err<void>(io_error("Failed to walk " + root.string() + ": " + ec.message()));
    }

    const auto end = fs::recursive_directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Err<void>(io_error("Failed to walk " + root.string() + ": " + ec.message()));
        }

        const auto& entry = *it;
        const auto status = entry.symlink_status(ec);
        if (ec) {
            return Err<void>(io_error("Failed to stat " + entry.path().string() + ": " + ec.message()));
        }

        auto rel = relative_key(root, entry.path());
        if (rel.is_error()) {
            return Err<void>(rel.error());
        }

        if (fs::is_directory(status)) {
            auto watched = watcher_.add_watch(entry.path());
            if (watched.is_error()) {
                return watched;
            }
            index_.set_dir_known(rel.value());
            report.dirs_seen++;
        } else if (fs::is_regular_file(status)) {
            auto fingerprint = checksum_.fingerprint(entry.path());
            if (fingerprint.is_error()) {
                return Err<void>(fingerprint.error());
            }
            index_.set_file(rel.value(), std::move(fingerprint.value()), Tier::Staging);
            report.files_seen++;
        }
    }
    if (ec) {
        return Err<void>(io_error("Failed to walk " + root.string() + ": " + ec.message()));
    }

    spdlog::debug("Walked {}: {} files, {} directories", root.string(), report.files_seen, report.dirs_seen);
    return Ok();
}

Result<void> Reconciler::upload_missing(ReconcileReport& report) {
    auto staged = list_relative(store_, namespaces_, Tier::Staging);
    if (staged.is_error()) {
        return Err<void>(staged.error());
    }
    auto produced = list_relative(store_, namespaces_, Tier::Production);
    if (produced.is_error()) {
        return Err<void>(produced.error());
    }

    for (const auto& path : index_.file_paths()) {
        if (staged.value().count(path) > 0) {
            continue;
        }
        if (produced.value().count(path) > 0) {
            if (auto entry = index_.get_file(path)) {
                index_.set_file(path, entry->fingerprint, Tier::Production);
            }
            continue;
        }

        auto created = synchronizer_.handle_create(path);
        if (created.is_error()) {
            return Err<void>(Error(created.error().kind,
                "Initial upload of " + path + " failed: " + created.error().message));
        }
        report.uploaded++;
    }
    return Ok();
}

Result<void> Reconciler::upload_changed(ReconcileReport& report) {
    auto files = store_.list_files(namespaces_.staging_prefix());
    if (files.is_error()) {
        return Err<void>(files.error());
    }

    for (const auto& file : files.value()) {
        auto rel = namespaces_.relative_of(file.remote_path, Tier::Staging);
        if (!rel || !index_.has_file(*rel)) {
            continue;
        }

        // The remote size is the only baseline the store offers. Hash
        // fingerprints are never comparable to it, so compare sizes directly.
        if (checksum_.mode() == FingerprintMode::ContentHash) {
            auto local_size = ChecksumProvider::file_size(synchronizer_.root() / *rel);
            if (local_size.is_error()) {
                return Err<void>(local_size.error());
            }
            if (local_size.value() == file.size) {
                continue;
            }
        }
        index_.update_fingerprint(*rel, ChecksumProvider::size_fingerprint(file.size));

        auto written = synchronizer_.handle_write(*rel);
        if (written.is_error()) {
            return Err<void>(Error(written.error().kind,
                "Re-upload of " + *rel + " failed: " + written.error().message));
        }
        if (written.value()) {
            report.reuploaded++;
        }
    }
    return Ok();
}

} // namespace tiersync::sync
