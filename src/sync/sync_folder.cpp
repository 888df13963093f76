#include "tiersync/sync/sync_folder.hpp"

#include "tiersync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace tiersync::sync {
namespace fs = std::filesystem;

namespace {

SyncOptions sync_options(const SyncConfig& config) {
    SyncOptions options;
    options.dry_run = config.dry_run;
    options.archive = config.archive;
    options.redundancy = config.redundancy;
    return options;
}

PromotionOptions promotion_options(const SyncConfig& config) {
    PromotionOptions options;
    options.interval = config.promotion_interval;
    options.threshold = config.promotion_threshold;
    options.categories = config.promotion_categories;
    return options;
}

} // namespace

SyncFolder::SyncFolder(const SyncConfig& config,
                       remote::RemoteStoreClient& store,
                       std::unique_ptr<watch::DirectoryWatcher> watcher,
                       events::EventBus& bus)
    : root_(config.root),
      bus_(bus),
      watcher_(std::move(watcher)),
      namespaces_(config.staging_prefix, config.production_prefix),
      checksum_(config.fingerprint),
      synchronizer_(root_, index_, namespaces_, checksum_, store, bus, sync_options(config)),
      dispatcher_(synchronizer_, index_, *watcher_, bus),
      scheduler_(store, namespaces_, index_, bus, promotion_options(config)) {}

Result<std::unique_ptr<SyncFolder>> SyncFolder::open(const SyncConfig& config,
                                                     remote::RemoteStoreClient& store,
                                                     std::unique_ptr<watch::DirectoryWatcher> watcher,
                                                     events::EventBus& bus) {
    if (!watcher) {
        return Err<std::unique_ptr<SyncFolder>>(config_error("No directory watcher supplied"));
    }

    std::error_code ec;
    const auto root = fs::canonical(config.root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        return Err<std::unique_ptr<SyncFolder>>(config_error("Cannot synchronize " + config.root.string() +
                                                             ": not an accessible directory"));
    }

    SyncConfig resolved = config;
    resolved.root = root;

    auto watched = watcher->add_watch(root);
    if (watched.is_error()) {
        return Err<std::unique_ptr<SyncFolder>>(watched.error());
    }

    std::unique_ptr<SyncFolder> folder(new SyncFolder(resolved, store, std::move(watcher), bus));

    Reconciler reconciler(folder->synchronizer_, folder->index_, folder->namespaces_,
                          folder->checksum_, store, *folder->watcher_, bus);
    auto report = reconciler.reconcile();
    if (report.is_error()) {
        folder->close();
        return Err<std::unique_ptr<SyncFolder>>(report.error());
    }
    folder->report_ = report.value();

    folder->dispatcher_.start();
    folder->scheduler_.start();
    spdlog::info("Watching for changes to {}", root.string());
    return Ok(std::move(folder));
}

SyncFolder::~SyncFolder() {
    close();
}

void SyncFolder::close() {
    if (closed_.exchange(true)) {
        return;
    }

    dispatcher_.request_stop();
    scheduler_.request_stop();
    watcher_->close();
    dispatcher_.join();
    scheduler_.join();

    bus_.emit(events::FolderClosedEvent{root_.string()});
}

} // namespace tiersync::sync
