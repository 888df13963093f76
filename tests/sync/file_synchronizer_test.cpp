#include "tiersync/sync/file_synchronizer.hpp"

#include "tiersync/events/events.hpp"

#include "support/fake_remote_store.hpp"
#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using tiersync::ErrorKind;
using tiersync::events::EventBus;
using tiersync::sync::ChecksumProvider;
using tiersync::sync::FileSynchronizer;
using tiersync::sync::LocalStateIndex;
using tiersync::sync::NamespaceMap;
using tiersync::sync::SyncOptions;
using tiersync::sync::Tier;
using tiersync::test_support::FakeRemoteStore;
using tiersync::test_support::TempTree;

namespace {

std::vector<std::string> describe(const std::vector<FakeRemoteStore::Call>& calls) {
    std::vector<std::string> out;
    for (const auto& call : calls) {
        out.push_back(call.op + " " + call.path);
    }
    return out;
}

struct Harness {
    explicit Harness(SyncOptions options = {})
        : tree("tiersync_sync"),
          namespaces("fuse/staging", "fuse/prod"),
          synchronizer(tree.root(), index, namespaces, checksum, store, bus, options) {
        bus.subscribe<tiersync::events::FileUploadedEvent>(
            [this](const tiersync::events::FileUploadedEvent& e) { uploaded.push_back(e); });
        bus.subscribe<tiersync::events::FileDeletedEvent>(
            [this](const tiersync::events::FileDeletedEvent& e) { deleted.push_back(e); });
        bus.subscribe<tiersync::events::FileChangedEvent>(
            [this](const tiersync::events::FileChangedEvent& e) { changed.push_back(e); });
        bus.subscribe<tiersync::events::SyncFailedEvent>(
            [this](const tiersync::events::SyncFailedEvent& e) { failed.push_back(e); });
    }

    TempTree tree;
    LocalStateIndex index;
    NamespaceMap namespaces;
    ChecksumProvider checksum;
    FakeRemoteStore store;
    EventBus bus;
    FileSynchronizer synchronizer;

    std::vector<tiersync::events::FileUploadedEvent> uploaded;
    std::vector<tiersync::events::FileDeletedEvent> deleted;
    std::vector<tiersync::events::FileChangedEvent> changed;
    std::vector<tiersync::events::SyncFailedEvent> failed;
};

SyncOptions dry_run() {
    SyncOptions options;
    options.dry_run = true;
    return options;
}

SyncOptions archive() {
    SyncOptions options;
    options.archive = true;
    return options;
}

} // namespace

TEST(FileSynchronizerTest, CreateUploadsToStagingAndIndexes) {
    Harness h;
    h.tree.write("a.txt", 10);

    auto created = h.synchronizer.handle_create(h.tree.path("a.txt"));
    ASSERT_TRUE(created.is_ok()) << created.error().message;

    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 10u);
    EXPECT_EQ(h.store.last_redundancy().data_pieces, 10u);
    EXPECT_EQ(h.store.last_redundancy().parity_pieces, 30u);

    auto entry = h.index.get_file("a.txt");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->fingerprint, "10");
    EXPECT_EQ(entry->tier, Tier::Staging);

    ASSERT_EQ(h.uploaded.size(), 1u);
    EXPECT_EQ(h.uploaded[0].relative_path, "a.txt");
    EXPECT_EQ(h.uploaded[0].remote_path, "fuse/staging/a.txt");
    EXPECT_EQ(h.uploaded[0].bytes, 10u);
    EXPECT_FALSE(h.uploaded[0].dry_run);
}

TEST(FileSynchronizerTest, CreateAcceptsRelativePathsAndCustomRedundancy) {
    SyncOptions options;
    options.redundancy.data_pieces = 4;
    options.redundancy.parity_pieces = 8;
    Harness h(options);
    h.tree.write("sub/b.txt", 5);

    ASSERT_TRUE(h.synchronizer.handle_create("sub/b.txt").is_ok());
    EXPECT_TRUE(h.store.has("fuse/staging/sub/b.txt"));
    EXPECT_EQ(h.store.last_redundancy().data_pieces, 4u);
    EXPECT_EQ(h.store.last_redundancy().parity_pieces, 8u);
    EXPECT_TRUE(h.index.has_file("sub/b.txt"));
}

TEST(FileSynchronizerTest, CreateFailuresLeaveIndexUntouched) {
    Harness h;

    auto missing = h.synchronizer.handle_create(h.tree.path("gone.txt"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Io);
    EXPECT_TRUE(h.store.calls().empty());

    h.tree.write("a.txt", 10);
    h.store.fail_upload("fuse/staging/a.txt");
    auto rejected = h.synchronizer.handle_create(h.tree.path("a.txt"));
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::Remote);
    EXPECT_FALSE(h.index.has_file("a.txt"));
    EXPECT_TRUE(h.uploaded.empty());

    auto outside = h.synchronizer.handle_create("/definitely/not/under/root.txt");
    ASSERT_TRUE(outside.is_error());
    EXPECT_EQ(outside.error().kind, ErrorKind::Io);
}

TEST(FileSynchronizerTest, WriteOfUnchangedOrUnindexedFileIsNoop) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.tree.write("stray.txt", 3);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.clear_calls();

    auto unchanged = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(unchanged.is_ok());
    EXPECT_FALSE(unchanged.value());

    auto unindexed = h.synchronizer.handle_write(h.tree.path("stray.txt"));
    ASSERT_TRUE(unindexed.is_ok());
    EXPECT_FALSE(unindexed.value());

    EXPECT_TRUE(h.store.calls().empty());
    EXPECT_TRUE(h.changed.empty());
    EXPECT_FALSE(h.index.has_file("stray.txt"));
}

TEST(FileSynchronizerTest, WriteDeletesThenReuploads) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.clear_calls();

    h.tree.write("a.txt", 20);
    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_TRUE(written.value());

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"delete fuse/staging/a.txt", "upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 20u);
    EXPECT_EQ(h.index.get_file("a.txt")->fingerprint, "20");

    ASSERT_EQ(h.changed.size(), 1u);
    EXPECT_EQ(h.changed[0].old_fingerprint, "10");
    EXPECT_EQ(h.changed[0].new_fingerprint, "20");
    ASSERT_EQ(h.deleted.size(), 1u);
}

TEST(FileSynchronizerTest, WriteOfPromotedFileDeletesProductionObject) {
    Harness h;
    h.tree.write("movies/a.mkv", 20);
    h.index.set_file("movies/a.mkv", "10", Tier::Production);
    h.store.put("fuse/prod/movies/a.mkv", 10);

    auto written = h.synchronizer.handle_write(h.tree.path("movies/a.mkv"));
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_TRUE(written.value());

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"delete fuse/prod/movies/a.mkv", "upload fuse/staging/movies/a.mkv"}));
    EXPECT_EQ(h.index.get_file("movies/a.mkv")->tier, Tier::Staging);
}

TEST(FileSynchronizerTest, ArchiveWriteUploadsWithoutDeleting) {
    Harness h(archive());
    h.tree.write("a.txt", 20);
    h.index.set_file("a.txt", "10", Tier::Production);
    h.store.put("fuse/prod/a.txt", 10);

    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_TRUE(written.value());

    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"upload fuse/staging/a.txt"}));
    EXPECT_TRUE(h.store.has("fuse/prod/a.txt"));
    EXPECT_TRUE(h.deleted.empty());
}

TEST(FileSynchronizerTest, WriteStopsWhenDeleteFails) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.clear_calls();
    h.store.fail_delete("fuse/staging/a.txt");

    h.tree.write("a.txt", 20);
    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Remote);
    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"delete fuse/staging/a.txt"}));
    EXPECT_EQ(h.index.get_file("a.txt")->fingerprint, "10");
}

TEST(FileSynchronizerTest, FailedReuploadIsRetriedByNextWrite) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.clear_calls();
    h.store.fail_upload("fuse/staging/a.txt");

    h.tree.write("a.txt", 20);
    auto failed = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_FALSE(h.store.has("fuse/staging/a.txt"));

    auto entry = h.index.get_file("a.txt");
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->remote_present);
    EXPECT_EQ(entry->fingerprint, "20");

    // The store recovers; the next write uploads without a second delete
    h.store.clear_failures();
    h.store.clear_calls();
    h.tree.write("a.txt", 30);
    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_TRUE(written.value());

    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 30u);
    entry = h.index.get_file("a.txt");
    EXPECT_TRUE(entry->remote_present);
    EXPECT_EQ(entry->fingerprint, "30");
}

TEST(FileSynchronizerTest, FailedReuploadIsRetriedEvenWithoutFurtherChange) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.fail_upload("fuse/staging/a.txt");

    h.tree.write("a.txt", 20);
    ASSERT_TRUE(h.synchronizer.handle_write(h.tree.path("a.txt")).is_error());

    h.store.clear_failures();
    h.store.clear_calls();
    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_TRUE(written.value());
    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 20u);

    // Converged: a further identical write is a no-op again
    h.store.clear_calls();
    auto again = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value());
    EXPECT_TRUE(h.store.calls().empty());
}

TEST(FileSynchronizerTest, RemoveAfterFailedReuploadSkipsDelete) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.fail_upload("fuse/staging/a.txt");
    h.tree.write("a.txt", 20);
    ASSERT_TRUE(h.synchronizer.handle_write(h.tree.path("a.txt")).is_error());
    h.store.clear_calls();

    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("a.txt")).is_ok());
    EXPECT_TRUE(h.store.mutations().empty());
    EXPECT_FALSE(h.index.has_file("a.txt"));
}

TEST(FileSynchronizerTest, DryRunOnlyTouchesTheIndex) {
    Harness h(dry_run());
    h.tree.write("a.txt", 10);

    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    EXPECT_TRUE(h.index.has_file("a.txt"));
    ASSERT_EQ(h.uploaded.size(), 1u);
    EXPECT_TRUE(h.uploaded[0].dry_run);

    h.tree.write("a.txt", 20);
    auto written = h.synchronizer.handle_write(h.tree.path("a.txt"));
    ASSERT_TRUE(written.is_ok());
    EXPECT_TRUE(written.value());
    EXPECT_EQ(h.index.get_file("a.txt")->fingerprint, "20");

    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("a.txt")).is_ok());
    EXPECT_FALSE(h.index.has_file("a.txt"));

    EXPECT_TRUE(h.store.mutations().empty());
}

TEST(FileSynchronizerTest, RemoveDeletesAtRecordedTier) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.index.set_file("movies/b.mkv", "5", Tier::Production);
    h.store.put("fuse/prod/movies/b.mkv", 5);
    h.store.clear_calls();

    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("a.txt")).is_ok());
    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("movies/b.mkv")).is_ok());
    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("never-seen.txt")).is_ok());

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"delete fuse/staging/a.txt", "delete fuse/prod/movies/b.mkv"}));
    EXPECT_EQ(h.index.file_count(), 0u);
    EXPECT_EQ(h.deleted.size(), 2u);
}

TEST(FileSynchronizerTest, RemoveFailureStillDropsEntry) {
    Harness h;
    h.index.set_file("a.txt", "10");
    h.store.put("fuse/staging/a.txt", 10);
    h.store.fail_delete("fuse/staging/a.txt");

    auto removed = h.synchronizer.handle_remove(h.tree.path("a.txt"));
    ASSERT_TRUE(removed.is_error());
    EXPECT_EQ(removed.error().kind, ErrorKind::Remote);
    EXPECT_NE(removed.error().message.find("fuse/staging/a.txt"), std::string::npos);
    EXPECT_FALSE(h.index.has_file("a.txt"));
    EXPECT_TRUE(h.deleted.empty());

    // Nothing is left behind to retry
    h.store.clear_calls();
    ASSERT_TRUE(h.synchronizer.handle_remove(h.tree.path("a.txt")).is_ok());
    EXPECT_TRUE(h.store.calls().empty());
}

TEST(FileSynchronizerTest, RetryClearsStaleObject) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.store.put("fuse/staging/a.txt", 3);

    auto created = h.synchronizer.create_with_retry(h.tree.path("a.txt"));
    ASSERT_TRUE(created.is_ok()) << created.error().message;

    EXPECT_EQ(describe(h.store.calls()),
              (std::vector<std::string>{"upload fuse/staging/a.txt", "exists fuse/staging/a.txt",
                                        "delete fuse/staging/a.txt", "upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 10u);
    EXPECT_TRUE(h.index.has_file("a.txt"));
}

TEST(FileSynchronizerTest, RetryInArchiveModeKeepsStaleObject) {
    Harness h(archive());
    h.tree.write("a.txt", 10);
    h.store.put("fuse/staging/a.txt", 3);

    auto created = h.synchronizer.create_with_retry(h.tree.path("a.txt"));
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::Race);

    EXPECT_TRUE(h.store.calls("delete").empty());
    EXPECT_EQ(h.store.calls("upload").size(), 2u);
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 3u);
    EXPECT_FALSE(h.index.has_file("a.txt"));
}

TEST(FileSynchronizerTest, RetryReportsRaceWhenExistenceCheckFails) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.store.fail_upload("fuse/staging/a.txt");
    h.store.fail_exists(true);

    auto created = h.synchronizer.create_with_retry(h.tree.path("a.txt"));
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::Race);
    EXPECT_EQ(h.store.calls("upload").size(), 2u);
    EXPECT_EQ(h.store.calls("exists").size(), 1u);
}

TEST(FileSynchronizerTest, RetryDoesNotRepeatLocalFailures) {
    Harness h;

    auto created = h.synchronizer.create_with_retry(h.tree.path("gone.txt"));
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::Io);
    EXPECT_TRUE(h.store.calls().empty());
}

TEST(FileSynchronizerTest, RemoveDirectoryPrunesSubtree) {
    Harness h;
    h.tree.write("sub/a.txt", 1);
    h.tree.write("sub/deep/b.txt", 2);
    h.tree.write("other.txt", 3);
    h.index.set_dir_known("sub");
    h.index.set_dir_known("sub/deep");
    for (const auto* rel : {"sub/a.txt", "sub/deep/b.txt", "other.txt"}) {
        ASSERT_TRUE(h.synchronizer.handle_create(rel).is_ok());
    }
    h.store.fail_delete("fuse/staging/sub/deep/b.txt");

    auto pruned = h.synchronizer.remove_directory(h.tree.path("sub"));
    ASSERT_TRUE(pruned.is_ok());
    EXPECT_EQ(pruned.value(), (std::vector<std::string>{"sub/deep/b.txt"}));

    EXPECT_FALSE(h.store.has("fuse/staging/sub/a.txt"));
    EXPECT_FALSE(h.index.has_file("sub/a.txt"));
    EXPECT_FALSE(h.index.has_file("sub/deep/b.txt"));
    EXPECT_FALSE(h.index.has_dir("sub"));
    EXPECT_FALSE(h.index.has_dir("sub/deep"));
    EXPECT_TRUE(h.index.has_file("other.txt"));

    ASSERT_EQ(h.failed.size(), 1u);
    EXPECT_EQ(h.failed[0].relative_path, "sub/deep/b.txt");
    EXPECT_EQ(h.failed[0].operation, "delete");
}
