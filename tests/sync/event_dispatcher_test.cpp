#include "tiersync/sync/event_dispatcher.hpp"

#include "tiersync/events/events.hpp"

#include "support/fake_remote_store.hpp"
#include "support/fake_watcher.hpp"
#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

using tiersync::ErrorKind;
using tiersync::events::EventBus;
using tiersync::sync::ChecksumProvider;
using tiersync::sync::EventDispatcher;
using tiersync::sync::FileSynchronizer;
using tiersync::sync::LocalStateIndex;
using tiersync::sync::NamespaceMap;
using tiersync::sync::WatchEvent;
using tiersync::test_support::FakeRemoteStore;
using tiersync::test_support::FakeWatcher;
using tiersync::test_support::TempTree;
using tiersync::test_support::wait_until;

namespace {

std::vector<std::string> describe(const std::vector<FakeRemoteStore::Call>& calls) {
    std::vector<std::string> out;
    for (const auto& call : calls) {
        out.push_back(call.op + " " + call.path);
    }
    return out;
}

struct Harness {
    Harness()
        : tree("tiersync_dispatch"),
          namespaces("fuse/staging", "fuse/prod"),
          synchronizer(tree.root(), index, namespaces, checksum, store, bus, {}),
          dispatcher(synchronizer, index, watcher, bus) {
        bus.subscribe<tiersync::events::SyncFailedEvent>([this](const tiersync::events::SyncFailedEvent& e) {
            std::lock_guard lock(mutex);
            failures.push_back(e);
        });
        bus.subscribe<tiersync::events::DirectoryRegisteredEvent>(
            [this](const tiersync::events::DirectoryRegisteredEvent&) { registered++; });
        bus.subscribe<tiersync::events::WatcherErrorEvent>(
            [this](const tiersync::events::WatcherErrorEvent&) { watcher_errors++; });
    }

    void dispatch(const std::string& relative, WatchEvent::Kind kind) {
        dispatcher.dispatch(WatchEvent{tree.path(relative).string(), kind});
    }

    std::vector<tiersync::events::SyncFailedEvent> failed() {
        std::lock_guard lock(mutex);
        return failures;
    }

    // Declared first so they outlive the dispatcher thread
    std::mutex mutex;
    std::vector<tiersync::events::SyncFailedEvent> failures;
    std::atomic<int> registered{0};
    std::atomic<int> watcher_errors{0};

    TempTree tree;
    LocalStateIndex index;
    NamespaceMap namespaces;
    ChecksumProvider checksum;
    FakeRemoteStore store;
    FakeWatcher watcher;
    EventBus bus;
    FileSynchronizer synchronizer;
    EventDispatcher dispatcher;
};

} // namespace

TEST(EventDispatcherTest, CreateUploadsNewFile) {
    Harness h;
    h.tree.write("a.txt", 10);

    h.dispatch("a.txt", WatchEvent::Kind::Create);

    EXPECT_EQ(describe(h.store.mutations()), (std::vector<std::string>{"upload fuse/staging/a.txt"}));
    EXPECT_TRUE(h.index.has_file("a.txt"));
    EXPECT_EQ(h.dispatcher.processed(), 1u);
    EXPECT_TRUE(h.failed().empty());
}

TEST(EventDispatcherTest, LateCreateAfterReconcileIsRecovered) {
    Harness h;
    h.tree.write("a.txt", 10);
    ASSERT_TRUE(h.synchronizer.handle_create(h.tree.path("a.txt")).is_ok());
    h.store.clear_calls();

    h.dispatch("a.txt", WatchEvent::Kind::Create);

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"upload fuse/staging/a.txt", "delete fuse/staging/a.txt",
                                        "upload fuse/staging/a.txt"}));
    EXPECT_TRUE(h.store.has("fuse/staging/a.txt"));
    EXPECT_TRUE(h.failed().empty());
}

TEST(EventDispatcherTest, WriteReuploadsChangedFile) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.dispatch("a.txt", WatchEvent::Kind::Create);
    h.store.clear_calls();

    h.tree.write("a.txt", 20);
    h.dispatch("a.txt", WatchEvent::Kind::Write);

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"delete fuse/staging/a.txt", "upload fuse/staging/a.txt"}));
    EXPECT_EQ(h.store.size_of("fuse/staging/a.txt"), 20u);
}

TEST(EventDispatcherTest, WriteOfUnknownFileIsIgnored) {
    Harness h;
    h.tree.write("a.txt", 10);

    h.dispatch("a.txt", WatchEvent::Kind::Write);

    EXPECT_TRUE(h.store.calls().empty());
    EXPECT_FALSE(h.index.has_file("a.txt"));
    EXPECT_TRUE(h.failed().empty());
}

TEST(EventDispatcherTest, RemoveDeletesRemoteObject) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.dispatch("a.txt", WatchEvent::Kind::Create);
    std::filesystem::remove(h.tree.path("a.txt"));

    h.dispatch("a.txt", WatchEvent::Kind::Remove);

    EXPECT_FALSE(h.store.has("fuse/staging/a.txt"));
    EXPECT_FALSE(h.index.has_file("a.txt"));
}

TEST(EventDispatcherTest, FailedRemoteDeleteStillForgetsFile) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.dispatch("a.txt", WatchEvent::Kind::Create);
    std::filesystem::remove(h.tree.path("a.txt"));
    h.store.fail_delete("fuse/staging/a.txt");

    h.dispatch("a.txt", WatchEvent::Kind::Remove);

    EXPECT_FALSE(h.index.has_file("a.txt"));
    const auto failures = h.failed();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].relative_path, "a.txt");
    EXPECT_EQ(failures[0].operation, "delete");
    EXPECT_EQ(failures[0].kind, ErrorKind::Remote);
}

TEST(EventDispatcherTest, NewDirectoryIsWatchedAndScanned) {
    Harness h;
    h.tree.write("movies/a.mkv", 10);
    h.tree.write("movies/extras/b.txt", 5);

    h.dispatch("movies", WatchEvent::Kind::Create);

    EXPECT_TRUE(h.watcher.is_watching(h.tree.path("movies")));
    EXPECT_TRUE(h.watcher.is_watching(h.tree.path("movies/extras")));
    EXPECT_TRUE(h.index.has_dir("movies"));
    EXPECT_TRUE(h.index.has_dir("movies/extras"));
    EXPECT_EQ(h.registered.load(), 2);

    auto uploads = describe(h.store.calls("upload"));
    std::sort(uploads.begin(), uploads.end());
    EXPECT_EQ(uploads, (std::vector<std::string>{"upload fuse/staging/movies/a.mkv",
                                                 "upload fuse/staging/movies/extras/b.txt"}));

    // A repeated create of a known directory does nothing
    h.store.clear_calls();
    h.dispatch("movies", WatchEvent::Kind::Create);
    EXPECT_TRUE(h.store.calls().empty());
}

TEST(EventDispatcherTest, RemovedDirectoryIsPruned) {
    Harness h;
    h.tree.write("movies/a.mkv", 10);
    h.tree.write("movies/extras/b.txt", 5);
    h.tree.write("keep.txt", 1);
    h.dispatch("movies", WatchEvent::Kind::Create);
    h.dispatch("keep.txt", WatchEvent::Kind::Create);
    std::filesystem::remove_all(h.tree.path("movies"));
    h.store.clear_calls();

    h.dispatch("movies", WatchEvent::Kind::Remove);

    auto deletes = describe(h.store.calls("delete"));
    std::sort(deletes.begin(), deletes.end());
    EXPECT_EQ(deletes, (std::vector<std::string>{"delete fuse/staging/movies/a.mkv",
                                                 "delete fuse/staging/movies/extras/b.txt"}));
    EXPECT_FALSE(h.index.has_dir("movies"));
    EXPECT_FALSE(h.index.has_dir("movies/extras"));
    EXPECT_EQ(h.index.file_paths(), (std::vector<std::string>{"keep.txt"}));
}

TEST(EventDispatcherTest, EventsOutsideRootAreIgnored) {
    Harness h;
    TempTree elsewhere("tiersync_elsewhere");
    elsewhere.write("a.txt", 10);

    h.dispatcher.dispatch(WatchEvent{elsewhere.path("a.txt").string(), WatchEvent::Kind::Create});
    h.dispatcher.dispatch(WatchEvent{h.tree.root().string(), WatchEvent::Kind::Write});

    EXPECT_TRUE(h.store.calls().empty());
    EXPECT_EQ(h.index.file_count(), 0u);
    EXPECT_EQ(h.dispatcher.processed(), 2u);
}

TEST(EventDispatcherTest, FailuresBecomeSyncFailedEvents) {
    Harness h;
    h.tree.write("a.txt", 10);
    h.store.fail_upload("fuse/staging/a.txt");

    h.dispatch("a.txt", WatchEvent::Kind::Create);

    const auto failures = h.failed();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].relative_path, "a.txt");
    EXPECT_EQ(failures[0].operation, "upload");
    EXPECT_EQ(failures[0].kind, ErrorKind::Race);
    EXPECT_FALSE(h.index.has_file("a.txt"));

    // The dispatcher keeps going after a failure
    h.tree.write("b.txt", 3);
    h.dispatch("b.txt", WatchEvent::Kind::Create);
    EXPECT_TRUE(h.store.has("fuse/staging/b.txt"));
}

TEST(EventDispatcherTest, WorkerAppliesQueuedEventsInOrder) {
    Harness h;
    h.dispatcher.start();

    h.tree.write("a.txt", 10);
    h.watcher.push(h.tree.path("a.txt"), WatchEvent::Kind::Create);
    ASSERT_TRUE(wait_until([&]() { return h.index.has_file("a.txt"); }));

    h.tree.write("a.txt", 20);
    h.watcher.push(h.tree.path("a.txt"), WatchEvent::Kind::Write);
    ASSERT_TRUE(wait_until([&]() { return h.store.size_of("fuse/staging/a.txt") == 20; }));

    std::filesystem::remove(h.tree.path("a.txt"));
    h.watcher.push(h.tree.path("a.txt"), WatchEvent::Kind::Remove);
    ASSERT_TRUE(wait_until([&]() { return !h.index.has_file("a.txt"); }));

    h.watcher.errors().push("event queue overflow");
    ASSERT_TRUE(wait_until([&]() { return h.watcher_errors.load() == 1; }));

    h.dispatcher.stop();

    EXPECT_EQ(describe(h.store.mutations()),
              (std::vector<std::string>{"upload fuse/staging/a.txt", "delete fuse/staging/a.txt",
                                        "upload fuse/staging/a.txt", "delete fuse/staging/a.txt"}));
    EXPECT_EQ(h.dispatcher.processed(), 3u);
}

TEST(EventDispatcherTest, WorkerExitsWhenWatcherCloses) {
    Harness h;
    h.dispatcher.start();

    h.watcher.close();
    const auto started = std::chrono::steady_clock::now();
    h.dispatcher.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));
}
