#include "tiersync/events/event_bus.hpp"
#include "tiersync/events/components.hpp"
#include "tiersync/events/events.hpp"

#include <gtest/gtest.h>

using tiersync::events::DirectoryPromotedEvent;
using tiersync::events::EventBus;
using tiersync::events::FileChangedEvent;
using tiersync::events::FileDeletedEvent;
using tiersync::events::FileUploadedEvent;
using tiersync::events::LoggerComponent;
using tiersync::events::MetricsComponent;
using tiersync::events::PromotionFailedEvent;
using tiersync::events::SyncFailedEvent;
using tiersync::events::WatcherErrorEvent;

TEST(MetricsComponentTest, TracksSyncCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileUploadedEvent{"a.txt", "fuse/staging/a.txt", 10});
    bus.emit(FileUploadedEvent{"sub/b.txt", "fuse/staging/sub/b.txt", 5});
    bus.emit(FileDeletedEvent{"a.txt", "fuse/staging/a.txt"});
    bus.emit(FileChangedEvent{"a.txt", "10", "20"});
    bus.emit(SyncFailedEvent{"c.txt", "upload", tiersync::ErrorKind::Remote, "boom"});
    bus.emit(DirectoryPromotedEvent{"fuse/staging/sub", "fuse/prod/sub", 1.5});
    bus.emit(PromotionFailedEvent{"fuse/staging/other", "rename refused"});
    bus.emit(WatcherErrorEvent{"overflow"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_uploaded.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 15u);
    EXPECT_EQ(stats.files_deleted.load(), 1u);
    EXPECT_EQ(stats.files_changed.load(), 1u);
    EXPECT_EQ(stats.sync_failures.load(), 1u);
    EXPECT_EQ(stats.directories_promoted.load(), 1u);
    EXPECT_EQ(stats.promotion_failures.load(), 1u);
    EXPECT_EQ(stats.watcher_errors.load(), 1u);
}

TEST(MetricsComponentTest, CoexistsWithLogger) {
    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    EXPECT_EQ(bus.subscriber_count<FileUploadedEvent>(), 2u);

    bus.emit(FileUploadedEvent{"a.txt", "fuse/staging/a.txt", 10, true});
    EXPECT_EQ(metrics.get_stats().files_uploaded.load(), 1u);

    metrics.print_stats();
}
