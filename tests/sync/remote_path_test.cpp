#include "tiersync/sync/remote_path.hpp"

#include <gtest/gtest.h>

using tiersync::sync::NamespaceMap;
using tiersync::sync::Tier;

TEST(RemotePathTest, RelativeKeyUsesPosixSeparators) {
    const std::filesystem::path root = "/srv/media";

    EXPECT_EQ(tiersync::sync::relative_key(root, "/srv/media/a.txt").value(), "a.txt");
    EXPECT_EQ(tiersync::sync::relative_key(root, "/srv/media/sub/./b.txt").value(), "sub/b.txt");
    EXPECT_EQ(tiersync::sync::relative_key("/srv/media/", "/srv/media/sub/").value(), "sub");
    EXPECT_EQ(tiersync::sync::relative_key(root, "sub/../c.txt").value(), "c.txt");
}

TEST(RemotePathTest, RelativeKeyRejectsPathsOutsideRoot) {
    const std::filesystem::path root = "/srv/media";

    EXPECT_TRUE(tiersync::sync::relative_key(root, "/srv/media").is_error());
    EXPECT_TRUE(tiersync::sync::relative_key(root, "/srv/other/a.txt").is_error());
    EXPECT_TRUE(tiersync::sync::relative_key(root, "/srv/media/../x").is_error());
    EXPECT_TRUE(tiersync::sync::relative_key(root, "../x").is_error());
}

TEST(RemotePathTest, JoinAndCleanTrimSlashes) {
    EXPECT_EQ(tiersync::sync::clean_remote("/fuse/staging/"), "fuse/staging");
    EXPECT_EQ(tiersync::sync::clean_remote("///"), "");
    EXPECT_EQ(tiersync::sync::join_remote("fuse/staging/", "/a.txt"), "fuse/staging/a.txt");
    EXPECT_EQ(tiersync::sync::join_remote("", "a.txt"), "a.txt");
    EXPECT_EQ(tiersync::sync::join_remote("fuse/prod", ""), "fuse/prod");
}

TEST(RemotePathTest, RebaseMatchesWholeComponents) {
    EXPECT_EQ(tiersync::sync::rebase("fuse/staging/movies/a.mkv", "fuse/staging", "fuse/prod").value(),
              "fuse/prod/movies/a.mkv");
    EXPECT_EQ(tiersync::sync::rebase("fuse/staging", "fuse/staging", "fuse/prod").value(), "fuse/prod");
    EXPECT_EQ(tiersync::sync::rebase("a/b", "", "root").value(), "root/a/b");

    auto sibling = tiersync::sync::rebase("fuse/stagingx/a", "fuse/staging", "fuse/prod");
    ASSERT_TRUE(sibling.is_error());
    EXPECT_EQ(sibling.error().kind, tiersync::ErrorKind::Remote);
    EXPECT_TRUE(tiersync::sync::rebase("other/a", "fuse/staging", "fuse/prod").is_error());
}

TEST(NamespaceMapTest, MapsKeysIntoBothTiers) {
    NamespaceMap namespaces("/fuse/staging/", "fuse/prod");

    EXPECT_EQ(namespaces.staging_prefix(), "fuse/staging");
    EXPECT_EQ(namespaces.staging_path("sub/b.txt"), "fuse/staging/sub/b.txt");
    EXPECT_EQ(namespaces.production_path("sub/b.txt"), "fuse/prod/sub/b.txt");
    EXPECT_EQ(namespaces.remote_path("a.txt", Tier::Production), "fuse/prod/a.txt");
}

TEST(NamespaceMapTest, RelativeOfInvertsRemotePath) {
    NamespaceMap namespaces("fuse/staging", "fuse/prod");

    EXPECT_EQ(namespaces.relative_of("fuse/staging/sub/b.txt", Tier::Staging).value(), "sub/b.txt");
    EXPECT_EQ(namespaces.relative_of("fuse/prod/a.txt", Tier::Production).value(), "a.txt");
    EXPECT_FALSE(namespaces.relative_of("fuse/prod/a.txt", Tier::Staging).has_value());
    EXPECT_FALSE(namespaces.relative_of("fuse/staging", Tier::Staging).has_value());
}

TEST(NamespaceMapTest, PromoteMovesStagingPathToProduction) {
    NamespaceMap namespaces("fuse/staging", "fuse/prod");

    EXPECT_EQ(namespaces.promote("fuse/staging/movies/Heat").value(), "fuse/prod/movies/Heat");
    EXPECT_EQ(namespaces.promote("/fuse/staging/sub/").value(), "fuse/prod/sub");
    EXPECT_TRUE(namespaces.promote("fuse/prod/sub").is_error());
}
