#include "upstream.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

TEST(CompareVersions, NumericParts) {
    EXPECT_GT(compare_versions("1.10.0", "1.9.2"), 0);
    EXPECT_LT(compare_versions("1.2", "1.2.1"), 0);
    EXPECT_EQ(compare_versions("1.2", "1.2.0"), 0);
    EXPECT_EQ(compare_versions("v2.0.0", "2.0.0"), 0);
    EXPECT_EQ(compare_versions("1.02", "1.2"), 0);
}

TEST(DirectoryUpstream, LatestAndFetch) {
    TempProject p;
    p.write("1.9.0/.templates/a.md", "old");
    p.write("1.10.0/.templates/b.md", "b");
    p.write("1.10.0/.templates/a.md", "a");
    DirectoryUpstream upstream(p.root());

    EXPECT_EQ(upstream.latest_version(), "1.10.0");
    EXPECT_TRUE(upstream.version_exists("1.9.0"));
    EXPECT_FALSE(upstream.version_exists("3.0.0"));
    EXPECT_FALSE(upstream.version_exists(".."));

    auto files = upstream.fetch("1.10.0");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, ".templates/a.md");
    EXPECT_EQ(files[0].content, "a");
    EXPECT_EQ(files[1].path, ".templates/b.md");
}

TEST(DirectoryUpstream, Errors) {
    TempProject p;
    DirectoryUpstream empty(p.root());
    EXPECT_THROW(empty.latest_version(), UpstreamError);
    EXPECT_THROW(empty.fetch("1.0.0"), UpstreamError);

    DirectoryUpstream missing(p.path("nowhere").string());
    EXPECT_THROW(missing.latest_version(), UpstreamError);
}
