#include "backup.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

TEST(BackupManager, CreateCopiesWholeDirectories) {
    TempProject p;
    p.write(".templates/a.md", "a");
    p.write(".templates/untracked/extra.md", "extra");
    p.write(".templsync/manifest.json", "{}");
    BackupManager backups(p.root());

    Backup b = backups.create_backup({".templates", "docs"}, "1.0.0", "1.1.0");
    EXPECT_EQ(b.source_version, "1.0.0");
    EXPECT_EQ(b.target_version, "1.1.0");
    EXPECT_TRUE(b.has_manifest);
    EXPECT_TRUE(fs::exists(fs::path(b.storage_path) / "files/.templates/untracked/extra.md"));
    EXPECT_TRUE(fs::exists(fs::path(b.storage_path) / "manifest.json"));
    EXPECT_FALSE(fs::exists(fs::path(b.storage_path + ".partial")));
}

TEST(BackupManager, RestoreReplacesRatherThanMerges) {
    TempProject p;
    p.write(".templates/a.md", "original a");
    BackupManager backups(p.root());
    Backup b = backups.create_backup({".templates", "docs"}, "1", "2");

    p.write(".templates/a.md", "half-written");
    p.write(".templates/new.md", "added during apply");
    p.write("docs/created.md", "created during apply");
    p.write(".templsync/manifest.json", "{}");

    backups.restore(b);
    EXPECT_EQ(p.read(".templates/a.md"), "original a");
    EXPECT_FALSE(p.exists(".templates/new.md"));
    EXPECT_FALSE(p.exists("docs"));
    EXPECT_FALSE(p.exists(".templsync/manifest.json"));
}

TEST(BackupManager, RejectsEscapingEntryWithoutLeavingPartial) {
    TempProject p;
    BackupManager backups(p.root());
    EXPECT_THROW(backups.create_backup({"../x"}, "1", "2"), BackupError);
    EXPECT_TRUE(backups.list_backups().empty());
    EXPECT_TRUE(fs::is_empty(p.path(".templsync/backups")));
}

TEST(BackupManager, ListIsNewestFirstAndSkipsIncomplete) {
    TempProject p;
    p.write(".templates/a.md", "a");
    BackupManager backups(p.root());
    Backup first = backups.create_backup({".templates"}, "1", "2");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    Backup second = backups.create_backup({".templates"}, "2", "3");
    fs::create_directories(p.path(".templsync/backups/20000101T000000.000Z.partial"));
    fs::create_directories(p.path(".templsync/backups/stray"));

    auto list = backups.list_backups();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, second.name);
    EXPECT_EQ(list[1].name, first.name);
    EXPECT_EQ(backups.find_backup(first.name).source_version, "1");
    EXPECT_THROW(backups.find_backup("nope"), BackupError);
}

TEST(BackupManager, PruneKeepsNewest) {
    TempProject p;
    p.write(".templates/a.md", "a");
    BackupManager backups(p.root());
    std::vector<std::string> names;
    for (int i = 0; i < 7; ++i) {
        names.push_back(backups.create_backup({".templates"}, std::to_string(i), std::to_string(i + 1)).name);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    std::vector<std::string> offered;
    size_t deleted = backups.prune(3, [&](const std::vector<Backup>& doomed) {
        for (auto& b : doomed)
            offered.push_back(b.name);
        return true;
    });
    EXPECT_EQ(deleted, 4u);
    EXPECT_EQ(offered, std::vector<std::string>(names.begin(), names.begin() + 4));

    auto left = backups.list_backups();
    ASSERT_EQ(left.size(), 3u);
    EXPECT_EQ(left[0].name, names[6]);
    EXPECT_EQ(left[1].name, names[5]);
    EXPECT_EQ(left[2].name, names[4]);
}

TEST(BackupManager, PruneNeedsConfirmation) {
    TempProject p;
    p.write(".templates/a.md", "a");
    BackupManager backups(p.root());
    for (int i = 0; i < 3; ++i)
        backups.create_backup({".templates"}, "1", "2");

    EXPECT_EQ(backups.prune(1, [](const std::vector<Backup>&) { return false; }), 0u);
    EXPECT_EQ(backups.prune(1, PruneConfirm{}), 0u);
    EXPECT_EQ(backups.list_backups().size(), 3u);
}

TEST(BackupManager, RefusesMetadataDirEntry) {
    TempProject p;
    p.write(".templates/a.md", "a");
    BackupManager backups(p.root());
    Backup kept = backups.create_backup({".templates"}, "1", "2");

    EXPECT_THROW(backups.create_backup({".templates", ".templsync"}, "2", "3"), BackupError);
    auto list = backups.list_backups();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].name, kept.name);
    EXPECT_FALSE(fs::exists(fs::path(kept.storage_path) / "files/.templsync"));
}
