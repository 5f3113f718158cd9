#include "session.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

class SessionTest : public ::testing::Test {
protected:
    SessionTest()
        : upstream(releases.root())
    {
        releases.write("1.0.0/.templates/guide.md", "# Guide\n");
        releases.write("1.0.0/.templates/rules.md", "rule one\n");
        releases.write("1.1.0/.templates/guide.md", "# Guide\nmore\n");
        releases.write("1.1.0/.templates/rules.md", "rule one\n");
        releases.write("1.1.0/.templates/extra/new.md", "new\n");
    }

    TempProject project;
    TempProject releases;
    DirectoryUpstream upstream;
};

TEST_F(SessionTest, PlanWritesNothing) {
    SyncSession session(project.root());
    SyncPlan plan = session.plan(upstream);
    EXPECT_TRUE(plan.new_manifest);
    EXPECT_EQ(plan.target_version, "1.1.0");
    EXPECT_EQ(plan.count(Action::Add), 3u);
    EXPECT_FALSE(project.exists(".templsync"));
}

TEST_F(SessionTest, UnknownVersionIsRejected) {
    SyncSession session(project.root());
    EXPECT_THROW(session.plan(upstream, "9.9.9"), UpstreamError);
}

TEST_F(SessionTest, InstallThenUpgrade) {
    SyncSession session(project.root());
    auto installed = session.apply(session.plan(upstream, "1.0.0"));
    EXPECT_EQ(installed.phase, ApplyPhase::Committed);
    EXPECT_EQ(installed.added.size(), 2u);

    project.write(".templates/rules.md", "rule one\nmy local rule\n");
    SyncPlan plan = session.plan(upstream);
    EXPECT_FALSE(plan.new_manifest);
    EXPECT_EQ(plan.count(Action::Update), 1u);
    EXPECT_EQ(plan.count(Action::Preserve), 1u);
    EXPECT_EQ(plan.count(Action::Add), 1u);

    auto upgraded = session.apply(plan);
    EXPECT_EQ(project.read(".templates/guide.md"), "# Guide\nmore\n");
    EXPECT_EQ(project.read(".templates/rules.md"), "rule one\nmy local rule\n");
    EXPECT_TRUE(project.exists(".templates/extra/new.md"));
    EXPECT_EQ(upgraded.manifest.distribution_version, "1.1.0");
    // One backup per mutating apply, including the initial install.
    EXPECT_EQ(session.list_backups().size(), 2u);
}

TEST_F(SessionTest, SafeDefaultOnExistingCopy) {
    project.write(".templates/guide.md", "# Guide\nmore\n");
    project.write(".templates/rules.md", "rule one, edited\n");
    project.write(".templates/mine.md", "personal\n");
    SyncSession session(project.root());

    SyncPlan plan = session.plan(upstream, "1.1.0");
    ASSERT_TRUE(plan.new_manifest);
    EXPECT_EQ(plan.reconciled.custom_files, std::vector<std::string>{".templates/mine.md"});
    auto result = session.apply(plan);

    EXPECT_EQ(result.false_positives, std::vector<std::string>{".templates/guide.md"});
    EXPECT_EQ(result.conflicts, std::vector<std::string>{".templates/rules.md"});
    EXPECT_EQ(project.read(".templates/mine.md"), "personal\n");
    const TrackedFile* mine = result.manifest.find(".templates/mine.md");
    ASSERT_NE(mine, nullptr);
    EXPECT_FALSE(mine->is_official);
}

TEST_F(SessionTest, RollbackToEarlierBackup) {
    SyncSession session(project.root());
    session.apply(session.plan(upstream, "1.0.0"));
    session.apply(session.plan(upstream, "1.1.0"));
    auto backups = session.list_backups();
    ASSERT_EQ(backups.size(), 2u);
    EXPECT_EQ(backups[0].source_version, "1.0.0");
    EXPECT_EQ(backups[0].target_version, "1.1.0");

    session.rollback_to(backups[0].name);
    EXPECT_EQ(project.read(".templates/guide.md"), "# Guide\n");
    EXPECT_FALSE(project.exists(".templates/extra/new.md"));
    StateStore store(project.root(), {".templates"});
    EXPECT_EQ(store.load()->distribution_version, "1.0.0");
}

TEST_F(SessionTest, RebaselineAcceptsLocalEdits) {
    SyncSession session(project.root());
    session.apply(session.plan(upstream, "1.0.0"));
    project.write(".templates/rules.md", "rewritten\n");

    Manifest m = session.rebaseline(true);
    EXPECT_EQ(m.find(".templates/rules.md")->original_hash, normalized_hash("rewritten\n"));
    SyncPlan plan = session.plan(upstream, "1.0.0");
    // Upstream 1.0.0 now differs from the accepted baseline.
    EXPECT_EQ(plan.reconciled.states[1].action, Action::Update);
}

TEST_F(SessionTest, RebaselineNeedsManifest) {
    SyncSession session(project.root());
    EXPECT_THROW(session.rebaseline(false), ManifestError);
}

TEST_F(SessionTest, BackupsCanBeDisabled) {
    SyncConfig config;
    config.backups_enabled = false;
    SyncSession session(project.root(), config);
    auto result = session.apply(session.plan(upstream));
    EXPECT_FALSE(result.backup.has_value());
    EXPECT_TRUE(session.list_backups().empty());
}

TEST_F(SessionTest, FirstSyncNeverOverwritesExistingFileOutsideManagedDirs) {
    releases.write("2.0.0/docs/guide.md", "upstream guide\n");
    project.write("docs/guide.md", "my own guide\n");
    SyncSession session(project.root());

    SyncPlan plan = session.plan(upstream, "2.0.0");
    ASSERT_TRUE(plan.new_manifest);
    const FileState* guide = nullptr;
    for (auto& s : plan.reconciled.states) {
        if (s.path == "docs/guide.md")
            guide = &s;
    }
    ASSERT_NE(guide, nullptr);
    EXPECT_TRUE(guide->is_customized);
    EXPECT_EQ(guide->action, Action::Merge);

    auto result = session.apply(plan);
    EXPECT_EQ(result.conflicts, std::vector<std::string>{"docs/guide.md"});
    std::string text = project.read("docs/guide.md");
    EXPECT_NE(text.find("my own guide\n"), std::string::npos);
    EXPECT_NE(text.find("upstream guide\n"), std::string::npos);
}

TEST_F(SessionTest, FirstSyncAdoptsIdenticalFileOutsideManagedDirs) {
    releases.write("2.0.0/docs/guide.md", "upstream guide\n");
    project.write("docs/guide.md", "upstream guide  \r\n");
    SyncSession session(project.root());

    auto result = session.apply(session.plan(upstream, "2.0.0"));
    EXPECT_EQ(result.false_positives, std::vector<std::string>{"docs/guide.md"});
    EXPECT_FALSE(result.manifest.find("docs/guide.md")->customized);
}

TEST_F(SessionTest, MetadataPathFromUpstreamIsRejectedBeforeAnyChange) {
    SyncSession session(project.root());
    session.apply(session.plan(upstream, "1.0.0"));
    auto backups_before = session.list_backups();

    releases.write("3.0.0/.templsync/notes.md", "x\n");
    releases.write("3.0.0/.templates/guide.md", "# Guide v3\n");
    EXPECT_THROW(session.plan(upstream, "3.0.0"), ReconcileError);
    EXPECT_EQ(project.read(".templates/guide.md"), "# Guide\n");
    EXPECT_EQ(session.list_backups().size(), backups_before.size());
}
