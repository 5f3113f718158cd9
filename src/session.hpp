#pragma once
#include "apply.hpp"
#include "backup.hpp"
#include "config.hpp"
#include "manifest.hpp"
#include "reconcile.hpp"
#include "upstream.hpp"
#include <string>
#include <vector>

struct SyncPlan {
    Manifest manifest;
    bool new_manifest = false;  // created in memory, not yet on disk
    std::string target_version;
    UpstreamContents upstream;
    ReconcileResult reconciled;

    size_t count(Action action) const;
};

// Public surface over one project directory.
class SyncSession {
public:
    explicit SyncSession(const std::string& project_root);
    SyncSession(const std::string& project_root, SyncConfig config);

    // Empty version means latest. Reads only; never writes to disk.
    SyncPlan plan(UpstreamProvider& provider, const std::string& version = "");

    ApplyResult apply(const SyncPlan& plan, const PruneConfirm& confirm_prune = {},
                      bool backups_enabled = true);

    void rollback_to(const std::string& backup_name);
    std::vector<Backup> list_backups() const;
    size_t prune(size_t keep, const PruneConfirm& confirm);

    // Accept the current content as the new baseline.
    Manifest rebaseline(bool clear_customized);

    const SyncConfig& config() const { return config_; }

private:
    std::string project_root_;
    SyncConfig config_;
    StateStore store_;
    BackupManager backups_;
};
