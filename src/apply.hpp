#pragma once
#include "backup.hpp"
#include "config.hpp"
#include "manifest.hpp"
#include "reconcile.hpp"
#include "upstream.hpp"
#include <optional>
#include <string>
#include <vector>

enum class ApplyPhase { Idle, BackedUp, Applying, Committed, RolledBack, Aborted, Failed };

const char* phase_name(ApplyPhase phase);

struct ApplyOptions {
    bool backups_enabled = true;
    std::string target_version;
    // Project-relative files/directories captured by the backup.
    std::vector<std::string> backup_entries;
    // Post-commit retention; no pruning when confirm is empty.
    size_t retain = DEFAULT_BACKUP_RETAIN;
    PruneConfirm confirm_prune;
};

struct ApplyResult {
    ApplyPhase phase = ApplyPhase::Idle;
    Manifest manifest;
    std::optional<Backup> backup;
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;
    std::vector<std::string> preserved;
    std::vector<std::string> conflicts;
    std::vector<std::string> false_positives;  // flagged customized but equal to upstream
    size_t skipped = 0;
    size_t pruned = 0;
    std::string prune_error;
};

// Top-level entries touched by the states plus the managed directories.
std::vector<std::string> tracked_entries(const std::vector<FileState>& states,
                                         const std::vector<std::string>& managed_dirs);

std::string conflict_block(const std::string& current, const std::string& incoming,
                           const std::string& incoming_version);

// One transaction: backup, mutate in list order, commit the manifest last.
// Any failure after the backup restores it and rethrows.
class ApplyCoordinator {
public:
    ApplyCoordinator(StateStore& store, BackupManager& backups);

    ApplyResult apply(const Manifest& manifest, const std::vector<FileState>& states,
                      const UpstreamContents& upstream, const ApplyOptions& options);

    ApplyPhase phase() const { return phase_; }
    const std::optional<Backup>& backup() const { return backup_; }

private:
    void set_phase(ApplyPhase phase);
    void check_writable(const std::vector<std::string>& entries) const;
    void apply_state(const FileState& state, const std::string* content, const ApplyOptions& options,
                     ApplyResult& result);
    Manifest commit_manifest(const Manifest& manifest, const std::vector<FileState>& states,
                             const ApplyResult& result, const std::string& version) const;

    StateStore& store_;
    BackupManager& backups_;
    ApplyPhase phase_ = ApplyPhase::Idle;
    std::optional<Backup> backup_;
};
