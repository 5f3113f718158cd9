#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct Backup {
    std::string name;            // directory name, sortable
    uint64_t timestamp = 0;      // milliseconds since epoch
    std::string source_version;
    std::string target_version;
    std::string storage_path;
    std::vector<std::string> entries;  // top-level project entries captured
    bool has_manifest = false;
};

// Return true to allow deleting the listed backups.
using PruneConfirm = std::function<bool(const std::vector<Backup>&)>;

class BackupManager {
public:
    explicit BackupManager(const std::string& project_root);
    virtual ~BackupManager() = default;

    // Copies each entry (file or directory, project-relative) plus the manifest.
    // Entries absent from the working copy are recorded and removed again on restore.
    Backup create_backup(const std::vector<std::string>& entries, const std::string& source_version,
                         const std::string& target_version);

    // Replaces the captured entries and manifest with the backup's copies.
    virtual void restore(const Backup& backup);

    // Newest first. Incomplete backups are ignored.
    std::vector<Backup> list_backups() const;
    Backup find_backup(const std::string& name) const;

    // Keeps the newest `keep`; deletes nothing unless confirm approves. Returns the number deleted.
    size_t prune(size_t keep, const PruneConfirm& confirm);

private:
    std::string project_root_;
    std::string backup_root_;
};
