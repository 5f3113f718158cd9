#pragma once
#include <stdexcept>
#include <string>

class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public SyncError {
public:
    using SyncError::SyncError;
};

// Manifest exists but cannot be read or parsed. Never treated as "no manifest".
class ManifestError : public SyncError {
public:
    using SyncError::SyncError;
};

class PrerequisiteError : public SyncError {
public:
    using SyncError::SyncError;
};

class ReconcileError : public SyncError {
public:
    using SyncError::SyncError;
};

class BackupError : public SyncError {
public:
    using SyncError::SyncError;
};

class UpstreamError : public SyncError {
public:
    using SyncError::SyncError;
};

// Restore after a failed apply did not complete; the working copy may be inconsistent.
class RollbackError : public SyncError {
public:
    RollbackError(const std::string& original, const std::string& restore, const std::string& backup_path)
        : SyncError("apply failed: " + original + "; rollback failed: " + restore +
                    "; recover manually from backup at " + backup_path)
        , original_(original)
        , restore_(restore)
        , backup_path_(backup_path)
    {}

    const std::string& original_error() const { return original_; }
    const std::string& restore_error() const { return restore_; }
    const std::string& backup_path() const { return backup_path_; }

private:
    std::string original_;
    std::string restore_;
    std::string backup_path_;
};
