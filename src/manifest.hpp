#pragma once
#include "fingerprint.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct TrackedFile {
    std::string path;
    Hash original_hash;
    bool customized = false;
    bool is_official = true;
};

bool operator==(const TrackedFile& a, const TrackedFile& b);

struct Manifest {
    std::string schema_version;
    std::string distribution_version;
    std::vector<TrackedFile> tracked_files;

    TrackedFile* find(const std::string& path);
    const TrackedFile* find(const std::string& path) const;
    bool erase(const std::string& path);
};

bool operator==(const Manifest& a, const Manifest& b);
bool operator!=(const Manifest& a, const Manifest& b);

// Owns the on-disk manifest of one project. Reads and writes are explicit;
// the manifest value itself is passed around by callers.
class StateStore {
public:
    StateStore(const std::string& project_root, std::vector<std::string> managed_dirs);

    // nullopt when no manifest exists; ManifestError when it is unreadable or corrupt.
    std::optional<Manifest> load() const;

    // In-memory only; nothing is written until save(). Tracks every file under the
    // managed directories plus every official path already present on disk.
    Manifest create(const std::string& version, bool assume_all_customized) const;
    Manifest create(const std::string& version, bool assume_all_customized,
                    const std::unordered_set<std::string>& official_paths) const;

    void save(const Manifest& manifest) const;

    // Reset every original_hash to the current on-disk fingerprint.
    void update_hashes(Manifest& manifest) const;

    // Project-relative paths of all regular files under the managed directories.
    std::vector<std::string> scan_managed() const;

    const std::string& project_root() const { return project_root_; }

private:
    std::string project_root_;
    std::vector<std::string> managed_dirs_;
};
