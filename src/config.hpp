#pragma once
#include <optional>
#include <string>
#include <vector>

constexpr const char* META_DIR = ".templsync";
constexpr const char* MANIFEST_FILE = "manifest.json";
constexpr const char* CONFIG_FILE = "config.json";
constexpr const char* BACKUP_DIR = "backups";
constexpr const char* SCHEMA_VERSION = "1";
constexpr size_t DEFAULT_BACKUP_RETAIN = 5;

struct SyncConfig {
    std::vector<std::string> managed_dirs{".templates"};
    bool backups_enabled = true;
    size_t backup_retain = DEFAULT_BACKUP_RETAIN;
    bool assume_customized_on_init = true;
};

std::string meta_dir(const std::string& project_root);
std::string manifest_path(const std::string& project_root);
std::string backup_root(const std::string& project_root);

// Missing file yields defaults; malformed file throws ConfigError.
SyncConfig load_config(const std::string& project_root);
void save_config(const std::string& project_root, const SyncConfig& config);

// Relative, normalized, no ".." components. Throws PrerequisiteError otherwise.
void check_relative_path(const std::string& path);

// Non-negative decimal count such as a backup retention; nullopt for "-1", "", "3x" or overflow.
std::optional<size_t> parse_count(const std::string& text);

// True when the first component is the metadata directory.
bool is_meta_path(const std::string& path);

// check_relative_path, and never inside the metadata directory.
void check_project_path(const std::string& path);
