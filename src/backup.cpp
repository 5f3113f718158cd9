#include "backup.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* METADATA_FILE = "backup.json";
constexpr const char* FILES_DIR = "files";
constexpr const char* PARTIAL_SUFFIX = ".partial";

std::string format_timestamp(uint64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%S") << '.' << std::setw(3) << std::setfill('0') << ms % 1000
        << 'Z';
    return oss.str();
}

void copy_entry(const fs::path& from, const fs::path& to) {
    fs::create_directories(to.parent_path());
    if (fs::is_directory(from))
        fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    else
        fs::copy(from, to, fs::copy_options::copy_symlinks);
}

}  // namespace

BackupManager::BackupManager(const std::string& project_root)
    : project_root_(project_root)
    , backup_root_(backup_root(project_root))
{}

Backup BackupManager::create_backup(const std::vector<std::string>& entries,
                                    const std::string& source_version,
                                    const std::string& target_version) {
    Backup b;
    b.timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    b.source_version = source_version;
    b.target_version = target_version;

    fs::path root(backup_root_);
    fs::path staging;
    try {
        fs::create_directories(root);
        std::string base = format_timestamp(b.timestamp);
        b.name = base;
        for (int n = 1; fs::exists(root / b.name) || fs::exists(root / (b.name + PARTIAL_SUFFIX)); ++n) {
            std::ostringstream oss;
            oss << base << '_' << std::setw(2) << std::setfill('0') << n;
            b.name = oss.str();
        }
        staging = root / (b.name + PARTIAL_SUFFIX);
        fs::create_directories(staging / FILES_DIR);

        json captured = json::array();
        for (auto& entry : entries) {
            check_project_path(entry);
            fs::path src = fs::path(project_root_) / entry;
            bool present = fs::exists(fs::symlink_status(src));
            if (present)
                copy_entry(src, staging / FILES_DIR / entry);
            captured.push_back({{"path", entry}, {"present", present}});
            b.entries.push_back(entry);
        }

        fs::path manifest = manifest_path(project_root_);
        b.has_manifest = fs::exists(manifest);
        if (b.has_manifest)
            fs::copy_file(manifest, staging / MANIFEST_FILE);

        json meta = {
            {"timestamp", b.timestamp},
            {"sourceVersion", b.source_version},
            {"targetVersion", b.target_version},
            {"entries", captured},
            {"manifest", b.has_manifest}
        };
        std::ofstream out(staging / METADATA_FILE);
        out << meta.dump(4);
        out.close();
        if (!out)
            throw BackupError("cannot write backup metadata");

        fs::rename(staging, root / b.name);
    } catch (const std::exception& e) {
        std::error_code ec;
        if (!staging.empty())
            fs::remove_all(staging, ec);
        throw BackupError(std::string("backup failed: ") + e.what());
    }

    b.storage_path = (root / b.name).string();
    spdlog::info("created backup {} ({} entries)", b.storage_path, b.entries.size());
    return b;
}

void BackupManager::restore(const Backup& backup) {
    fs::path stored(backup.storage_path);
    if (!fs::is_directory(stored))
        throw BackupError("backup not found: " + backup.storage_path);

    std::ifstream in(stored / METADATA_FILE);
    json meta;
    try {
        in >> meta;
    } catch (const json::exception& e) {
        throw BackupError("corrupt backup metadata in " + backup.storage_path + ": " + e.what());
    }

    spdlog::warn("restoring working copy from backup {}", backup.storage_path);
    for (auto& item : meta.at("entries")) {
        std::string entry = item.at("path").get<std::string>();
        check_project_path(entry);
        fs::path target = fs::path(project_root_) / entry;
        fs::remove_all(target);
        if (item.at("present").get<bool>())
            copy_entry(stored / FILES_DIR / entry, target);
    }

    fs::path manifest = manifest_path(project_root_);
    if (meta.value("manifest", false)) {
        fs::create_directories(manifest.parent_path());
        fs::copy_file(stored / MANIFEST_FILE, manifest, fs::copy_options::overwrite_existing);
    } else {
        fs::remove(manifest);
    }
    spdlog::info("restore from {} complete", backup.name);
}

std::vector<Backup> BackupManager::list_backups() const {
    std::vector<Backup> backups;
    std::error_code ec;
    if (!fs::is_directory(backup_root_, ec))
        return backups;

    try {
        for (auto& entry : fs::directory_iterator(backup_root_)) {
            if (!entry.is_directory())
                continue;
            std::string name = entry.path().filename().string();
            fs::path meta_file = entry.path() / METADATA_FILE;
            if (name.size() > 8 && name.compare(name.size() - 8, 8, PARTIAL_SUFFIX) == 0)
                continue;
            if (!fs::exists(meta_file)) {
                spdlog::warn("ignoring {}: no {}", entry.path().string(), METADATA_FILE);
                continue;
            }
            try {
                std::ifstream in(meta_file);
                json meta;
                in >> meta;
                Backup b;
                b.name = name;
                b.storage_path = entry.path().string();
                b.timestamp = meta.at("timestamp").get<uint64_t>();
                b.source_version = meta.value("sourceVersion", "");
                b.target_version = meta.value("targetVersion", "");
                b.has_manifest = meta.value("manifest", false);
                for (auto& item : meta.at("entries"))
                    b.entries.push_back(item.at("path").get<std::string>());
                backups.push_back(std::move(b));
            } catch (const json::exception& e) {
                spdlog::warn("ignoring {}: {}", entry.path().string(), e.what());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw BackupError(std::string("cannot list backups: ") + e.what());
    }

    std::sort(backups.begin(), backups.end(), [](const Backup& a, const Backup& b) {
        if (a.timestamp != b.timestamp)
            return a.timestamp > b.timestamp;
        return a.name > b.name;
    });
    return backups;
}

Backup BackupManager::find_backup(const std::string& name) const {
    for (auto& b : list_backups()) {
        if (b.name == name)
            return b;
    }
    throw BackupError("no backup named '" + name + "'");
}

size_t BackupManager::prune(size_t keep, const PruneConfirm& confirm) {
    auto backups = list_backups();
    if (backups.size() <= keep)
        return 0;
    std::vector<Backup> doomed(backups.begin() + keep, backups.end());
    // Oldest first.
    std::reverse(doomed.begin(), doomed.end());
    if (!confirm || !confirm(doomed)) {
        spdlog::info("prune declined, {} backups kept", backups.size());
        return 0;
    }
    for (auto& b : doomed) {
        fs::remove_all(b.storage_path);
        spdlog::info("deleted backup {}", b.name);
    }
    return doomed.size();
}
