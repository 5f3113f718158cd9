#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string meta_dir(const std::string& project_root) {
    return (fs::path(project_root) / META_DIR).string();
}

std::string manifest_path(const std::string& project_root) {
    return (fs::path(project_root) / META_DIR / MANIFEST_FILE).string();
}

std::string backup_root(const std::string& project_root) {
    return (fs::path(project_root) / META_DIR / BACKUP_DIR).string();
}

SyncConfig load_config(const std::string& project_root) {
    SyncConfig config;
    fs::path file = fs::path(project_root) / META_DIR / CONFIG_FILE;
    if (!fs::exists(file)) {
        spdlog::debug("no config at {}, using defaults", file.string());
        return config;
    }
    std::ifstream in(file);
    if (!in)
        throw ConfigError("cannot open " + file.string());
    try {
        json j;
        in >> j;
        if (j.contains("managed_dirs"))
            config.managed_dirs = j["managed_dirs"].get<std::vector<std::string>>();
        if (j.contains("backups")) {
            const auto& b = j["backups"];
            config.backups_enabled = b.value("enabled", config.backups_enabled);
            config.backup_retain = b.value("retain", config.backup_retain);
        }
        config.assume_customized_on_init =
            j.value("assume_customized_on_init", config.assume_customized_on_init);
    } catch (const json::exception& e) {
        throw ConfigError("malformed config " + file.string() + ": " + e.what());
    }
    for (const auto& dir : config.managed_dirs) {
        try {
            check_project_path(dir);
        } catch (const PrerequisiteError& e) {
            throw ConfigError(std::string("managed_dirs: ") + e.what());
        }
    }
    return config;
}

void save_config(const std::string& project_root, const SyncConfig& config) {
    json j = {
        {"managed_dirs", config.managed_dirs},
        {"backups", {{"enabled", config.backups_enabled}, {"retain", config.backup_retain}}},
        {"assume_customized_on_init", config.assume_customized_on_init}
    };
    fs::create_directories(meta_dir(project_root));
    std::ofstream out(fs::path(project_root) / META_DIR / CONFIG_FILE);
    out << j.dump(4);
    if (!out)
        throw ConfigError("cannot write config in " + meta_dir(project_root));
}

void check_relative_path(const std::string& path) {
    fs::path p(path);
    if (path.empty() || p.is_absolute() || p.has_root_name())
        throw PrerequisiteError("not a project-relative path: '" + path + "'");
    for (const auto& part : p) {
        if (part == ".." || part == ".")
            throw PrerequisiteError("path may not contain '.' or '..': '" + path + "'");
    }
}

bool is_meta_path(const std::string& path) {
    fs::path p(path);
    return !p.empty() && p.begin()->string() == META_DIR;
}

void check_project_path(const std::string& path) {
    check_relative_path(path);
    if (is_meta_path(path))
        throw PrerequisiteError("path inside " + std::string(META_DIR) + " is reserved: '" + path + "'");
}

std::optional<size_t> parse_count(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
        return std::nullopt;
    try {
        unsigned long long value = std::stoull(text);
        if (value > static_cast<unsigned long long>(SIZE_MAX))
            return std::nullopt;
        return static_cast<size_t>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
