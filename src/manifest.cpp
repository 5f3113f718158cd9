#include "manifest.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

bool operator==(const TrackedFile& a, const TrackedFile& b) {
    return a.path == b.path && a.original_hash == b.original_hash && a.customized == b.customized &&
           a.is_official == b.is_official;
}

bool operator==(const Manifest& a, const Manifest& b) {
    return a.schema_version == b.schema_version && a.distribution_version == b.distribution_version &&
           a.tracked_files == b.tracked_files;
}

bool operator!=(const Manifest& a, const Manifest& b) {
    return !(a == b);
}

TrackedFile* Manifest::find(const std::string& path) {
    for (auto& f : tracked_files) {
        if (f.path == path)
            return &f;
    }
    return nullptr;
}

const TrackedFile* Manifest::find(const std::string& path) const {
    auto it = std::find_if(tracked_files.begin(), tracked_files.end(),
                           [&](const TrackedFile& f) { return f.path == path; });
    return it == tracked_files.end() ? nullptr : &*it;
}

bool Manifest::erase(const std::string& path) {
    auto it = std::find_if(tracked_files.begin(), tracked_files.end(),
                           [&](const TrackedFile& f) { return f.path == path; });
    if (it == tracked_files.end())
        return false;
    tracked_files.erase(it);
    return true;
}

StateStore::StateStore(const std::string& project_root, std::vector<std::string> managed_dirs)
    : project_root_(project_root)
    , managed_dirs_(std::move(managed_dirs))
{}

std::optional<Manifest> StateStore::load() const {
    std::string file = manifest_path(project_root_);
    std::error_code ec;
    if (!fs::exists(file, ec))
        return std::nullopt;
    std::ifstream in(file);
    if (!in)
        throw ManifestError("cannot open manifest " + file);

    Manifest m;
    try {
        json j;
        in >> j;
        m.schema_version = j.at("schemaVersion").get<std::string>();
        if (m.schema_version != SCHEMA_VERSION)
            throw ManifestError("unsupported manifest schema '" + m.schema_version + "' in " + file);
        m.distribution_version = j.at("distributionVersion").get<std::string>();
        std::unordered_set<std::string> seen;
        for (auto& obj : j.at("trackedFiles")) {
            TrackedFile f;
            f.path = obj.at("path").get<std::string>();
            if (!obj.at("originalHash").is_null())
                f.original_hash = obj["originalHash"].get<std::string>();
            f.customized = obj.at("customized").get<bool>();
            f.is_official = obj.at("isOfficial").get<bool>();
            check_project_path(f.path);
            if (!seen.insert(f.path).second)
                throw ManifestError("duplicate tracked path '" + f.path + "' in " + file);
            m.tracked_files.push_back(std::move(f));
        }
    } catch (const json::exception& e) {
        throw ManifestError("corrupt manifest " + file + ": " + e.what());
    } catch (const PrerequisiteError& e) {
        throw ManifestError("corrupt manifest " + file + ": " + e.what());
    }
    spdlog::debug("loaded manifest {} ({} files, version {})", file, m.tracked_files.size(),
                  m.distribution_version);
    return m;
}

Manifest StateStore::create(const std::string& version, bool assume_all_customized) const {
    auto paths = scan_managed();
    return create(version, assume_all_customized, std::unordered_set<std::string>(paths.begin(), paths.end()));
}

Manifest StateStore::create(const std::string& version, bool assume_all_customized,
                            const std::unordered_set<std::string>& official_paths) const {
    Manifest m;
    m.schema_version = SCHEMA_VERSION;
    m.distribution_version = version;

    // Official paths outside the managed directories that already exist locally
    // are unknown user content too.
    auto paths = scan_managed();
    for (auto& path : official_paths) {
        check_project_path(path);
        std::error_code ec;
        if (fs::is_regular_file(fs::path(project_root_) / path, ec))
            paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    for (auto& path : paths) {
        TrackedFile f;
        f.path = path;
        f.customized = assume_all_customized;
        f.is_official = official_paths.count(path) > 0;
        m.tracked_files.push_back(std::move(f));
    }
    spdlog::info("new manifest for {} with {} existing files{}", project_root_, m.tracked_files.size(),
                 assume_all_customized ? " (all assumed customized)" : "");
    return m;
}

void StateStore::save(const Manifest& manifest) const {
    json files = json::array();
    for (auto& f : manifest.tracked_files) {
        files.push_back({
            {"path", f.path},
            {"originalHash", f.original_hash ? json(*f.original_hash) : json(nullptr)},
            {"customized", f.customized},
            {"isOfficial", f.is_official}
        });
    }
    json j = {
        {"schemaVersion", manifest.schema_version.empty() ? SCHEMA_VERSION : manifest.schema_version},
        {"distributionVersion", manifest.distribution_version},
        {"trackedFiles", files}
    };

    fs::create_directories(meta_dir(project_root_));
    std::string file = manifest_path(project_root_);
    std::string tmp = file + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << j.dump(4);
        out.flush();
        if (!out)
            throw SyncError("cannot write " + tmp);
    }
    fs::rename(tmp, file);
    spdlog::debug("saved manifest {} (version {})", file, manifest.distribution_version);
}

void StateStore::update_hashes(Manifest& manifest) const {
    for (auto& f : manifest.tracked_files)
        f.original_hash = hash_file((fs::path(project_root_) / f.path).string());
    spdlog::info("rebaselined {} tracked files", manifest.tracked_files.size());
}

std::vector<std::string> StateStore::scan_managed() const {
    std::vector<std::string> paths;
    for (auto& dir : managed_dirs_) {
        fs::path full = fs::path(project_root_) / dir;
        std::error_code ec;
        if (!fs::is_directory(full, ec))
            continue;
        for (auto& p : fs::recursive_directory_iterator(full)) {
            if (!p.is_regular_file())
                continue;
            paths.push_back(fs::relative(p.path(), project_root_).generic_string());
        }
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}
