#include "reconcile.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

const char* action_name(Action action) {
    switch (action) {
    case Action::Add: return "add";
    case Action::Remove: return "remove";
    case Action::Preserve: return "preserve";
    case Action::Update: return "update";
    case Action::Merge: return "merge";
    case Action::Skip: return "skip";
    }
    return "unknown";
}

FileState classify(const std::string& path, const Hash& original_hash, const Hash& upstream_hash,
                   const Hash& current_hash, bool is_official, bool customized_flag) {
    FileState s;
    s.path = path;
    s.current_hash = current_hash;
    s.original_hash = original_hash;
    s.upstream_hash = upstream_hash;
    s.is_official = is_official;

    bool hash_customized = current_hash && original_hash && !hash_equal(current_hash, original_hash);
    s.is_customized = current_hash.has_value() && (customized_flag || hash_customized);

    if (original_hash.has_value() != upstream_hash.has_value())
        s.has_upstream_changes = true;
    else if (original_hash && upstream_hash)
        s.has_upstream_changes = !hash_equal(original_hash, upstream_hash);

    s.is_conflict = s.is_customized && s.has_upstream_changes;

    if (!current_hash) {
        s.action = upstream_hash ? Action::Add : Action::Skip;
    } else if (!upstream_hash) {
        s.action = s.is_customized ? Action::Preserve : Action::Remove;
    } else if (s.is_conflict) {
        s.action = Action::Merge;
    } else if (s.is_customized) {
        s.action = Action::Preserve;
    } else if (s.has_upstream_changes) {
        s.action = Action::Update;
    } else {
        s.action = Action::Skip;
    }

    // Equal to both original and upstream while those differ: do not guess.
    if (hash_equal(current_hash, original_hash) && hash_equal(current_hash, upstream_hash) &&
        !hash_equal(original_hash, upstream_hash)) {
        spdlog::warn("inconsistent fingerprints for {}, flagging as conflict", path);
        s.is_conflict = true;
        s.action = Action::Merge;
    }
    return s;
}

namespace {

Hash read_current(const std::string& project_root, const std::string& path) {
    try {
        return hash_file((fs::path(project_root) / path).string());
    } catch (const std::exception& e) {
        throw ReconcileError("cannot fingerprint " + path + ": " + e.what());
    }
}

}  // namespace

ReconcileResult reconcile_all(const Manifest& manifest, const UpstreamContents& upstream,
                              const std::string& project_root,
                              const std::vector<std::string>& managed_dirs) {
    std::unordered_map<std::string, const UpstreamFile*> by_path;
    for (auto& file : upstream) {
        try {
            check_project_path(file.path);
        } catch (const PrerequisiteError& e) {
            throw ReconcileError(std::string("upstream: ") + e.what());
        }
        by_path.emplace(file.path, &file);
    }

    ReconcileResult result;
    std::unordered_set<std::string> official;
    std::unordered_set<std::string> known;
    for (auto& f : manifest.tracked_files) {
        known.insert(f.path);
        if (f.is_official)
            official.insert(f.path);
    }

    StateStore scanner(project_root, managed_dirs);
    std::unordered_set<std::string> custom;
    for (auto& path : scanner.scan_managed()) {
        if (!official.count(path)) {
            custom.insert(path);
            result.custom_files.push_back(path);
        }
    }

    auto protect = [&](FileState& s) {
        if (!custom.count(s.path) || !s.current_hash)
            return;
        s.is_custom = true;
        if (s.action != Action::Preserve && s.action != Action::Skip) {
            spdlog::info("{} is a custom file, {} suppressed", s.path, action_name(s.action));
            s.action = Action::Preserve;
        }
    };

    for (auto& f : manifest.tracked_files) {
        auto it = by_path.find(f.path);
        Hash upstream_hash;
        if (it != by_path.end())
            upstream_hash = normalized_hash(it->second->content);
        auto state = classify(f.path, f.original_hash, upstream_hash, read_current(project_root, f.path),
                              f.is_official, f.customized);
        protect(state);
        result.states.push_back(std::move(state));
    }

    std::unordered_set<std::string> emitted;
    for (auto& file : upstream) {
        if (known.count(file.path) || !emitted.insert(file.path).second)
            continue;
        auto state = classify(file.path, std::nullopt, normalized_hash(file.content),
                              read_current(project_root, file.path), true);
        protect(state);
        result.states.push_back(std::move(state));
    }

    spdlog::debug("reconciled {} files, {} custom", result.states.size(), result.custom_files.size());
    return result;
}
