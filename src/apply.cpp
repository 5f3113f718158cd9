#include "apply.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace fs = std::filesystem;

const char* phase_name(ApplyPhase phase) {
    switch (phase) {
    case ApplyPhase::Idle: return "idle";
    case ApplyPhase::BackedUp: return "backed-up";
    case ApplyPhase::Applying: return "applying";
    case ApplyPhase::Committed: return "committed";
    case ApplyPhase::RolledBack: return "rolled-back";
    case ApplyPhase::Aborted: return "aborted";
    case ApplyPhase::Failed: return "failed";
    }
    return "unknown";
}

std::vector<std::string> tracked_entries(const std::vector<FileState>& states,
                                         const std::vector<std::string>& managed_dirs) {
    std::vector<std::string> entries(managed_dirs.begin(), managed_dirs.end());
    for (auto& s : states)
        entries.push_back(fs::path(s.path).begin()->generic_string());
    for (auto& e : entries)
        check_project_path(e);
    std::sort(entries.begin(), entries.end());
    entries.erase(std::unique(entries.begin(), entries.end()), entries.end());

    // Drop entries nested inside another entry.
    std::vector<std::string> roots;
    for (auto& e : entries) {
        bool nested = std::any_of(roots.begin(), roots.end(), [&](const std::string& r) {
            return e.size() > r.size() && e.compare(0, r.size(), r) == 0 && e[r.size()] == '/';
        });
        if (!nested)
            roots.push_back(e);
    }
    return roots;
}

std::string conflict_block(const std::string& current, const std::string& incoming,
                           const std::string& incoming_version) {
    std::string out = "<<<<<<< Current (local changes)\n";
    out += current;
    if (!current.empty() && current.back() != '\n')
        out += '\n';
    out += "=======\n";
    out += incoming;
    if (!incoming.empty() && incoming.back() != '\n')
        out += '\n';
    out += ">>>>>>> Incoming (upstream " + incoming_version + ")\n";
    return out;
}

namespace {

bool mutates(Action action) {
    switch (action) {
    case Action::Add:
    case Action::Update:
    case Action::Remove:
    case Action::Merge:
        return true;
    case Action::Preserve:
    case Action::Skip:
        return false;
    }
    return true;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw SyncError("cannot read " + path.string());
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw SyncError("cannot open " + path.string() + " for writing");
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out)
        throw SyncError("write failed on " + path.string());
}

}  // namespace

ApplyCoordinator::ApplyCoordinator(StateStore& store, BackupManager& backups)
    : store_(store)
    , backups_(backups)
{}

void ApplyCoordinator::set_phase(ApplyPhase phase) {
    spdlog::debug("apply: {} -> {}", phase_name(phase_), phase_name(phase));
    phase_ = phase;
}

void ApplyCoordinator::check_writable(const std::vector<std::string>& entries) const {
    std::vector<fs::path> targets{fs::path(store_.project_root())};
    for (auto& e : entries)
        targets.push_back(fs::path(store_.project_root()) / e);
    for (auto target : targets) {
        while (!fs::exists(target) && target.has_parent_path() && target != target.parent_path())
            target = target.parent_path();
        if (::access(target.c_str(), W_OK) != 0)
            throw PrerequisiteError("no write permission on " + target.string());
    }
}

ApplyResult ApplyCoordinator::apply(const Manifest& manifest, const std::vector<FileState>& states,
                                    const UpstreamContents& upstream, const ApplyOptions& options) {
    if (phase_ != ApplyPhase::Idle)
        throw std::logic_error("apply transaction already used");

    std::unordered_map<std::string, const std::string*> content;
    for (auto& file : upstream)
        content.emplace(file.path, &file.content);
    for (auto& s : states) {
        check_project_path(s.path);
        if ((s.action == Action::Add || s.action == Action::Update || s.action == Action::Merge) &&
            !content.count(s.path))
            throw PrerequisiteError("no upstream content for " + s.path);
    }

    ApplyResult result;
    result.manifest = manifest;
    bool any_mutation = std::any_of(states.begin(), states.end(),
                                    [](const FileState& s) { return mutates(s.action); });

    try {
        check_writable(options.backup_entries);
    } catch (const std::exception&) {
        set_phase(ApplyPhase::Aborted);
        throw;
    }

    if (options.backups_enabled && any_mutation) {
        try {
            backup_ = backups_.create_backup(options.backup_entries, manifest.distribution_version,
                                             options.target_version);
        } catch (const std::exception& e) {
            set_phase(ApplyPhase::Aborted);
            spdlog::error("backup failed, nothing was changed: {}", e.what());
            throw;
        }
        result.backup = backup_;
        set_phase(ApplyPhase::BackedUp);
    } else if (any_mutation) {
        spdlog::warn("backups disabled, changes cannot be rolled back");
    }

    set_phase(ApplyPhase::Applying);
    spdlog::info("applying {} file states ({} -> {})", states.size(), manifest.distribution_version,
                 options.target_version);
    try {
        for (auto& s : states) {
            auto it = content.find(s.path);
            apply_state(s, it == content.end() ? nullptr : it->second, options, result);
        }
        Manifest next = commit_manifest(manifest, states, result, options.target_version);
        if (any_mutation || next != manifest)
            store_.save(next);
        result.manifest = std::move(next);
    } catch (const std::exception& e) {
        spdlog::error("apply failed: {}", e.what());
        if (!backup_) {
            set_phase(ApplyPhase::Failed);
            throw;
        }
        try {
            backups_.restore(*backup_);
        } catch (const std::exception& restore_error) {
            set_phase(ApplyPhase::Failed);
            spdlog::critical("rollback failed, recover manually from {}", backup_->storage_path);
            throw RollbackError(e.what(), restore_error.what(), backup_->storage_path);
        }
        set_phase(ApplyPhase::RolledBack);
        spdlog::warn("rolled back to backup {}", backup_->name);
        throw;
    }
    set_phase(ApplyPhase::Committed);
    result.phase = phase_;
    spdlog::info("committed version {}: {} added, {} updated, {} removed, {} conflicts",
                 options.target_version, result.added.size(), result.updated.size(),
                 result.removed.size(), result.conflicts.size());

    if (backup_ && options.confirm_prune) {
        try {
            result.pruned = backups_.prune(options.retain, options.confirm_prune);
        } catch (const std::exception& e) {
            result.prune_error = e.what();
            spdlog::error("pruning old backups failed: {}", e.what());
        }
    }
    return result;
}

void ApplyCoordinator::apply_state(const FileState& state, const std::string* content,
                                   const ApplyOptions& options, ApplyResult& result) {
    fs::path target = fs::path(store_.project_root()) / state.path;
    switch (state.action) {
    case Action::Add:
        write_file(target, *content);
        result.added.push_back(state.path);
        spdlog::debug("added {}", state.path);
        break;
    case Action::Update:
        write_file(target, *content);
        result.updated.push_back(state.path);
        spdlog::debug("updated {}", state.path);
        break;
    case Action::Remove:
        fs::remove(target);
        result.removed.push_back(state.path);
        spdlog::debug("removed {}", state.path);
        break;
    case Action::Preserve:
        result.preserved.push_back(state.path);
        break;
    case Action::Merge: {
        std::string current = read_file(target);
        if (hash_equal(normalized_hash(current), state.upstream_hash)) {
            write_file(target, *content);
            result.updated.push_back(state.path);
            result.false_positives.push_back(state.path);
            spdlog::info("{} matches upstream, customized flag cleared", state.path);
        } else {
            write_file(target, conflict_block(current, *content, options.target_version));
            result.conflicts.push_back(state.path);
            spdlog::warn("conflict in {} needs manual resolution", state.path);
        }
        break;
    }
    case Action::Skip:
        ++result.skipped;
        break;
    }
}

Manifest ApplyCoordinator::commit_manifest(const Manifest& manifest, const std::vector<FileState>& states,
                                           const ApplyResult& result, const std::string& version) const {
    Manifest next = manifest;
    next.distribution_version = version;

    auto upsert = [&](const FileState& s) -> TrackedFile& {
        if (auto* f = next.find(s.path))
            return *f;
        next.tracked_files.push_back({s.path, std::nullopt, false, true});
        return next.tracked_files.back();
    };
    auto is_conflict = [&](const std::string& path) {
        return std::find(result.conflicts.begin(), result.conflicts.end(), path) != result.conflicts.end();
    };

    for (auto& s : states) {
        switch (s.action) {
        case Action::Add:
        case Action::Update: {
            auto& f = upsert(s);
            f.original_hash = s.upstream_hash;
            f.customized = false;
            f.is_official = true;
            break;
        }
        case Action::Merge: {
            auto& f = upsert(s);
            f.original_hash = s.upstream_hash;
            f.customized = is_conflict(s.path);
            f.is_official = true;
            break;
        }
        case Action::Remove:
            next.erase(s.path);
            break;
        case Action::Preserve:
            if (s.is_custom)
                break;
            if (!s.upstream_hash) {
                if (auto* f = next.find(s.path)) {
                    f->is_official = false;
                    f->customized = true;
                }
            }
            break;
        case Action::Skip:
            if (!s.current_hash && !s.upstream_hash)
                next.erase(s.path);
            break;
        }
    }
    return next;
}
