#include "session.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

size_t SyncPlan::count(Action action) const {
    return static_cast<size_t>(std::count_if(reconciled.states.begin(), reconciled.states.end(),
                                             [action](const FileState& s) { return s.action == action; }));
}

SyncSession::SyncSession(const std::string& project_root)
    : SyncSession(project_root, load_config(project_root))
{}

SyncSession::SyncSession(const std::string& project_root, SyncConfig config)
    : project_root_(project_root)
    , config_(std::move(config))
    , store_(project_root_, config_.managed_dirs)
    , backups_(project_root_)
{}

SyncPlan SyncSession::plan(UpstreamProvider& provider, const std::string& version) {
    SyncPlan p;
    p.target_version = version.empty() ? provider.latest_version() : version;
    if (!provider.version_exists(p.target_version))
        throw UpstreamError("upstream has no version '" + p.target_version + "'");
    p.upstream = provider.fetch(p.target_version);

    auto existing = store_.load();
    if (existing) {
        p.manifest = std::move(*existing);
    } else {
        std::unordered_set<std::string> official;
        for (auto& f : p.upstream)
            official.insert(f.path);
        p.manifest = store_.create("", config_.assume_customized_on_init, official);
        p.new_manifest = true;
    }

    p.reconciled = reconcile_all(p.manifest, p.upstream, project_root_, config_.managed_dirs);
    spdlog::info("plan {} -> {}: {} add, {} update, {} remove, {} merge, {} preserve",
                 p.manifest.distribution_version.empty() ? "(none)" : p.manifest.distribution_version,
                 p.target_version, p.count(Action::Add), p.count(Action::Update), p.count(Action::Remove),
                 p.count(Action::Merge), p.count(Action::Preserve));
    return p;
}

ApplyResult SyncSession::apply(const SyncPlan& plan, const PruneConfirm& confirm_prune, bool backups_enabled) {
    ApplyOptions options;
    options.backups_enabled = backups_enabled && config_.backups_enabled;
    options.target_version = plan.target_version;
    options.backup_entries = tracked_entries(plan.reconciled.states, config_.managed_dirs);
    options.retain = config_.backup_retain;
    options.confirm_prune = confirm_prune;

    ApplyCoordinator coordinator(store_, backups_);
    return coordinator.apply(plan.manifest, plan.reconciled.states, plan.upstream, options);
}

void SyncSession::rollback_to(const std::string& backup_name) {
    backups_.restore(backups_.find_backup(backup_name));
}

std::vector<Backup> SyncSession::list_backups() const {
    return backups_.list_backups();
}

size_t SyncSession::prune(size_t keep, const PruneConfirm& confirm) {
    return backups_.prune(keep, confirm);
}

Manifest SyncSession::rebaseline(bool clear_customized) {
    auto manifest = store_.load();
    if (!manifest)
        throw ManifestError("no manifest in " + project_root_ + " to rebaseline");
    store_.update_hashes(*manifest);
    if (clear_customized) {
        for (auto& f : manifest->tracked_files)
            f.customized = false;
    }
    store_.save(*manifest);
    return *manifest;
}
