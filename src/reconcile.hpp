#pragma once
#include "fingerprint.hpp"
#include "manifest.hpp"
#include "upstream.hpp"
#include <string>
#include <vector>

enum class Action { Add, Remove, Preserve, Update, Merge, Skip };

const char* action_name(Action action);

struct FileState {
    std::string path;
    Hash current_hash;
    Hash original_hash;
    Hash upstream_hash;
    bool is_customized = false;
    bool has_upstream_changes = false;
    bool is_conflict = false;
    bool is_official = true;
    bool is_custom = false;  // user-authored file; never mutated
    Action action = Action::Skip;
};

struct ReconcileResult {
    std::vector<FileState> states;
    std::vector<std::string> custom_files;
};

// A present file counts as customized when the stored flag is set or its
// hash differs from the original.
FileState classify(const std::string& path, const Hash& original_hash, const Hash& upstream_hash,
                   const Hash& current_hash, bool is_official, bool customized_flag = false);

// Tracked files in manifest order, then new upstream files in upstream order.
ReconcileResult reconcile_all(const Manifest& manifest, const UpstreamContents& upstream,
                              const std::string& project_root,
                              const std::vector<std::string>& managed_dirs);
