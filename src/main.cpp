#include "errors.hpp"
#include "logging.hpp"
#include "session.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "Usage: templsync [-v] <project> <command> [args]\n"
                 "  status <upstream_dir> [version]\n"
                 "  apply <upstream_dir> [version] [--yes] [--no-backup]\n"
                 "  backups\n"
                 "  rollback <backup>\n"
                 "  prune [keep] [--yes]\n"
                 "  rebaseline [--clear-flags]\n";
}

bool confirm(const std::string& question, bool assume_yes) {
    if (assume_yes)
        return true;
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

void print_plan(const SyncPlan& plan) {
    std::cout << "Target version: " << plan.target_version;
    if (plan.new_manifest)
        std::cout << " (first sync, existing files treated as customized)";
    std::cout << "\n";
    for (auto& s : plan.reconciled.states) {
        if (s.action == Action::Skip)
            continue;
        std::cout << "  " << action_name(s.action) << "\t" << s.path;
        if (s.is_custom)
            std::cout << " (custom)";
        std::cout << "\n";
    }
    std::cout << plan.count(Action::Skip) << " unchanged, " << plan.reconciled.custom_files.size()
              << " custom files left alone\n";
}

PruneConfirm prune_prompt(bool assume_yes) {
    return [assume_yes](const std::vector<Backup>& doomed) {
        for (auto& b : doomed)
            std::cout << "  " << b.name << " (" << b.source_version << " -> " << b.target_version << ")\n";
        return confirm("Delete " + std::to_string(doomed.size()) + " old backups?", assume_yes);
    };
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    bool verbose = false;
    bool yes = false;
    bool no_backup = false;
    bool clear_flags = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v")
            verbose = true;
        else if (a == "--yes")
            yes = true;
        else if (a == "--no-backup")
            no_backup = true;
        else if (a == "--clear-flags")
            clear_flags = true;
        else
            args.push_back(a);
    }
    if (args.size() < 2) {
        usage();
        return 1;
    }
    init_logging(verbose);

    const std::string project = args[0];
    const std::string command = args[1];
    try {
        SyncSession session(project);

        if (command == "status" || command == "apply") {
            if (args.size() < 3) {
                usage();
                return 1;
            }
            DirectoryUpstream upstream(args[2]);
            SyncPlan plan = session.plan(upstream, args.size() > 3 ? args[3] : "");
            print_plan(plan);
            if (command == "status")
                return 0;
            if (!confirm("Apply these changes?", yes)) {
                std::cout << "Cancelled, nothing changed.\n";
                return 0;
            }
            ApplyResult result = session.apply(plan, prune_prompt(yes), !no_backup);
            for (auto& path : result.false_positives)
                std::cout << "  resolved automatically (content already matched): " << path << "\n";
            for (auto& path : result.conflicts)
                std::cout << "  needs manual resolution: " << path << "\n";
            if (result.backup)
                std::cout << "Backup: " << result.backup->name << "\n";
            std::cout << "Now at version " << result.manifest.distribution_version << "\n";
            return 0;
        }
        if (command == "backups") {
            for (auto& b : session.list_backups())
                std::cout << b.name << "\t" << b.source_version << " -> " << b.target_version << "\n";
            return 0;
        }
        if (command == "rollback") {
            if (args.size() < 3) {
                usage();
                return 1;
            }
            if (!confirm("Replace managed files with backup " + args[2] + "?", yes))
                return 0;
            session.rollback_to(args[2]);
            std::cout << "Restored " << args[2] << "\n";
            return 0;
        }
        if (command == "prune") {
            size_t keep = session.config().backup_retain;
            if (args.size() > 2) {
                auto parsed = parse_count(args[2]);
                if (!parsed) {
                    std::cerr << "prune: keep must be a non-negative number, got '" << args[2] << "'\n";
                    usage();
                    return 1;
                }
                keep = *parsed;
            }
            size_t deleted = session.prune(keep, prune_prompt(yes));
            std::cout << "Deleted " << deleted << " backups\n";
            return 0;
        }
        if (command == "rebaseline") {
            if (!confirm("Record current content as the new baseline?", yes))
                return 0;
            auto manifest = session.rebaseline(clear_flags);
            std::cout << "Rebaselined " << manifest.tracked_files.size() << " files\n";
            return 0;
        }
        usage();
        return 1;
    } catch (const RollbackError& e) {
        spdlog::critical("{}", e.what());
        std::cerr << "Working copy may be inconsistent. Backup: " << e.backup_path() << "\n";
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
}
