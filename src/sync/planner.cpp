#include "csync/sync/planner.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace csync::sync {
using rules::RuleAction;

namespace {

// Record every ancestor of a path that stays on the destination.
void pin_ancestors(const std::string& path, std::set<std::string>& pinned) {
    for (auto parent = parent_path(path); !parent.empty(); parent = parent_path(parent)) {
        if (!pinned.insert(parent).second) {
            break;  // ancestors of an already pinned dir are pinned too
        }
    }
}

bool below_any(const std::string& path, const std::set<std::string>& directories) {
    for (auto parent = parent_path(path); !parent.empty(); parent = parent_path(parent)) {
        if (directories.count(parent) > 0) {
            return true;
        }
    }
    return false;
}

} // namespace

SyncPlan SyncPlanner::plan(const TreeListing& source, const TreeListing& destination) const {
    std::vector<PlanItem> source_items;
    std::vector<PlanItem> destination_items;
    std::set<std::string> pinned;

    // Destination directory links are leaves: what the scan found through
    // them belongs to the link target and is never planned on its own.
    std::set<std::string> linked_dirs;
    for (const auto& [path, entry] : destination) {
        if (entry.symlink && entry.is_directory() && !below_any(path, linked_dirs)) {
            linked_dirs.insert(path);
        }
    }

    source_items.reserve(source.size());
    for (const auto& [path, entry] : source) {
        PlanItem item{path, SyncAction::Skip, entry.kind, PlanReason::Unchanged};

        if (rules_.classify(path, entry.kind) == RuleAction::Exclude) {
            item.reason = PlanReason::Excluded;
        } else {
            const auto existing = below_any(path, linked_dirs) ? destination.end() : destination.find(path);
            if (existing == destination.end()) {
                item.action = SyncAction::Copy;
                item.reason = PlanReason::New;
            } else if (!entry.identical_to(existing->second) || linked_dirs.count(path) > 0) {
                item.action = SyncAction::Copy;
                item.reason = PlanReason::Changed;
            }
            pin_ancestors(path, pinned);
        }
        source_items.push_back(std::move(item));
    }

    for (const auto& [path, entry] : destination) {
        if (below_any(path, linked_dirs)) {
            continue;
        }
        if (source.count(path) > 0) {
            pin_ancestors(path, pinned);
            continue;
        }

        PlanItem item{path, SyncAction::Delete, entry.kind, PlanReason::Extraneous};
        switch (rules_.classify(path, entry.kind)) {
            case RuleAction::Exclude:
                item.action = SyncAction::Skip;
                item.reason = PlanReason::Excluded;
                break;
            case RuleAction::Protect:
                item.action = SyncAction::Skip;
                item.reason = PlanReason::Protected;
                break;
            case RuleAction::Allow:
                break;
        }
        if (item.action == SyncAction::Skip) {
            pin_ancestors(path, pinned);
        }
        destination_items.push_back(std::move(item));
    }

    // A directory cannot be removed while something inside it is kept.
    for (auto& item : destination_items) {
        if (item.action == SyncAction::Delete && item.kind == EntryKind::Directory && pinned.count(item.path) > 0) {
            item.action = SyncAction::Skip;
            item.reason = PlanReason::Retained;
        }
    }

    SyncPlan result;
    result.items.reserve(source_items.size() + destination_items.size());
    result.items.insert(result.items.end(), destination_items.rbegin(), destination_items.rend());
    result.items.insert(result.items.end(), source_items.begin(), source_items.end());

    const auto summary = result.summary();
    spdlog::debug("Planned {} copies, {} deletions, {} skips", summary.copies, summary.deletions, summary.skips);
    return result;
}

SyncPlan plan(const TreeListing& source, const TreeListing& destination, const rules::RuleSet& rules) {
    return SyncPlanner(rules).plan(source, destination);
}

} // namespace csync::sync
