#include "csync/sync/types.hpp"

#include <algorithm>

namespace csync::sync {

PlanSummary SyncPlan::summary() const {
    PlanSummary summary;
    for (const auto& item : items) {
        switch (item.action) {
            case SyncAction::Copy: ++summary.copies; break;
            case SyncAction::Delete: ++summary.deletions; break;
            case SyncAction::Skip: ++summary.skips; break;
        }
    }
    return summary;
}

bool SyncPlan::converged() const {
    return std::all_of(items.begin(), items.end(), [](const PlanItem& item) {
        return item.action == SyncAction::Skip;
    });
}

const char* to_string(Direction direction) noexcept {
    return direction == Direction::Push ? "push" : "pull";
}

const char* to_string(EntryKind kind) noexcept {
    return kind == EntryKind::Directory ? "dir" : "file";
}

const char* to_string(SyncAction action) noexcept {
    switch (action) {
        case SyncAction::Copy: return "COPY";
        case SyncAction::Delete: return "DELETE";
        case SyncAction::Skip: return "SKIP";
    }
    return "SKIP";
}

const char* to_string(PlanReason reason) noexcept {
    switch (reason) {
        case PlanReason::New: return "new";
        case PlanReason::Changed: return "changed";
        case PlanReason::Unchanged: return "unchanged";
        case PlanReason::Excluded: return "excluded";
        case PlanReason::Protected: return "protected";
        case PlanReason::Extraneous: return "extraneous";
        case PlanReason::Retained: return "retained";
    }
    return "unchanged";
}

bool is_normalized_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) {
        return false;
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        const auto segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

std::string parent_path(const std::string& path) {
    const auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {};
    }
    return path.substr(0, slash);
}

} // namespace csync::sync
