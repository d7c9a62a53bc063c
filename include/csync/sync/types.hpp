#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace csync::sync {

enum class Direction {
    Push,  ///< authoring workstation -> live instance
    Pull   ///< live instance -> authoring workstation
};

enum class EntryKind {
    File,
    Directory
};

/**
 * @brief Comparable content identity of an entry
 *
 * Files carry their size and the hex SHA-256 of their content. Directories
 * carry an empty fingerprint; their content is compared entry by entry.
 */
struct Fingerprint {
    std::uint64_t size = 0;
    std::string checksum;

    bool operator==(const Fingerprint& other) const {
        return size == other.size && checksum == other.checksum;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

struct Entry {
    std::string path;  ///< Relative to the tree root, '/'-separated, no ".." segments
    EntryKind kind = EntryKind::File;
    Fingerprint fingerprint;
    bool symlink = false;  ///< The entry itself is a link; kind and fingerprint describe its target

    [[nodiscard]] bool is_directory() const noexcept { return kind == EntryKind::Directory; }

    [[nodiscard]] bool identical_to(const Entry& other) const {
        return kind == other.kind && fingerprint == other.fingerprint;
    }
};

/// Ordered by path so that every parent sorts before its descendants.
using TreeListing = std::map<std::string, Entry>;

enum class SyncAction {
    Copy,
    Delete,
    Skip
};

/// Why the planner chose an action; carried for previews and logs only.
enum class PlanReason {
    New,          ///< absent from destination
    Changed,      ///< present but not identical
    Unchanged,
    Excluded,
    Protected,
    Extraneous,   ///< destination-only, not covered by any rule
    Retained      ///< destination-only directory that still holds kept entries
};

struct PlanItem {
    std::string path;
    SyncAction action = SyncAction::Skip;
    EntryKind kind = EntryKind::File;
    PlanReason reason = PlanReason::Unchanged;

    bool operator==(const PlanItem& other) const {
        return path == other.path && action == other.action &&
               kind == other.kind && reason == other.reason;
    }
};

struct PlanSummary {
    std::size_t copies = 0;
    std::size_t deletions = 0;
    std::size_t skips = 0;
};

/**
 * @brief Fully computed ordered change list for one sync call
 *
 * Deletions come first, children before parents; copies follow, parents
 * before children. The executor applies items in sequence.
 */
struct SyncPlan {
    std::vector<PlanItem> items;

    [[nodiscard]] PlanSummary summary() const;

    /// True when the plan would not change the destination.
    [[nodiscard]] bool converged() const;
};

struct FailedPath {
    std::string path;
    std::string reason;
};

/**
 * @brief Outcome of applying a plan
 *
 * A non-empty failed list is a partial success: the transfer ran but some
 * paths did not make it. Fatal failures are reported as Error instead.
 */
struct SyncResult {
    std::size_t copied = 0;
    std::size_t deleted = 0;
    bool dry_run = false;
    std::vector<FailedPath> failed;

    [[nodiscard]] bool ok() const noexcept { return failed.empty(); }
};

const char* to_string(Direction direction) noexcept;
const char* to_string(EntryKind kind) noexcept;
const char* to_string(SyncAction action) noexcept;
const char* to_string(PlanReason reason) noexcept;

/**
 * @brief Checks the relative-path form used as a listing key
 *
 * Rejects empty paths, absolute paths, backslashes, empty segments and
 * "." / ".." segments.
 */
bool is_normalized_path(const std::string& path);

/// Parent of a relative path, or "" for a top-level entry.
std::string parent_path(const std::string& path);

} // namespace csync::sync
