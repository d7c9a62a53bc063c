#pragma once

#include "csync/rules/rule_set.hpp"
#include "csync/sync/types.hpp"

namespace csync::sync {

/**
 * @brief Merges two tree listings and a rule set into an ordered sync plan
 *
 * Pure and deterministic: the same inputs always produce the same plan.
 *
 * Source entries:
 *   EXCLUDE                         -> SKIP
 *   missing or different in dest    -> COPY
 *   identical in dest               -> SKIP
 * Destination-only entries:
 *   EXCLUDE or PROTECT              -> SKIP
 *   directory still holding a kept entry -> SKIP
 *   otherwise                       -> DELETE
 *
 * A directory link on the destination is planned as a leaf: deleting it
 * removes the link only, a source directory at its path replaces it, and
 * entries listed through it are not planned.
 *
 * Ordering: destination-only items first, deepest paths first, so children
 * are removed before their parent directory; then source items in path
 * order, so parents are created before children.
 */
class SyncPlanner {
public:
    explicit SyncPlanner(const rules::RuleSet& rules) : rules_(rules) {}

    [[nodiscard]] SyncPlan plan(const TreeListing& source, const TreeListing& destination) const;

private:
    const rules::RuleSet& rules_;
};

/// Convenience wrapper for a one-off plan.
SyncPlan plan(const TreeListing& source, const TreeListing& destination, const rules::RuleSet& rules);

} // namespace csync::sync
