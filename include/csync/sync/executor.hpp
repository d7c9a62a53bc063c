#pragma once

#include "csync/core/result.hpp"
#include "csync/rules/rule_set.hpp"
#include "csync/sync/transfer.hpp"
#include "csync/sync/types.hpp"

#include <filesystem>

namespace csync::sync {

struct ApplyOptions {
    bool mirror = true;
    bool checksum = true;
    bool dry_run = false;
};

/**
 * @brief Applies a sync plan through a transfer primitive
 *
 * The executor hands the primitive one request per plan: the ordered
 * COPY/DELETE items and the filter lines rendered from the same rule set the
 * planner used. A failed primitive call is never retried.
 */
class SyncExecutor {
public:
    explicit SyncExecutor(const rules::RuleSet& rules, ApplyOptions options = {})
        : rules_(rules), options_(options) {}

    /**
     * @brief Apply @p plan from @p source_root onto @p destination_root
     * @return SyncResult (possibly with failed paths) or a TransferError when
     *         the primitive failed without naming any path
     */
    Result<SyncResult> apply(const SyncPlan& plan,
                             const std::filesystem::path& source_root,
                             const std::filesystem::path& destination_root,
                             TransferPrimitive& transfer) const;

    [[nodiscard]] TransferRequest build_request(const SyncPlan& plan,
                                                const std::filesystem::path& source_root,
                                                const std::filesystem::path& destination_root) const;

private:
    const rules::RuleSet& rules_;
    ApplyOptions options_;
};

} // namespace csync::sync
