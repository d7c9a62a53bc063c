#pragma once

#include "csync/sync/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace csync::sync {

/**
 * @brief Everything a transfer primitive needs for one sync call
 *
 * filter_lines is the active rule set rendered by RuleSet::to_filter_lines(),
 * so the primitive's own delete-extraneous logic is bounded by the same rules
 * the planner used. items is the ordered COPY/DELETE list; primitives that
 * mirror on their own (rsync) may ignore it.
 */
struct TransferRequest {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::vector<std::string> filter_lines;
    bool mirror = true;     ///< remove destination entries missing from the source
    bool checksum = true;   ///< compare content, not size + mtime
    std::vector<PlanItem> items;
};

struct TransferOutcome {
    int exit_code = 0;
    std::vector<FailedPath> failures;  ///< per-path detail, when the primitive can give it
    std::string diagnostics;           ///< captured error output
};

/**
 * @brief Opaque "transfer tree A to tree B" capability
 */
class TransferPrimitive {
public:
    virtual ~TransferPrimitive() = default;

    virtual std::string name() const = 0;

    virtual TransferOutcome transfer(const TransferRequest& request) = 0;
};

/// Exit code used by primitives for "some paths failed" (matches rsync).
constexpr int kPartialTransferExitCode = 23;

} // namespace csync::sync
