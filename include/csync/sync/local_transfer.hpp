#pragma once

#include "csync/core/result.hpp"
#include "csync/rules/rule_set.hpp"
#include "csync/sync/transfer.hpp"

#include <filesystem>

namespace csync::sync {

/**
 * @brief Applies the ordered change list with std::filesystem
 *
 * Both roots must be reachable as local paths (a mounted share of the
 * device's config directory counts). Files are staged next to their target
 * and renamed into place. Directory removal is never recursive.
 *
 * Symbolic links on the destination are never followed: an item whose
 * parent is a link fails, deleting a link removes only the link, and
 * copying a directory over a link replaces the link with a directory.
 *
 * The request's filter lines are parsed back into a rule set and every
 * operation is checked against it: deleting a non-ALLOW path or copying an
 * EXCLUDE path is refused and reported as a failed path.
 */
class LocalTransfer : public TransferPrimitive {
public:
    std::string name() const override { return "local"; }

    TransferOutcome transfer(const TransferRequest& request) override;

private:
    static Result<void> copy_entry(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   EntryKind kind);

    static Result<void> remove_entry(const std::filesystem::path& destination, EntryKind kind);

    static Result<void> replace_file(const std::filesystem::path& source,
                                     const std::filesystem::path& destination);
};

} // namespace csync::sync
