#pragma once

#include "csync/core/result.hpp"
#include "csync/sync/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace csync::sync {

/**
 * @brief Builds a full listing of one tree root for planning
 *
 * Every file and directory below the root is listed with a POSIX-style
 * relative path. Files are fingerprinted by size and SHA-256 of content.
 * Symlinks are followed and flagged on their entry, but a link resolving outside the root, or a
 * directory link looping back onto the walk, fails the scan. Any entry that
 * cannot be read fails the scan as well; a partial listing is never returned.
 */
class TreeScanner {
public:
    TreeScanner() = default;

    /**
     * @brief Scan a root directory
     *
     * @return listing, or AccessError / TraversalError
     */
    Result<TreeListing> scan(const std::filesystem::path& root) const;

    /**
     * @brief Hex SHA-256 of a file's content
     */
    static Result<Fingerprint> fingerprint_file(const std::filesystem::path& file);

private:
    struct WalkState {
        std::filesystem::path root;                     ///< canonical root
        std::vector<std::filesystem::path> active_dirs; ///< canonical dirs currently being walked
        TreeListing listing;
    };

    Result<void> walk(const std::filesystem::path& directory,
                      const std::string& relative,
                      WalkState& state) const;

    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);
};

} // namespace csync::sync
