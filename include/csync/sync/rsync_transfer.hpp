#pragma once

#include "csync/sync/transfer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace csync::sync {

/// Filter merge file that lives exactly as long as one rsync run.
class FilterFile {
public:
    /// Creates a fresh, owner-only file under directory; never reuses an existing path.
    explicit FilterFile(const std::vector<std::string>& lines,
                        const std::filesystem::path& directory = std::filesystem::temp_directory_path());
    ~FilterFile();

    FilterFile(const FilterFile&) = delete;
    FilterFile& operator=(const FilterFile&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    bool ok() const noexcept { return !path_.empty() && error_.empty(); }
    const std::string& error() const noexcept { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

/**
 * @brief Delegates the transfer to an rsync process
 *
 * Runs `rsync -a --copy-links --itemize-changes [--delete] [--checksum]
 * --filter="merge FILE" SRC/ DST/` where FILE holds the request's filter
 * lines. --copy-links makes rsync send what a link points at, the same
 * content the tree scanner fingerprints. Exit codes 23 and 24 are partial transfers; the failing paths are
 * recovered from rsync's diagnostics.
 */
class RsyncTransfer : public TransferPrimitive {
public:
    explicit RsyncTransfer(std::string binary = "rsync", std::vector<std::string> extra_arguments = {});

    std::string name() const override { return "rsync"; }

    TransferOutcome transfer(const TransferRequest& request) override;

    [[nodiscard]] std::vector<std::string> build_arguments(const TransferRequest& request,
                                                           const std::filesystem::path& filter_file) const;

    /**
     * @brief Extract failed paths from rsync's stderr
     *
     * Understands quoted paths (`send_files failed to open "/src/x": ...`,
     * `file has vanished: "/src/x"`) and call-style paths
     * (`delete_file: unlink(x) failed: ...`). Paths under either root are
     * made relative to it.
     */
    static std::vector<FailedPath> parse_failures(const std::string& diagnostics,
                                                  const TransferRequest& request);

private:
    std::string binary_;
    std::vector<std::string> extra_arguments_;
};

} // namespace csync::sync
