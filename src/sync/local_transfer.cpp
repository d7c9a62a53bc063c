#include "csync/sync/local_transfer.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <sstream>
#include <system_error>

namespace csync::sync {
namespace fs = std::filesystem;
using rules::RuleAction;
using rules::RuleSet;

namespace {

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(Error(ErrorCode::Transfer, "cannot create directory " + parent.string() + ": " + ec.message()));
    }
    return Ok();
}

fs::path staging_path_for(const fs::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".csync-partial");
}

// First parent directory of relative, below root, that is a symbolic link.
std::optional<std::string> linked_parent(const fs::path& root, const std::string& relative) {
    for (auto slash = relative.find('/'); slash != std::string::npos; slash = relative.find('/', slash + 1)) {
        const std::string parent = relative.substr(0, slash);
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(root / parent, ec))) {
            return parent;
        }
    }
    return std::nullopt;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::ostringstream oss;
    for (const auto& line : lines) {
        oss << line << '\n';
    }
    return oss.str();
}

} // namespace

TransferOutcome LocalTransfer::transfer(const TransferRequest& request) {
    TransferOutcome outcome;

    RuleSet filter;
    if (!request.filter_lines.empty()) {
        auto parsed = RuleSet::parse(join_lines(request.filter_lines), "<transfer filter>");
        if (parsed.is_error()) {
            outcome.exit_code = 1;
            outcome.diagnostics = parsed.error().describe();
            return outcome;
        }
        filter = std::move(parsed.value());
    }

    std::error_code ec;
    if (!fs::is_directory(request.source_root, ec)) {
        outcome.exit_code = 1;
        outcome.diagnostics = "source root is not a directory: " + request.source_root.string();
        return outcome;
    }
    fs::create_directories(request.destination_root, ec);
    if (ec && !fs::is_directory(request.destination_root)) {
        outcome.exit_code = 1;
        outcome.diagnostics = "cannot create destination root " + request.destination_root.string() + ": " + ec.message();
        return outcome;
    }

    for (const auto& item : request.items) {
        const fs::path target = request.destination_root / item.path;

        if (item.action != SyncAction::Skip) {
            if (const auto link = linked_parent(request.destination_root, item.path)) {
                outcome.failures.push_back({item.path, "refusing to follow symlinked directory " + *link});
                continue;
            }
        }

        if (item.action == SyncAction::Delete) {
            if (!request.mirror) {
                continue;
            }
            if (filter.classify(item.path, item.kind) != RuleAction::Allow) {
                outcome.failures.push_back({item.path, "refusing to delete a protected path"});
                continue;
            }
            if (auto removed = remove_entry(target, item.kind); removed.is_error()) {
                outcome.failures.push_back({item.path, removed.error().message});
                continue;
            }
            spdlog::debug("deleted {}", item.path);
        } else if (item.action == SyncAction::Copy) {
            if (filter.classify(item.path, item.kind) == RuleAction::Exclude) {
                outcome.failures.push_back({item.path, "refusing to transfer an excluded path"});
                continue;
            }
            if (auto copied = copy_entry(request.source_root / item.path, target, item.kind); copied.is_error()) {
                outcome.failures.push_back({item.path, copied.error().message});
                continue;
            }
            spdlog::debug("copied {}", item.path);
        }
    }

    if (!outcome.failures.empty()) {
        outcome.exit_code = kPartialTransferExitCode;
        std::ostringstream oss;
        for (const auto& failure : outcome.failures) {
            oss << failure.path << ": " << failure.reason << '\n';
        }
        outcome.diagnostics = oss.str();
    }
    return outcome;
}

Result<void> LocalTransfer::copy_entry(const fs::path& source, const fs::path& destination, EntryKind kind) {
    std::error_code ec;
    const auto existing = fs::symlink_status(destination, ec);
    const bool exists = !ec && fs::exists(existing);

    if (kind == EntryKind::Directory) {
        // A link to a directory is replaced too; writes never go through it.
        if (exists && !fs::is_directory(existing)) {
            fs::remove(destination, ec);
            if (ec) {
                return Err<void>(Error(ErrorCode::Transfer, "cannot replace entry with directory: " + ec.message()));
            }
        }
        fs::create_directories(destination, ec);
        if (ec) {
            return Err<void>(Error(ErrorCode::Transfer, "cannot create directory: " + ec.message()));
        }
        return Ok();
    }

    if (exists && fs::is_directory(existing)) {
        // Only succeeds when the old directory is already empty.
        fs::remove(destination, ec);
        if (ec) {
            return Err<void>(Error(ErrorCode::Transfer, "cannot replace directory with file: " + ec.message()));
        }
    }

    if (auto parent = ensure_parent_exists(destination); parent.is_error()) {
        return parent;
    }
    return replace_file(source, destination);
}

Result<void> LocalTransfer::replace_file(const fs::path& source, const fs::path& destination) {
    const fs::path staging = staging_path_for(destination);
    std::error_code ec;

    fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(Error(ErrorCode::Transfer, "cannot copy " + source.string() + ": " + ec.message()));
    }

    const auto modified = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(staging, modified, ec);
    }

    fs::rename(staging, destination, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        return Err<void>(Error(ErrorCode::Transfer, "cannot move into place: " + reason));
    }
    return Ok();
}

Result<void> LocalTransfer::remove_entry(const fs::path& destination, EntryKind kind) {
    std::error_code ec;
    const auto status = fs::symlink_status(destination, ec);
    if (ec || !fs::exists(status)) {
        return Ok();  // already gone
    }

    fs::remove(destination, ec);
    if (ec) {
        const char* what = kind == EntryKind::Directory ? "cannot remove directory: " : "cannot remove file: ";
        return Err<void>(Error(ErrorCode::Transfer, what + ec.message()));
    }
    return Ok();
}

} // namespace csync::sync
