#include "csync/sync/executor.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace csync::sync {

TransferRequest SyncExecutor::build_request(const SyncPlan& plan,
                                            const std::filesystem::path& source_root,
                                            const std::filesystem::path& destination_root) const {
    TransferRequest request;
    request.source_root = source_root;
    request.destination_root = destination_root;
    request.filter_lines = rules_.to_filter_lines();
    request.mirror = options_.mirror;
    request.checksum = options_.checksum;
    for (const auto& item : plan.items) {
        if (item.action != SyncAction::Skip) {
            request.items.push_back(item);
        }
    }
    return request;
}

Result<SyncResult> SyncExecutor::apply(const SyncPlan& plan,
                                       const std::filesystem::path& source_root,
                                       const std::filesystem::path& destination_root,
                                       TransferPrimitive& transfer) const {
    const auto summary = plan.summary();

    SyncResult result;
    result.dry_run = options_.dry_run;

    if (options_.dry_run) {
        result.copied = summary.copies;
        result.deleted = options_.mirror ? summary.deletions : 0;
        spdlog::info("Dry run: would copy {} and delete {} entries", result.copied, result.deleted);
        return Ok(std::move(result));
    }

    if (plan.converged()) {
        spdlog::info("Destination already up to date, nothing to transfer");
        return Ok(std::move(result));
    }

    const auto request = build_request(plan, source_root, destination_root);
    spdlog::info("Transferring {} -> {} via {} ({} items)",
                 source_root.string(), destination_root.string(), transfer.name(), request.items.size());

    auto outcome = transfer.transfer(request);

    if (outcome.exit_code != 0 && outcome.failures.empty()) {
        spdlog::error("{} transfer failed with exit code {}", transfer.name(), outcome.exit_code);
        std::string message = transfer.name() + " exited with code " + std::to_string(outcome.exit_code);
        if (!outcome.diagnostics.empty()) {
            message += ": " + outcome.diagnostics;
        }
        return Err<SyncResult>(transfer_error(std::move(message)));
    }

    std::set<std::string> failed_paths;
    for (const auto& failure : outcome.failures) {
        failed_paths.insert(failure.path);
        spdlog::warn("Failed to sync {}: {}", failure.path, failure.reason);
    }

    for (const auto& item : request.items) {
        if (failed_paths.count(item.path) != 0) {
            continue;
        }
        if (item.action == SyncAction::Copy) {
            ++result.copied;
        } else if (item.action == SyncAction::Delete && options_.mirror) {
            ++result.deleted;
        }
    }
    result.failed = std::move(outcome.failures);
    return Ok(std::move(result));
}

} // namespace csync::sync
