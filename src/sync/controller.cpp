#include "csync/sync/controller.hpp"
#include "csync/events/events.hpp"
#include "csync/sync/executor.hpp"
#include "csync/sync/planner.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace csync::sync {
namespace fs = std::filesystem;

bool SyncReport::ok() const {
    return result.ok() && (!reload || reload->ok());
}

DirectionController::DirectionController(rules::RuleSet push_rules,
                                         rules::RuleSet pull_rules,
                                         TransferPrimitive& transfer,
                                         events::EventBus& bus,
                                         reload::ReloadNotifier* notifier)
    : push_rules_(std::move(push_rules)),
      pull_rules_(std::move(pull_rules)),
      transfer_(transfer),
      bus_(bus),
      notifier_(notifier) {}

const rules::RuleSet& DirectionController::rules_for(Direction direction) const noexcept {
    return direction == Direction::Push ? push_rules_ : pull_rules_;
}

Result<SyncReport> DirectionController::push(const fs::path& local_root,
                                             const fs::path& remote_root,
                                             SyncOptions options) {
    return run(Direction::Push, local_root, remote_root, options);
}

Result<SyncReport> DirectionController::pull(const fs::path& remote_root,
                                             const fs::path& local_root,
                                             SyncOptions options) {
    return run(Direction::Pull, remote_root, local_root, options);
}

Result<TreeListing> DirectionController::scan_destination(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(root, ec))) {
        spdlog::info("Destination {} does not exist yet, treating it as empty", root.string());
        return Ok(TreeListing{});
    }
    return scanner_.scan(root);
}

Result<SyncPlan> DirectionController::preview(Direction direction,
                                              const fs::path& source_root,
                                              const fs::path& destination_root) const {
    auto source = scanner_.scan(source_root);
    if (source.is_error()) {
        return Err<SyncPlan>(source.error());
    }
    auto destination = scan_destination(destination_root);
    if (destination.is_error()) {
        return Err<SyncPlan>(destination.error());
    }
    return Ok(SyncPlanner(rules_for(direction)).plan(source.value(), destination.value()));
}

Result<SyncReport> DirectionController::fail(Direction direction, Error error) {
    bus_.emit(events::SyncFailedEvent{direction, error.describe()});
    return Err<SyncReport>(std::move(error));
}

Result<SyncReport> DirectionController::run(Direction direction,
                                            const fs::path& source_root,
                                            const fs::path& destination_root,
                                            const SyncOptions& options) {
    const auto started_at = std::chrono::steady_clock::now();
    bus_.emit(events::SyncStartedEvent{direction, source_root.string(), destination_root.string(), options.dry_run});

    const rules::RuleSet& rules = rules_for(direction);

    auto source = scanner_.scan(source_root);
    if (source.is_error()) {
        return fail(direction, source.error());
    }
    auto destination = scan_destination(destination_root);
    if (destination.is_error()) {
        return fail(direction, destination.error());
    }

    SyncReport report;
    report.direction = direction;
    report.plan = SyncPlanner(rules).plan(source.value(), destination.value());
    bus_.emit(events::PlanComputedEvent{direction, source.value().size(), destination.value().size(),
                                        report.plan.summary()});

    for (const auto& item : report.plan.items) {
        if (item.action != SyncAction::Skip) {
            spdlog::debug("{} {} ({})", to_string(item.action), item.path, to_string(item.reason));
        }
    }

    ApplyOptions apply_options;
    apply_options.dry_run = options.dry_run;
    auto applied = SyncExecutor(rules, apply_options).apply(report.plan, source_root, destination_root, transfer_);
    if (applied.is_error()) {
        return fail(direction, applied.error());
    }
    report.result = std::move(applied.value());

    for (const auto& failure : report.result.failed) {
        bus_.emit(events::PathFailedEvent{direction, failure.path, failure.reason});
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    bus_.emit(events::SyncCompletedEvent{direction, report.result.copied, report.result.deleted,
                                         report.result.failed.size(), report.result.dry_run, elapsed});

    const bool reload_wanted = direction == Direction::Push && options.reload && !options.dry_run;
    if (reload_wanted && notifier_ != nullptr) {
        if (report.result.ok()) {
            report.reload = notifier_->notify();
        } else {
            spdlog::warn("Skipping reload: {} path(s) failed to sync", report.result.failed.size());
        }
    }

    return Ok(std::move(report));
}

} // namespace csync::sync
