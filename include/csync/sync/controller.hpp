#pragma once

#include "csync/core/result.hpp"
#include "csync/events/event_bus.hpp"
#include "csync/reload/reload_notifier.hpp"
#include "csync/rules/rule_set.hpp"
#include "csync/sync/transfer.hpp"
#include "csync/sync/tree_scanner.hpp"
#include "csync/sync/types.hpp"

#include <filesystem>
#include <optional>

namespace csync::sync {

struct SyncOptions {
    bool dry_run = false;
    bool reload = true;  ///< call the reload notifier after a clean push
};

struct SyncReport {
    Direction direction = Direction::Push;
    SyncPlan plan;
    SyncResult result;
    std::optional<reload::ReloadReport> reload;  ///< set only when a reload was attempted

    /// No failed paths and, when a reload ran, every service reloaded.
    [[nodiscard]] bool ok() const;
};

/**
 * @brief Runs scan -> plan -> apply for one direction
 *
 * push: local tree is the source, the live instance the destination, push
 * rules apply. pull: the other way round with pull rules. A destination root
 * that does not exist yet is treated as an empty tree.
 */
class DirectionController {
public:
    DirectionController(rules::RuleSet push_rules,
                        rules::RuleSet pull_rules,
                        TransferPrimitive& transfer,
                        events::EventBus& bus,
                        reload::ReloadNotifier* notifier = nullptr);

    Result<SyncReport> push(const std::filesystem::path& local_root,
                            const std::filesystem::path& remote_root,
                            SyncOptions options = {});

    Result<SyncReport> pull(const std::filesystem::path& remote_root,
                            const std::filesystem::path& local_root,
                            SyncOptions options = {});

    /// Scan both trees and plan, without touching either.
    Result<SyncPlan> preview(Direction direction,
                             const std::filesystem::path& source_root,
                             const std::filesystem::path& destination_root) const;

    const rules::RuleSet& rules_for(Direction direction) const noexcept;

private:
    Result<SyncReport> run(Direction direction,
                           const std::filesystem::path& source_root,
                           const std::filesystem::path& destination_root,
                           const SyncOptions& options);

    Result<TreeListing> scan_destination(const std::filesystem::path& root) const;

    Result<SyncReport> fail(Direction direction, Error error);

    rules::RuleSet push_rules_;
    rules::RuleSet pull_rules_;
    TransferPrimitive& transfer_;
    events::EventBus& bus_;
    reload::ReloadNotifier* notifier_;
    TreeScanner scanner_;
};

} // namespace csync::sync
