/**
 * @file components.hpp
 * @brief Event subscribers used by the command-line tool
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "csync/events/event_bus.hpp"
#include "csync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace csync::events {

/**
 * @brief Logs every lifecycle event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] direction={} source={} destination={}{}",
                         sync::to_string(e.direction), e.source_root, e.destination_root,
                         e.dry_run ? " (dry run)" : "");
        });

        bus.subscribe<PlanComputedEvent>([](const PlanComputedEvent& e) {
            spdlog::info("[PlanComputed] direction={} source_entries={} destination_entries={} "
                         "copy={} delete={} skip={}",
                         sync::to_string(e.direction), e.source_entries, e.destination_entries,
                         e.summary.copies, e.summary.deletions, e.summary.skips);
        });

        bus.subscribe<PathFailedEvent>([](const PathFailedEvent& e) {
            spdlog::warn("[PathFailed] direction={} path={} reason={}",
                         sync::to_string(e.direction), e.path, e.reason);
        });

        bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            auto level = e.failed == 0 ? spdlog::level::info : spdlog::level::warn;
            spdlog::log(level, "[SyncCompleted] direction={} copied={} deleted={} failed={} duration={}ms{}",
                        sync::to_string(e.direction), e.copied, e.deleted, e.failed,
                        e.duration.count(), e.dry_run ? " (dry run)" : "");
        });

        bus.subscribe<SyncFailedEvent>([](const SyncFailedEvent& e) {
            spdlog::error("[SyncFailed] direction={} error={}", sync::to_string(e.direction), e.error_message);
        });

        bus.subscribe<ServiceReloadedEvent>([](const ServiceReloadedEvent& e) {
            if (e.success) {
                spdlog::info("[ServiceReloaded] {} ({})", e.name, e.service);
            } else {
                spdlog::warn("[ServiceReloadFailed] {} ({}) status={} detail={}",
                             e.name, e.service, e.status, e.detail);
            }
        });
    }
};

/**
 * @brief Counts what a run did, for the end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> syncs_completed{0};
        std::atomic<std::uint64_t> syncs_failed{0};
        std::atomic<std::uint64_t> entries_copied{0};
        std::atomic<std::uint64_t> entries_deleted{0};
        std::atomic<std::uint64_t> paths_failed{0};
        std::atomic<std::uint64_t> services_reloaded{0};
        std::atomic<std::uint64_t> reload_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.syncs_completed++;
            stats_.entries_copied += e.copied;
            stats_.entries_deleted += e.deleted;
        });

        bus.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) {
            stats_.syncs_failed++;
        });

        bus.subscribe<PathFailedEvent>([this](const PathFailedEvent&) {
            stats_.paths_failed++;
        });

        bus.subscribe<ServiceReloadedEvent>([this](const ServiceReloadedEvent& e) {
            if (e.success) {
                stats_.services_reloaded++;
            } else {
                stats_.reload_failures++;
            }
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Run summary:");
        spdlog::info("  Syncs completed:   {}", stats_.syncs_completed.load());
        spdlog::info("  Syncs failed:      {}", stats_.syncs_failed.load());
        spdlog::info("  Entries copied:    {}", stats_.entries_copied.load());
        spdlog::info("  Entries deleted:   {}", stats_.entries_deleted.load());
        spdlog::info("  Paths failed:      {}", stats_.paths_failed.load());
        spdlog::info("  Services reloaded: {}", stats_.services_reloaded.load());
        spdlog::info("  Reload failures:   {}", stats_.reload_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace csync::events
