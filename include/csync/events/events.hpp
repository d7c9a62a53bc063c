/**
 * @file events.hpp
 * @brief Events emitted by the direction controller and the reload notifier
 *
 * NAMING CONVENTION: past tense, one struct per lifecycle step.
 */

#pragma once

#include "csync/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace csync::events {

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted before the source tree is scanned
 */
struct SyncStartedEvent {
    sync::Direction direction;
    std::string source_root;
    std::string destination_root;
    bool dry_run = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once both trees are scanned and the plan exists
 */
struct PlanComputedEvent {
    sync::Direction direction;
    std::size_t source_entries = 0;
    std::size_t destination_entries = 0;
    sync::PlanSummary summary;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted for every path the transfer primitive could not sync
 */
struct PathFailedEvent {
    sync::Direction direction;
    std::string path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when apply returned a SyncResult (failed paths included)
 */
struct SyncCompletedEvent {
    sync::Direction direction;
    std::size_t copied = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;
    bool dry_run = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a sync call ends with a fatal error
 */
struct SyncFailedEvent {
    sync::Direction direction;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Reload Events
// ════════════════════════════════════════════════════════

struct ServiceReloadedEvent {
    std::string name;
    std::string service;
    bool success = false;
    int status = 0;          ///< HTTP status, 0 when no response arrived
    std::string detail;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace csync::events
