#pragma once

#include "csync/config/env_source.hpp"
#include "csync/core/result.hpp"
#include "csync/reload/reload_notifier.hpp"
#include "csync/rules/rule_set.hpp"
#include "csync/sync/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace csync::config {

enum class TransportKind {
    Local,
    Rsync
};

const char* to_string(TransportKind kind) noexcept;

Result<TransportKind> parse_transport(const std::string& name);

/// Default reload endpoint when neither the config file nor HA_URL names one.
inline constexpr const char* kDefaultReloadUrl = "http://homeassistant.local:8123";
/// Upper bound for reload.timeout_seconds; keeps the deadline arithmetic far from overflow.
inline constexpr long long kMaxReloadTimeoutSeconds = 3600;

/**
 * @brief Settings from the optional JSON config file
 *
 * {
 *   "local_root": "./config",
 *   "remote_root": "/mnt/ha-config",
 *   "push_rules": "rules-push.conf",
 *   "pull_rules": "rules-pull.conf",
 *   "transport": "local",
 *   "rsync_binary": "rsync",
 *   "rsync_args": ["-e", "ssh -p 22222"],
 *   "log_level": "info",
 *   "reload": {
 *     "url": "http://homeassistant.local:8123",
 *     "timeout_seconds": 30,
 *     "services": [{"name": "automations", "service": "automation/reload"}]
 *   }
 * }
 *
 * Relative paths are resolved against the config file's directory. Unknown
 * keys are ignored.
 */
struct SyncConfig {
    std::filesystem::path local_root;
    std::filesystem::path remote_root;
    std::filesystem::path push_rules;   ///< empty: built-in push rules
    std::filesystem::path pull_rules;   ///< empty: built-in pull rules
    TransportKind transport = TransportKind::Local;
    std::string rsync_binary = "rsync";
    std::vector<std::string> rsync_args;
    std::string log_level = "info";
    std::optional<std::string> reload_url;
    std::chrono::seconds reload_timeout{30};
    std::vector<reload::ReloadService> reload_services = reload::default_reload_services();

    static Result<SyncConfig> load(const std::filesystem::path& path);

    static Result<SyncConfig> parse(const std::string& text, const std::filesystem::path& base_dir);

    /// The configured rule file for @p direction, or the built-in defaults.
    Result<rules::RuleSet> rules_for(sync::Direction direction) const;
};

/**
 * @brief Combine config and environment into reload settings
 *
 * URL precedence: config "reload.url", then HA_URL, then kDefaultReloadUrl.
 * A missing HA_TOKEN is a Config error.
 */
Result<reload::ReloadSettings> resolve_reload_settings(const SyncConfig& config, const EnvSource& env);

} // namespace csync::config
