#include "csync/config/env_source.hpp"
#include "csync/config/sync_config.hpp"
#include "csync/events/components.hpp"
#include "csync/events/event_bus.hpp"
#include "csync/network/http_client.hpp"
#include "csync/reload/reload_notifier.hpp"
#include "csync/rules/rule_set.hpp"
#include "csync/sync/controller.hpp"
#include "csync/sync/local_transfer.hpp"
#include "csync/sync/rsync_transfer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using csync::sync::Direction;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitPartial = 3;

struct CliOptions {
    std::string command;
    std::optional<Direction> direction;
    std::vector<std::string> positional;
    std::optional<fs::path> config_file;
    fs::path env_file = ".env";
    std::optional<fs::path> rules_file;
    std::optional<std::string> transport;
    bool dry_run = false;
    bool json_output = false;
    bool no_reload = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: csync <command> [options]\n"
           "\n"
           "Commands:\n"
           "  push [LOCAL REMOTE]        mirror the local tree onto the live instance\n"
           "  pull [REMOTE LOCAL]        mirror the live instance into the local tree\n"
           "  plan push|pull [SRC DST]   show what a sync would do, change nothing\n"
           "  rules push|pull            print the active rules as transfer filter lines\n"
           "  reload                     ask the live instance to reload its configuration\n"
           "\n"
           "Options:\n"
           "  --config FILE              JSON settings (roots, rule files, transport, reload)\n"
           "  --env FILE                 env file with HA_URL / HA_TOKEN (default .env)\n"
           "  --rules FILE               rule file for this direction, replaces the configured one\n"
           "  --transport local|rsync    transfer primitive (default local)\n"
           "  --dry-run                  plan and report only\n"
           "  --json                     machine-readable output\n"
           "  --no-reload                skip the reload after push\n"
           "  --verbose | --quiet        log level debug | warn\n";
}

std::optional<Direction> parse_direction(const std::string& text) {
    if (text == "push") {
        return Direction::Push;
    }
    if (text == "pull") {
        return Direction::Pull;
    }
    return std::nullopt;
}

csync::Result<CliOptions> parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    auto usage_error = [](const std::string& message) {
        return csync::Err<CliOptions>(csync::config_error(message));
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&](const std::string& flag) { return i + 1 >= argc ? flag + " needs a value" : ""; };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config" || arg == "--env" || arg == "--rules" || arg == "--transport") {
            if (auto missing = needs_value(arg); !missing.empty()) {
                return usage_error(missing);
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                options.config_file = fs::path(value);
            } else if (arg == "--env") {
                options.env_file = fs::path(value);
            } else if (arg == "--rules") {
                options.rules_file = fs::path(value);
            } else {
                options.transport = value;
            }
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--no-reload") {
            options.no_reload = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option " + arg);
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }

    if (options.help) {
        return csync::Ok(std::move(options));
    }

    if (options.command == "push" || options.command == "pull") {
        options.direction = parse_direction(options.command);
    } else if (options.command == "plan" || options.command == "rules") {
        if (options.positional.empty() || !parse_direction(options.positional.front())) {
            return usage_error(options.command + " needs a direction (push or pull)");
        }
        options.direction = parse_direction(options.positional.front());
        options.positional.erase(options.positional.begin());
    } else if (options.command != "reload") {
        return usage_error(options.command.empty() ? "missing command" : "unknown command " + options.command);
    }

    const std::size_t max_positional = (options.command == "rules" || options.command == "reload") ? 0 : 2;
    if (options.positional.size() > max_positional ||
        (options.positional.size() == 1 && max_positional == 2)) {
        return usage_error("expected " + std::string(max_positional == 0 ? "no" : "zero or two") +
                           " path arguments for " + options.command);
    }
    return csync::Ok(std::move(options));
}

void configure_logging(const CliOptions& options, const std::string& configured_level) {
    auto level = spdlog::level::from_str(configured_level);
    if (options.verbose) {
        level = spdlog::level::debug;
    } else if (options.quiet) {
        level = spdlog::level::warn;
    }
    spdlog::set_level(level);
}

json plan_to_json(const csync::sync::SyncPlan& plan) {
    json j;
    j["items"] = json::array();
    for (const auto& item : plan.items) {
        j["items"].push_back({
            {"path", item.path},
            {"action", csync::sync::to_string(item.action)},
            {"kind", csync::sync::to_string(item.kind)},
            {"reason", csync::sync::to_string(item.reason)},
        });
    }
    const auto summary = plan.summary();
    j["summary"] = {{"copy", summary.copies}, {"delete", summary.deletions}, {"skip", summary.skips}};
    return j;
}

json reload_to_json(const csync::reload::ReloadReport& report) {
    json j;
    j["ok"] = report.ok();
    j["aborted"] = report.aborted;
    j["services"] = json::array();
    for (const auto& outcome : report.outcomes) {
        j["services"].push_back({
            {"name", outcome.service.name},
            {"service", outcome.service.service},
            {"success", outcome.success},
            {"status", outcome.status},
            {"detail", outcome.detail},
        });
    }
    return j;
}

json report_to_json(const csync::sync::SyncReport& report) {
    json j;
    j["direction"] = csync::sync::to_string(report.direction);
    j["plan"] = plan_to_json(report.plan);
    j["result"] = {
        {"copied", report.result.copied},
        {"deleted", report.result.deleted},
        {"dry_run", report.result.dry_run},
        {"failed", json::array()},
    };
    for (const auto& failure : report.result.failed) {
        j["result"]["failed"].push_back({{"path", failure.path}, {"reason", failure.reason}});
    }
    if (report.reload) {
        j["reload"] = reload_to_json(*report.reload);
    }
    j["ok"] = report.ok();
    return j;
}

void print_plan(const csync::sync::SyncPlan& plan) {
    for (const auto& item : plan.items) {
        if (item.action == csync::sync::SyncAction::Skip) {
            continue;
        }
        std::cout << csync::sync::to_string(item.action) << ' ' << item.path
                  << (item.kind == csync::sync::EntryKind::Directory ? "/" : "")
                  << "  (" << csync::sync::to_string(item.reason) << ")\n";
    }
    const auto summary = plan.summary();
    std::cout << summary.copies << " to copy, " << summary.deletions << " to delete, "
              << summary.skips << " skipped\n";
}

void print_reload(const csync::reload::ReloadReport& report) {
    for (const auto& outcome : report.outcomes) {
        if (outcome.success) {
            std::cout << "reloaded " << outcome.service.name << '\n';
        } else {
            std::cerr << "reload failed: " << outcome.service.name;
            if (outcome.status != 0) {
                std::cerr << " (HTTP " << outcome.status << ")";
            }
            if (!outcome.detail.empty()) {
                std::cerr << ": " << outcome.detail;
            }
            std::cerr << '\n';
        }
    }
    if (report.aborted) {
        std::cerr << "remaining services skipped, endpoint unreachable\n";
    }
}

void print_report(const csync::sync::SyncReport& report) {
    const auto& result = report.result;
    std::cout << (result.dry_run ? "would copy " : "copied ") << result.copied
              << (result.dry_run ? ", would delete " : ", deleted ") << result.deleted << '\n';
    for (const auto& failure : result.failed) {
        std::cerr << "FAILED " << failure.path << ": " << failure.reason << '\n';
    }
    if (report.reload) {
        print_reload(*report.reload);
    }
}

csync::Result<csync::reload::ReloadSettings> load_reload_settings(const CliOptions& options,
                                                                  const csync::config::SyncConfig& config) {
    auto env = csync::config::EnvSource::load(options.env_file);
    if (env.is_error()) {
        return csync::Err<csync::reload::ReloadSettings>(env.error());
    }
    return csync::config::resolve_reload_settings(config, env.value());
}

std::unique_ptr<csync::sync::TransferPrimitive> make_transfer(csync::config::TransportKind kind,
                                                              const csync::config::SyncConfig& config) {
    if (kind == csync::config::TransportKind::Rsync) {
        return std::make_unique<csync::sync::RsyncTransfer>(config.rsync_binary, config.rsync_args);
    }
    return std::make_unique<csync::sync::LocalTransfer>();
}

int run_reload(const CliOptions& options, const csync::config::SyncConfig& config) {
    auto settings = load_reload_settings(options, config);
    if (settings.is_error()) {
        spdlog::error("{}", settings.error().describe());
        return kExitFatal;
    }

    csync::network::AsioHttpClient client;
    csync::events::EventBus bus;
    csync::events::LoggerComponent logger(bus);
    auto notifier = csync::reload::ReloadNotifier::create(std::move(settings.value()), client, &bus);
    if (notifier.is_error()) {
        spdlog::error("{}", notifier.error().describe());
        return kExitFatal;
    }

    const auto report = notifier.value().notify();
    if (options.json_output) {
        std::cout << reload_to_json(report).dump(2) << '\n';
    } else {
        print_reload(report);
    }
    return report.ok() ? kExitOk : kExitPartial;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << "csync: " << parsed.error().message << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    const CliOptions options = std::move(parsed.value());
    if (options.help) {
        print_usage(std::cout);
        return kExitOk;
    }

    csync::config::SyncConfig config;
    if (options.config_file) {
        auto loaded = csync::config::SyncConfig::load(*options.config_file);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return kExitFatal;
        }
        config = std::move(loaded.value());
    }
    configure_logging(options, config.log_level);

    if (options.command == "reload") {
        return run_reload(options, config);
    }

    const Direction direction = *options.direction;

    if (options.rules_file) {
        (direction == Direction::Push ? config.push_rules : config.pull_rules) = *options.rules_file;
    }
    auto push_rules = config.rules_for(Direction::Push);
    auto pull_rules = config.rules_for(Direction::Pull);
    for (const auto* rules : {&push_rules, &pull_rules}) {
        if (rules->is_error()) {
            spdlog::error("{}", rules->error().describe());
            return kExitFatal;
        }
    }

    if (options.command == "rules") {
        const auto& active = direction == Direction::Push ? push_rules.value() : pull_rules.value();
        for (const auto& line : active.to_filter_lines()) {
            std::cout << line << '\n';
        }
        return kExitOk;
    }

    fs::path local_root = config.local_root;
    fs::path remote_root = config.remote_root;
    if (options.positional.size() == 2) {
        // push LOCAL REMOTE, pull REMOTE LOCAL, plan DIR SRC DST
        const bool source_first_is_local = direction == Direction::Push;
        local_root = options.positional[source_first_is_local ? 0 : 1];
        remote_root = options.positional[source_first_is_local ? 1 : 0];
    }
    if (local_root.empty() || remote_root.empty()) {
        std::cerr << "csync: no tree roots given and none configured\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    const fs::path& source_root = direction == Direction::Push ? local_root : remote_root;
    const fs::path& destination_root = direction == Direction::Push ? remote_root : local_root;

    auto transport_kind = csync::config::parse_transport(options.transport.value_or(csync::config::to_string(config.transport)));
    if (transport_kind.is_error()) {
        std::cerr << "csync: " << transport_kind.error().message << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    auto transfer = make_transfer(transport_kind.value(), config);

    csync::events::EventBus event_bus;
    csync::events::LoggerComponent logger(event_bus);
    csync::events::MetricsComponent metrics(event_bus);

    csync::network::AsioHttpClient http_client;
    std::optional<csync::reload::ReloadNotifier> notifier;
    const bool wants_reload = options.command == "push" && !options.no_reload && !options.dry_run;
    if (wants_reload) {
        // Credentials are checked before anything is transferred.
        auto settings = load_reload_settings(options, config);
        if (settings.is_error()) {
            spdlog::error("{} (use --no-reload to push without reloading)", settings.error().describe());
            return kExitFatal;
        }
        auto created = csync::reload::ReloadNotifier::create(std::move(settings.value()), http_client, &event_bus);
        if (created.is_error()) {
            spdlog::error("{}", created.error().describe());
            return kExitFatal;
        }
        notifier = std::move(created.value());
    }

    csync::sync::DirectionController controller(std::move(push_rules.value()), std::move(pull_rules.value()),
                                                 *transfer, event_bus, notifier ? &*notifier : nullptr);

    if (options.command == "plan") {
        auto plan = controller.preview(direction, source_root, destination_root);
        if (plan.is_error()) {
            spdlog::error("{}", plan.error().describe());
            return kExitFatal;
        }
        if (options.json_output) {
            std::cout << plan_to_json(plan.value()).dump(2) << '\n';
        } else {
            print_plan(plan.value());
        }
        return kExitOk;
    }

    csync::sync::SyncOptions sync_options;
    sync_options.dry_run = options.dry_run;
    sync_options.reload = wants_reload;

    auto report = direction == Direction::Push
        ? controller.push(local_root, remote_root, sync_options)
        : controller.pull(remote_root, local_root, sync_options);
    if (report.is_error()) {
        spdlog::error("{}", report.error().describe());
        return kExitFatal;
    }

    if (options.json_output) {
        std::cout << report_to_json(report.value()).dump(2) << '\n';
    } else {
        if (options.dry_run) {
            print_plan(report.value().plan);
        }
        print_report(report.value());
        metrics.print_stats();
    }
    return report.value().ok() ? kExitOk : kExitPartial;
}
