#include "csync/config/sync_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <string>

namespace csync::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> read_string(const json& object, const char* key, std::string& out) {
    if (!object.contains(key)) {
        return Ok();
    }
    const auto& value = object.at(key);
    if (!value.is_string()) {
        return Err<void>(config_error(std::string("'") + key + "' must be a string"));
    }
    out = value.get<std::string>();
    return Ok();
}

Result<void> read_path(const json& object, const char* key, const fs::path& base_dir, fs::path& out) {
    std::string text;
    if (auto read = read_string(object, key, text); read.is_error()) {
        return read;
    }
    if (text.empty()) {
        return Ok();
    }
    fs::path path(text);
    out = path.is_relative() && !base_dir.empty() ? base_dir / path : path;
    return Ok();
}

bool is_log_level(const std::string& level) {
    for (const char* known : {"trace", "debug", "info", "warn", "error", "off"}) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

Result<void> read_reload(const json& reload, SyncConfig& config) {
    if (!reload.is_object()) {
        return Err<void>(config_error("'reload' must be an object"));
    }

    std::string url;
    if (auto read = read_string(reload, "url", url); read.is_error()) {
        return read;
    }
    if (!url.empty()) {
        config.reload_url = url;
    }

    if (reload.contains("timeout_seconds")) {
        const auto& timeout = reload.at("timeout_seconds");
        if (!timeout.is_number_integer() || timeout.get<long long>() <= 0 ||
            timeout.get<long long>() > kMaxReloadTimeoutSeconds) {
            return Err<void>(config_error("'reload.timeout_seconds' must be an integer between 1 and " +
                                          std::to_string(kMaxReloadTimeoutSeconds)));
        }
        config.reload_timeout = std::chrono::seconds(timeout.get<long long>());
    }

    if (reload.contains("services")) {
        const auto& services = reload.at("services");
        if (!services.is_array()) {
            return Err<void>(config_error("'reload.services' must be an array"));
        }
        config.reload_services.clear();
        for (const auto& entry : services) {
            if (!entry.is_object() || !entry.contains("service") || !entry.at("service").is_string()) {
                return Err<void>(config_error("each reload service needs a string 'service'"));
            }
            reload::ReloadService service;
            service.service = entry.at("service").get<std::string>();
            service.name = service.service;
            if (auto read = read_string(entry, "name", service.name); read.is_error()) {
                return read;
            }
            config.reload_services.push_back(std::move(service));
        }
    }
    return Ok();
}

} // namespace

const char* to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Local: return "local";
        case TransportKind::Rsync: return "rsync";
    }
    return "unknown";
}

Result<TransportKind> parse_transport(const std::string& name) {
    if (name == "local") {
        return Ok(TransportKind::Local);
    }
    if (name == "rsync") {
        return Ok(TransportKind::Rsync);
    }
    return Err<TransportKind>(config_error("unknown transport '" + name + "' (expected local or rsync)"));
}

Result<SyncConfig> SyncConfig::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<SyncConfig>(config_error("cannot read config file " + path.string()));
    }
    std::ostringstream content;
    content << in.rdbuf();

    auto parsed = parse(content.str(), path.parent_path());
    if (parsed.is_error()) {
        return Err<SyncConfig>(config_error(path.string() + ": " + parsed.error().message));
    }
    spdlog::debug("Loaded config from {}", path.string());
    return parsed;
}

Result<SyncConfig> SyncConfig::parse(const std::string& text, const fs::path& base_dir) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<SyncConfig>(config_error("invalid JSON"));
    }
    if (!document.is_object()) {
        return Err<SyncConfig>(config_error("top level must be a JSON object"));
    }

    SyncConfig config;

    const std::pair<const char*, fs::path*> paths[] = {
        {"local_root", &config.local_root},
        {"remote_root", &config.remote_root},
        {"push_rules", &config.push_rules},
        {"pull_rules", &config.pull_rules},
    };
    for (const auto& [key, target] : paths) {
        if (auto read = read_path(document, key, base_dir, *target); read.is_error()) {
            return Err<SyncConfig>(read.error());
        }
    }

    std::string transport;
    if (auto read = read_string(document, "transport", transport); read.is_error()) {
        return Err<SyncConfig>(read.error());
    }
    if (!transport.empty()) {
        auto kind = parse_transport(transport);
        if (kind.is_error()) {
            return Err<SyncConfig>(kind.error());
        }
        config.transport = kind.value();
    }

    if (auto read = read_string(document, "rsync_binary", config.rsync_binary); read.is_error()) {
        return Err<SyncConfig>(read.error());
    }
    if (document.contains("rsync_args")) {
        const auto& args = document.at("rsync_args");
        if (!args.is_array()) {
            return Err<SyncConfig>(config_error("'rsync_args' must be an array of strings"));
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                return Err<SyncConfig>(config_error("'rsync_args' must be an array of strings"));
            }
            config.rsync_args.push_back(arg.get<std::string>());
        }
    }

    if (auto read = read_string(document, "log_level", config.log_level); read.is_error()) {
        return Err<SyncConfig>(read.error());
    }
    if (!is_log_level(config.log_level)) {
        return Err<SyncConfig>(config_error("unknown log_level '" + config.log_level + "'"));
    }

    if (document.contains("reload")) {
        if (auto read = read_reload(document.at("reload"), config); read.is_error()) {
            return Err<SyncConfig>(read.error());
        }
    }

    return Ok(std::move(config));
}

Result<rules::RuleSet> SyncConfig::rules_for(sync::Direction direction) const {
    const fs::path& file = direction == sync::Direction::Push ? push_rules : pull_rules;
    if (file.empty()) {
        return Ok(rules::RuleSet::default_for(direction));
    }
    return rules::RuleSet::load(file);
}

Result<reload::ReloadSettings> resolve_reload_settings(const SyncConfig& config, const EnvSource& env) {
    reload::ReloadSettings settings;
    settings.base_url = config.reload_url.value_or(env.get_or("HA_URL", kDefaultReloadUrl));
    while (!settings.base_url.empty() && settings.base_url.back() == '/') {
        settings.base_url.pop_back();
    }
    settings.token = env.get_or("HA_TOKEN", "");
    settings.timeout = config.reload_timeout;
    settings.services = config.reload_services;

    if (settings.token.empty()) {
        return Err<reload::ReloadSettings>(
            config_error("HA_TOKEN not found in the environment or .env file"));
    }
    return Ok(std::move(settings));
}

} // namespace csync::config
