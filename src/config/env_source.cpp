#include "csync/config/env_source.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace csync::config {
namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::string unquote(std::string value) {
    if (value.size() >= 2) {
        const char open = value.front();
        if ((open == '"' || open == '\'') && value.back() == open) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

Result<EnvSource> EnvSource::load(const fs::path& env_file) {
    EnvSource source;

    std::error_code ec;
    if (env_file.empty() || !fs::exists(env_file, ec)) {
        spdlog::debug("No env file at {}, using the process environment only", env_file.string());
        return Ok(std::move(source));
    }

    if (!fs::is_regular_file(env_file, ec)) {
        return Err<EnvSource>(access_error("env file is not a regular file: " + env_file.string()));
    }

    std::ifstream in(env_file);
    if (!in) {
        return Err<EnvSource>(access_error("cannot read env file " + env_file.string()));
    }
    std::ostringstream content;
    content << in.rdbuf();

    source.values_ = parse(content.str());
    spdlog::debug("Loaded {} key(s) from {}", source.values_.size(), env_file.string());
    return Ok(std::move(source));
}

std::map<std::string, std::string> EnvSource::parse(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream lines(text);
    for (std::string raw; std::getline(lines, raw);) {
        std::string line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto equals = line.find('=');
        if (equals == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, equals));
        if (key.empty()) {
            continue;
        }
        values[key] = unquote(trim(line.substr(equals + 1)));
    }
    return values;
}

std::optional<std::string> EnvSource::get(const std::string& key) const {
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    if (const char* value = std::getenv(key.c_str()); value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string EnvSource::get_or(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value && !value->empty() ? *value : fallback;
}

} // namespace csync::config
