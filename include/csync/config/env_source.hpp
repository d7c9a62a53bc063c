#pragma once

#include "csync/core/result.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace csync::config {

/**
 * @brief Key/value settings from a .env file layered over the process environment
 *
 * File format: KEY=VALUE per line, optional "export " prefix, optional
 * surrounding single or double quotes, '#' comments. Values read from the
 * file take precedence over the process environment.
 */
class EnvSource {
public:
    EnvSource() = default;

    /**
     * @brief Read @p env_file if it exists
     *
     * A missing file is not an error (only the process environment is used);
     * an unreadable one is an Access error.
     */
    static Result<EnvSource> load(const std::filesystem::path& env_file);

    static std::map<std::string, std::string> parse(const std::string& text);

    std::optional<std::string> get(const std::string& key) const;

    std::string get_or(const std::string& key, const std::string& fallback) const;

    void set(const std::string& key, std::string value) { values_[key] = std::move(value); }

    /// Number of keys loaded from the file.
    std::size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace csync::config
