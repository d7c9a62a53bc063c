#pragma once

#include "csync/core/result.hpp"
#include "csync/sync/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace csync::rules {

enum class RuleAction {
    Exclude,  ///< never transferred, never deleted
    Protect,  ///< never deleted on the destination, may still be created/updated
    Allow     ///< transferred and mirrored normally
};

struct Rule {
    std::string pattern;
    RuleAction action = RuleAction::Exclude;
};

const char* to_string(RuleAction action) noexcept;

/**
 * @brief Ordered, immutable list of path rules for one sync direction
 *
 * The first rule whose pattern matches a path decides its action; a path no
 * rule matches is ALLOW. A rule that matches a directory also matches every
 * path below it, so an earlier directory rule shadows later, more specific
 * rules for anything inside that directory.
 *
 * Pattern forms:
 *   "name"      matches any path component called "name" (and its subtree)
 *   "/name"     anchored to the tree root
 *   "a/b"       contains '/', matched against the whole relative path
 *   "name/"     trailing '/' only matches directories
 */
class RuleSet {
public:
    RuleSet() = default;

    /**
     * @brief Build from rule objects, validating every pattern
     *
     * Fails with ConfigError on an empty list or a malformed pattern, and
     * when an unanchored ALLOW/PROTECT rule precedes a directory EXCLUDE:
     * the transfer tool never descends into the excluded directory, so the
     * earlier rule could not take effect there.
     */
    static Result<RuleSet> from_rules(std::vector<Rule> rules);

    /**
     * @brief Parse rule-file text ("- pat", "P pat", "+ pat", bare = exclude)
     *
     * @param origin Name used in error messages (usually the file path)
     */
    static Result<RuleSet> parse(const std::string& text, const std::string& origin = "<rules>");

    static Result<RuleSet> load(const std::filesystem::path& file);

    /// Remote runtime state (auth storage, backups, add-ons, media, caches) stays untouched.
    static RuleSet default_push();

    /// Secrets and credentials never leave the remote; stale local files are mirrored away.
    static RuleSet default_pull();

    static RuleSet default_for(sync::Direction direction);

    [[nodiscard]] RuleAction classify(const std::string& path, sync::EntryKind kind) const;

    /// First rule matching the path, or nullptr when the implicit ALLOW applies.
    [[nodiscard]] const Rule* match(const std::string& path, sync::EntryKind kind) const;

    /**
     * @brief Render the rules in the transfer primitive's filter syntax
     *
     * Each rule yields its own line plus a "/**" line so tools that match a
     * directory pattern against the directory node alone still cover the
     * subtree. Order is preserved, so first-match precedence is unchanged.
     *
     * An anchored ALLOW/PROTECT rule is preceded by perishable "+p /dir/"
     * lines for each parent directory, and a PROTECT rule by sender-side
     * "+s" lines. parse() skips both kinds when reading the lines back.
     */
    [[nodiscard]] std::vector<std::string> to_filter_lines() const;

    [[nodiscard]] std::vector<Rule> rules() const;
    [[nodiscard]] std::size_t size() const noexcept { return compiled_.size(); }
    [[nodiscard]] bool empty() const noexcept { return compiled_.empty(); }

private:
    struct CompiledRule {
        Rule rule;
        std::string body;        ///< pattern without leading/trailing '/'
        bool anchored = false;   ///< leading '/' or '/' inside the pattern
        bool dir_only = false;   ///< trailing '/'
    };

    static CompiledRule compile(const Rule& rule);
    static Result<void> validate(const Rule& rule);
    Result<void> check_reachable() const;
    static RuleSet from_trusted(const std::vector<Rule>& rules);

    static bool matches(const CompiledRule& compiled, const std::string& path, sync::EntryKind kind);

    std::vector<CompiledRule> compiled_;
};

} // namespace csync::rules
