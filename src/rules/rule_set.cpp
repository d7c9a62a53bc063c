#include "csync/rules/rule_set.hpp"
#include "csync/rules/glob.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace csync::rules {
namespace fs = std::filesystem;
using sync::Direction;
using sync::EntryKind;

namespace {

const std::vector<Rule>& push_defaults() {
    static const std::vector<Rule> rules{
        {".storage/", RuleAction::Exclude},
        {".cloud/", RuleAction::Exclude},
        {"home-assistant_v2.db*", RuleAction::Exclude},
        {"*.log", RuleAction::Exclude},
        {"*.log.*", RuleAction::Exclude},
        {"backups/", RuleAction::Exclude},
        {"tmp_backups/", RuleAction::Exclude},
        {"www/", RuleAction::Exclude},
        {"custom_components/", RuleAction::Exclude},
        {"image/", RuleAction::Exclude},
        {"deps/", RuleAction::Exclude},
        {"tts/", RuleAction::Exclude},
        {"secrets.yaml", RuleAction::Exclude},
        {".env", RuleAction::Exclude},
        {".git/", RuleAction::Exclude},
        {"blueprints/", RuleAction::Protect},
        {".HA_VERSION", RuleAction::Protect},
    };
    return rules;
}

const std::vector<Rule>& pull_defaults() {
    static const std::vector<Rule> rules{
        {"/.storage/auth", RuleAction::Exclude},
        {"/.storage/auth_provider.*", RuleAction::Exclude},
        {"/.storage/cloud", RuleAction::Exclude},
        {"/.storage/http.auth", RuleAction::Exclude},
        {"/.storage/onboarding", RuleAction::Exclude},
        {"/.cloud/", RuleAction::Exclude},
        {"secrets.yaml", RuleAction::Exclude},
        {"backups/", RuleAction::Exclude},
        {"tmp_backups/", RuleAction::Exclude},
        {"deps/", RuleAction::Exclude},
        {"tts/", RuleAction::Exclude},
        {"home-assistant_v2.db*", RuleAction::Exclude},
        {"*.log", RuleAction::Exclude},
        {"*.log.*", RuleAction::Exclude},
        {".env", RuleAction::Exclude},
        {".git/", RuleAction::Protect},
        {".csync/", RuleAction::Protect},
    };
    return rules;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

const char* filter_prefix(RuleAction action) {
    switch (action) {
        case RuleAction::Exclude: return "- ";
        case RuleAction::Protect: return "P ";
        case RuleAction::Allow: return "+ ";
    }
    return "- ";
}

} // namespace

const char* to_string(RuleAction action) noexcept {
    switch (action) {
        case RuleAction::Exclude: return "EXCLUDE";
        case RuleAction::Protect: return "PROTECT";
        case RuleAction::Allow: return "ALLOW";
    }
    return "ALLOW";
}

Result<RuleSet> RuleSet::from_rules(std::vector<Rule> rules) {
    if (rules.empty()) {
        return Err<RuleSet>(config_error("rule set is empty"));
    }

    RuleSet set;
    set.compiled_.reserve(rules.size());
    for (auto& rule : rules) {
        if (auto valid = validate(rule); valid.is_error()) {
            return Err<RuleSet>(valid.error());
        }
        set.compiled_.push_back(compile(rule));
    }
    if (auto reachable = set.check_reachable(); reachable.is_error()) {
        return Err<RuleSet>(reachable.error());
    }
    return Ok(std::move(set));
}

Result<RuleSet> RuleSet::parse(const std::string& text, const std::string& origin) {
    std::vector<Rule> rules;
    std::istringstream input(text);
    std::string raw;
    std::size_t line_number = 0;

    while (std::getline(input, raw)) {
        ++line_number;
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }

        // Sender-side and perishable includes only steer the transfer tool's
        // traversal; the rule they accompany carries the meaning.
        if (starts_with(line, "+s ") || starts_with(line, "+p ")) {
            continue;
        }

        const std::string where = origin + ":" + std::to_string(line_number);
        Rule rule;
        if (starts_with(line, "- ") || starts_with(line, "exclude ")) {
            rule.action = RuleAction::Exclude;
        } else if (starts_with(line, "P ") || starts_with(line, "protect ")) {
            rule.action = RuleAction::Protect;
        } else if (starts_with(line, "+ ") || starts_with(line, "include ")) {
            rule.action = RuleAction::Allow;
        } else if (line.size() > 1 && line[1] == ' ' &&
                   std::string("HSRC.:!").find(line[0]) != std::string::npos) {
            return Err<RuleSet>(config_error(where + ": unsupported filter rule '" + line + "'"));
        } else {
            rule.action = RuleAction::Exclude;
            rule.pattern = line;
        }

        if (rule.pattern.empty()) {
            rule.pattern = trim(line.substr(line.find(' ') + 1));
        }

        if (auto valid = validate(rule); valid.is_error()) {
            return Err<RuleSet>(config_error(where + ": " + valid.error().message));
        }
        rules.push_back(std::move(rule));
    }

    if (rules.empty()) {
        return Err<RuleSet>(config_error(origin + ": no rules defined"));
    }

    auto set = from_rules(std::move(rules));
    if (set.is_ok()) {
        spdlog::debug("Loaded {} rules from {}", set.value().size(), origin);
    }
    return set;
}

Result<RuleSet> RuleSet::load(const fs::path& file) {
    std::ifstream input(file);
    if (!input) {
        return Err<RuleSet>(config_error("cannot read rule file: " + file.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse(buffer.str(), file.string());
}

RuleSet RuleSet::default_push() {
    return from_trusted(push_defaults());
}

RuleSet RuleSet::default_pull() {
    return from_trusted(pull_defaults());
}

RuleSet RuleSet::default_for(Direction direction) {
    return direction == Direction::Push ? default_push() : default_pull();
}

RuleAction RuleSet::classify(const std::string& path, EntryKind kind) const {
    const Rule* rule = match(path, kind);
    return rule != nullptr ? rule->action : RuleAction::Allow;
}

const Rule* RuleSet::match(const std::string& path, EntryKind kind) const {
    for (const auto& compiled : compiled_) {
        if (matches(compiled, path, kind)) {
            return &compiled.rule;
        }
    }
    return nullptr;
}

std::vector<std::string> RuleSet::to_filter_lines() const {
    std::vector<std::string> lines;
    lines.reserve(compiled_.size() * 4);
    for (const auto& compiled : compiled_) {
        const std::string prefix = filter_prefix(compiled.rule.action);
        // Patterns with an inner '/' are root-relative here; say so explicitly.
        const std::string anchored = compiled.anchored ? "/" + compiled.body : compiled.body;
        const std::string node = anchored + (compiled.dir_only ? "/" : "");
        const std::string subtree = anchored + "/**";

        // The tool skips a directory's subtree once the directory itself is
        // excluded, so open the way to an anchored rule's target first.
        if (compiled.rule.action != RuleAction::Exclude && compiled.anchored) {
            for (auto slash = compiled.body.find('/'); slash != std::string::npos;
                 slash = compiled.body.find('/', slash + 1)) {
                lines.push_back("+p /" + compiled.body.substr(0, slash) + "/");
            }
        }
        // "P" only acts on the receiving side; the sender must include the path too.
        if (compiled.rule.action == RuleAction::Protect) {
            lines.push_back("+s " + node);
            lines.push_back("+s " + subtree);
        }
        lines.push_back(prefix + node);
        lines.push_back(prefix + subtree);
    }
    return lines;
}

std::vector<Rule> RuleSet::rules() const {
    std::vector<Rule> out;
    out.reserve(compiled_.size());
    for (const auto& compiled : compiled_) {
        out.push_back(compiled.rule);
    }
    return out;
}

RuleSet::CompiledRule RuleSet::compile(const Rule& rule) {
    CompiledRule compiled;
    compiled.rule = rule;

    std::string body = rule.pattern;
    if (!body.empty() && body.front() == '/') {
        compiled.anchored = true;
        body.erase(0, 1);
    }
    if (!body.empty() && body.back() == '/') {
        compiled.dir_only = true;
        body.pop_back();
    }
    if (body.find('/') != std::string::npos) {
        compiled.anchored = true;
    }
    compiled.body = std::move(body);
    return compiled;
}

Result<void> RuleSet::validate(const Rule& rule) {
    std::string body = rule.pattern;
    if (!body.empty() && body.front() == '/') {
        body.erase(0, 1);
    }
    if (!body.empty() && body.back() == '/') {
        body.pop_back();
    }
    if (body.empty()) {
        return Err<void>(config_error("pattern '" + rule.pattern + "' matches nothing"));
    }

    std::size_t start = 0;
    while (true) {
        const auto slash = body.find('/', start);
        const auto segment = body.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment.empty()) {
            return Err<void>(config_error("empty path segment in pattern '" + rule.pattern + "'"));
        }
        if (segment == "..") {
            return Err<void>(config_error("'..' is not allowed in pattern '" + rule.pattern + "'"));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    return validate_glob(body);
}

Result<void> RuleSet::check_reachable() const {
    for (std::size_t i = 0; i < compiled_.size(); ++i) {
        const auto& earlier = compiled_[i];
        if (earlier.rule.action == RuleAction::Exclude || earlier.anchored) {
            continue;
        }
        for (std::size_t j = i + 1; j < compiled_.size(); ++j) {
            const auto& later = compiled_[j];
            if (later.rule.action == RuleAction::Exclude && later.dir_only) {
                return Err<void>(config_error("rule '" + earlier.rule.pattern +
                                              "' would reach inside directories excluded by the later rule '" +
                                              later.rule.pattern + "'; anchor it or move it below"));
            }
        }
    }
    return Ok();
}

RuleSet RuleSet::from_trusted(const std::vector<Rule>& rules) {
    RuleSet set;
    for (const auto& rule : rules) {
        set.compiled_.push_back(compile(rule));
    }
    return set;
}

bool RuleSet::matches(const CompiledRule& compiled, const std::string& path, EntryKind kind) {
    // Try the path itself and every ancestor directory, shortest first.
    std::size_t end = path.find('/');
    while (true) {
        const bool is_full = end == std::string::npos;
        const std::string prefix = is_full ? path : path.substr(0, end);
        const bool prefix_is_dir = !is_full || kind == EntryKind::Directory;

        if (!compiled.dir_only || prefix_is_dir) {
            if (compiled.anchored) {
                if (glob_match(compiled.body, prefix)) {
                    return true;
                }
            } else {
                const auto slash = prefix.rfind('/');
                const std::string name = slash == std::string::npos ? prefix : prefix.substr(slash + 1);
                if (glob_match(compiled.body, name)) {
                    return true;
                }
            }
        }

        if (is_full) {
            return false;
        }
        end = path.find('/', end + 1);
    }
}

} // namespace csync::rules
