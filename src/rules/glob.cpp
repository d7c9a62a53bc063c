#include "csync/rules/glob.hpp"

namespace csync::rules {
namespace {

constexpr std::size_t npos = std::string::npos;

// Index one past the ']' closing the class opened at pattern[open], or npos.
std::size_t class_end(const std::string& pattern, std::size_t open) {
    std::size_t i = open + 1;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        ++i;
    }
    if (i < pattern.size() && pattern[i] == ']') {
        ++i;  // a leading ']' is a literal member
    }
    while (i < pattern.size() && pattern[i] != ']') {
        if (pattern[i] == '\\') {
            ++i;
            if (i >= pattern.size()) {
                return npos;
            }
        }
        ++i;
    }
    return i < pattern.size() ? i + 1 : npos;
}

bool class_matches(const std::string& pattern, std::size_t open, std::size_t end, char c) {
    if (c == '/') {
        return false;
    }

    std::size_t i = open + 1;
    const std::size_t close = end - 1;
    bool negate = false;
    if (pattern[i] == '!' || pattern[i] == '^') {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < close) {
        char low = pattern[i];
        if (low == '\\') {
            low = pattern[++i];
        } else if (low == ']' && !first) {
            break;
        }
        ++i;
        first = false;

        if (i + 1 < close && pattern[i] == '-') {
            std::size_t hi_index = i + 1;
            if (pattern[hi_index] == '\\' && hi_index + 1 < close) {
                ++hi_index;
            }
            const char high = pattern[hi_index];
            i = hi_index + 1;
            if (low <= c && c <= high) {
                matched = true;
            }
            continue;
        }

        if (c == low) {
            matched = true;
        }
    }
    return matched != negate;
}

bool match_from(const std::string& pattern, std::size_t pi,
                const std::string& text, std::size_t ti) {
    while (pi < pattern.size()) {
        char pc = pattern[pi];

        if (pc == '*') {
            const bool globstar = pi + 1 < pattern.size() && pattern[pi + 1] == '*';
            std::size_t next = pi + 1;
            while (next < pattern.size() && pattern[next] == '*') {
                ++next;
            }

            // "a/**/b" also matches "a/b"
            if (globstar && next < pattern.size() && pattern[next] == '/' &&
                match_from(pattern, next + 1, text, ti)) {
                return true;
            }

            for (std::size_t k = ti; k <= text.size(); ++k) {
                if (match_from(pattern, next, text, k)) {
                    return true;
                }
                if (k < text.size() && !globstar && text[k] == '/') {
                    break;
                }
            }
            return false;
        }

        if (ti >= text.size()) {
            return false;
        }

        if (pc == '?') {
            if (text[ti] == '/') {
                return false;
            }
            ++pi;
            ++ti;
            continue;
        }

        if (pc == '[') {
            const auto end = class_end(pattern, pi);
            if (end == npos || !class_matches(pattern, pi, end, text[ti])) {
                return false;
            }
            pi = end;
            ++ti;
            continue;
        }

        if (pc == '\\') {
            if (++pi >= pattern.size()) {
                return false;
            }
            pc = pattern[pi];
        }

        if (pc != text[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }
    return ti == text.size();
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(pattern, 0, path, 0);
}

Result<void> validate_glob(const std::string& pattern) {
    if (pattern.empty()) {
        return Err<void>(config_error("empty pattern"));
    }

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 >= pattern.size()) {
                return Err<void>(config_error("dangling escape in pattern '" + pattern + "'"));
            }
            ++i;
            continue;
        }
        if (pattern[i] == '[') {
            const auto end = class_end(pattern, i);
            if (end == npos) {
                return Err<void>(config_error("unterminated '[' in pattern '" + pattern + "'"));
            }
            i = end - 1;
        }
    }
    return Ok();
}

} // namespace csync::rules
