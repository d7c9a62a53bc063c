#pragma once

#include "csync/core/result.hpp"

#include <string>

namespace csync::rules {

// Match a glob pattern against a '/'-separated relative path.
// Supports: * (any chars except /), ? (single char except /),
//           ** (any chars including /, "**/" may also match nothing),
//           [abc], [a-z], [!0-9] / [^0-9], and \ to escape the next char.
bool glob_match(const std::string& pattern, const std::string& path);

// Reject patterns glob_match cannot interpret: empty, unterminated '[',
// dangling '\'.
Result<void> validate_glob(const std::string& pattern);

} // namespace csync::rules
