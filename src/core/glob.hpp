#pragma once

#include <string>
#include <vector>

namespace toolgate {

// Match a whole string against a glob pattern.
// Supports: * (any chars, including '/'), ? (single char), [abc], [^abc]/[!abc], [a-z] ranges.
// Braces are literal characters, as in fnmatch.
bool glob_match(const std::string &pattern, const std::string &str);

// True if any pattern in the list matches
bool glob_match_any(const std::vector<std::string> &patterns, const std::string &str);

}  // namespace toolgate
