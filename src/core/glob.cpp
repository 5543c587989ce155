#include "core/glob.hpp"

namespace toolgate {

static bool match_from(const std::string &pattern, size_t pi, const std::string &str, size_t si) {
  while (pi < pattern.size() && si < str.size()) {
    char pc = pattern[pi];

    if (pc == '*') {
      // Collapse runs of '*'
      while (pi < pattern.size() && pattern[pi] == '*') pi++;
      if (pi == pattern.size()) return true;
      for (size_t k = si; k <= str.size(); ++k) {
        if (match_from(pattern, pi, str, k)) {
          return true;
        }
      }
      return false;
    } else if (pc == '?') {
      pi++;
      si++;
    } else if (pc == '[') {
      pi++;
      bool negated = false;
      if (pi < pattern.size() && (pattern[pi] == '!' || pattern[pi] == '^')) {
        negated = true;
        pi++;
      }
      bool found = false;
      while (pi < pattern.size() && pattern[pi] != ']') {
        if (pi + 2 < pattern.size() && pattern[pi + 1] == '-' && pattern[pi + 2] != ']') {
          char lo = pattern[pi];
          char hi = pattern[pi + 2];
          if (str[si] >= lo && str[si] <= hi) {
            found = true;
          }
          pi += 3;
        } else {
          if (pattern[pi] == str[si]) {
            found = true;
          }
          pi++;
        }
      }
      if (pi < pattern.size()) pi++;       // skip ']'
      if (found == negated) return false;  // negated XOR found must be true
      si++;
    } else {
      if (pc != str[si]) return false;
      pi++;
      si++;
    }
  }

  // Skip trailing '*' in pattern
  while (pi < pattern.size() && pattern[pi] == '*') pi++;

  return pi == pattern.size() && si == str.size();
}

bool glob_match(const std::string &pattern, const std::string &str) {
  return match_from(pattern, 0, str, 0);
}

bool glob_match_any(const std::vector<std::string> &patterns, const std::string &str) {
  for (const auto &pattern : patterns) {
    if (glob_match(pattern, str)) {
      return true;
    }
  }
  return false;
}

}  // namespace toolgate
