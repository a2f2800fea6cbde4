#include "taptik/glob.h"

namespace taptik {

namespace {
bool match_from(std::string_view p, size_t pi, std::string_view s, size_t si) {
  while (pi < p.size()) {
    const char c = p[pi];
    if (c == '*') {
      if (pi + 1 < p.size() && p[pi + 1] == '*') {
        size_t next = pi + 2;
        // "**/" also matches zero directories.
        if (next < p.size() && p[next] == '/') {
          if (match_from(p, next + 1, s, si)) return true;
        }
        for (size_t k = si; k <= s.size(); ++k) {
          if (match_from(p, next, s, k)) return true;
        }
        return false;
      }
      for (size_t k = si; k <= s.size(); ++k) {
        if (match_from(p, pi + 1, s, k)) return true;
        if (k < s.size() && s[k] == '/') break;
      }
      return false;
    }
    if (si >= s.size()) return false;
    if (c == '?') {
      if (s[si] == '/') return false;
    } else if (c != s[si]) {
      return false;
    }
    ++pi;
    ++si;
  }
  return si == s.size();
}
} // namespace

bool glob_match(std::string_view pattern, std::string_view path) {
  return match_from(pattern, 0, path, 0);
}

bool matches_any(const std::vector<std::string>& patterns, std::string_view path) {
  for (const auto& pattern : patterns) {
    if (glob_match(pattern, path)) return true;
  }
  return false;
}

} // namespace taptik
