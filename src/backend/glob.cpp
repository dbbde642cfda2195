#include "backend/glob.hpp"

#include <sstream>

namespace skillkit::backend {

namespace {

// Index of the '}' closing the '{' at open, or npos
size_t closing_brace(const std::string &s, size_t open) {
  int depth = 0;
  for (size_t i = open; i < s.size(); ++i) {
    if (s[i] == '{') {
      ++depth;
    } else if (s[i] == '}' && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// "a,b{c,d}" -> {"a", "b{c,d}"}
std::vector<std::string> split_alternatives(const std::string &inner) {
  std::vector<std::string> parts(1);
  int depth = 0;
  for (char c : inner) {
    if (c == ',' && depth == 0) {
      parts.emplace_back();
      continue;
    }
    if (c == '{') ++depth;
    if (c == '}') --depth;
    parts.back() += c;
  }
  return parts;
}

// Match str[si] against the class starting at pattern[pi] == '['.
// Returns the index just past the class, or npos when the class rejects.
size_t match_class(const std::string &pattern, size_t pi, char c) {
  size_t i = pi + 1;
  bool negated = i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^');
  if (negated) ++i;

  bool hit = false;
  while (i < pattern.size() && pattern[i] != ']') {
    bool is_range = i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']';
    if (is_range) {
      hit = hit || (c >= pattern[i] && c <= pattern[i + 2]);
      i += 3;
    } else {
      hit = hit || c == pattern[i];
      ++i;
    }
  }
  if (i < pattern.size()) ++i;
  return hit != negated ? i : std::string::npos;
}

std::vector<std::string> segments_of(const std::string &path) {
  std::vector<std::string> segments;
  std::istringstream iss(path);
  std::string seg;
  while (std::getline(iss, seg, '/')) {
    if (!seg.empty()) segments.push_back(std::move(seg));
  }
  return segments;
}

}  // namespace

std::vector<std::string> expand_braces(const std::string &pattern) {
  size_t open = pattern.find('{');
  if (open == std::string::npos) return {pattern};

  size_t close = closing_brace(pattern, open);
  if (close == std::string::npos) return {pattern};

  std::string head = pattern.substr(0, open);
  std::string tail = pattern.substr(close + 1);

  std::vector<std::string> out;
  for (const auto &alt : split_alternatives(pattern.substr(open + 1, close - open - 1))) {
    for (auto &expanded : expand_braces(head + alt + tail)) {
      out.push_back(std::move(expanded));
    }
  }
  return out;
}

bool match_segment(const std::string &pattern, const std::string &str) {
  size_t pi = 0, si = 0;
  // Resume point of the last '*': pattern index after it, and the string
  // index it currently swallows up to
  size_t star_pi = std::string::npos, star_si = 0;

  while (si < str.size()) {
    if (pi < pattern.size()) {
      char pc = pattern[pi];
      if (pc == '*') {
        star_pi = ++pi;
        star_si = si;
        continue;
      }
      if (pc == '?') {
        ++pi;
        ++si;
        continue;
      }
      if (pc == '[') {
        size_t next = match_class(pattern, pi, str[si]);
        if (next != std::string::npos) {
          pi = next;
          ++si;
          continue;
        }
      } else if (pc == str[si]) {
        ++pi;
        ++si;
        continue;
      }
    }
    if (star_pi == std::string::npos) return false;
    pi = star_pi;
    si = ++star_si;
  }

  while (pi < pattern.size() && pattern[pi] == '*') ++pi;
  return pi == pattern.size();
}

bool match_glob(const std::string &pattern, const std::string &rel_path) {
  auto pat = segments_of(pattern);
  auto path = segments_of(rel_path);

  // reach[j]: pattern prefix matched so far can end right before path[j]
  std::vector<bool> reach(path.size() + 1, false);
  reach[0] = true;
  for (const auto &p : pat) {
    std::vector<bool> next(path.size() + 1, false);
    for (size_t j = 0; j <= path.size(); ++j) {
      if (!reach[j]) continue;
      if (p == "**") {
        // Any number of segments, none included
        for (size_t k = j; k <= path.size(); ++k) next[k] = true;
        break;
      }
      if (j < path.size() && match_segment(p, path[j])) next[j + 1] = true;
    }
    reach = std::move(next);
  }
  return reach[path.size()];
}

bool glob_matches(const std::string &pattern, const std::string &rel_path) {
  auto slash = rel_path.rfind('/');
  std::string filename = slash == std::string::npos ? rel_path : rel_path.substr(slash + 1);

  for (const auto &pat : expand_braces(pattern)) {
    bool whole_path = pat.find('/') != std::string::npos;
    if (whole_path ? match_glob(pat, rel_path) : match_segment(pat, filename)) {
      return true;
    }
  }
  return false;
}

}  // namespace skillkit::backend
