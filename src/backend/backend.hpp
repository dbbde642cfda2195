#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace skillkit::backend {

struct FileInfo {
  std::string path;  // Absolute virtual path
  bool is_dir = false;
  uint64_t size = 0;
};

struct GrepMatch {
  std::string path;
  int line = 0;  // 1-based
  std::string text;
};

// Virtual filesystem seen by the agent's file tools. All paths are
// absolute POSIX-style virtual paths. Failures are returned, not thrown.
class Backend {
 public:
  virtual ~Backend() = default;

  // Direct children of a directory
  virtual Result<std::vector<FileInfo>> ls(const std::string &path) = 0;

  virtual Result<std::string> read(const std::string &path) = 0;

  // Create or overwrite; returns bytes written
  virtual Result<size_t> write(const std::string &path, const std::string &content) = 0;

  // Exact string replacement; returns the number of replacements
  virtual Result<int> edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) = 0;

  // Files below path whose path relative to it matches pattern
  virtual Result<std::vector<std::string>> glob(const std::string &pattern, const std::string &path) = 0;

  // Lines matching a regex in files below path; include filters by file name glob
  virtual Result<std::vector<GrepMatch>> grep(const std::string &pattern, const std::string &path, const std::string &include) = 0;
};

// "/a//b/" -> "/a/b"; always absolute, "/" for empty input
std::string normalize_virtual_path(const std::string &path);

// True if path equals dir or lies below it
bool is_under(const std::string &path, const std::string &dir);

// Replace old_str in content. Fails if old_str is empty or absent, or
// occurs more than once while replace_all is false.
Result<std::pair<std::string, int>> replace_text(const std::string &content, const std::string &old_str, const std::string &new_str, bool replace_all);

inline constexpr size_t kMaxGrepMatches = 100;

// Append matching lines of content to out, stopping at kMaxGrepMatches
void grep_content(const std::string &path, const std::string &content, const std::regex &re, std::vector<GrepMatch> &out);

}  // namespace skillkit::backend
