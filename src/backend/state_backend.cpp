#include "backend/state_backend.hpp"

#include <set>

#include "backend/glob.hpp"

namespace skillkit::backend {

namespace {

// Relative part of path below dir ("" when equal)
std::string relative_to(const std::string &path, const std::string &dir) {
  if (path == dir) return "";
  if (dir == "/") return path.substr(1);
  return path.substr(dir.size() + 1);
}

}  // namespace

Result<std::vector<FileInfo>> StateBackend::ls(const std::string &path) {
  std::string dir = normalize_virtual_path(path);
  std::lock_guard lock(mutex_);

  if (files_.count(dir)) {
    return Result<std::vector<FileInfo>>::failure("Path is a file, not a directory: " + dir);
  }

  std::vector<FileInfo> entries;
  std::set<std::string> seen_dirs;
  for (const auto &[file_path, content] : files_) {
    if (file_path == dir || !is_under(file_path, dir)) continue;
    std::string rel = relative_to(file_path, dir);
    auto slash = rel.find('/');
    std::string child = (dir == "/" ? "" : dir) + "/" + rel.substr(0, slash);
    if (slash == std::string::npos) {
      entries.push_back({child, false, content.size()});
    } else if (seen_dirs.insert(child).second) {
      entries.push_back({child, true, 0});
    }
  }

  if (entries.empty() && dir != "/") {
    return Result<std::vector<FileInfo>>::failure("Directory not found: " + dir);
  }
  return Result<std::vector<FileInfo>>::success(std::move(entries));
}

Result<std::string> StateBackend::read(const std::string &path) {
  std::string key = normalize_virtual_path(path);
  std::lock_guard lock(mutex_);
  if (auto it = files_.find(key); it != files_.end()) {
    return Result<std::string>::success(it->second);
  }
  return Result<std::string>::failure("File not found: " + key);
}

Result<size_t> StateBackend::write(const std::string &path, const std::string &content) {
  std::string key = normalize_virtual_path(path);
  if (key == "/") {
    return Result<size_t>::failure("Cannot write to the root directory");
  }
  std::lock_guard lock(mutex_);
  files_[key] = content;
  return Result<size_t>::success(content.size());
}

Result<int> StateBackend::edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) {
  std::string key = normalize_virtual_path(path);
  std::lock_guard lock(mutex_);
  auto it = files_.find(key);
  if (it == files_.end()) {
    return Result<int>::failure("File not found: " + key);
  }
  auto replaced = replace_text(it->second, old_str, new_str, replace_all);
  if (replaced.failed()) {
    return Result<int>::failure(*replaced.error);
  }
  it->second = std::move(replaced.value->first);
  return Result<int>::success(replaced.value->second);
}

Result<std::vector<std::string>> StateBackend::glob(const std::string &pattern, const std::string &path) {
  std::string dir = normalize_virtual_path(path);
  std::lock_guard lock(mutex_);
  std::vector<std::string> matches;
  for (const auto &[file_path, content] : files_) {
    if (file_path == dir || !is_under(file_path, dir)) continue;
    if (glob_matches(pattern, relative_to(file_path, dir))) {
      matches.push_back(file_path);
    }
  }
  return Result<std::vector<std::string>>::success(std::move(matches));
}

Result<std::vector<GrepMatch>> StateBackend::grep(const std::string &pattern, const std::string &path, const std::string &include) {
  std::regex re;
  try {
    re = std::regex(pattern);
  } catch (const std::regex_error &e) {
    return Result<std::vector<GrepMatch>>::failure("Invalid regex pattern: " + std::string(e.what()));
  }

  std::string dir = normalize_virtual_path(path);
  std::lock_guard lock(mutex_);
  std::vector<GrepMatch> matches;
  for (const auto &[file_path, content] : files_) {
    if (!is_under(file_path, dir)) continue;
    if (!include.empty() && !glob_matches(include, file_path.substr(file_path.rfind('/') + 1))) continue;
    grep_content(file_path, content, re, matches);
    if (matches.size() >= kMaxGrepMatches) break;
  }
  return Result<std::vector<GrepMatch>>::success(std::move(matches));
}

std::map<std::string, std::string> StateBackend::files() const {
  std::lock_guard lock(mutex_);
  return files_;
}

}  // namespace skillkit::backend
