#include "backend/skills_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "backend/glob.hpp"
#include "core/error.hpp"

namespace skillkit::backend {

namespace fs = std::filesystem;

SkillsReadonlyBackend::SkillsReadonlyBackend(const skill::ContentStore &store, std::vector<std::string> visible_slugs)
    : store_(store), visible_slugs_(std::move(visible_slugs)) {}

bool SkillsReadonlyBackend::is_visible(const std::string &slug) const {
  return std::find(visible_slugs_.begin(), visible_slugs_.end(), slug) != visible_slugs_.end();
}

std::string SkillsReadonlyBackend::virtual_path(const std::string &slug, const std::string &relative) {
  return relative.empty() ? "/" + slug : "/" + slug + "/" + relative;
}

Result<SkillsReadonlyBackend::Location> SkillsReadonlyBackend::locate(const std::string &path) const {
  std::string p = normalize_virtual_path(path);
  if (p == "/") {
    return Result<Location>::success(Location{});
  }

  auto slash = p.find('/', 1);
  std::string slug = p.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
  std::string rest = slash == std::string::npos ? "" : p.substr(slash + 1);

  if (!skill::is_valid_skill_slug(slug) || !is_visible(slug) || !fs::is_directory(store_.slug_dir(slug))) {
    return Result<Location>::failure("Path not found: " + p);
  }

  try {
    return Result<Location>::success(Location{slug, skill::resolve_path(store_.slug_dir(slug), rest, true)});
  } catch (const SkillError &e) {
    spdlog::warn("Rejected skills path '{}': {}", p, e.what());
    return Result<Location>::failure(e.what());
  }
}

std::vector<std::pair<std::string, fs::path>> SkillsReadonlyBackend::files_under(const Location &location) const {
  std::vector<std::pair<std::string, fs::path>> files;

  auto collect = [&](const std::string &slug, const skill::ResolvedPath &start) {
    fs::path root = store_.slug_dir(slug);
    auto add = [&](const std::string &rel) {
      // Symlinks may point anywhere; re-check every file against the sandbox
      try {
        auto resolved = skill::resolve_path(root, rel);
        if (fs::is_regular_file(resolved.target)) {
          files.emplace_back(virtual_path(slug, rel), resolved.target);
        }
      } catch (const SkillError &e) {
        spdlog::debug("Skipping '{}' in skill '{}': {}", rel, slug, e.what());
      }
    };

    if (fs::is_regular_file(start.target)) {
      add(start.relative);
      return;
    }
    if (!fs::is_directory(start.target)) return;

    fs::path canonical_root = fs::weakly_canonical(root);
    for (const auto &entry : fs::recursive_directory_iterator(start.target)) {
      if (entry.is_directory()) continue;
      add(entry.path().lexically_relative(canonical_root).generic_string());
    }
  };

  if (location.slug.empty()) {
    for (const auto &slug : visible_slugs_) {
      if (!fs::is_directory(store_.slug_dir(slug))) continue;
      collect(slug, skill::resolve_path(store_.slug_dir(slug), "", true));
    }
  } else {
    collect(location.slug, location.resolved);
  }

  std::sort(files.begin(), files.end());
  return files;
}

Result<std::vector<FileInfo>> SkillsReadonlyBackend::ls(const std::string &path) {
  auto location = locate(path);
  if (location.failed()) {
    return Result<std::vector<FileInfo>>::failure(*location.error);
  }

  std::vector<FileInfo> entries;
  if (location.value->slug.empty()) {
    for (const auto &slug : visible_slugs_) {
      if (fs::is_directory(store_.slug_dir(slug))) {
        entries.push_back({"/" + slug, true, 0});
      }
    }
    return Result<std::vector<FileInfo>>::success(std::move(entries));
  }

  const auto &[slug, resolved] = *location.value;
  if (!fs::is_directory(resolved.target)) {
    return Result<std::vector<FileInfo>>::failure("Not a directory: " + normalize_virtual_path(path));
  }

  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(resolved.target, ec)) {
    std::string rel = resolved.relative.empty() ? entry.path().filename().string() : resolved.relative + "/" + entry.path().filename().string();
    bool is_dir = entry.is_directory();
    uint64_t size = 0;
    if (!is_dir) {
      std::error_code size_ec;
      size = entry.file_size(size_ec);
    }
    entries.push_back({virtual_path(slug, rel), is_dir, size});
  }
  if (ec) {
    return Result<std::vector<FileInfo>>::failure("Cannot list " + normalize_virtual_path(path) + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](const FileInfo &a, const FileInfo &b) { return a.path < b.path; });
  return Result<std::vector<FileInfo>>::success(std::move(entries));
}

Result<std::string> SkillsReadonlyBackend::read(const std::string &path) {
  auto location = locate(path);
  if (location.failed()) {
    return Result<std::string>::failure(*location.error);
  }

  const auto &resolved = location.value->resolved;
  if (location.value->slug.empty() || !fs::is_regular_file(resolved.target)) {
    return Result<std::string>::failure("File not found: " + normalize_virtual_path(path));
  }
  if (!skill::is_text_path(resolved.target, store_.text_extensions())) {
    return Result<std::string>::failure("Only text files can be read: " + normalize_virtual_path(path));
  }

  try {
    return Result<std::string>::success(skill::read_text_file(resolved.target));
  } catch (const SkillError &e) {
    return Result<std::string>::failure(e.what());
  }
}

Result<size_t> SkillsReadonlyBackend::write(const std::string &path, const std::string &) {
  return Result<size_t>::failure("Skills are read-only: " + normalize_virtual_path(path));
}

Result<int> SkillsReadonlyBackend::edit(const std::string &path, const std::string &, const std::string &, bool) {
  return Result<int>::failure("Skills are read-only: " + normalize_virtual_path(path));
}

Result<std::vector<std::string>> SkillsReadonlyBackend::glob(const std::string &pattern, const std::string &path) {
  auto location = locate(path);
  if (location.failed()) {
    return Result<std::vector<std::string>>::failure(*location.error);
  }

  std::string base = normalize_virtual_path(path);
  std::vector<std::string> matches;
  try {
    for (const auto &[vpath, target] : files_under(*location.value)) {
      std::string rel = base == "/" ? vpath.substr(1) : vpath.substr(std::min(vpath.size(), base.size() + 1));
      if (glob_matches(pattern, rel)) {
        matches.push_back(vpath);
      }
    }
  } catch (const std::exception &e) {
    return Result<std::vector<std::string>>::failure(std::string("Error searching: ") + e.what());
  }
  return Result<std::vector<std::string>>::success(std::move(matches));
}

Result<std::vector<GrepMatch>> SkillsReadonlyBackend::grep(const std::string &pattern, const std::string &path, const std::string &include) {
  std::regex re;
  try {
    re = std::regex(pattern);
  } catch (const std::regex_error &e) {
    return Result<std::vector<GrepMatch>>::failure("Invalid regex pattern: " + std::string(e.what()));
  }

  auto location = locate(path);
  if (location.failed()) {
    return Result<std::vector<GrepMatch>>::failure(*location.error);
  }

  std::vector<GrepMatch> matches;
  try {
    for (const auto &[vpath, target] : files_under(*location.value)) {
      if (matches.size() >= kMaxGrepMatches) break;
      if (!include.empty() && !glob_matches(include, target.filename().string())) continue;
      if (!skill::is_text_path(target, store_.text_extensions())) continue;
      try {
        grep_content(vpath, skill::read_text_file(target), re, matches);
      } catch (const SkillError &e) {
        spdlog::debug("Skipping '{}' during grep: {}", vpath, e.what());
      }
    }
  } catch (const std::exception &e) {
    return Result<std::vector<GrepMatch>>::failure(std::string("Error searching: ") + e.what());
  }
  return Result<std::vector<GrepMatch>>::success(std::move(matches));
}

}  // namespace skillkit::backend
