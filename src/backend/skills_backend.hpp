#pragma once

#include <string>
#include <vector>

#include "backend/backend.hpp"
#include "skill/content_store.hpp"

namespace skillkit::backend {

// Read-only view of the visible skills' directories.
//
// Paths are relative to the route prefix: "/<slug>/<file>". A slug outside
// the visible set behaves exactly like a missing one. Every file access
// goes through skill::resolve_path.
class SkillsReadonlyBackend : public Backend {
 public:
  SkillsReadonlyBackend(const skill::ContentStore &store, std::vector<std::string> visible_slugs);

  Result<std::vector<FileInfo>> ls(const std::string &path) override;
  Result<std::string> read(const std::string &path) override;
  Result<size_t> write(const std::string &path, const std::string &content) override;
  Result<int> edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) override;
  Result<std::vector<std::string>> glob(const std::string &pattern, const std::string &path) override;
  Result<std::vector<GrepMatch>> grep(const std::string &pattern, const std::string &path, const std::string &include) override;

  const std::vector<std::string> &visible_slugs() const {
    return visible_slugs_;
  }

 private:
  struct Location {
    std::string slug;  // Empty for the route root
    skill::ResolvedPath resolved;
  };

  // Split "/<slug>/<rest>" and sandbox rest; fails for invisible slugs
  Result<Location> locate(const std::string &path) const;

  bool is_visible(const std::string &slug) const;

  // Virtual path of a file below a skill directory
  static std::string virtual_path(const std::string &slug, const std::string &relative);

  // All regular files below a location as (virtual path, absolute path)
  std::vector<std::pair<std::string, std::filesystem::path>> files_under(const Location &location) const;

  const skill::ContentStore &store_;
  std::vector<std::string> visible_slugs_;
};

}  // namespace skillkit::backend
