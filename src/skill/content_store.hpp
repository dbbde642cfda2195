#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "skill/metadata_cache.hpp"
#include "skill/names.hpp"
#include "skill/repository.hpp"

namespace skillkit::skill {

// A path inside a skill directory that passed the sandbox checks
struct ResolvedPath {
  std::filesystem::path target;  // Absolute, canonical
  std::string relative;          // POSIX style, no leading slash ("" for the root)
  bool is_root_manifest = false;
};

// Resolve relative_path against skill_dir:
//   - trims, turns "\" into "/", strips leading "/"
//   - empty is a ValidationError unless allow_root
//   - any ".." segment is a PathViolation
//   - the canonical target (symlinks followed) must stay inside skill_dir,
//     otherwise PathViolation
ResolvedPath resolve_path(const std::filesystem::path &skill_dir, const std::string &relative_path, bool allow_root = false);

// SKILL.md, or a file whose extension is in the allowlist
bool is_text_path(const std::filesystem::path &path, const std::vector<std::string> &extensions);

// Read a UTF-8 text file. Non UTF-8 content is a ValidationError.
std::string read_text_file(const std::filesystem::path &path);

struct TreeNode {
  std::string name;
  std::string path;  // Relative to the skill root, POSIX style
  bool is_dir = false;
  std::vector<TreeNode> children;

  json to_json() const;
};

// Directories first, then case-insensitive name
std::vector<TreeNode> build_tree(const std::filesystem::path &dir, const std::filesystem::path &base);

struct FileContent {
  std::string path;
  std::string content;
};

// Sandboxed filesystem store for skill directories.
//
// Layout:
//   save_dir/
//     skills/<slug>/SKILL.md       : one directory per skill
//     skills/.<slug>.tmp-xxxxxxxx  : import being published
//     skills/.deleted-<slug>-xxxx  : skill being deleted
//     .skill-import-XXXXXX/        : private scratch area of one import
//
// Every mutation rebuilds the metadata cache from the repository.
class ContentStore {
 public:
  ContentStore(const std::filesystem::path &save_dir, SkillRepository &repo, MetadataCache &cache,
               std::vector<std::string> text_extensions = default_text_extensions());
  ContentStore(const Config &config, SkillRepository &repo, MetadataCache &cache);

  const std::filesystem::path &save_dir() const {
    return save_dir_;
  }
  const std::filesystem::path &skills_root() const {
    return skills_root_;
  }
  const std::vector<std::string> &text_extensions() const {
    return text_extensions_;
  }

  // Directory of a record (dir_path is relative to the save dir)
  std::filesystem::path skill_dir(const SkillRecord &record) const;

  // Directory a published slug lives in; no repository access
  std::filesystem::path slug_dir(const std::string &slug) const {
    return skills_root_ / slug;
  }

  // First free name among base, base-v2, base-v3, ... checked against
  // both the repository and the skills root
  std::string allocate_slug(const std::string &base);

  SkillRecord import_zip(const std::string &filename, const std::string &bytes, const std::optional<std::string> &created_by = std::nullopt);

  // Zip the skill into a private temp file; the caller removes it
  std::filesystem::path export_zip(const std::string &slug);

  SkillRecord get_skill(const std::string &slug);
  std::vector<SkillRecord> list_skills();

  std::vector<TreeNode> tree(const std::string &slug);
  FileContent read_file(const std::string &slug, const std::string &relative_path);
  void create_node(const std::string &slug, const std::string &relative_path, bool is_dir, const std::optional<std::string> &content,
                   const std::optional<std::string> &updated_by = std::nullopt);
  void update_file(const std::string &slug, const std::string &relative_path, const std::string &content,
                   const std::optional<std::string> &updated_by = std::nullopt);
  void delete_node(const std::string &slug, const std::string &relative_path);

  void delete_skill(const std::string &slug);

  // Admin edit of the dependency declaration
  SkillRecord update_dependencies(const std::string &slug, const DependencyLists &lists, const std::optional<std::string> &updated_by = std::nullopt);

  void refresh_cache();

 private:
  void ensure_skills_root();

  // Write content to target; for the root manifest also sync repository
  // metadata, restoring the previous file content if that fails
  void write_text(const SkillRecord &record, const ResolvedPath &resolved, const std::string &content, const std::optional<std::string> &updated_by);

  std::filesystem::path save_dir_;
  std::filesystem::path skills_root_;
  SkillRepository &repo_;
  MetadataCache &cache_;
  std::vector<std::string> text_extensions_;
  std::mutex publish_mutex_;  // Serializes slug allocation + publish in this process
};

}  // namespace skillkit::skill
