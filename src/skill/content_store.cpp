#include "skill/content_store.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "core/error.hpp"
#include "core/uuid.hpp"
#include "skill/archive.hpp"
#include "skill/manifest.hpp"

namespace skillkit::skill {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string &str, const std::string &suffix) {
  return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_segments(const std::string &path) {
  std::vector<std::string> segments;
  std::istringstream iss(path);
  std::string seg;
  while (std::getline(iss, seg, '/')) {
    segments.push_back(seg);
  }
  return segments;
}

void write_file_bytes(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw IoFailure("Cannot open file for writing: " + path.string());
  }
  out << content;
  if (!out.good()) {
    throw IoFailure("Failed to write file: " + path.string());
  }
}

// Removes a directory tree on scope exit unless released
class DirGuard {
 public:
  explicit DirGuard(fs::path path) : path_(std::move(path)) {}
  ~DirGuard() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      spdlog::warn("Failed to clean up {}: {}", path_.string(), ec.message());
    }
  }

  DirGuard(const DirGuard &) = delete;
  DirGuard &operator=(const DirGuard &) = delete;

  const fs::path &path() const {
    return path_;
  }

  void release() {
    path_.clear();
  }

 private:
  fs::path path_;
};

// mkdtemp below parent with the given prefix
fs::path make_scratch_dir(const fs::path &parent, const std::string &prefix) {
  std::string tmpl = (parent / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw IoFailure("Cannot create scratch directory under " + parent.string());
  }
  return fs::path(buf.data());
}

}  // namespace

// ============================================================================
// Path helpers
// ============================================================================

ResolvedPath resolve_path(const fs::path &skill_dir, const std::string &relative_path, bool allow_root) {
  std::string rel = trim(relative_path);
  std::replace(rel.begin(), rel.end(), '\\', '/');
  rel.erase(0, rel.find_first_not_of('/'));
  if (rel.find_first_not_of('/') == std::string::npos) {
    rel.clear();
  }

  if (rel.empty() && !allow_root) {
    throw ValidationError("Path must not be empty");
  }

  auto segments = split_segments(rel);
  if (std::find(segments.begin(), segments.end(), "..") != segments.end()) {
    throw PathViolation("Parent directory references are not allowed: " + relative_path);
  }

  std::error_code ec;
  fs::path root = fs::weakly_canonical(skill_dir, ec);
  if (ec) {
    throw IoFailure("Cannot resolve skill directory " + skill_dir.string() + ": " + ec.message());
  }
  fs::path target = rel.empty() ? root : fs::weakly_canonical(root / rel, ec);
  if (ec) {
    throw IoFailure("Cannot resolve path " + rel + ": " + ec.message());
  }

  auto diff = target.lexically_relative(root);
  if (diff.empty() || *diff.begin() == "..") {
    throw PathViolation("Path escapes the skill directory: " + relative_path);
  }

  ResolvedPath resolved;
  resolved.target = target;
  resolved.relative = diff == fs::path(".") ? "" : diff.generic_string();
  // "." and "./" name the root too
  if (resolved.relative.empty() && !allow_root) {
    throw ValidationError("Path must not be the skill root: " + relative_path);
  }
  resolved.is_root_manifest = diff == fs::path(kManifestFileName);
  return resolved;
}

bool is_text_path(const fs::path &path, const std::vector<std::string> &extensions) {
  if (path.filename() == kManifestFileName) return true;
  std::string ext = to_lower(path.extension().string());
  if (ext.empty()) return false;
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::string read_text_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IoFailure("Cannot open file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  std::string content = ss.str();
  if (!is_valid_utf8(content)) {
    throw ValidationError("File is not valid UTF-8 text: " + path.filename().string());
  }
  return content;
}

json TreeNode::to_json() const {
  json j = {{"name", name}, {"path", path}, {"type", is_dir ? "dir" : "file"}};
  if (is_dir) {
    json kids = json::array();
    for (const auto &child : children) {
      kids.push_back(child.to_json());
    }
    j["children"] = kids;
  }
  return j;
}

std::vector<TreeNode> build_tree(const fs::path &dir, const fs::path &base) {
  std::vector<TreeNode> nodes;
  for (const auto &entry : fs::directory_iterator(dir)) {
    TreeNode node;
    node.name = entry.path().filename().string();
    node.path = entry.path().lexically_relative(base).generic_string();
    node.is_dir = entry.is_directory();
    if (node.is_dir) {
      node.children = build_tree(entry.path(), base);
    }
    nodes.push_back(std::move(node));
  }

  std::sort(nodes.begin(), nodes.end(), [](const TreeNode &a, const TreeNode &b) {
    if (a.is_dir != b.is_dir) return a.is_dir;
    return to_lower(a.name) < to_lower(b.name);
  });
  return nodes;
}

// ============================================================================
// ContentStore
// ============================================================================

ContentStore::ContentStore(const fs::path &save_dir, SkillRepository &repo, MetadataCache &cache, std::vector<std::string> text_extensions)
    : save_dir_(save_dir), skills_root_(save_dir / "skills"), repo_(repo), cache_(cache), text_extensions_(std::move(text_extensions)) {
  for (auto &ext : text_extensions_) {
    ext = to_lower(ext);
    if (!ext.empty() && ext[0] != '.') ext.insert(ext.begin(), '.');
  }
}

ContentStore::ContentStore(const Config &config, SkillRepository &repo, MetadataCache &cache)
    : ContentStore(config.save_dir, repo, cache, config.text_extensions) {}

void ContentStore::ensure_skills_root() {
  std::error_code ec;
  fs::create_directories(skills_root_, ec);
  if (ec) {
    throw IoFailure("Cannot create skills root " + skills_root_.string() + ": " + ec.message());
  }
}

fs::path ContentStore::skill_dir(const SkillRecord &record) const {
  fs::path dir(record.dir_path);
  if (dir.empty()) return slug_dir(record.slug);
  if (dir.is_absolute()) return dir.lexically_normal();
  return (save_dir_ / dir).lexically_normal();
}

std::string ContentStore::allocate_slug(const std::string &base) {
  if (!is_valid_skill_slug(base)) {
    throw ValidationError("Invalid skill name: " + base);
  }

  auto taken = [this](const std::string &candidate) {
    std::error_code ec;
    return repo_.exists_slug(candidate) || fs::exists(skills_root_ / candidate, ec);
  };

  if (!taken(base)) return base;

  for (int version = 2;; ++version) {
    std::string suffix = "-v" + std::to_string(version);
    std::string stem = base;
    if (stem.size() + suffix.size() > kMaxSlugLength) {
      stem.resize(kMaxSlugLength - suffix.size());
      while (!stem.empty() && stem.back() == '-') stem.pop_back();
    }
    std::string candidate = stem + suffix;
    if (!taken(candidate)) return candidate;
  }
}

void ContentStore::refresh_cache() {
  cache_.rebuild_from(repo_);
}

SkillRecord ContentStore::get_skill(const std::string &slug) {
  auto record = repo_.get_by_slug(slug);
  if (!record) {
    throw NotFoundError("Skill not found: " + slug);
  }
  return *record;
}

std::vector<SkillRecord> ContentStore::list_skills() {
  auto records = repo_.list_all();
  cache_.rebuild(records);
  return records;
}

// ============================================================================
// Import / export
// ============================================================================

SkillRecord ContentStore::import_zip(const std::string &filename, const std::string &bytes, const std::optional<std::string> &created_by) {
  if (!ends_with(to_lower(filename), ".zip")) {
    throw ValidationError("Only .zip uploads are supported: " + filename);
  }

  ensure_skills_root();

  try {
    // Scratch lives under save_dir so the final renames stay on one filesystem
    DirGuard scratch(make_scratch_dir(save_dir_, ".skill-import-"));
    fs::path extract_dir = scratch.path() / "extract";
    fs::path stage_dir = scratch.path() / "stage";
    fs::create_directories(extract_dir);

    archive::extract(bytes, extract_dir);

    std::vector<fs::path> manifests;
    for (const auto &entry : fs::recursive_directory_iterator(extract_dir)) {
      if (entry.is_regular_file() && entry.path().filename() == kManifestFileName) {
        manifests.push_back(entry.path());
      }
    }
    if (manifests.size() != 1) {
      throw ValidationError("ZIP must contain exactly one skill (one SKILL.md), found " + std::to_string(manifests.size()));
    }

    fs::path manifest_path = manifests.front();
    fs::path source_dir = manifest_path.parent_path();
    std::string content = read_text_file(manifest_path);
    Manifest manifest = parse_manifest_or_throw(content);
    DependencyDeclaration deps = parse_dependencies_strict(manifest.dependencies);

    std::lock_guard lock(publish_mutex_);

    std::string slug = allocate_slug(manifest.name);
    if (slug != manifest.name) {
      spdlog::info("Skill name '{}' is taken, importing as '{}'", manifest.name, slug);
      write_file_bytes(manifest_path, rewrite_manifest_name(content, slug));
    }

    fs::copy(source_dir, stage_dir, fs::copy_options::recursive);

    DirGuard temp_target(skills_root_ / ("." + slug + ".tmp-" + random_hex(8)));
    fs::rename(stage_dir, temp_target.path());

    fs::path final_dir = skills_root_ / slug;
    std::error_code ec;
    if (!fs::create_directory(final_dir, ec)) {
      if (ec) {
        throw IoFailure("Cannot create skill directory " + final_dir.string() + ": " + ec.message());
      }
      throw ConflictError("Skill directory already exists, please retry: " + slug);
    }
    DirGuard published(final_dir);

    fs::rename(temp_target.path(), final_dir);
    temp_target.release();

    SkillRecord record;
    record.slug = slug;
    record.name = slug;
    record.description = manifest.description;
    record.dir_path = fs::path("skills").append(slug).generic_string();
    record.dependencies = deps.to_lists();
    record.created_by = created_by;
    record.updated_by = created_by;

    SkillRecord created = repo_.create(record);
    published.release();

    refresh_cache();
    spdlog::info("Imported skill '{}' from {}", slug, filename);
    return created;
  } catch (const fs::filesystem_error &e) {
    throw IoFailure(std::string("Import failed: ") + e.what());
  }
}

fs::path ContentStore::export_zip(const std::string &slug) {
  auto record = get_skill(slug);
  fs::path dir = skill_dir(record);
  if (!fs::is_directory(dir)) {
    throw NotFoundError("Skill directory missing: " + slug);
  }

  std::string tmpl = (fs::temp_directory_path() / ("skill-" + slug + "-XXXXXX.zip")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  int fd = mkstemps(buf.data(), 4);
  if (fd < 0) {
    throw IoFailure("Cannot create temporary zip for " + slug);
  }
  ::close(fd);
  fs::path out(buf.data());

  try {
    archive::write_directory(dir, slug, out);
  } catch (...) {
    std::error_code ec;
    fs::remove(out, ec);
    throw;
  }

  spdlog::info("Exported skill '{}' to {}", slug, out.string());
  return out;
}

// ============================================================================
// File operations
// ============================================================================

std::vector<TreeNode> ContentStore::tree(const std::string &slug) {
  auto record = get_skill(slug);
  fs::path dir = skill_dir(record);
  if (!fs::is_directory(dir)) {
    throw NotFoundError("Skill directory missing: " + slug);
  }
  return build_tree(dir, dir);
}

FileContent ContentStore::read_file(const std::string &slug, const std::string &relative_path) {
  auto record = get_skill(slug);
  auto resolved = resolve_path(skill_dir(record), relative_path);
  if (!fs::is_regular_file(resolved.target)) {
    throw NotFoundError("File not found: " + resolved.relative);
  }
  if (!is_text_path(resolved.target, text_extensions_)) {
    throw ValidationError("Only text files can be read: " + resolved.relative);
  }
  return FileContent{resolved.relative, read_text_file(resolved.target)};
}

void ContentStore::write_text(const SkillRecord &record, const ResolvedPath &resolved, const std::string &content,
                              const std::optional<std::string> &updated_by) {
  if (!is_valid_utf8(content)) {
    throw ValidationError("Content is not valid UTF-8 text");
  }

  std::optional<Manifest> manifest;
  if (resolved.is_root_manifest) {
    manifest = parse_manifest_or_throw(content);
    if (manifest->name != record.slug) {
      throw ValidationError("SKILL.md name '" + manifest->name + "' must match the skill slug '" + record.slug + "'");
    }
  }

  std::optional<DependencyDeclaration> deps;
  if (manifest && manifest->declares_dependencies) {
    deps = parse_dependencies_strict(manifest->dependencies);
  }

  std::optional<std::string> previous;
  if (fs::exists(resolved.target)) {
    std::ifstream in(resolved.target, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    previous = ss.str();
  }

  std::error_code ec;
  fs::create_directories(resolved.target.parent_path(), ec);
  if (ec) {
    throw IoFailure("Cannot create parent directory for " + resolved.relative + ": " + ec.message());
  }
  write_file_bytes(resolved.target, content);

  if (!manifest) return;

  MetadataUpdate update;
  update.name = manifest->name;
  update.description = manifest->description;
  if (deps) update.dependencies = deps->to_lists();
  update.updated_by = updated_by;

  try {
    repo_.update_metadata(record.slug, update);
  } catch (...) {
    if (previous) {
      write_file_bytes(resolved.target, *previous);
    } else {
      fs::remove(resolved.target, ec);
    }
    throw;
  }
  refresh_cache();
}

void ContentStore::create_node(const std::string &slug, const std::string &relative_path, bool is_dir, const std::optional<std::string> &content,
                               const std::optional<std::string> &updated_by) {
  auto record = get_skill(slug);
  auto resolved = resolve_path(skill_dir(record), relative_path);

  if (fs::exists(resolved.target)) {
    throw ConflictError("Target already exists: " + resolved.relative);
  }

  if (is_dir) {
    std::error_code ec;
    fs::create_directories(resolved.target, ec);
    if (ec) {
      throw IoFailure("Cannot create directory " + resolved.relative + ": " + ec.message());
    }
    spdlog::debug("Created directory '{}' in skill '{}'", resolved.relative, slug);
    return;
  }

  if (!is_text_path(resolved.target, text_extensions_)) {
    throw ValidationError("Only text files can be created: " + resolved.relative);
  }
  write_text(record, resolved, content.value_or(""), updated_by);
  spdlog::debug("Created file '{}' in skill '{}'", resolved.relative, slug);
}

void ContentStore::update_file(const std::string &slug, const std::string &relative_path, const std::string &content,
                               const std::optional<std::string> &updated_by) {
  auto record = get_skill(slug);
  auto resolved = resolve_path(skill_dir(record), relative_path);

  if (!fs::is_regular_file(resolved.target)) {
    throw NotFoundError("File not found: " + resolved.relative);
  }
  if (!is_text_path(resolved.target, text_extensions_)) {
    throw ValidationError("Only text files can be edited: " + resolved.relative);
  }
  write_text(record, resolved, content, updated_by);
  spdlog::debug("Updated file '{}' in skill '{}'", resolved.relative, slug);
}

void ContentStore::delete_node(const std::string &slug, const std::string &relative_path) {
  auto record = get_skill(slug);
  auto resolved = resolve_path(skill_dir(record), relative_path);

  if (resolved.relative.empty()) {
    throw ValidationError("The skill root cannot be deleted");
  }
  if (resolved.is_root_manifest) {
    throw ValidationError("The root SKILL.md cannot be deleted");
  }
  if (!fs::exists(resolved.target)) {
    throw NotFoundError("Path not found: " + resolved.relative);
  }

  std::error_code ec;
  fs::remove_all(resolved.target, ec);
  if (ec) {
    throw IoFailure("Cannot delete " + resolved.relative + ": " + ec.message());
  }
  spdlog::debug("Deleted '{}' from skill '{}'", resolved.relative, slug);
}

// ============================================================================
// Skill lifecycle
// ============================================================================

void ContentStore::delete_skill(const std::string &slug) {
  auto record = get_skill(slug);
  fs::path dir = skill_dir(record);

  std::lock_guard lock(publish_mutex_);

  std::error_code ec;
  std::optional<fs::path> trash;
  if (fs::exists(dir)) {
    trash = skills_root_ / (".deleted-" + slug + "-" + random_hex(8));
    fs::rename(dir, *trash, ec);
    if (ec) {
      throw IoFailure("Cannot move skill directory aside: " + ec.message());
    }
  }

  try {
    repo_.remove(slug);
  } catch (...) {
    if (trash) {
      fs::rename(*trash, dir, ec);
      if (ec) {
        spdlog::error("Failed to restore skill directory {} from {}: {}", dir.string(), trash->string(), ec.message());
      }
    }
    throw;
  }

  if (trash) {
    fs::remove_all(*trash, ec);
    if (ec) {
      spdlog::warn("Failed to purge deleted skill directory {}: {}", trash->string(), ec.message());
    }
  }

  refresh_cache();
  spdlog::info("Deleted skill '{}'", slug);
}

SkillRecord ContentStore::update_dependencies(const std::string &slug, const DependencyLists &lists, const std::optional<std::string> &updated_by) {
  get_skill(slug);

  auto decl = parse_dependencies_strict(lists);
  for (const auto &dep : decl.skills) {
    if (dep.str() == slug) {
      throw ValidationError("A skill cannot depend on itself: " + slug);
    }
    if (!repo_.exists_slug(dep.str())) {
      throw ValidationError("Unknown skill dependency: " + dep.str());
    }
  }

  MetadataUpdate update;
  update.dependencies = decl.to_lists();
  update.updated_by = updated_by;
  auto record = repo_.update_metadata(slug, update);

  refresh_cache();
  spdlog::info("Updated dependencies of skill '{}'", slug);
  return record;
}

}  // namespace skillkit::skill
