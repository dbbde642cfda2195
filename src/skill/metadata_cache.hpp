#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "skill/names.hpp"
#include "skill/repository.hpp"

namespace skillkit::skill {

// Entry of the skill option list offered to agent configuration
struct SkillOption {
  std::string id;  // slug
  std::string name;
  std::string description;
};

// What the prompt shows for one skill
struct PromptMetadata {
  std::string slug;
  std::string name;
  std::string description;
  std::string path;  // Manifest virtual path
};

// Immutable view of every known skill. Built wholesale from repository
// records; never modified after construction.
class SkillCatalog {
 public:
  SkillCatalog() = default;
  explicit SkillCatalog(const std::vector<SkillRecord> &records);

  bool contains(const std::string &slug) const;
  size_t size() const {
    return entries_.size();
  }

  // Repository order (most recently updated first)
  const std::vector<SkillOption> &options() const {
    return options_;
  }

  std::optional<PromptMetadata> prompt_metadata(const std::string &slug) const;
  std::optional<DependencyDeclaration> dependencies(const std::string &slug) const;

 private:
  struct Entry {
    PromptMetadata meta;
    DependencyDeclaration deps;
  };

  std::vector<SkillOption> options_;
  std::map<std::string, Entry> entries_;
};

// Process-wide, read-mostly slug -> metadata cache.
//
// Single writer: the content store calls rebuild() after every mutation.
// Readers take one consistent catalog snapshot with catalog(); a rebuild
// swaps in a new catalog without touching snapshots already handed out.
class MetadataCache {
 public:
  MetadataCache();

  void rebuild(const std::vector<SkillRecord> &records);
  void rebuild_from(SkillRepository &repo);

  std::shared_ptr<const SkillCatalog> catalog() const;

  // Convenience wrappers over the current catalog
  std::vector<SkillOption> options() const;
  bool contains(const std::string &slug) const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const SkillCatalog> catalog_;
};

}  // namespace skillkit::skill
