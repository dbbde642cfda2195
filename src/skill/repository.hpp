#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/names.hpp"

namespace skillkit::skill {

// Persisted skill record
struct SkillRecord {
  int64_t id = 0;
  std::string slug;
  std::string name;
  std::string description;
  std::string dir_path;  // Relative to the save dir, e.g. "skills/<slug>"
  DependencyLists dependencies;
  std::optional<std::string> created_by;
  std::optional<std::string> updated_by;
  Timestamp created_at = std::chrono::system_clock::now();
  Timestamp updated_at = std::chrono::system_clock::now();

  json to_json() const;
  static SkillRecord from_json(const json &j);
};

// Fields changed by an admin or manifest edit; unset fields are kept
struct MetadataUpdate {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<DependencyLists> dependencies;
  std::optional<std::string> updated_by;
};

// CRUD contract the content store depends on
class SkillRepository {
 public:
  virtual ~SkillRepository() = default;

  // Most recently updated first
  virtual std::vector<SkillRecord> list_all() = 0;

  virtual std::optional<SkillRecord> get_by_slug(const std::string &slug) = 0;

  virtual bool exists_slug(const std::string &slug) {
    return get_by_slug(slug).has_value();
  }

  // Throws ConflictError if the slug is taken. Assigns id and timestamps.
  virtual SkillRecord create(const SkillRecord &record) = 0;

  // Throws NotFoundError for an unknown slug. Bumps updated_at.
  virtual SkillRecord update_metadata(const std::string &slug, const MetadataUpdate &update) = 0;

  // Throws NotFoundError for an unknown slug
  virtual void remove(const std::string &slug) = 0;
};

// Volatile repository, used by tests and embedded callers
class InMemorySkillRepository : public SkillRepository {
 public:
  std::vector<SkillRecord> list_all() override;
  std::optional<SkillRecord> get_by_slug(const std::string &slug) override;
  SkillRecord create(const SkillRecord &record) override;
  SkillRecord update_metadata(const std::string &slug, const MetadataUpdate &update) override;
  void remove(const std::string &slug) override;

 protected:
  // Called with mutex_ held after every mutation
  virtual void on_changed() {}

  mutable std::mutex mutex_;
  std::map<std::string, SkillRecord> records_;
  int64_t next_id_ = 1;
};

// JSON file repository
// Storage layout:
//   path                : {"next_id": N, "skills": [SkillRecord...]}
// Every mutation rewrites the file atomically (write .tmp then rename).
class JsonSkillRepository : public InMemorySkillRepository {
 public:
  explicit JsonSkillRepository(const std::filesystem::path &path);

  const std::filesystem::path &path() const {
    return path_;
  }

 protected:
  void on_changed() override;

 private:
  void load();

  std::filesystem::path path_;
};

// Sort by updated_at desc, then id desc
void sort_by_recency(std::vector<SkillRecord> &records);

}  // namespace skillkit::skill
