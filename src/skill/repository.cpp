#include "skill/repository.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

#include "core/error.hpp"

namespace skillkit::skill {

namespace fs = std::filesystem;

// ============================================================================
// SkillRecord
// ============================================================================

namespace {

json optional_to_json(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_from_json(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

std::vector<std::string> strings_from_json(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_array()) {
    return j[key].get<std::vector<std::string>>();
  }
  return {};
}

}  // namespace

json SkillRecord::to_json() const {
  return json{{"id", id},
              {"slug", slug},
              {"name", name},
              {"description", description},
              {"dir_path", dir_path},
              {"tool_dependencies", dependencies.tools},
              {"integration_dependencies", dependencies.integrations},
              {"skill_dependencies", dependencies.skills},
              {"created_by", optional_to_json(created_by)},
              {"updated_by", optional_to_json(updated_by)},
              {"created_at", to_millis(created_at)},
              {"updated_at", to_millis(updated_at)}};
}

SkillRecord SkillRecord::from_json(const json &j) {
  SkillRecord record;
  record.id = j.value("id", int64_t{0});
  record.slug = j.value("slug", "");
  record.name = j.value("name", "");
  record.description = j.value("description", "");
  record.dir_path = j.value("dir_path", "");
  record.dependencies.tools = strings_from_json(j, "tool_dependencies");
  record.dependencies.integrations = strings_from_json(j, "integration_dependencies");
  record.dependencies.skills = strings_from_json(j, "skill_dependencies");
  record.created_by = optional_from_json(j, "created_by");
  record.updated_by = optional_from_json(j, "updated_by");
  record.created_at = from_millis(j.value("created_at", int64_t{0}));
  record.updated_at = from_millis(j.value("updated_at", int64_t{0}));
  return record;
}

void sort_by_recency(std::vector<SkillRecord> &records) {
  std::sort(records.begin(), records.end(), [](const SkillRecord &a, const SkillRecord &b) {
    if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
    return a.id > b.id;
  });
}

// ============================================================================
// InMemorySkillRepository
// ============================================================================

std::vector<SkillRecord> InMemorySkillRepository::list_all() {
  std::lock_guard lock(mutex_);
  std::vector<SkillRecord> result;
  result.reserve(records_.size());
  for (const auto &[slug, record] : records_) {
    result.push_back(record);
  }
  sort_by_recency(result);
  return result;
}

std::optional<SkillRecord> InMemorySkillRepository::get_by_slug(const std::string &slug) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(slug);
  if (it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

SkillRecord InMemorySkillRepository::create(const SkillRecord &record) {
  std::lock_guard lock(mutex_);
  if (records_.count(record.slug)) {
    throw ConflictError("Skill '" + record.slug + "' already exists");
  }

  auto now = std::chrono::system_clock::now();
  SkillRecord item = record;
  item.id = next_id_;
  item.updated_by = record.created_by;
  item.created_at = now;
  item.updated_at = now;

  records_[item.slug] = item;
  next_id_++;
  try {
    on_changed();
  } catch (...) {
    records_.erase(item.slug);
    next_id_--;
    throw;
  }
  return item;
}

SkillRecord InMemorySkillRepository::update_metadata(const std::string &slug, const MetadataUpdate &update) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(slug);
  if (it == records_.end()) {
    throw NotFoundError("Skill '" + slug + "' does not exist");
  }

  SkillRecord backup = it->second;
  SkillRecord &item = it->second;
  if (update.name) item.name = *update.name;
  if (update.description) item.description = *update.description;
  if (update.dependencies) item.dependencies = *update.dependencies;
  item.updated_by = update.updated_by;
  item.updated_at = std::max(std::chrono::system_clock::now(), backup.updated_at + std::chrono::milliseconds(1));

  try {
    on_changed();
  } catch (...) {
    item = backup;
    throw;
  }
  return item;
}

void InMemorySkillRepository::remove(const std::string &slug) {
  std::lock_guard lock(mutex_);
  auto it = records_.find(slug);
  if (it == records_.end()) {
    throw NotFoundError("Skill '" + slug + "' does not exist");
  }

  SkillRecord backup = it->second;
  records_.erase(it);
  try {
    on_changed();
  } catch (...) {
    records_[slug] = backup;
    throw;
  }
}

// ============================================================================
// JsonSkillRepository
// ============================================================================

JsonSkillRepository::JsonSkillRepository(const fs::path &path) : path_(path) {
  load();
}

void JsonSkillRepository::load() {
  std::lock_guard lock(mutex_);
  if (!fs::exists(path_)) {
    return;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    throw IoFailure("Cannot open skill repository: " + path_.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error &e) {
    throw IoFailure("Corrupt skill repository " + path_.string() + ": " + e.what());
  }

  for (const auto &item : j.value("skills", json::array())) {
    auto record = SkillRecord::from_json(item);
    if (!is_valid_skill_slug(record.slug)) {
      spdlog::warn("Skipping stored skill with invalid slug '{}'", record.slug);
      continue;
    }
    next_id_ = std::max(next_id_, record.id + 1);
    records_[record.slug] = std::move(record);
  }
  next_id_ = std::max(next_id_, j.value("next_id", int64_t{1}));

  spdlog::debug("Loaded {} skill records from {}", records_.size(), path_.string());
}

void JsonSkillRepository::on_changed() {
  json skills = json::array();
  for (const auto &[slug, record] : records_) {
    skills.push_back(record.to_json());
  }
  json j = {{"next_id", next_id_}, {"skills", skills}};

  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
  }

  // Atomic write: write to .tmp then rename
  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      throw IoFailure("Cannot write skill repository: " + tmp.string());
    }
    file << j.dump(2);
    if (!file.good()) {
      throw IoFailure("Failed writing skill repository: " + tmp.string());
    }
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    std::string reason = ec.message();
    fs::remove(tmp, ec);
    throw IoFailure("Cannot replace skill repository " + path_.string() + ": " + reason);
  }
}

}  // namespace skillkit::skill
