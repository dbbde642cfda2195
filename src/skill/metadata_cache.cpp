#include "skill/metadata_cache.hpp"

#include <spdlog/spdlog.h>

#include "skill/manifest.hpp"

namespace skillkit::skill {

// ============================================================================
// SkillCatalog
// ============================================================================

SkillCatalog::SkillCatalog(const std::vector<SkillRecord> &records) {
  options_.reserve(records.size());
  for (const auto &record : records) {
    if (entries_.count(record.slug)) continue;

    options_.push_back({record.slug, record.name, record.description});

    Entry entry;
    entry.meta = {record.slug, record.name, record.description, manifest_virtual_path(record.slug)};
    entry.deps = parse_dependencies(record.dependencies, record.slug);
    entries_[record.slug] = std::move(entry);
  }
}

bool SkillCatalog::contains(const std::string &slug) const {
  return entries_.count(slug) > 0;
}

std::optional<PromptMetadata> SkillCatalog::prompt_metadata(const std::string &slug) const {
  auto it = entries_.find(slug);
  if (it == entries_.end()) return std::nullopt;
  return it->second.meta;
}

std::optional<DependencyDeclaration> SkillCatalog::dependencies(const std::string &slug) const {
  auto it = entries_.find(slug);
  if (it == entries_.end()) return std::nullopt;
  return it->second.deps;
}

// ============================================================================
// MetadataCache
// ============================================================================

MetadataCache::MetadataCache() : catalog_(std::make_shared<const SkillCatalog>()) {}

void MetadataCache::rebuild(const std::vector<SkillRecord> &records) {
  // Build outside the lock, then swap
  auto fresh = std::make_shared<const SkillCatalog>(records);
  {
    std::lock_guard lock(mutex_);
    catalog_ = fresh;
  }
  spdlog::debug("Rebuilt skills cache with {} items", fresh->size());
}

void MetadataCache::rebuild_from(SkillRepository &repo) {
  rebuild(repo.list_all());
}

std::shared_ptr<const SkillCatalog> MetadataCache::catalog() const {
  std::lock_guard lock(mutex_);
  return catalog_;
}

std::vector<SkillOption> MetadataCache::options() const {
  return catalog()->options();
}

bool MetadataCache::contains(const std::string &slug) const {
  return catalog()->contains(slug);
}

}  // namespace skillkit::skill
