#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/metadata_cache.hpp"
#include "skill/names.hpp"

namespace skillkit::skill {

// Resolved per-turn view of skill state
struct SessionSnapshot {
  std::vector<std::string> selected_skills;                    // Deduped, validated, input order
  std::vector<std::string> visible_skills;                     // Selected, then discovered dependencies
  std::vector<PromptMetadata> prompt_metadata;                 // Visible order
  std::map<std::string, DependencyDeclaration> dependency_map;  // Visible slugs only

  bool is_visible(const std::string &slug) const;

  json to_json() const;
};

// Drop invalid slugs and duplicates, keeping first-seen order
std::vector<std::string> normalize_selected_skills(const std::vector<std::string> &slugs);

// Computes visible-skill closures from the metadata cache. Stateless and
// safe to share between concurrently running turns.
class DependencyResolver {
 public:
  explicit DependencyResolver(const MetadataCache &cache) : cache_(cache) {}

  // Never throws for bad input: invalid or unknown slugs are dropped.
  // Terminates on cyclic skill graphs.
  SessionSnapshot resolve(const std::vector<std::string> &selected) const;

 private:
  const MetadataCache &cache_;
};

}  // namespace skillkit::skill
