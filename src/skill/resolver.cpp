#include "skill/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <set>

namespace skillkit::skill {

bool SessionSnapshot::is_visible(const std::string &slug) const {
  return std::find(visible_skills.begin(), visible_skills.end(), slug) != visible_skills.end();
}

json SessionSnapshot::to_json() const {
  json deps = json::object();
  for (const auto &[slug, decl] : dependency_map) {
    auto lists = decl.to_lists();
    deps[slug] = {{"tools", lists.tools}, {"integrations", lists.integrations}, {"skills", lists.skills}};
  }

  json meta = json::array();
  for (const auto &m : prompt_metadata) {
    meta.push_back({{"slug", m.slug}, {"name", m.name}, {"description", m.description}, {"path", m.path}});
  }

  return json{{"selected_skills", selected_skills}, {"visible_skills", visible_skills}, {"prompt_metadata", meta}, {"dependency_map", deps}};
}

std::vector<std::string> normalize_selected_skills(const std::vector<std::string> &slugs) {
  std::vector<std::string> result;
  std::set<std::string> seen;
  for (const auto &slug : slugs) {
    if (!is_valid_skill_slug(slug)) {
      spdlog::debug("Ignoring invalid skill slug '{}'", slug);
      continue;
    }
    if (seen.insert(slug).second) {
      result.push_back(slug);
    }
  }
  return result;
}

SessionSnapshot DependencyResolver::resolve(const std::vector<std::string> &selected) const {
  // One catalog for the whole resolution so a concurrent rebuild cannot
  // produce a mixed view
  auto catalog = cache_.catalog();

  SessionSnapshot snapshot;
  for (const auto &slug : normalize_selected_skills(selected)) {
    if (!catalog->contains(slug)) {
      spdlog::debug("Selected skill '{}' is unknown, skipped", slug);
      continue;
    }
    snapshot.selected_skills.push_back(slug);
  }

  // Breadth-first over skill -> skill edges, guarded by a visited set
  std::set<std::string> visited(snapshot.selected_skills.begin(), snapshot.selected_skills.end());
  std::deque<std::string> queue(snapshot.selected_skills.begin(), snapshot.selected_skills.end());
  snapshot.visible_skills = snapshot.selected_skills;

  while (!queue.empty()) {
    std::string current = queue.front();
    queue.pop_front();

    auto deps = catalog->dependencies(current);
    if (!deps) continue;

    for (const auto &dep : deps->skills) {
      const auto &slug = dep.str();
      if (visited.count(slug)) continue;
      if (!catalog->contains(slug)) {
        spdlog::debug("Skill '{}' depends on unknown skill '{}', skipped", current, slug);
        continue;
      }
      visited.insert(slug);
      snapshot.visible_skills.push_back(slug);
      queue.push_back(slug);
    }
  }

  for (const auto &slug : snapshot.visible_skills) {
    if (auto meta = catalog->prompt_metadata(slug)) {
      snapshot.prompt_metadata.push_back(std::move(*meta));
    }
    if (auto deps = catalog->dependencies(slug)) {
      snapshot.dependency_map[slug] = std::move(*deps);
    }
  }

  return snapshot;
}

}  // namespace skillkit::skill
