#include "skill/names.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

#include "core/error.hpp"

namespace skillkit::skill {

bool is_valid_skill_slug(const std::string &slug) {
  if (slug.empty() || slug.size() > kMaxSlugLength) return false;

  static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
  return std::regex_match(slug, pattern);
}

bool is_valid_dependency_name(const std::string &name) {
  if (name.empty() || name.size() > 128) return false;

  static const std::regex pattern("^[A-Za-z0-9_.:-]+$");
  return std::regex_match(name, pattern);
}

DependencyLists DependencyDeclaration::to_lists() const {
  DependencyLists lists;
  for (const auto &t : tools) lists.tools.push_back(t.str());
  for (const auto &i : integrations) lists.integrations.push_back(i.str());
  for (const auto &s : skills) lists.skills.push_back(s.str());
  return lists;
}

namespace {

template <typename Tag>
void append_unique(std::vector<Name<Tag>> &out, const std::string &raw, const char *kind, const std::string &owner, bool strict) {
  auto name = make_name<Tag>(raw);
  if (!name) {
    if (strict) {
      throw ValidationError(std::string("Invalid ") + kind + " dependency name: '" + raw + "'");
    }
    spdlog::warn("Skill '{}' declares invalid {} dependency '{}', ignored", owner, kind, raw);
    return;
  }
  if (std::find(out.begin(), out.end(), *name) == out.end()) {
    out.push_back(std::move(*name));
  }
}

DependencyDeclaration parse_impl(const DependencyLists &lists, const std::string &owner, bool strict) {
  DependencyDeclaration decl;
  for (const auto &raw : lists.tools) append_unique(decl.tools, raw, "tool", owner, strict);
  for (const auto &raw : lists.integrations) append_unique(decl.integrations, raw, "integration", owner, strict);
  for (const auto &raw : lists.skills) append_unique(decl.skills, raw, "skill", owner, strict);
  return decl;
}

}  // namespace

DependencyDeclaration parse_dependencies(const DependencyLists &lists, const std::string &owner) {
  return parse_impl(lists, owner, false);
}

DependencyDeclaration parse_dependencies_strict(const DependencyLists &lists) {
  return parse_impl(lists, "", true);
}

}  // namespace skillkit::skill
