#include "session/turn.hpp"

#include <algorithm>

namespace skillkit::session {

std::string to_string(SkillState state) {
  switch (state) {
    case SkillState::NotVisible:
      return "not_visible";
    case SkillState::Visible:
      return "visible";
    case SkillState::Activated:
      return "activated";
  }
  return "unknown";
}

std::vector<std::string> TurnContext::visible_skills() const {
  if (skills.snapshot) {
    return skills.snapshot->visible_skills;
  }
  return skill::normalize_selected_skills(selected_skills);
}

SkillState TurnContext::state_of(const std::string &slug) const {
  const auto &activated = skills.activated_skills;
  if (std::find(activated.begin(), activated.end(), slug) != activated.end()) {
    return SkillState::Activated;
  }
  auto visible = visible_skills();
  if (std::find(visible.begin(), visible.end(), slug) != visible.end()) {
    return SkillState::Visible;
  }
  return SkillState::NotVisible;
}

std::vector<std::string> ModelRequest::tool_names() const {
  std::vector<std::string> names;
  names.reserve(tools.size());
  for (const auto &tool : tools) {
    names.push_back(tool->id());
  }
  return names;
}

bool ModelRequest::has_tool(const std::string &name) const {
  return std::any_of(tools.begin(), tools.end(), [&](const auto &tool) { return tool->id() == name; });
}

}  // namespace skillkit::session
