#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/resolver.hpp"
#include "tool/tool.hpp"

namespace skillkit::session {

struct ToolCall {
  std::string id;
  std::string name;
  json args = json::object();
};

struct ToolCallRecord {
  ToolCall call;
  std::optional<ToolResult> result;  // Unset while the call is running
};

// Per-skill lifecycle within one turn
enum class SkillState { NotVisible, Visible, Activated };

std::string to_string(SkillState state);

// Skill bookkeeping carried by a turn
struct SkillTurnState {
  std::optional<skill::SessionSnapshot> snapshot;  // Set once at turn start
  bool skills_prompt_injected = false;
  std::string skills_prompt;
  std::vector<std::string> activated_skills;  // Activation order
};

// One agent turn as seen by the skill hooks
struct TurnContext {
  std::string session_id;
  std::vector<std::string> selected_skills;
  std::string system_prompt;
  SkillTurnState skills;
  std::vector<ToolCallRecord> tool_history;

  // Snapshot visibility, or the normalized selection when no snapshot exists
  std::vector<std::string> visible_skills() const;

  SkillState state_of(const std::string &slug) const;
};

// What is sent to the model for one call
struct ModelRequest {
  std::string system_prompt;
  std::vector<std::shared_ptr<Tool>> tools;

  std::vector<std::string> tool_names() const;
  bool has_tool(const std::string &name) const;
};

}  // namespace skillkit::session
