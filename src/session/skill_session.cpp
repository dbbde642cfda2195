#include "session/skill_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

#include "backend/skills_backend.hpp"
#include "session/skills_prompt.hpp"
#include "skill/manifest.hpp"
#include "tool/builtin/builtins.hpp"

namespace skillkit::session {

namespace {

bool contains(const std::vector<std::string> &items, const std::string &item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

std::string join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) out += ", ";
    out += item;
  }
  return out;
}

std::string read_path_of(const ToolCall &call) {
  if (!call.args.is_object()) return "";
  auto it = call.args.find("file_path");
  if (it == call.args.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

// Replace a same-named tool so the latest addition wins
void put_tool(std::vector<std::shared_ptr<Tool>> &tools, std::shared_ptr<Tool> tool) {
  auto id = tool->id();
  tools.erase(std::remove_if(tools.begin(), tools.end(), [&](const auto &t) { return t->id() == id; }), tools.end());
  tools.push_back(std::move(tool));
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::string> manifest_path_slug(const std::string &path) {
  std::string normalized = path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');
  normalized = backend::normalize_virtual_path(normalized);

  const std::string prefix = skill::kSkillsRoutePrefix;
  const std::string suffix = std::string("/") + skill::kManifestFileName;
  if (normalized.size() <= prefix.size() + suffix.size()) return std::nullopt;
  if (normalized.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  if (normalized.compare(normalized.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

  std::string slug = normalized.substr(prefix.size(), normalized.size() - prefix.size() - suffix.size());
  if (!skill::is_valid_skill_slug(slug)) return std::nullopt;
  return slug;
}

std::vector<std::string> activated_from_history(const std::vector<ToolCallRecord> &history, const std::vector<std::string> &visible) {
  std::vector<std::string> activated;
  for (const auto &record : history) {
    if (record.call.name != tools::kReadFileToolName) continue;
    auto slug = manifest_path_slug(read_path_of(record.call));
    if (!slug || !contains(visible, *slug) || contains(activated, *slug)) continue;
    activated.push_back(*slug);
  }
  return activated;
}

skill::DependencyDeclaration dependency_bundle(const std::vector<std::string> &activated, const skill::SessionSnapshot &snapshot) {
  skill::DependencyDeclaration bundle;
  std::set<std::string> tools, integrations, skills;

  for (const auto &slug : activated) {
    auto it = snapshot.dependency_map.find(slug);
    if (it == snapshot.dependency_map.end()) continue;
    const auto &decl = it->second;
    for (const auto &t : decl.tools) {
      if (tools.insert(t.str()).second) bundle.tools.push_back(t);
    }
    for (const auto &i : decl.integrations) {
      if (integrations.insert(i.str()).second) bundle.integrations.push_back(i);
    }
    for (const auto &s : decl.skills) {
      if (skills.insert(s.str()).second) bundle.skills.push_back(s);
    }
  }
  return bundle;
}

// ============================================================================
// SkillSessionManager
// ============================================================================

SkillSessionManager::SkillSessionManager(const skill::MetadataCache &cache, const ToolRegistry &registry,
                                         std::shared_ptr<IntegrationToolSource> integrations, Clock clock)
    : resolver_(cache), registry_(registry), integrations_(std::move(integrations)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

void SkillSessionManager::on_turn_start(TurnContext &turn) const {
  // Once per turn
  if (turn.skills.snapshot) return;

  try {
    turn.skills.snapshot = resolver_.resolve(turn.selected_skills);
  } catch (const std::exception &e) {
    spdlog::warn("Skill resolution failed, falling back to selected skills: {}", e.what());
    skill::SessionSnapshot fallback;
    fallback.selected_skills = skill::normalize_selected_skills(turn.selected_skills);
    fallback.visible_skills = fallback.selected_skills;
    turn.skills.snapshot = std::move(fallback);
    return;
  }

  const auto &snapshot = *turn.skills.snapshot;
  spdlog::debug("Turn skills: {}", snapshot.to_json().dump());

  if (turn.skills.skills_prompt_injected) return;
  if (snapshot.visible_skills.empty()) return;

  if (!registry_.has(tools::kReadFileToolName)) {
    spdlog::warn("Skills configured but read_file unavailable, skills prompt not injected");
    return;
  }

  std::string prompt;
  try {
    prompt = build_skills_prompt(snapshot.prompt_metadata);
  } catch (const std::exception &e) {
    spdlog::warn("Failed to build skills prompt: {}", e.what());
    return;
  }
  if (prompt.empty()) return;

  if (!turn.system_prompt.empty()) {
    turn.system_prompt += "\n\n";
  }
  turn.system_prompt += prompt;
  turn.skills.skills_prompt = std::move(prompt);
  turn.skills.skills_prompt_injected = true;
}

ModelRequest SkillSessionManager::prepare_model_call(TurnContext &turn, const ModelRequest &base) const {
  ModelRequest request;
  request.system_prompt = base.system_prompt;
  if (turn.skills.skills_prompt_injected) {
    if (!request.system_prompt.empty()) {
      request.system_prompt += "\n\n";
    }
    request.system_prompt += turn.skills.skills_prompt;
  }
  if (!request.system_prompt.empty()) {
    request.system_prompt += "\n\n";
  }
  request.system_prompt += "Current time: " + format_timestamp(clock_());

  auto visible = turn.visible_skills();
  turn.skills.activated_skills = activated_from_history(turn.tool_history, visible);
  const auto &activated = turn.skills.activated_skills;

  skill::SessionSnapshot empty;
  const auto &snapshot = turn.skills.snapshot ? *turn.skills.snapshot : empty;
  auto bundle = dependency_bundle(activated, snapshot);

  std::set<std::string> unlocked;
  for (const auto &t : bundle.tools) {
    unlocked.insert(t.str());
  }

  // Tools of visible skills stay hidden until one of their skills is read
  std::set<std::string> withheld;
  for (const auto &slug : visible) {
    if (contains(activated, slug)) continue;
    auto it = snapshot.dependency_map.find(slug);
    if (it == snapshot.dependency_map.end()) continue;
    for (const auto &t : it->second.tools) {
      if (!unlocked.count(t.str())) withheld.insert(t.str());
    }
  }

  for (const auto &tool : base.tools) {
    if (!withheld.count(tool->id())) {
      request.tools.push_back(tool);
    }
  }

  // Per skill in activation order, so the later skill wins a name clash
  for (const auto &slug : activated) {
    auto it = snapshot.dependency_map.find(slug);
    if (it == snapshot.dependency_map.end()) continue;
    const auto &decl = it->second;

    for (const auto &name : decl.tools) {
      if (auto tool = registry_.get(name.str())) {
        put_tool(request.tools, tool);
      } else {
        spdlog::debug("Skill '{}' requires tool '{}' which is not registered", slug, name.str());
      }
    }

    if (!integrations_) continue;
    for (const auto &name : decl.integrations) {
      try {
        for (auto &tool : integrations_->tools_for(name.str())) {
          if (tool) put_tool(request.tools, std::move(tool));
        }
      } catch (const std::exception &e) {
        spdlog::warn("Integration '{}' for skill '{}' failed, skipped: {}", name.str(), slug, e.what());
      }
    }
  }

  return request;
}

ToolResult SkillSessionManager::on_tool_call(TurnContext &turn, const ToolCall &call, const ToolExecutor &execute) const {
  turn.tool_history.push_back({call, std::nullopt});
  size_t index = turn.tool_history.size() - 1;

  if (call.name == tools::kReadFileToolName) {
    if (auto slug = manifest_path_slug(read_path_of(call))) {
      auto state = turn.state_of(*slug);
      if (state == SkillState::NotVisible) {
        auto visible = turn.visible_skills();
        spdlog::info("Denied read of skill '{}' outside the visible set", *slug);
        auto denial = ToolResult::error("Access denied: skill '" + *slug + "' is not enabled for this conversation. Enabled skills: " +
                                        (visible.empty() ? std::string("(none)") : join(visible)));
        turn.tool_history[index].result = denial;
        return denial;
      }
      if (state != SkillState::Activated) {
        turn.skills.activated_skills.push_back(*slug);
        spdlog::info("Skill '{}' {} -> {}", *slug, to_string(state), to_string(SkillState::Activated));
      }
    }
  }

  ToolResult result = execute(call);
  turn.tool_history[index].result = result;
  return result;
}

// ============================================================================
// Backend
// ============================================================================

std::shared_ptr<backend::CompositeBackend> make_turn_backend(const TurnContext &turn, const skill::ContentStore &store,
                                                             std::shared_ptr<backend::Backend> state) {
  auto composite = std::make_shared<backend::CompositeBackend>(std::move(state));
  composite->add_route(skill::kSkillsRoutePrefix, std::make_shared<backend::SkillsReadonlyBackend>(store, turn.visible_skills()));
  return composite;
}

}  // namespace skillkit::session
