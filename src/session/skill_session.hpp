#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend/backend.hpp"
#include "backend/composite.hpp"
#include "session/turn.hpp"
#include "skill/content_store.hpp"
#include "skill/metadata_cache.hpp"
#include "skill/resolver.hpp"
#include "tool/tool.hpp"

namespace skillkit::session {

// Supplies the tools of an external integration by name. Implementations
// may throw; a failing integration is skipped for that model call.
class IntegrationToolSource {
 public:
  virtual ~IntegrationToolSource() = default;
  virtual std::vector<std::shared_ptr<Tool>> tools_for(const std::string &integration) = 0;
};

using Clock = std::function<Timestamp()>;

// Runs a tool call once the hook lets it through
using ToolExecutor = std::function<ToolResult(const ToolCall &)>;

// "/skills/<slug>/SKILL.md" -> slug, for any well-formed manifest path
std::optional<std::string> manifest_path_slug(const std::string &path);

// Slugs whose manifest was read through read_file in history, in order.
// Only slugs in visible count.
std::vector<std::string> activated_from_history(const std::vector<ToolCallRecord> &history, const std::vector<std::string> &visible);

// Union of the declarations of the activated skills, deduplicated in
// activation order
skill::DependencyDeclaration dependency_bundle(const std::vector<std::string> &activated, const skill::SessionSnapshot &snapshot);

// Skill hooks of one agent, called in order for every turn:
//   on_turn_start       once, before the first model call
//   prepare_model_call  before every model call
//   on_tool_call        around every tool call
//
// One manager may serve many turns concurrently; all per-turn state lives
// in the TurnContext.
class SkillSessionManager {
 public:
  SkillSessionManager(const skill::MetadataCache &cache, const ToolRegistry &registry, std::shared_ptr<IntegrationToolSource> integrations = nullptr,
                      Clock clock = nullptr);

  // Resolve visibility and inject the skills section into the system
  // prompt at most once. No-op when the turn already has a snapshot.
  // Never throws.
  void on_turn_start(TurnContext &turn) const;

  // Base prompt, injected skills section and time marker; tools scoped to
  // the activated skills
  ModelRequest prepare_model_call(TurnContext &turn, const ModelRequest &base) const;

  // Record the call; deny manifest reads of skills that are not visible,
  // mark visible ones activated, run everything else unchanged
  ToolResult on_tool_call(TurnContext &turn, const ToolCall &call, const ToolExecutor &execute) const;

 private:
  skill::DependencyResolver resolver_;
  const ToolRegistry &registry_;
  std::shared_ptr<IntegrationToolSource> integrations_;
  Clock clock_;
};

// Filesystem a turn's tools see: /skills/ routes to the visible skills
// (read-only), everything else to the session's state backend
std::shared_ptr<backend::CompositeBackend> make_turn_backend(const TurnContext &turn, const skill::ContentStore &store,
                                                             std::shared_ptr<backend::Backend> state);

}  // namespace skillkit::session
