#include <spdlog/spdlog.h>

#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

namespace skillkit {

json Tool::schema() const {
  json properties = json::object();
  json required = json::array();

  for (const auto &param : parameters()) {
    json prop = {{"type", param.type}, {"description", param.description}};
    if (param.default_value) {
      prop["default"] = *param.default_value;
    }
    if (param.enum_values) {
      prop["enum"] = *param.enum_values;
    }
    properties[param.name] = prop;
    if (param.required) {
      required.push_back(param.name);
    }
  }

  return json{{"name", id()},
              {"description", description()},
              {"parameters", {{"type", "object"}, {"properties", properties}, {"required", required}}}};
}

ToolRegistry &ToolRegistry::instance() {
  static ToolRegistry registry;
  return registry;
}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) return;
  std::lock_guard lock(mutex_);
  auto id = tool->id();
  if (tools_.count(id)) {
    spdlog::debug("Replacing tool '{}'", id);
  }
  tools_[id] = std::move(tool);
}

void ToolRegistry::unregister_tool(const std::string &id) {
  std::lock_guard lock(mutex_);
  tools_.erase(id);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &id) const {
  std::lock_guard lock(mutex_);
  if (auto it = tools_.find(id); it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

bool ToolRegistry::has(const std::string &id) const {
  std::lock_guard lock(mutex_);
  return tools_.count(id) > 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto &[id, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

std::vector<std::string> ToolRegistry::ids() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  for (const auto &[id, tool] : tools_) {
    result.push_back(id);
  }
  return result;
}

void ToolRegistry::clear() {
  std::lock_guard lock(mutex_);
  tools_.clear();
}

void ToolRegistry::init_builtins() {
  tools::register_builtins(*this);
}

}  // namespace skillkit
