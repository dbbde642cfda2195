#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace skillkit {

namespace backend {
class Backend;
}

struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "array", "object"
  std::string description;
  bool required = false;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
};

struct ToolResult {
  std::string output;
  std::string title;
  bool is_error = false;

  static ToolResult success(std::string output) {
    return ToolResult{std::move(output), "", false};
  }

  static ToolResult error(std::string message) {
    return ToolResult{std::move(message), "Error", true};
  }

  static ToolResult with_title(std::string output, std::string title) {
    return ToolResult{std::move(output), std::move(title), false};
  }
};

struct ToolContext {
  std::string session_id;

  // File tools operate on this backend; paths are virtual ("/notes.md",
  // "/skills/<slug>/SKILL.md")
  std::shared_ptr<backend::Backend> backend;
};

class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string id() const = 0;
  virtual std::string description() const = 0;
  virtual std::vector<ParameterSchema> parameters() const = 0;
  virtual std::future<ToolResult> execute(const json &args, const ToolContext &ctx) = 0;

  // JSON schema of the parameters, in function-calling format
  json schema() const;
};

class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

  std::string id() const override {
    return id_;
  }
  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Registry of tools available to a session, keyed by id.
// A later registration under the same id replaces the earlier tool.
class ToolRegistry {
 public:
  ToolRegistry() = default;

  static ToolRegistry &instance();

  void register_tool(std::shared_ptr<Tool> tool);
  void unregister_tool(const std::string &id);

  std::shared_ptr<Tool> get(const std::string &id) const;
  bool has(const std::string &id) const;

  // Sorted by id
  std::vector<std::shared_ptr<Tool>> all() const;
  std::vector<std::string> ids() const;

  void clear();

  // Register read_file, write_file, edit_file, ls, glob and grep
  void init_builtins();

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace skillkit
