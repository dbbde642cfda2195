#pragma once

#include "tool/tool.hpp"

namespace skillkit::tools {

// File tools over ToolContext::backend. Paths are virtual, e.g.
// "/notes.md" or "/skills/<slug>/SKILL.md".

class ReadFileTool : public SimpleTool {
 public:
  ReadFileTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

class WriteFileTool : public SimpleTool {
 public:
  WriteFileTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

class EditFileTool : public SimpleTool {
 public:
  EditFileTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

class LsTool : public SimpleTool {
 public:
  LsTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

class GlobTool : public SimpleTool {
 public:
  GlobTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

class GrepTool : public SimpleTool {
 public:
  GrepTool();
  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;
};

inline constexpr const char *kReadFileToolName = "read_file";

void register_builtins(ToolRegistry &registry);

}  // namespace skillkit::tools
