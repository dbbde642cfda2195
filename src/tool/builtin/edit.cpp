#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// EditFileTool
// ============================================================================

EditFileTool::EditFileTool() : SimpleTool("edit_file", "Performs exact string replacements in files using search and replace.") {}

std::vector<ParameterSchema> EditFileTool::parameters() const {
  return {{"file_path", "string", "The absolute path to the file to modify", true, std::nullopt, std::nullopt},
          {"old_string", "string", "The text to replace", true, std::nullopt, std::nullopt},
          {"new_string", "string", "The text to replace it with", true, std::nullopt, std::nullopt},
          {"replace_all", "boolean", "Replace all occurrences (default false)", false, json(false), std::nullopt}};
}

std::future<ToolResult> EditFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("file_path", "");
    std::string old_str = args.value("old_string", "");
    std::string new_str = args.value("new_string", "");
    bool replace_all = args.value("replace_all", false);

    if (file_path.empty()) {
      return ToolResult::error("file_path is required");
    }
    if (old_str.empty()) {
      return ToolResult::error("old_string is required");
    }
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto replaced = ctx.backend->edit(file_path, old_str, new_str, replace_all);
    if (replaced.failed()) {
      return ToolResult::error(*replaced.error);
    }

    std::string path = backend::normalize_virtual_path(file_path);
    return ToolResult::with_title("Replaced " + std::to_string(*replaced.value) + " occurrence(s) in " + path,
                                  "Edited " + path.substr(path.rfind('/') + 1));
  });
}

}  // namespace skillkit::tools
