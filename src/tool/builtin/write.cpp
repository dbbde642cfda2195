#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// WriteFileTool
// ============================================================================

WriteFileTool::WriteFileTool()
    : SimpleTool("write_file", "Writes content to a file. Creates the file if it doesn't exist, overwrites if it does.") {}

std::vector<ParameterSchema> WriteFileTool::parameters() const {
  return {{"file_path", "string", "The absolute path to the file to write", true, std::nullopt, std::nullopt},
          {"content", "string", "The content to write to the file", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> WriteFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("file_path", "");
    std::string content = args.value("content", "");

    if (file_path.empty()) {
      return ToolResult::error("file_path is required");
    }
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto written = ctx.backend->write(file_path, content);
    if (written.failed()) {
      return ToolResult::error(*written.error);
    }

    std::string path = backend::normalize_virtual_path(file_path);
    return ToolResult::with_title("Successfully wrote " + std::to_string(*written.value) + " bytes to " + path,
                                  "Wrote " + path.substr(path.rfind('/') + 1));
  });
}

}  // namespace skillkit::tools
