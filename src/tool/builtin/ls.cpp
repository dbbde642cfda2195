#include <sstream>

#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// LsTool
// ============================================================================

LsTool::LsTool() : SimpleTool("ls", "Lists the entries of a directory. Directories are marked with a trailing slash.") {}

std::vector<ParameterSchema> LsTool::parameters() const {
  return {{"path", "string", "The absolute directory path to list (defaults to /)", false, json("/"), std::nullopt}};
}

std::future<ToolResult> LsTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string path = args.value("path", "/");
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto entries = ctx.backend->ls(path);
    if (entries.failed()) {
      return ToolResult::error(*entries.error);
    }
    if (entries.value->empty()) {
      return ToolResult::success("(empty directory)");
    }

    std::ostringstream output;
    for (const auto &entry : *entries.value) {
      output << entry.path << (entry.is_dir ? "/" : "") << "\n";
    }
    return ToolResult::with_title(output.str(), std::to_string(entries.value->size()) + " entries");
  });
}

}  // namespace skillkit::tools
