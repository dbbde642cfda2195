#include <algorithm>
#include <sstream>

#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// GlobTool
// ============================================================================

GlobTool::GlobTool() : SimpleTool("glob", "Fast file pattern matching tool. Supports glob patterns like \"**/*.md\".") {}

std::vector<ParameterSchema> GlobTool::parameters() const {
  return {{"pattern", "string", "The glob pattern to match files against", true, std::nullopt, std::nullopt},
          {"path", "string", "The directory to search in (defaults to /)", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> GlobTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string pattern = args.value("pattern", "");
    std::string search_path = args.value("path", "/");

    if (pattern.empty()) {
      return ToolResult::error("pattern is required");
    }
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto found = ctx.backend->glob(pattern, search_path);
    if (found.failed()) {
      return ToolResult::error(*found.error);
    }

    auto matches = std::move(*found.value);
    if (matches.empty()) {
      return ToolResult::success("No files found matching pattern: " + pattern);
    }

    std::sort(matches.begin(), matches.end());

    std::ostringstream output;
    for (const auto &match : matches) {
      output << match << "\n";
    }
    return ToolResult::with_title(output.str(), "Found " + std::to_string(matches.size()) + " files");
  });
}

}  // namespace skillkit::tools
