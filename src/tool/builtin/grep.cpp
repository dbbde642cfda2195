#include <sstream>

#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// GrepTool
// ============================================================================

GrepTool::GrepTool() : SimpleTool("grep", "Fast content search tool. Searches file contents using regular expressions.") {}

std::vector<ParameterSchema> GrepTool::parameters() const {
  return {{"pattern", "string", "The regex pattern to search for", true, std::nullopt, std::nullopt},
          {"path", "string", "The directory to search in (defaults to /)", false, std::nullopt, std::nullopt},
          {"include", "string", "File pattern to include (e.g. \"*.md\")", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> GrepTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string pattern = args.value("pattern", "");
    std::string search_path = args.value("path", "/");
    std::string include = args.value("include", "");

    if (pattern.empty()) {
      return ToolResult::error("pattern is required");
    }
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto found = ctx.backend->grep(pattern, search_path, include);
    if (found.failed()) {
      return ToolResult::error(*found.error);
    }

    const auto &matches = *found.value;
    if (matches.empty()) {
      return ToolResult::success("No matches found for pattern: " + pattern);
    }

    std::ostringstream output;
    for (const auto &match : matches) {
      output << match.path << ":" << match.line << ": " << match.text << "\n";
    }

    std::string result = output.str();
    if (matches.size() >= backend::kMaxGrepMatches) {
      result += "\n... (results truncated, showing first " + std::to_string(backend::kMaxGrepMatches) + " matches)";
    }
    return ToolResult::with_title(result, std::to_string(matches.size()) + " matches");
  });
}

void register_builtins(ToolRegistry &registry) {
  registry.register_tool(std::make_shared<ReadFileTool>());
  registry.register_tool(std::make_shared<WriteFileTool>());
  registry.register_tool(std::make_shared<EditFileTool>());
  registry.register_tool(std::make_shared<LsTool>());
  registry.register_tool(std::make_shared<GlobTool>());
  registry.register_tool(std::make_shared<GrepTool>());
}

}  // namespace skillkit::tools
