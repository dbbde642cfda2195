#include <iomanip>
#include <sstream>

#include "backend/backend.hpp"
#include "builtins.hpp"

namespace skillkit::tools {

// ============================================================================
// ReadFileTool
// ============================================================================

ReadFileTool::ReadFileTool() : SimpleTool(kReadFileToolName, "Reads a file from the session filesystem. Returns the file content with line numbers.") {}

std::vector<ParameterSchema> ReadFileTool::parameters() const {
  return {{"file_path", "string", "The absolute path to the file to read", true, std::nullopt, std::nullopt},
          {"offset", "number", "The line number to start reading from (0-based)", false, json(0), std::nullopt},
          {"limit", "number", "The number of lines to read (defaults to 2000)", false, json(2000), std::nullopt}};
}

std::future<ToolResult> ReadFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string file_path = args.value("file_path", "");
    int offset = args.value("offset", 0);
    int limit = args.value("limit", 2000);

    if (file_path.empty()) {
      return ToolResult::error("file_path is required");
    }
    if (!ctx.backend) {
      return ToolResult::error("No filesystem backend available");
    }

    auto content = ctx.backend->read(file_path);
    if (content.failed()) {
      return ToolResult::error(*content.error);
    }

    std::istringstream file(*content.value);
    std::ostringstream output;
    std::string line;
    int line_num = 0;
    int lines_read = 0;
    bool has_more = false;

    while (std::getline(file, line)) {
      line_num++;

      if (line_num <= offset) continue;
      if (lines_read >= limit) {
        has_more = true;
        break;
      }

      // Same layout as cat -n
      output << std::setw(5) << line_num << "\t" << line << "\n";
      lines_read++;
    }

    std::string result = output.str();
    if (line_num == 0) {
      result = "(empty file)";
    }
    if (has_more) {
      result += "\n(File has more lines. Use 'offset' parameter to read beyond line " + std::to_string(offset + limit) + ")";
    }

    std::string title = backend::normalize_virtual_path(file_path);
    return ToolResult::with_title(result, title.substr(title.rfind('/') + 1));
  });
}

}  // namespace skillkit::tools
