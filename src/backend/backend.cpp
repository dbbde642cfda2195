#include "backend/backend.hpp"

#include <sstream>

namespace skillkit::backend {

std::string normalize_virtual_path(const std::string &path) {
  std::istringstream iss(path);
  std::string seg;
  std::string result;
  while (std::getline(iss, seg, '/')) {
    if (seg.empty() || seg == ".") continue;
    result += "/" + seg;
  }
  return result.empty() ? "/" : result;
}

bool is_under(const std::string &path, const std::string &dir) {
  if (dir == "/") return true;
  if (path == dir) return true;
  return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

Result<std::pair<std::string, int>> replace_text(const std::string &content, const std::string &old_str, const std::string &new_str, bool replace_all) {
  using R = Result<std::pair<std::string, int>>;

  if (old_str.empty()) {
    return R::failure("old_string is required");
  }

  int count = 0;
  size_t pos = 0;
  while ((pos = content.find(old_str, pos)) != std::string::npos) {
    count++;
    pos += old_str.length();
  }

  if (count == 0) {
    return R::failure("old_string not found in content");
  }
  if (count > 1 && !replace_all) {
    return R::failure("old_string found " + std::to_string(count) + " times. " +
                      "Use replace_all=true to replace all occurrences, or provide more context to make it unique.");
  }

  std::string result;
  pos = 0;
  int replaced = 0;
  while (true) {
    size_t found = content.find(old_str, pos);
    if (found == std::string::npos || (replaced > 0 && !replace_all)) {
      result += content.substr(pos);
      break;
    }
    result += content.substr(pos, found - pos);
    result += new_str;
    pos = found + old_str.length();
    replaced++;
  }

  return R::success({std::move(result), replaced});
}

void grep_content(const std::string &path, const std::string &content, const std::regex &re, std::vector<GrepMatch> &out) {
  std::istringstream iss(content);
  std::string line;
  int line_num = 0;
  while (out.size() < kMaxGrepMatches && std::getline(iss, line)) {
    line_num++;
    if (std::regex_search(line, re)) {
      out.push_back({path, line_num, line});
    }
  }
}

}  // namespace skillkit::backend
