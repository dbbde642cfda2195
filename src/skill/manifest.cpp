#include "skill/manifest.hpp"

#include <algorithm>
#include <sstream>

#include "core/error.hpp"
#include "core/types.hpp"

namespace skillkit::skill {

// ============================================================================
// Frontmatter splitting
// ============================================================================

namespace {

struct FrontmatterSpan {
  size_t body_start = 0;  // Offset of the body in the original content
  size_t fm_start = 0;    // Offset of the first frontmatter line
  size_t fm_end = 0;      // Offset of the "\n" before the closing ---
};

bool is_delimiter_line(const std::string &content, size_t pos, size_t *line_end) {
  if (content.compare(pos, 3, "---") != 0) return false;
  size_t i = pos + 3;
  while (i < content.size() && (content[i] == ' ' || content[i] == '\t' || content[i] == '\r')) i++;
  if (i < content.size() && content[i] != '\n') return false;
  *line_end = i;
  return true;
}

std::optional<FrontmatterSpan> find_frontmatter(const std::string &content) {
  size_t open_end = 0;
  if (!is_delimiter_line(content, 0, &open_end) || open_end >= content.size()) {
    return std::nullopt;
  }

  FrontmatterSpan span;
  span.fm_start = open_end + 1;

  size_t search = open_end;
  while (true) {
    size_t nl = content.find("\n---", search);
    if (nl == std::string::npos) return std::nullopt;

    size_t close_end = 0;
    if (is_delimiter_line(content, nl + 1, &close_end)) {
      span.fm_end = nl;
      span.body_start = (close_end < content.size()) ? close_end + 1 : content.size();
      return span;
    }
    search = nl + 1;
  }
}

std::string strip_quotes(const std::string &value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_indented(const std::string &s) {
  return !s.empty() && (s[0] == ' ' || s[0] == '\t');
}

// "[a, b, 'c']" -> {a, b, c}
std::vector<std::string> parse_inline_list(const std::string &value) {
  std::vector<std::string> items;
  std::string inner = value.substr(1, value.size() - 2);
  std::istringstream stream(inner);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = strip_quotes(trim(item));
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

size_t leading_blanks(const std::string &s) {
  size_t n = s.find_first_not_of(" \t");
  return n == std::string::npos ? s.size() : n;
}

bool is_block_indicator(const std::string &value) {
  return value == "|" || value == "|-" || value == "|+" || value == ">" || value == ">-" || value == ">+";
}

// Block scalar lines, already dedented; empty entries are blank lines.
// '|' keeps line breaks, '>' folds lines into spaces and blank lines into breaks.
std::string join_block(const std::vector<std::string> &lines, char style) {
  size_t end = lines.size();
  while (end > 0 && lines[end - 1].empty()) end--;

  std::string out;
  for (size_t i = 0; i < end; ++i) {
    if (style == '|') {
      if (i > 0) out += "\n";
    } else if (lines[i].empty()) {
      out += "\n";
      continue;
    } else if (i > 0 && !lines[i - 1].empty()) {
      out += " ";
    }
    out += lines[i];
  }
  return out;
}

struct Frontmatter {
  std::map<std::string, std::string> scalars;
  std::map<std::string, std::vector<std::string>> lists;
};

// Simple YAML-like parser for frontmatter:
//   key: value                scalar
//   key: [a, b]               inline list
//   key:                      block list
//     - a
//   key: |                    literal block, lines kept
//   key: >                    folded block, lines joined with space
//   indented non-list lines continue the previous scalar (joined with space)
Frontmatter parse_frontmatter(const std::string &yaml) {
  Frontmatter fm;
  std::istringstream stream(yaml);
  std::string line;
  std::string current_key;
  std::string current_value;
  std::vector<std::string> current_items;
  bool in_list = false;
  char block_style = 0;
  size_t block_indent = std::string::npos;

  auto save_current = [&]() {
    if (current_key.empty()) return;
    if (block_style) {
      fm.scalars[current_key] = join_block(current_items, block_style);
    } else if (in_list) {
      fm.lists[current_key] = current_items;
    } else if (current_value.size() >= 2 && current_value.front() == '[' && current_value.back() == ']') {
      fm.lists[current_key] = parse_inline_list(current_value);
    } else {
      fm.scalars[current_key] = strip_quotes(current_value);
    }
    current_key.clear();
    current_value.clear();
    current_items.clear();
    in_list = false;
    block_style = 0;
    block_indent = std::string::npos;
  };

  while (std::getline(stream, line)) {
    std::string trimmed = trim(line);

    if (block_style && (trimmed.empty() || is_indented(line))) {
      if (trimmed.empty()) {
        current_items.emplace_back();
        continue;
      }
      if (block_indent == std::string::npos) block_indent = leading_blanks(line);
      size_t cut = std::min(block_indent, leading_blanks(line));
      std::string text = line.substr(cut);
      text.erase(text.find_last_not_of(" \t\r") + 1);
      current_items.push_back(text);
      continue;
    }

    if (trimmed.empty() || trimmed[0] == '#') continue;

    if (is_indented(line) || trimmed[0] == '-') {
      if (current_key.empty()) continue;

      if (trimmed[0] == '-' && (in_list || current_value.empty())) {
        in_list = true;
        std::string item = strip_quotes(trim(trimmed.substr(1)));
        if (!item.empty()) current_items.push_back(item);
      } else if (!in_list) {
        if (!current_value.empty()) current_value += " ";
        current_value += trimmed;
      }
      continue;
    }

    save_current();

    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) continue;

    current_key = trim(line.substr(0, colon_pos));
    current_value = trim(line.substr(colon_pos + 1));
    if (is_block_indicator(current_value)) {
      block_style = current_value[0];
      current_value.clear();
    }
  }

  save_current();
  return fm;
}

std::vector<std::string> list_or_scalar(const Frontmatter &fm, const std::string &key, bool *present) {
  if (auto it = fm.lists.find(key); it != fm.lists.end()) {
    *present = true;
    return it->second;
  }
  if (auto it = fm.scalars.find(key); it != fm.scalars.end()) {
    *present = true;
    // A single scalar is a one-element list; an empty value is an empty list
    if (it->second.empty()) return {};
    return {it->second};
  }
  return {};
}

}  // namespace

// ============================================================================
// SKILL.md parser
// ============================================================================

ParseResult parse_manifest(const std::string &content) {
  auto span = find_frontmatter(content);
  if (!span) {
    return {std::nullopt, "SKILL.md is missing a valid frontmatter block (--- ... ---)"};
  }

  std::string yaml = (span->fm_end > span->fm_start) ? content.substr(span->fm_start, span->fm_end - span->fm_start) : "";
  auto fm = parse_frontmatter(yaml);

  Manifest manifest;
  manifest.fields = fm.scalars;
  manifest.body = content.substr(span->body_start);

  auto name_it = fm.scalars.find("name");
  manifest.name = (name_it != fm.scalars.end()) ? trim(name_it->second) : "";
  if (manifest.name.empty()) {
    return {std::nullopt, "SKILL.md frontmatter is missing 'name'"};
  }
  if (manifest.name.size() > kMaxSlugLength) {
    return {std::nullopt, "Skill name must not exceed " + std::to_string(kMaxSlugLength) + " characters"};
  }
  if (!is_valid_skill_slug(manifest.name)) {
    return {std::nullopt, "Skill name '" + manifest.name + "' must be lowercase letters, digits and single hyphens"};
  }

  auto desc_it = fm.scalars.find("description");
  manifest.description = (desc_it != fm.scalars.end()) ? trim(desc_it->second) : "";
  if (manifest.description.empty()) {
    return {std::nullopt, "SKILL.md frontmatter is missing 'description'"};
  }

  bool present = false;
  manifest.dependencies.tools = list_or_scalar(fm, kToolDependenciesKey, &present);
  manifest.declares_dependencies |= present;
  present = false;
  manifest.dependencies.integrations = list_or_scalar(fm, kIntegrationDependenciesKey, &present);
  manifest.declares_dependencies |= present;
  present = false;
  manifest.dependencies.skills = list_or_scalar(fm, kSkillDependenciesKey, &present);
  manifest.declares_dependencies |= present;

  return {std::move(manifest), std::nullopt};
}

Manifest parse_manifest_or_throw(const std::string &content) {
  auto result = parse_manifest(content);
  if (!result.ok()) {
    throw ValidationError(result.error.value_or("Invalid SKILL.md"));
  }
  return std::move(*result.manifest);
}

std::string rewrite_manifest_name(const std::string &content, const std::string &new_name) {
  auto span = find_frontmatter(content);
  if (!span) {
    throw ValidationError("SKILL.md is missing a valid frontmatter block (--- ... ---)");
  }

  size_t pos = span->fm_start;
  while (pos < span->fm_end) {
    size_t eol = content.find('\n', pos);
    if (eol == std::string::npos || eol > span->fm_end) eol = span->fm_end;

    std::string line = content.substr(pos, eol - pos);
    if (!is_indented(line)) {
      auto colon_pos = line.find(':');
      if (colon_pos != std::string::npos && trim(line.substr(0, colon_pos)) == "name") {
        std::string cr = (!line.empty() && line.back() == '\r') ? "\r" : "";
        return content.substr(0, pos) + "name: " + new_name + cr + content.substr(eol);
      }
    }
    pos = eol + 1;
  }

  throw ValidationError("SKILL.md frontmatter is missing 'name'");
}

std::string manifest_virtual_path(const std::string &slug) {
  return std::string(kSkillsRoutePrefix) + slug + "/" + kManifestFileName;
}

}  // namespace skillkit::skill
