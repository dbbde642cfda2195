#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "skill/names.hpp"

namespace skillkit::skill {

inline constexpr const char *kManifestFileName = "SKILL.md";

// Agent-visible prefix under which skill directories are exposed
inline constexpr const char *kSkillsRoutePrefix = "/skills/";

// Frontmatter keys holding dependency lists
inline constexpr const char *kToolDependenciesKey = "tool_dependencies";
inline constexpr const char *kIntegrationDependenciesKey = "integration_dependencies";
inline constexpr const char *kSkillDependenciesKey = "skill_dependencies";

// Parsed SKILL.md representation
struct Manifest {
  std::string name;                           // Required: valid slug
  std::string description;                    // Required: non-empty
  std::string body;                           // Markdown content after frontmatter
  std::map<std::string, std::string> fields;  // All scalar frontmatter fields
  DependencyLists dependencies;               // Raw, validated later
  bool declares_dependencies = false;         // Any dependency key present
};

// Result of parsing a SKILL.md document
struct ParseResult {
  std::optional<Manifest> manifest;
  std::optional<std::string> error;

  bool ok() const {
    return manifest.has_value();
  }
};

// Parse SKILL.md content. The document must start with a "---" line and
// the frontmatter must be closed by another "---" line.
ParseResult parse_manifest(const std::string &content);

// Same as parse_manifest, throwing ValidationError on failure
Manifest parse_manifest_or_throw(const std::string &content);

// Replace the top-level `name:` value inside the frontmatter, leaving
// everything else byte-for-byte intact
std::string rewrite_manifest_name(const std::string &content, const std::string &new_name);

// "/skills/<slug>/SKILL.md"
std::string manifest_virtual_path(const std::string &slug);

}  // namespace skillkit::skill
