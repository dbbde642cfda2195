#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace skillkit::skill {

inline constexpr size_t kMaxSlugLength = 128;

// Slug rules:
//   - 1-128 characters
//   - lowercase alphanumeric with single hyphen separators
//   - Must match: ^[a-z0-9]+(-[a-z0-9]+)*$
bool is_valid_skill_slug(const std::string &slug);

// Tool and integration names: 1-128 chars of [A-Za-z0-9_.:-]
bool is_valid_dependency_name(const std::string &name);

// Strongly typed name. Only constructible through the parse_* helpers
// below, so a handle always holds a validated value.
template <typename Tag>
class Name {
 public:
  const std::string &str() const {
    return value_;
  }

  bool operator==(const Name &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const Name &other) const {
    return value_ != other.value_;
  }
  bool operator<(const Name &other) const {
    return value_ < other.value_;
  }

 private:
  explicit Name(std::string value) : value_(std::move(value)) {}

  template <typename T>
  friend std::optional<Name<T>> make_name(const std::string &raw);

  std::string value_;
};

struct ToolTag {};
struct IntegrationTag {};
struct SkillTag {};

using ToolName = Name<ToolTag>;
using IntegrationName = Name<IntegrationTag>;
using SkillRef = Name<SkillTag>;

template <typename Tag>
std::optional<Name<Tag>> make_name(const std::string &raw) {
  if constexpr (std::is_same_v<Tag, SkillTag>) {
    if (!is_valid_skill_slug(raw)) return std::nullopt;
  } else {
    if (!is_valid_dependency_name(raw)) return std::nullopt;
  }
  return Name<Tag>(raw);
}

inline std::optional<ToolName> parse_tool_name(const std::string &raw) {
  return make_name<ToolTag>(raw);
}

inline std::optional<IntegrationName> parse_integration_name(const std::string &raw) {
  return make_name<IntegrationTag>(raw);
}

inline std::optional<SkillRef> parse_skill_ref(const std::string &raw) {
  return make_name<SkillTag>(raw);
}

// Raw dependency strings as they appear in a manifest or a stored record
struct DependencyLists {
  std::vector<std::string> tools;
  std::vector<std::string> integrations;
  std::vector<std::string> skills;

  bool empty() const {
    return tools.empty() && integrations.empty() && skills.empty();
  }
};

// Validated dependency declaration of one skill
struct DependencyDeclaration {
  std::vector<ToolName> tools;
  std::vector<IntegrationName> integrations;
  std::vector<SkillRef> skills;

  bool empty() const {
    return tools.empty() && integrations.empty() && skills.empty();
  }

  DependencyLists to_lists() const;
};

// Validate raw strings into handles. Invalid entries and duplicates are
// dropped (and logged); `owner` is only used for the log message.
DependencyDeclaration parse_dependencies(const DependencyLists &lists, const std::string &owner = "");

// Like parse_dependencies, but an invalid entry is a ValidationError
DependencyDeclaration parse_dependencies_strict(const DependencyLists &lists);

}  // namespace skillkit::skill
