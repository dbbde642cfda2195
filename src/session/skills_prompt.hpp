#pragma once

#include <string>
#include <vector>

#include "skill/metadata_cache.hpp"

namespace skillkit::session {

// Build the "Skills System" section appended to a turn's system prompt.
// Returns an empty string when there is nothing to list.
std::string build_skills_prompt(const std::vector<skill::PromptMetadata> &skills);

}  // namespace skillkit::session
