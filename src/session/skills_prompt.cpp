#include "session/skills_prompt.hpp"

#include <sstream>

#include "skill/manifest.hpp"

namespace skillkit::session {

std::string build_skills_prompt(const std::vector<skill::PromptMetadata> &skills) {
  if (skills.empty()) return "";

  std::ostringstream ss;
  ss << "## Skills System\n\n"
     << "You have access to a skills library that provides specialized capabilities and domain knowledge.\n\n"
     << "**Skills Skills**: `" << skill::kSkillsRoutePrefix << "` (higher priority)\n\n"
     << "**Available Skills:**\n\n";

  for (const auto &s : skills) {
    std::string name = s.name.empty() ? s.slug : s.name;
    ss << "- **" << name << "**: " << s.description << "\n"
       << "  -> Read `" << s.path << "` for full instructions\n";
  }

  ss << "\n**How to Use Skills (Progressive Disclosure):**\n\n"
     << "1. **Recognize when a skill applies**: check whether the task matches a skill's description\n"
     << "2. **Read the skill's full instructions**: use `read_file` on the path shown above\n"
     << "3. **Follow the instructions**: SKILL.md lists the workflow, best practices and examples\n"
     << "4. **Access supporting files**: scripts, templates and references sit next to SKILL.md\n\n"
     << "Tools and integrations a skill depends on become available once its SKILL.md has been read.\n";
  return ss.str();
}

}  // namespace skillkit::session
