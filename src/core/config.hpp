#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace skillkit {

namespace config_paths {

// $HOME, falling back to the passwd entry
std::filesystem::path home_dir();

// ~/.config/skillkit
std::filesystem::path config_dir();

// ~/.local/share/skillkit
std::filesystem::path data_dir();

// ~/.config/skillkit/config.json
std::filesystem::path config_file();

}  // namespace config_paths

// Extensions that may be read and written as text inside a skill.
// SKILL.md is always allowed regardless of this list.
std::vector<std::string> default_text_extensions();

struct Config {
  // Skills live under save_dir/skills, the repository file under save_dir
  std::filesystem::path save_dir = config_paths::data_dir();
  std::string log_level = "info";
  std::vector<std::string> text_extensions = default_text_extensions();
  std::string repository_file = "skills.json";

  std::filesystem::path skills_root() const {
    return save_dir / "skills";
  }

  std::filesystem::path repository_path() const {
    return save_dir / repository_file;
  }

  json to_json() const;
  static Config from_json(const json &j);

  // Load from a JSON file; missing keys keep their defaults
  static Config load(const std::filesystem::path &path);

  // Load ~/.config/skillkit/config.json if present, then apply
  // SKILLKIT_SAVE_DIR / SKILLKIT_LOG_LEVEL overrides
  static Config load_default();

  void save(const std::filesystem::path &path) const;
};

// Apply the configured log level to spdlog
void init_logging(const Config &config);

}  // namespace skillkit
