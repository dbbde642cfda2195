#include "core/config.hpp"

#include <pwd.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>

#include "core/error.hpp"

namespace skillkit {

namespace fs = std::filesystem;

// ============================================================================
// config_paths
// ============================================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME"); home && *home) {
    return home;
  }
  if (const passwd *pw = getpwuid(getuid()); pw && pw->pw_dir) {
    return pw->pw_dir;
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "skillkit";
}

fs::path data_dir() {
  return home_dir() / ".local" / "share" / "skillkit";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

std::vector<std::string> default_text_extensions() {
  return {".md",  ".txt", ".py",  ".js",  ".ts",  ".json", ".yaml", ".yml", ".toml", ".ini", ".cfg", ".conf", ".xml", ".html",
          ".css", ".sql", ".sh",  ".bat", ".ps1", ".env",  ".csv",  ".tsv", ".rst",  ".ipynb", ".vue", ".jsx", ".tsx"};
}

// ============================================================================
// Config
// ============================================================================

json Config::to_json() const {
  return json{{"save_dir", save_dir.string()},
              {"log_level", log_level},
              {"text_extensions", text_extensions},
              {"repository_file", repository_file}};
}

Config Config::from_json(const json &j) {
  Config config;
  if (j.contains("save_dir") && j["save_dir"].is_string()) {
    config.save_dir = j["save_dir"].get<std::string>();
  }
  config.log_level = j.value("log_level", config.log_level);
  if (j.contains("text_extensions") && j["text_extensions"].is_array()) {
    config.text_extensions = j["text_extensions"].get<std::vector<std::string>>();
  }
  config.repository_file = j.value("repository_file", config.repository_file);
  return config;
}

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IoFailure("Cannot open config file: " + path.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error &e) {
    throw ValidationError("Invalid config file " + path.string() + ": " + e.what());
  }
  return from_json(j);
}

Config Config::load_default() {
  Config config;
  auto path = config_paths::config_file();
  if (fs::exists(path)) {
    try {
      config = load(path);
    } catch (const SkillError &e) {
      spdlog::warn("Ignoring config file: {}", e.what());
    }
  }

  if (const char *save_dir = std::getenv("SKILLKIT_SAVE_DIR"); save_dir && *save_dir) {
    config.save_dir = save_dir;
  }
  if (const char *level = std::getenv("SKILLKIT_LOG_LEVEL"); level && *level) {
    config.log_level = level;
  }
  return config;
}

void Config::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw IoFailure("Cannot write config file: " + path.string());
  }
  file << to_json().dump(2);
}

void init_logging(const Config &config) {
  auto level = spdlog::level::from_str(config.log_level);
  if (level == spdlog::level::off && config.log_level != "off") {
    spdlog::warn("Unknown log level '{}', using info", config.log_level);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

}  // namespace skillkit
