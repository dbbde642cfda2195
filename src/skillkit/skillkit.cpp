#include "skillkit/skillkit.hpp"

#include <spdlog/spdlog.h>

namespace skillkit {

void init(const Config &config) {
  init_logging(config);
  ToolRegistry::instance().init_builtins();
}

std::unique_ptr<Runtime> open_runtime(const Config &config) {
  std::error_code ec;
  std::filesystem::create_directories(config.skills_root(), ec);
  if (ec) {
    throw IoFailure("Cannot create save dir " + config.save_dir.string() + ": " + ec.message());
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = config;
  runtime->repository = std::make_unique<skill::JsonSkillRepository>(config.repository_path());
  runtime->store = std::make_unique<skill::ContentStore>(config, *runtime->repository, runtime->cache);
  runtime->store->refresh_cache();

  spdlog::debug("Opened skill store at {}", config.save_dir.string());
  return runtime;
}

std::string version() {
  return "0.1.0";
}

}  // namespace skillkit
