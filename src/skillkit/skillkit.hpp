#pragma once

// Core types
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Skill storage
#include "skill/archive.hpp"
#include "skill/content_store.hpp"
#include "skill/manifest.hpp"
#include "skill/metadata_cache.hpp"
#include "skill/names.hpp"
#include "skill/repository.hpp"
#include "skill/resolver.hpp"

// Routing backends
#include "backend/backend.hpp"
#include "backend/composite.hpp"
#include "backend/skills_backend.hpp"
#include "backend/state_backend.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

// Session hooks
#include "session/skill_session.hpp"
#include "session/turn.hpp"

namespace skillkit {

// Storage stack of one process: repository, cache and content store wired
// to the configured save dir
struct Runtime {
  Config config;
  std::unique_ptr<skill::JsonSkillRepository> repository;
  skill::MetadataCache cache;
  std::unique_ptr<skill::ContentStore> store;
};

// Initialize logging and register builtin tools
void init(const Config &config);

// Create the save dir, load the repository and warm the cache
std::unique_ptr<Runtime> open_runtime(const Config &config);

std::string version();

}  // namespace skillkit
