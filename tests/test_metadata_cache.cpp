#include <gtest/gtest.h>

#include "skill/metadata_cache.hpp"
#include "skill/repository.hpp"

using namespace skillkit;
using namespace skillkit::skill;

namespace {

SkillRecord record(const std::string &slug, const std::string &description, DependencyLists deps = {}) {
  SkillRecord r;
  r.slug = slug;
  r.name = slug;
  r.description = description;
  r.dir_path = "skills/" + slug;
  r.dependencies = std::move(deps);
  return r;
}

}  // namespace

TEST(MetadataCacheTest, StartsEmpty) {
  MetadataCache cache;
  EXPECT_FALSE(cache.contains("demo"));
  EXPECT_TRUE(cache.options().empty());
  EXPECT_EQ(cache.catalog()->size(), 0u);
}

TEST(MetadataCacheTest, RebuildFromRepository) {
  InMemorySkillRepository repo;
  repo.create(record("alpha", "Alpha skill"));
  repo.create(record("beta", "Beta skill"));

  MetadataCache cache;
  cache.rebuild_from(repo);

  EXPECT_TRUE(cache.contains("alpha"));
  EXPECT_TRUE(cache.contains("beta"));
  EXPECT_EQ(cache.options().size(), 2u);

  auto meta = cache.catalog()->prompt_metadata("alpha");
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->name, "alpha");
  EXPECT_EQ(meta->description, "Alpha skill");
  EXPECT_EQ(meta->path, "/skills/alpha/SKILL.md");
}

TEST(MetadataCacheTest, DependenciesAreValidated) {
  DependencyLists deps;
  deps.tools = {"web_search", "not valid"};
  deps.skills = {"beta"};

  MetadataCache cache;
  cache.rebuild({record("alpha", "a", deps)});

  auto decl = cache.catalog()->dependencies("alpha");
  ASSERT_TRUE(decl.has_value());
  ASSERT_EQ(decl->tools.size(), 1u);
  EXPECT_EQ(decl->tools[0].str(), "web_search");
  ASSERT_EQ(decl->skills.size(), 1u);
  EXPECT_EQ(decl->skills[0].str(), "beta");
}

TEST(MetadataCacheTest, UnknownSlugHasNoMetadata) {
  MetadataCache cache;
  cache.rebuild({record("alpha", "a")});

  auto catalog = cache.catalog();
  EXPECT_FALSE(catalog->prompt_metadata("beta").has_value());
  EXPECT_FALSE(catalog->dependencies("beta").has_value());
}

TEST(MetadataCacheTest, RebuildDoesNotChangeHeldSnapshot) {
  MetadataCache cache;
  cache.rebuild({record("alpha", "a")});

  auto held = cache.catalog();
  cache.rebuild({record("beta", "b")});

  // 已取出的快照保持不变，新快照反映重建结果
  EXPECT_TRUE(held->contains("alpha"));
  EXPECT_FALSE(held->contains("beta"));
  EXPECT_FALSE(cache.contains("alpha"));
  EXPECT_TRUE(cache.contains("beta"));
}
