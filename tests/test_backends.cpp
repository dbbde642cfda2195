#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>

#include "backend/composite.hpp"
#include "backend/glob.hpp"
#include "backend/skills_backend.hpp"
#include "backend/state_backend.hpp"
#include "test_util.hpp"

using namespace skillkit;
using namespace skillkit::backend;
using skillkit::testing::make_zip;
using skillkit::testing::skill_md;
using skillkit::testing::TempDir;

namespace fs = std::filesystem;

namespace {

std::vector<std::string> paths_of(const std::vector<FileInfo> &entries) {
  std::vector<std::string> paths;
  for (const auto &e : entries) paths.push_back(e.path);
  std::sort(paths.begin(), paths.end());
  return paths;
}

bool contains(const std::vector<std::string> &items, const std::string &item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

}  // namespace

// ============================================================================
// Path and glob helpers
// ============================================================================

TEST(BackendHelpersTest, NormalizeVirtualPath) {
  EXPECT_EQ(normalize_virtual_path(""), "/");
  EXPECT_EQ(normalize_virtual_path("/"), "/");
  EXPECT_EQ(normalize_virtual_path("a//b/"), "/a/b");
  EXPECT_EQ(normalize_virtual_path("/skills/./demo"), "/skills/demo");
}

TEST(BackendHelpersTest, IsUnder) {
  EXPECT_TRUE(is_under("/a/b", "/"));
  EXPECT_TRUE(is_under("/a/b", "/a"));
  EXPECT_TRUE(is_under("/a", "/a"));
  EXPECT_FALSE(is_under("/ab", "/a"));
  EXPECT_FALSE(is_under("/a", "/a/b"));
}

TEST(BackendHelpersTest, ReplaceText) {
  auto once = replace_text("hello world", "world", "there", false);
  ASSERT_TRUE(once.ok());
  EXPECT_EQ(once.value->first, "hello there");
  EXPECT_EQ(once.value->second, 1);

  auto twice = replace_text("a-a-a", "a", "b", false);
  ASSERT_TRUE(twice.failed());
  EXPECT_NE(twice.error->find("found 3 times"), std::string::npos);

  auto all = replace_text("a-a-a", "a", "b", true);
  ASSERT_TRUE(all.ok());
  EXPECT_EQ(all.value->first, "b-b-b");
  EXPECT_EQ(all.value->second, 3);

  EXPECT_EQ(*replace_text("abc", "", "x", false).error, "old_string is required");
  EXPECT_EQ(*replace_text("abc", "zzz", "x", false).error, "old_string not found in content");
}

TEST(GlobTest, ExpandBraces) {
  EXPECT_EQ(expand_braces("*.md"), (std::vector<std::string>{"*.md"}));
  EXPECT_EQ(expand_braces("*.{md,txt}"), (std::vector<std::string>{"*.md", "*.txt"}));
  EXPECT_EQ(expand_braces("{a,b{c,d}}"), (std::vector<std::string>{"a", "bc", "bd"}));
  // 未闭合的花括号原样保留
  EXPECT_EQ(expand_braces("{a,b"), (std::vector<std::string>{"{a,b"}));
}

TEST(GlobTest, MatchSegment) {
  EXPECT_TRUE(match_segment("*.md", "SKILL.md"));
  EXPECT_FALSE(match_segment("*.md", "SKILL.txt"));
  EXPECT_TRUE(match_segment("file?.py", "file1.py"));
  EXPECT_TRUE(match_segment("[a-c]x", "bx"));
  EXPECT_FALSE(match_segment("[!a-c]x", "bx"));
  EXPECT_TRUE(match_segment("[^a-c]x", "dx"));
}

TEST(GlobTest, MatchGlobAcrossSegments) {
  EXPECT_TRUE(match_glob("**/*.md", "a/b/c.md"));
  EXPECT_TRUE(match_glob("**/*.md", "c.md"));
  EXPECT_TRUE(match_glob("docs/*.md", "docs/guide.md"));
  EXPECT_FALSE(match_glob("docs/*.md", "docs/deep/guide.md"));
  EXPECT_TRUE(match_glob("docs/**", "docs/deep/guide.md"));
}

TEST(GlobTest, GlobMatchesFileNameWithoutSlash) {
  EXPECT_TRUE(glob_matches("*.md", "docs/guide.md"));
  EXPECT_TRUE(glob_matches("*.{py,sh}", "scripts/run.sh"));
  EXPECT_FALSE(glob_matches("docs/*.md", "guide.md"));
  EXPECT_TRUE(glob_matches("docs/*.md", "docs/guide.md"));
}

// ============================================================================
// StateBackend
// ============================================================================

TEST(StateBackendTest, WriteReadAndList) {
  StateBackend state;
  ASSERT_TRUE(state.write("/notes.txt", "hello").ok());
  ASSERT_TRUE(state.write("work/a/b.txt", "deep").ok());

  EXPECT_EQ(*state.read("/notes.txt").value, "hello");
  EXPECT_EQ(*state.read("/work/a/b.txt").value, "deep");
  EXPECT_TRUE(state.read("/missing.txt").failed());

  auto root = state.ls("/");
  ASSERT_TRUE(root.ok());
  EXPECT_EQ(paths_of(*root.value), (std::vector<std::string>{"/notes.txt", "/work"}));
  for (const auto &entry : *root.value) {
    EXPECT_EQ(entry.is_dir, entry.path == "/work");
  }

  auto sub = state.ls("/work");
  ASSERT_TRUE(sub.ok());
  EXPECT_EQ(paths_of(*sub.value), (std::vector<std::string>{"/work/a"}));
}

TEST(StateBackendTest, ListErrors) {
  StateBackend state;
  EXPECT_TRUE(state.ls("/").ok());
  EXPECT_TRUE(state.ls("/").value->empty());
  EXPECT_TRUE(state.ls("/nothing").failed());

  state.write("/file.txt", "x");
  auto on_file = state.ls("/file.txt");
  ASSERT_TRUE(on_file.failed());
  EXPECT_NE(on_file.error->find("Path is a file"), std::string::npos);
}

TEST(StateBackendTest, WriteToRootFails) {
  StateBackend state;
  EXPECT_TRUE(state.write("/", "x").failed());
  EXPECT_TRUE(state.files().empty());
}

TEST(StateBackendTest, Edit) {
  StateBackend state;
  state.write("/a.txt", "one two one");

  EXPECT_TRUE(state.edit("/a.txt", "one", "1", false).failed());
  auto all = state.edit("/a.txt", "one", "1", true);
  ASSERT_TRUE(all.ok());
  EXPECT_EQ(*all.value, 2);
  EXPECT_EQ(*state.read("/a.txt").value, "1 two 1");

  EXPECT_TRUE(state.edit("/missing.txt", "a", "b", false).failed());
}

TEST(StateBackendTest, GlobAndGrep) {
  StateBackend state;
  state.write("/src/main.py", "import os\nprint('needle')\n");
  state.write("/src/util.sh", "echo needle\n");
  state.write("/README.md", "no match here\n");

  auto py = state.glob("*.py", "/");
  ASSERT_TRUE(py.ok());
  EXPECT_EQ(*py.value, (std::vector<std::string>{"/src/main.py"}));

  auto under = state.glob("**", "/src");
  ASSERT_TRUE(under.ok());
  EXPECT_EQ(under.value->size(), 2u);

  auto hits = state.grep("needle", "/", "");
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value->size(), 2u);
  EXPECT_EQ((*hits.value)[0].path, "/src/main.py");
  EXPECT_EQ((*hits.value)[0].line, 2);

  auto filtered = state.grep("needle", "/", "*.sh");
  ASSERT_TRUE(filtered.ok());
  ASSERT_EQ(filtered.value->size(), 1u);
  EXPECT_EQ((*filtered.value)[0].path, "/src/util.sh");

  EXPECT_TRUE(state.grep("[unclosed", "/", "").failed());
}

// ============================================================================
// SkillsReadonlyBackend / CompositeBackend
// ============================================================================

class SkillsBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.import_zip("alpha.zip", make_zip(tmp_.path(), {{"alpha/SKILL.md", skill_md("alpha", "Alpha skill")},
                                                          {"alpha/docs/guide.md", "find the needle\n"},
                                                          {"alpha/logo.png", "\x89PNG"}}));
    store_.import_zip("beta.zip", make_zip(tmp_.path(), {{"beta/SKILL.md", skill_md("beta", "Beta skill")},
                                                         {"beta/secret.md", "needle in beta\n"}}));
  }

  std::shared_ptr<SkillsReadonlyBackend> visible(std::vector<std::string> slugs) {
    return std::make_shared<SkillsReadonlyBackend>(store_, std::move(slugs));
  }

  TempDir tmp_;
  skill::InMemorySkillRepository repo_;
  skill::MetadataCache cache_;
  skill::ContentStore store_{tmp_.path() / "save", repo_, cache_};
};

TEST_F(SkillsBackendTest, ListsOnlyVisibleSkills) {
  auto skills = visible({"alpha"});

  auto root = skills->ls("/");
  ASSERT_TRUE(root.ok());
  EXPECT_EQ(paths_of(*root.value), (std::vector<std::string>{"/alpha"}));

  auto alpha = skills->ls("/alpha");
  ASSERT_TRUE(alpha.ok());
  EXPECT_EQ(paths_of(*alpha.value), (std::vector<std::string>{"/alpha/SKILL.md", "/alpha/docs", "/alpha/logo.png"}));

  // 不可见的技能与不存在的技能表现一致
  auto beta = skills->ls("/beta");
  ASSERT_TRUE(beta.failed());
  EXPECT_NE(beta.error->find("Path not found"), std::string::npos);
  EXPECT_TRUE(skills->ls("/ghost").failed());
}

TEST_F(SkillsBackendTest, ReadVisibleTextOnly) {
  auto skills = visible({"alpha"});

  auto manifest = skills->read("/alpha/SKILL.md");
  ASSERT_TRUE(manifest.ok());
  EXPECT_NE(manifest.value->find("name: alpha"), std::string::npos);

  EXPECT_TRUE(skills->read("/beta/SKILL.md").failed());
  EXPECT_TRUE(skills->read("/alpha/../beta/SKILL.md").failed());
  EXPECT_TRUE(skills->read("/alpha/logo.png").failed());
  EXPECT_TRUE(skills->read("/alpha/docs").failed());
  EXPECT_TRUE(skills->read("/alpha/missing.md").failed());
}

TEST_F(SkillsBackendTest, RejectsWrites) {
  auto skills = visible({"alpha"});

  auto write = skills->write("/alpha/SKILL.md", "overwritten");
  ASSERT_TRUE(write.failed());
  EXPECT_NE(write.error->find("Skills are read-only"), std::string::npos);

  auto edit = skills->edit("/alpha/SKILL.md", "alpha", "omega", true);
  ASSERT_TRUE(edit.failed());
  EXPECT_NE(edit.error->find("Skills are read-only"), std::string::npos);

  EXPECT_NE(skills->read("/alpha/SKILL.md").value->find("name: alpha"), std::string::npos);
}

TEST_F(SkillsBackendTest, GlobAndGrepStayInsideVisibleSkills) {
  auto skills = visible({"alpha"});

  auto md = skills->glob("*.md", "/");
  ASSERT_TRUE(md.ok());
  EXPECT_EQ(*md.value, (std::vector<std::string>{"/alpha/SKILL.md", "/alpha/docs/guide.md"}));

  auto hits = skills->grep("needle", "/", "");
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value->size(), 1u);
  EXPECT_EQ((*hits.value)[0].path, "/alpha/docs/guide.md");

  EXPECT_TRUE(skills->grep("needle", "/beta", "").failed());
}

TEST_F(SkillsBackendTest, SymlinkOutsideSkillIsIgnored) {
  tmp_.create_file("outside/leak.md", "needle outside\n");
  fs::create_symlink(tmp_.path() / "outside" / "leak.md", store_.slug_dir("alpha") / "leak.md");

  auto skills = visible({"alpha"});
  EXPECT_TRUE(skills->read("/alpha/leak.md").failed());

  auto hits = skills->grep("needle", "/alpha", "");
  ASSERT_TRUE(hits.ok());
  for (const auto &m : *hits.value) {
    EXPECT_NE(m.path, "/alpha/leak.md");
  }

  auto md = skills->glob("*.md", "/alpha");
  ASSERT_TRUE(md.ok());
  EXPECT_FALSE(contains(*md.value, "/alpha/leak.md"));
}

TEST_F(SkillsBackendTest, CompositeRoutesByPrefix) {
  auto state = std::make_shared<StateBackend>();
  CompositeBackend composite(state);
  composite.add_route("/skills/", visible({"alpha"}));

  ASSERT_TRUE(composite.write("/notes.txt", "scratch").ok());
  EXPECT_EQ(state->files().count("/notes.txt"), 1u);

  auto manifest = composite.read("/skills/alpha/SKILL.md");
  ASSERT_TRUE(manifest.ok());
  EXPECT_NE(manifest.value->find("Alpha skill"), std::string::npos);

  EXPECT_TRUE(composite.write("/skills/alpha/SKILL.md", "x").failed());
  EXPECT_TRUE(composite.edit("/skills/alpha/SKILL.md", "Alpha", "Omega", false).failed());
  EXPECT_EQ(state->files().size(), 1u);

  auto root = composite.ls("/");
  ASSERT_TRUE(root.ok());
  EXPECT_EQ(paths_of(*root.value), (std::vector<std::string>{"/notes.txt", "/skills"}));

  auto skills_root = composite.ls("/skills");
  ASSERT_TRUE(skills_root.ok());
  EXPECT_EQ(paths_of(*skills_root.value), (std::vector<std::string>{"/skills/alpha"}));

  auto md = composite.glob("*.md", "/skills");
  ASSERT_TRUE(md.ok());
  EXPECT_EQ(*md.value, (std::vector<std::string>{"/skills/alpha/SKILL.md", "/skills/alpha/docs/guide.md"}));

  auto hits = composite.grep("needle", "/skills/alpha", "*.md");
  ASSERT_TRUE(hits.ok());
  ASSERT_EQ(hits.value->size(), 1u);
  EXPECT_EQ((*hits.value)[0].path, "/skills/alpha/docs/guide.md");
}

TEST(CompositeBackendTest, LongestPrefixWins) {
  auto fallback = std::make_shared<StateBackend>();
  auto outer = std::make_shared<StateBackend>();
  auto inner = std::make_shared<StateBackend>();

  CompositeBackend composite(fallback);
  composite.add_route("/mnt", outer);
  composite.add_route("/mnt/special/", inner);

  composite.write("/mnt/special/a.txt", "inner");
  composite.write("/mnt/b.txt", "outer");
  composite.write("/mntx/c.txt", "fallback");

  EXPECT_EQ(inner->files().count("/a.txt"), 1u);
  EXPECT_EQ(outer->files().count("/b.txt"), 1u);
  EXPECT_EQ(fallback->files().count("/mntx/c.txt"), 1u);

  auto found = composite.glob("*.txt", "/mnt/special");
  ASSERT_TRUE(found.ok());
  EXPECT_EQ(*found.value, (std::vector<std::string>{"/mnt/special/a.txt"}));
}
