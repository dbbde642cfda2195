#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "backend/state_backend.hpp"
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

using namespace skillkit;
using namespace skillkit::tools;

// Helper: create a ToolContext over a fresh in-memory backend
static ToolContext make_context(std::shared_ptr<backend::StateBackend> state) {
  ToolContext ctx;
  ctx.session_id = "test-session";
  ctx.backend = std::move(state);
  return ctx;
}

class BuiltinToolTest : public ::testing::Test {
 protected:
  std::shared_ptr<backend::StateBackend> state_ = std::make_shared<backend::StateBackend>();
  ToolContext ctx_ = make_context(state_);
};

// ============================================================================
// ReadFileTool
// ============================================================================

class ReadFileToolTest : public BuiltinToolTest {
 protected:
  ReadFileTool tool_;
};

TEST_F(ReadFileToolTest, ReadFile) {
  state_->write("/test.txt", "line1\nline2\nline3\n");

  auto result = tool_.execute({{"file_path", "/test.txt"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("    1\tline1"), std::string::npos);
  EXPECT_NE(result.output.find("    3\tline3"), std::string::npos);
  EXPECT_EQ(result.title, "test.txt");
}

TEST_F(ReadFileToolTest, ReadWithOffset) {
  state_->write("/lines.txt", "aaa\nbbb\nccc\nddd\neee\n");

  auto result = tool_.execute({{"file_path", "/lines.txt"}, {"offset", 2}, {"limit", 2}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("ccc"), std::string::npos);
  EXPECT_NE(result.output.find("ddd"), std::string::npos);
  // offset 之前和 limit 之后的行不应出现
  EXPECT_EQ(result.output.find("bbb"), std::string::npos);
  EXPECT_EQ(result.output.find("eee"), std::string::npos);
  EXPECT_NE(result.output.find("beyond line 4"), std::string::npos);
}

TEST_F(ReadFileToolTest, ReadEmptyFile) {
  state_->write("/empty.txt", "");

  auto result = tool_.execute({{"file_path", "/empty.txt"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "(empty file)");
}

TEST_F(ReadFileToolTest, ReadNonexistentFile) {
  auto result = tool_.execute({{"file_path", "/nope.txt"}}, ctx_).get();

  EXPECT_TRUE(result.is_error);
  EXPECT_NE(result.output.find("not found"), std::string::npos);
}

TEST_F(ReadFileToolTest, MissingArgumentAndBackend) {
  auto missing = tool_.execute(json::object(), ctx_).get();
  EXPECT_TRUE(missing.is_error);
  EXPECT_EQ(missing.output, "file_path is required");

  ToolContext bare;
  auto no_backend = tool_.execute({{"file_path", "/test.txt"}}, bare).get();
  EXPECT_TRUE(no_backend.is_error);
  EXPECT_EQ(no_backend.output, "No filesystem backend available");
}

// ============================================================================
// WriteFileTool / EditFileTool
// ============================================================================

class WriteFileToolTest : public BuiltinToolTest {
 protected:
  WriteFileTool tool_;
};

TEST_F(WriteFileToolTest, WriteNewFile) {
  auto result = tool_.execute({{"file_path", "/out/new.txt"}, {"content", "hello"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("5 bytes"), std::string::npos);
  EXPECT_EQ(*state_->read("/out/new.txt").value, "hello");
}

TEST_F(WriteFileToolTest, OverwriteFile) {
  state_->write("/a.txt", "old");

  auto result = tool_.execute({{"file_path", "/a.txt"}, {"content", "new"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(*state_->read("/a.txt").value, "new");
}

TEST_F(WriteFileToolTest, BackendFailureIsReported) {
  auto result = tool_.execute({{"file_path", "/"}, {"content", "x"}}, ctx_).get();

  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.title, "Error");
}

class EditFileToolTest : public BuiltinToolTest {
 protected:
  EditFileTool tool_;
};

TEST_F(EditFileToolTest, SearchReplace) {
  state_->write("/code.py", "x = 1\ny = 2\n");

  auto result = tool_.execute({{"file_path", "/code.py"}, {"old_string", "y = 2"}, {"new_string", "y = 3"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(*state_->read("/code.py").value, "x = 1\ny = 3\n");
}

TEST_F(EditFileToolTest, AmbiguousMatchNeedsReplaceAll) {
  state_->write("/dup.txt", "foo foo");

  auto ambiguous = tool_.execute({{"file_path", "/dup.txt"}, {"old_string", "foo"}, {"new_string", "bar"}}, ctx_).get();
  EXPECT_TRUE(ambiguous.is_error);
  EXPECT_NE(ambiguous.output.find("replace_all"), std::string::npos);

  auto all = tool_.execute({{"file_path", "/dup.txt"}, {"old_string", "foo"}, {"new_string", "bar"}, {"replace_all", true}}, ctx_).get();
  EXPECT_FALSE(all.is_error);
  EXPECT_NE(all.output.find("Replaced 2"), std::string::npos);
  EXPECT_EQ(*state_->read("/dup.txt").value, "bar bar");
}

TEST_F(EditFileToolTest, OldStringNotFound) {
  state_->write("/a.txt", "content");

  auto result = tool_.execute({{"file_path", "/a.txt"}, {"old_string", "missing"}, {"new_string", "x"}}, ctx_).get();

  EXPECT_TRUE(result.is_error);
  EXPECT_NE(result.output.find("not found"), std::string::npos);
}

// ============================================================================
// LsTool / GlobTool / GrepTool
// ============================================================================

class SearchToolTest : public BuiltinToolTest {
 protected:
  void SetUp() override {
    state_->write("/src/main.cpp", "int main() { return 0; }\n");
    state_->write("/src/util.hpp", "// TODO: helper\n");
    state_->write("/docs/notes.md", "remember the TODO list\n");
    state_->write("/root.txt", "top\n");
  }

  LsTool ls_;
  GlobTool glob_;
  GrepTool grep_;
};

TEST_F(SearchToolTest, LsMarksDirectories) {
  auto result = ls_.execute(json::object(), ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("/src/\n"), std::string::npos);
  EXPECT_NE(result.output.find("/docs/\n"), std::string::npos);
  EXPECT_NE(result.output.find("/root.txt\n"), std::string::npos);
  EXPECT_EQ(result.title, "3 entries");
}

TEST_F(SearchToolTest, LsMissingDirectory) {
  auto result = ls_.execute({{"path", "/nowhere"}}, ctx_).get();
  EXPECT_TRUE(result.is_error);
}

TEST_F(SearchToolTest, GlobFindFiles) {
  auto result = glob_.execute({{"pattern", "*.{cpp,hpp}"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("/src/main.cpp"), std::string::npos);
  EXPECT_NE(result.output.find("/src/util.hpp"), std::string::npos);
  EXPECT_EQ(result.title, "Found 2 files");
}

TEST_F(SearchToolTest, GlobNoMatches) {
  auto result = glob_.execute({{"pattern", "*.rs"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("No files found"), std::string::npos);
}

TEST_F(SearchToolTest, GlobRequiresPattern) {
  auto result = glob_.execute(json::object(), ctx_).get();
  EXPECT_TRUE(result.is_error);
}

TEST_F(SearchToolTest, GrepFindPattern) {
  auto result = grep_.execute({{"pattern", "TODO"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_NE(result.output.find("/src/util.hpp:1: // TODO: helper"), std::string::npos);
  EXPECT_NE(result.output.find("/docs/notes.md:1:"), std::string::npos);
  EXPECT_EQ(result.title, "2 matches");
}

TEST_F(SearchToolTest, GrepWithIncludeAndPath) {
  auto result = grep_.execute({{"pattern", "TODO"}, {"path", "/docs"}, {"include", "*.md"}}, ctx_).get();

  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output.find("util.hpp"), std::string::npos);
  EXPECT_NE(result.output.find("/docs/notes.md"), std::string::npos);
}

TEST_F(SearchToolTest, GrepInvalidRegex) {
  auto result = grep_.execute({{"pattern", "(unclosed"}}, ctx_).get();

  EXPECT_TRUE(result.is_error);
  EXPECT_NE(result.output.find("Invalid regex"), std::string::npos);
}

// ============================================================================
// ToolRegistry
// ============================================================================

TEST(ToolRegistryTest, RegisterBuiltins) {
  ToolRegistry registry;
  registry.init_builtins();

  EXPECT_EQ(registry.ids(), (std::vector<std::string>{"edit_file", "glob", "grep", "ls", "read_file", "write_file"}));
  EXPECT_TRUE(registry.has(kReadFileToolName));
  EXPECT_EQ(registry.get("nope"), nullptr);

  registry.unregister_tool("grep");
  EXPECT_FALSE(registry.has("grep"));

  registry.clear();
  EXPECT_TRUE(registry.all().empty());
}

TEST(ToolRegistryTest, LaterRegistrationReplaces) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<ReadFileTool>());
  auto first = registry.get(kReadFileToolName);
  registry.register_tool(std::make_shared<ReadFileTool>());

  EXPECT_EQ(registry.all().size(), 1u);
  EXPECT_NE(registry.get(kReadFileToolName), first);
}

TEST(ToolRegistryTest, SchemaFormat) {
  EditFileTool tool;
  auto schema = tool.schema();

  EXPECT_EQ(schema["name"], "edit_file");
  EXPECT_EQ(schema["parameters"]["type"], "object");
  EXPECT_EQ(schema["parameters"]["properties"]["replace_all"]["type"], "boolean");
  EXPECT_EQ(schema["parameters"]["properties"]["replace_all"]["default"], false);
  EXPECT_EQ(schema["parameters"]["required"], json({"file_path", "old_string", "new_string"}));
}
