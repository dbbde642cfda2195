#include <gtest/gtest.h>

#include <string>

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

using namespace skillkit;

// --- ResultTest ---

TEST(ResultTest, Success) {
  auto result = Result<int>::success(42);

  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.failed());
  ASSERT_TRUE(result.value.has_value());
  EXPECT_EQ(*result.value, 42);
  EXPECT_FALSE(result.error.has_value());
}

TEST(ResultTest, Failure) {
  auto result = Result<int>::failure("something went wrong");

  EXPECT_FALSE(result.ok());
  EXPECT_TRUE(result.failed());
  EXPECT_FALSE(result.value.has_value());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, "something went wrong");
}

TEST(ResultTest, DefaultState) {
  Result<std::string> result;

  EXPECT_FALSE(result.ok());
  EXPECT_FALSE(result.failed());
}

// --- Utf8Test ---

TEST(Utf8Test, ValidSequences) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("中文技能说明"));
  EXPECT_TRUE(is_valid_utf8("emoji \xF0\x9F\x98\x80"));
}

TEST(Utf8Test, InvalidSequences) {
  EXPECT_FALSE(is_valid_utf8("\xFF\xFE"));
  EXPECT_FALSE(is_valid_utf8("truncated \xE4\xB8"));
  EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));      // Overlong "/"
  EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));  // Surrogate
}

// --- StringTest ---

TEST(StringTest, ToLowerAndTrim) {
  EXPECT_EQ(to_lower("SKILL.MD"), "skill.md");
  EXPECT_EQ(trim("  name \t\r\n"), "name");
  EXPECT_EQ(trim("   "), "");
}

// --- TimestampTest ---

TEST(TimestampTest, MillisRoundTrip) {
  auto ts = from_millis(1700000000123);
  EXPECT_EQ(to_millis(ts), 1700000000123);
}

TEST(TimestampTest, FormatShape) {
  auto text = format_timestamp(std::chrono::system_clock::now());
  ASSERT_EQ(text.size(), 19u);
  EXPECT_EQ(text[4], '-');
  EXPECT_EQ(text[10], ' ');
  EXPECT_EQ(text[13], ':');
}

// --- ErrorTest ---

TEST(ErrorTest, CodesAndNames) {
  EXPECT_EQ(to_string(ErrorCode::Validation), "validation_error");
  EXPECT_EQ(to_string(ErrorCode::PathViolation), "path_violation");
  EXPECT_EQ(to_string(ErrorCode::NotFound), "not_found");
  EXPECT_EQ(to_string(ErrorCode::Conflict), "conflict");
  EXPECT_EQ(to_string(ErrorCode::IoFailure), "io_failure");

  try {
    throw PathViolation("outside");
  } catch (const SkillError &e) {
    EXPECT_EQ(e.code(), ErrorCode::PathViolation);
    EXPECT_STREQ(e.what(), "outside");
  }
}

// --- UuidTest ---

TEST(UuidTest, RandomHex) {
  auto hex = random_hex(8);
  EXPECT_EQ(hex.size(), 8u);
  EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}
