#pragma once

#include <stdexcept>
#include <string>

namespace skillkit {

enum class ErrorCode { Validation, PathViolation, NotFound, Conflict, IoFailure };

std::string to_string(ErrorCode code);

// Base of all content store errors. Mutations that throw have already
// rolled back whatever they changed on disk.
class SkillError : public std::runtime_error {
 public:
  SkillError(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Bad slug, name, description, manifest or path input
class ValidationError : public SkillError {
 public:
  explicit ValidationError(const std::string &message) : SkillError(ErrorCode::Validation, message) {}
};

// Attempt to reach outside a skill directory
class PathViolation : public SkillError {
 public:
  explicit PathViolation(const std::string &message) : SkillError(ErrorCode::PathViolation, message) {}
};

class NotFoundError : public SkillError {
 public:
  explicit NotFoundError(const std::string &message) : SkillError(ErrorCode::NotFound, message) {}
};

// Slug or directory collision
class ConflictError : public SkillError {
 public:
  explicit ConflictError(const std::string &message) : SkillError(ErrorCode::Conflict, message) {}
};

// Disk or archive failure
class IoFailure : public SkillError {
 public:
  explicit IoFailure(const std::string &message) : SkillError(ErrorCode::IoFailure, message) {}
};

}  // namespace skillkit
