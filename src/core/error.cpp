#include "core/error.hpp"

namespace skillkit {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:
      return "validation_error";
    case ErrorCode::PathViolation:
      return "path_violation";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::IoFailure:
      return "io_failure";
  }
  return "unknown";
}

}  // namespace skillkit
