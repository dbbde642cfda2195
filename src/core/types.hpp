#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace skillkit {

using json = nlohmann::json;

using Timestamp = std::chrono::system_clock::time_point;

// Milliseconds since epoch, used for JSON persistence
int64_t to_millis(Timestamp ts);
Timestamp from_millis(int64_t ms);

// Format as "YYYY-MM-DD HH:MM:SS" in local time
std::string format_timestamp(Timestamp ts);

// Result type for operations that can fail without throwing
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// True if the bytes form well-formed UTF-8
bool is_valid_utf8(const std::string &str);

// ASCII lowercase
std::string to_lower(std::string str);

// Trim ASCII whitespace from both ends
std::string trim(const std::string &str);

}  // namespace skillkit
