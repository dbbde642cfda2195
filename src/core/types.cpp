#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace skillkit {

int64_t to_millis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_millis(int64_t ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

std::string format_timestamp(Timestamp ts) {
  std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

// ============================================================================
// UTF-8
// ============================================================================

// Length of the sequence starting at data[i], or 0 if it is not well-formed
static size_t utf8_sequence_length(const std::string &data, size_t i) {
  auto c = static_cast<unsigned char>(data[i]);
  size_t len = 0;
  if (c < 0x80) {
    return 1;
  } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
    len = 2;
  } else if ((c & 0xF0) == 0xE0) {
    len = 3;
  } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
    len = 4;
  } else {
    return 0;
  }

  if (i + len > data.size()) return 0;
  for (size_t k = 1; k < len; ++k) {
    if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) return 0;
  }

  // Reject overlong encodings and surrogates
  auto c1 = static_cast<unsigned char>(data[i + 1]);
  if (len == 3) {
    if (c == 0xE0 && c1 < 0xA0) return 0;
    if (c == 0xED && c1 >= 0xA0) return 0;
  } else if (len == 4) {
    if (c == 0xF0 && c1 < 0x90) return 0;
    if (c == 0xF4 && c1 >= 0x90) return 0;
  }
  return len;
}

bool is_valid_utf8(const std::string &str) {
  size_t i = 0;
  while (i < str.size()) {
    size_t len = utf8_sequence_length(str, i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::string trim(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\r\n");
  size_t end = str.find_last_not_of(" \t\r\n");
  return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

}  // namespace skillkit
