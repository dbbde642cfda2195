#include "core/uuid.hpp"

#include <mutex>
#include <random>

namespace skillkit {

namespace {

std::mt19937_64 &rng() {
  static std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

std::mutex rng_mutex;

}  // namespace

std::string random_hex(size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);

  std::lock_guard lock(rng_mutex);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out += kHex[dist(rng())];
  }
  return out;
}

}  // namespace skillkit
