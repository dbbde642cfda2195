#pragma once

#include <cstddef>
#include <string>

namespace skillkit {

// Random lowercase hex string of the given length
std::string random_hex(size_t length);

}  // namespace skillkit
