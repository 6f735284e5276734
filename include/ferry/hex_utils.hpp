#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ferry {
namespace util {

// --- Hex encoding for digests and session ids ---
std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& bytes);

} // namespace util
} // namespace ferry
