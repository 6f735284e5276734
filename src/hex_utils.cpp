#include "ferry/hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace ferry {
namespace util {

std::string to_hex(const uint8_t* data, size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

} // namespace util
} // namespace ferry
