#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

// Each test is a plain executable: a check that fails prints its location
// and makes the enclosing function return 1.
#define CHECK(cond)                                                         \
    do {                                                                    \
        if (!(cond)) {                                                      \
            std::cerr << "check failed at " << __FILE__ << ":" << __LINE__  \
                      << ": " #cond << std::endl;                           \
            return 1;                                                       \
        }                                                                   \
    } while (false)

// Passes if `expr` throws `type`, fails if it throws nothing.
#define CHECK_THROWS(expr, type)                                            \
    do {                                                                    \
        bool thrown_ = false;                                               \
        try {                                                               \
            expr;                                                           \
        } catch (const type&) {                                             \
            thrown_ = true;                                                 \
        }                                                                   \
        if (!thrown_) {                                                     \
            std::cerr << "expected " #type " at " << __FILE__ << ":"        \
                      << __LINE__ << std::endl;                             \
            return 1;                                                       \
        }                                                                   \
    } while (false)

#define RUN(test)                                                           \
    do {                                                                    \
        if (test() != 0) {                                                  \
            std::cerr << #test " failed" << std::endl;                      \
            return 1;                                                       \
        }                                                                   \
        std::cout << #test " passed" << std::endl;                          \
    } while (false)

namespace ferry_test {

inline std::filesystem::path temp_dir(const std::string& name) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec) / name;
    if (ec) {
        dir = std::filesystem::path{"."} / name;
    }
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

// Deterministic bytes: compressible text with a counter woven in.
inline std::vector<uint8_t> pattern_bytes(size_t size, uint32_t seed = 0) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        if (i % 64 == 0) {
            state = state * 1103515245u + 12345u;
        }
        data[i] = static_cast<uint8_t>('a' + ((state >> 16) + i % 7) % 26);
    }
    return data;
}

// Bytes zlib cannot shrink.
inline std::vector<uint8_t> noise_bytes(size_t size, uint32_t seed = 7) {
    std::vector<uint8_t> data(size);
    uint64_t state = seed + 0x9e3779b97f4a7c15ull;
    for (size_t i = 0; i < size; ++i) {
        state ^= state << 13;
        state ^= state >> 7;
        state ^= state << 17;
        data[i] = static_cast<uint8_t>(state >> 24);
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace ferry_test
