#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry {
namespace util {

// Writes `data` to a temporary sibling, fsyncs it, renames it over `path`
// and fsyncs the parent directory. Throws IoError on any failure; the
// previous contents of `path` survive a failed write.
void atomic_write(const std::filesystem::path& path, const uint8_t* data, size_t len);

inline void atomic_write(const std::filesystem::path& path, const std::string& data) {
    atomic_write(path, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// Reads the whole file. Throws IoError if it cannot be opened or read.
std::vector<uint8_t> read_file(const std::filesystem::path& path);

// Flushes an existing file's data to stable storage.
void fsync_file(const std::filesystem::path& path);

// Removes `path` if it exists. Returns false if nothing was removed.
bool remove_if_exists(const std::filesystem::path& path);

} // namespace util
} // namespace ferry
