#include "ferry/fs_utils.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace ferry {
namespace util {

namespace {

std::string errno_text(const std::string& op) {
    return op + ": " + std::strerror(errno);
}

void write_all_fd(int fd, const uint8_t* data, size_t len, const std::filesystem::path& path) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError(path.string(), errno_text("write failed"));
        }
        written += static_cast<size_t>(n);
    }
}

} // namespace

void atomic_write(const std::filesystem::path& path, const uint8_t* data, size_t len) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError(path.parent_path().string(), "cannot create directory: " + ec.message());
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw IoError(tmp.string(), errno_text("open failed"));
    }
    try {
        write_all_fd(fd, data, len, tmp);
    } catch (...) {
        ::close(fd);
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        throw;
    }
    if (::fsync(fd) != 0) {
        std::string err = errno_text("fsync failed");
        ::close(fd);
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        throw IoError(tmp.string(), err);
    }
    if (::close(fd) != 0) {
        std::string err = errno_text("close failed");
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        throw IoError(tmp.string(), err);
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        std::string err = errno_text("rename failed");
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        throw IoError(path.string(), err);
    }

    // Make the rename itself durable.
    std::filesystem::path dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) {
        ::fsync(dfd);
        ::close(dfd);
    }
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(path.string(), "cannot open file for reading");
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IoError(path.string(), "read failed");
    }
    return data;
}

void fsync_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw IoError(path.string(), errno_text("open failed"));
    }
    if (::fsync(fd) != 0) {
        std::string err = errno_text("fsync failed");
        ::close(fd);
        throw IoError(path.string(), err);
    }
    ::close(fd);
}

bool remove_if_exists(const std::filesystem::path& path) {
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw IoError(path.string(), "remove failed: " + ec.message());
    }
    return removed;
}

} // namespace util
} // namespace ferry
