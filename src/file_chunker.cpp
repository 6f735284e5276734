#include "file_chunker.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace ferry {

namespace {

std::vector<uint8_t> read_span(std::istream& in, const std::string& path,
                               uint64_t offset, uint32_t length, uint64_t index) {
    std::vector<uint8_t> data(length);
    if (length == 0) {
        return data;
    }
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(data.data()), length);
    if (static_cast<uint64_t>(in.gcount()) != length) {
        throw IoError(path, "short read for chunk " + std::to_string(index) + " (" +
                            std::to_string(in.gcount()) + " of " + std::to_string(length) + " bytes)");
    }
    return data;
}

} // namespace

uint64_t chunk_count_for(uint64_t file_size, uint32_t chunk_size) {
    if (file_size == 0) {
        return 1;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

FileChunker::FileChunker(const std::string& path, std::optional<uint32_t> chunk_size_hint,
                         CompressionPolicy policy)
    : path_(path),
      chunk_size_(chunk_size_hint ? *chunk_size_hint : DEFAULT_CHUNK_SIZE),
      policy_(policy) {
    if (chunk_size_ < MIN_CHUNK_SIZE || chunk_size_ > MAX_CHUNK_SIZE) {
        throw ConfigError("Chunk size " + std::to_string(chunk_size_) + " is outside [" +
                          std::to_string(MIN_CHUNK_SIZE) + ", " + std::to_string(MAX_CHUNK_SIZE) + "]");
    }

    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw IoError(path_, "source file does not exist");
    }
    seekable_ = std::filesystem::is_regular_file(status);

    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        throw IoError(path_, "cannot open source file");
    }

    if (seekable_) {
        file_size_ = std::filesystem::file_size(path_, ec);
        if (ec) {
            throw IoError(path_, "cannot determine file size: " + ec.message());
        }
        total_chunks_ = chunk_count_for(file_size_, chunk_size_);
    } else {
        std::cout << "[Chunker] " << path_ << " is not seekable, reading it as a stream" << std::endl;
    }
}

uint32_t FileChunker::length_of(uint64_t index) const {
    uint64_t offset = index * chunk_size_;
    if (offset >= file_size_) {
        return 0;
    }
    uint64_t remaining = file_size_ - offset;
    return static_cast<uint32_t>(remaining < chunk_size_ ? remaining : chunk_size_);
}

std::optional<uint64_t> FileChunker::next_wanted(uint64_t from) const {
    if (wanted_) {
        auto it = wanted_->lower_bound(from);
        if (it == wanted_->end()) {
            return std::nullopt;
        }
        from = *it;
    }
    if (total_chunks_ && from >= *total_chunks_) {
        return std::nullopt;
    }
    return from;
}

std::optional<ChunkRecord> FileChunker::next_chunk() {
    if (finished_) {
        return std::nullopt;
    }
    if (!seekable_) {
        return next_streaming();
    }

    auto index = next_wanted(cursor_);
    if (!index) {
        finished_ = true;
        return std::nullopt;
    }

    uint64_t offset = *index * chunk_size_;
    uint32_t length = length_of(*index);
    bool is_last = (*index + 1 == *total_chunks_);
    std::vector<uint8_t> data = read_span(file_, path_, offset, length, *index);

    ChunkRecord record = make_record(*index, offset, data, is_last, policy_);
    bytes_read_ += length;
    cursor_ = *index + 1;
    if (is_last || !next_wanted(cursor_)) {
        finished_ = true;
    }
    return record;
}

std::optional<ChunkRecord> FileChunker::next_streaming() {
    while (true) {
        uint64_t index = cursor_;
        uint64_t offset = bytes_read_;
        std::vector<uint8_t> data(chunk_size_);
        file_.read(reinterpret_cast<char*>(data.data()), chunk_size_);
        if (file_.bad()) {
            throw IoError(path_, "read failed at chunk " + std::to_string(index));
        }
        data.resize(static_cast<size_t>(file_.gcount()));
        bool is_last = file_.eof() || file_.peek() == std::char_traits<char>::eof();

        bytes_read_ += data.size();
        cursor_ = index + 1;
        if (is_last) {
            total_chunks_ = index + 1;
            file_size_ = bytes_read_;
            finished_ = true;
        }

        if (!wanted_ || wanted_->count(index)) {
            return make_record(index, offset, data, is_last, policy_);
        }
        if (finished_) {
            return std::nullopt;
        }
    }
}

void FileChunker::seek_to_chunk(uint64_t index) {
    if (!seekable_) {
        if (index != cursor_) {
            throw IoError(path_, "cannot seek a streaming source to chunk " + std::to_string(index));
        }
        return;
    }
    if (index > *total_chunks_) {
        throw std::out_of_range("Chunk " + std::to_string(index) + " is past the end of " + path_);
    }
    cursor_ = index;
    finished_ = false;
}

void FileChunker::reset() {
    if (!seekable_ && cursor_ != 0) {
        throw IoError(path_, "cannot rewind a streaming source");
    }
    cursor_ = 0;
    bytes_read_ = 0;
    finished_ = false;
    file_.clear();
}

void FileChunker::restrict_to(const std::vector<uint64_t>& indices) {
    wanted_ = std::set<uint64_t>(indices.begin(), indices.end());
}

void FileChunker::clear_restriction() {
    wanted_.reset();
}

ChunkRecord FileChunker::read_chunk(uint64_t index) const {
    if (!seekable_) {
        throw IoError(path_, "random access is not possible on a streaming source");
    }
    if (index >= *total_chunks_) {
        throw std::out_of_range("Chunk " + std::to_string(index) + " is past the end of " + path_);
    }
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(path_, "cannot open source file");
    }
    uint64_t offset = index * chunk_size_;
    std::vector<uint8_t> data = read_span(file, path_, offset, length_of(index), index);
    return make_record(index, offset, data, index + 1 == *total_chunks_, policy_);
}

double FileChunker::progress() const {
    if (!total_chunks_) {
        return 0.0;
    }
    if (finished_) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(cursor_) / static_cast<double>(*total_chunks_);
}

} // namespace ferry
