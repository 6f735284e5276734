#pragma once

#include "chunk_record.hpp"
#include "compressor.hpp"
#include <cstdint>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry {

const uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
const uint32_t MIN_CHUNK_SIZE = 4 * 1024;
const uint32_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

// Number of chunks for a file. An empty file is one zero-length chunk.
uint64_t chunk_count_for(uint64_t file_size, uint32_t chunk_size);

// Cuts a file into ChunkRecords in increasing index order.
//
// Regular files are seekable: the size is known up front and seek_to_chunk()
// is plain offset arithmetic. Anything else (a pipe, a character device) is
// read in streaming mode, where the total is only learned at end of file and
// the cursor can only move forward.
class FileChunker {
public:
    // Throws ConfigError for a hint outside [MIN_CHUNK_SIZE, MAX_CHUNK_SIZE]
    // and IoError if the file cannot be opened.
    FileChunker(const std::string& path,
                std::optional<uint32_t> chunk_size_hint = std::nullopt,
                CompressionPolicy policy = CompressionPolicy());

    FileChunker(const FileChunker&) = delete;
    FileChunker& operator=(const FileChunker&) = delete;

    // Next record, or nullopt once the end-of-file record (or the last index
    // allowed by restrict_to) has been produced. Throws IoError.
    std::optional<ChunkRecord> next_chunk();

    void seek_to_chunk(uint64_t index);
    void reset();

    // Limits next_chunk() to the given indices. Used with the missing list
    // of a resume response.
    void restrict_to(const std::vector<uint64_t>& indices);
    void clear_restriction();

    // Random access that leaves the cursor alone. Opens its own stream, so
    // it may be called from several threads at once. Seekable mode only.
    ChunkRecord read_chunk(uint64_t index) const;

    const std::string& path() const { return path_; }
    bool seekable() const { return seekable_; }
    // nullopt in streaming mode until the end of file has been reached.
    std::optional<uint64_t> total_chunks() const { return total_chunks_; }
    uint64_t file_size() const { return file_size_; }
    uint32_t chunk_size() const { return chunk_size_; }
    uint64_t current_chunk() const { return cursor_; }
    uint64_t bytes_read() const { return bytes_read_; }
    double progress() const;
    const CompressionPolicy& policy() const { return policy_; }

private:
    uint32_t length_of(uint64_t index) const;
    std::optional<uint64_t> next_wanted(uint64_t from) const;
    std::optional<ChunkRecord> next_streaming();

    std::string path_;
    uint32_t chunk_size_;
    CompressionPolicy policy_;
    bool seekable_ = true;
    uint64_t file_size_ = 0;
    std::optional<uint64_t> total_chunks_;

    std::ifstream file_;
    uint64_t cursor_ = 0;
    uint64_t bytes_read_ = 0;
    bool finished_ = false;
    std::optional<std::set<uint64_t>> wanted_;
};

} // namespace ferry
