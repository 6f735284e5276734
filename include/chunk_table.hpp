#pragma once

#include "checksum.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry {

namespace wire {
class ChunkTableSnapshot;
}

struct ChunkMetadata {
    uint64_t chunk_number = 0;
    uint64_t byte_offset = 0;
    uint32_t chunk_length = 0;
    Digest checksum;
    bool end_of_file = false;

    uint64_t end_offset() const { return byte_offset + chunk_length; }

    bool operator==(const ChunkMetadata& other) const {
        return chunk_number == other.chunk_number && byte_offset == other.byte_offset &&
               chunk_length == other.chunk_length && checksum == other.checksum &&
               end_of_file == other.end_of_file;
    }
    bool operator!=(const ChunkMetadata& other) const { return !(*this == other); }
};

// Metadata for every accepted chunk, keyed by chunk number. The presence set
// must always match the session's ChunkBitmap.
class ChunkTable {
public:
    ChunkTable() = default;

    // Expected totals, known from the manifest.
    void set_file_info(uint64_t total_size, uint64_t total_chunks);

    // Upsert by chunk number. An end-of-file entry fixes the total if it was
    // still unknown.
    void insert(const ChunkMetadata& metadata);
    bool remove(uint64_t chunk_number);
    void clear();

    std::optional<ChunkMetadata> get(uint64_t chunk_number) const;
    bool contains(uint64_t chunk_number) const { return chunks_.count(chunk_number) != 0; }
    size_t len() const { return chunks_.size(); }
    bool is_empty() const { return chunks_.empty(); }

    std::optional<uint64_t> total_chunks() const { return total_chunks_; }
    uint64_t total_size() const { return total_size_; }

    std::vector<uint64_t> chunk_numbers() const;
    std::vector<uint64_t> missing_chunks() const;
    std::vector<ChunkMetadata> sorted_entries() const;
    uint64_t bytes_stored() const;
    std::optional<ChunkMetadata> last_chunk() const;
    bool is_complete() const;

    // Throws IntegrityError naming the first offending chunk. Never repairs.
    void verify_integrity() const;

    // Binary form (protobuf) and a human-readable dump.
    std::string serialize() const;
    static ChunkTable deserialize(const std::string& data);
    std::string to_text() const;

    void save_to_disk(const std::string& path) const;
    static ChunkTable load_from_disk(const std::string& path);

    bool operator==(const ChunkTable& other) const;
    bool operator!=(const ChunkTable& other) const { return !(*this == other); }

private:
    void to_snapshot(wire::ChunkTableSnapshot& snapshot) const;

    std::unordered_map<uint64_t, ChunkMetadata> chunks_;
    uint64_t total_size_ = 0;
    std::optional<uint64_t> total_chunks_;
};

} // namespace ferry
