#pragma once

#include "checksum.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace ferry {

struct Manifest;

struct ChunkLocation {
    std::filesystem::path file_path;
    uint64_t byte_offset = 0;
    uint32_t length = 0;
};

// Digest -> places in completed files where a chunk with that digest sits.
// Lets the receiver copy chunks it already holds instead of taking them
// off the wire.
class ChunkIndex {
public:
    explicit ChunkIndex(std::filesystem::path index_file);

    // Replaces the entries with the index file's, if there is one.
    // Throws IoError, or a Corruption TransferError for an unparseable file.
    void load();
    // Throws IoError.
    void save() const;

    void add_chunk(const Digest& digest, const ChunkLocation& location);
    // Every chunk of a finalized file laid out as `manifest` describes.
    // Earlier locations inside the same file are dropped first.
    void add_file(const Manifest& manifest, const std::filesystem::path& file_path);
    void remove_file(const std::filesystem::path& file_path);

    bool contains(const Digest& digest) const;
    std::vector<ChunkLocation> locations(const Digest& digest) const;
    // The hashes present in the index, in request order.
    std::vector<Digest> existing(const std::vector<Digest>& hashes) const;

    // Bytes from the first location that still matches `digest`. Files that
    // were moved, truncated or rewritten are skipped.
    std::optional<std::vector<uint8_t>> read_chunk(const Digest& digest) const;

    size_t size() const { return index_.size(); }
    const std::filesystem::path& index_file() const { return index_file_; }

private:
    std::filesystem::path index_file_;
    std::map<Digest, std::vector<ChunkLocation>> index_;
};

} // namespace ferry
