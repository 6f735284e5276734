#pragma once

#include "checksum.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ferry {

// File metadata sent once, ahead of any chunk.
struct Manifest {
    std::string session_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t chunk_size = 0;
    uint64_t total_chunks = 0;
    Digest file_hash;
    std::vector<Digest> chunk_hashes;

    uint64_t chunk_offset(uint64_t index) const { return index * chunk_size; }
    uint32_t chunk_length(uint64_t index) const;
};

// hex(SHA-256(name, size, file digest))[0..32]. Stable across restarts of
// either side.
std::string session_id_for(const std::string& file_name, uint64_t file_size, const Digest& file_hash);

// Reads the file once, hashing every chunk and the whole file. Throws IoError.
Manifest build_manifest(const std::string& file_path, uint32_t chunk_size);

std::string manifest_path_for(const std::string& file_path);

// <file>.ferry next to the source. Throws IoError.
void save_manifest(const Manifest& manifest, const std::string& path);
// Throws IoError or a Corruption TransferError.
Manifest load_manifest(const std::string& path);

std::string encode_manifest(const Manifest& manifest);
// Throws ProtocolViolation.
Manifest decode_manifest(const std::string& bytes);

// Throws ProtocolViolation describing the first inconsistency.
void validate_manifest(const Manifest& manifest);

} // namespace ferry
