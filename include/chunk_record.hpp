#pragma once

#include "checksum.hpp"
#include "chunk_table.hpp"
#include "compressor.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ferry {

// One chunk as produced by the chunker and carried on the data channel.
struct ChunkRecord {
    uint64_t index = 0;
    uint64_t byte_offset = 0;
    // Uncompressed length.
    uint32_t length = 0;
    // Digest of the uncompressed bytes.
    Digest digest;
    bool is_last = false;
    CompressionAlgorithm compression = CompressionAlgorithm::None;
    // Bytes as carried on the wire, compressed if `compression` says so.
    std::vector<uint8_t> payload;

    ChunkMetadata metadata() const {
        ChunkMetadata m;
        m.chunk_number = index;
        m.byte_offset = byte_offset;
        m.chunk_length = length;
        m.checksum = digest;
        m.end_of_file = is_last;
        return m;
    }
};

// Digests and compresses raw file bytes into a record.
ChunkRecord make_record(uint64_t index, uint64_t byte_offset, const std::vector<uint8_t>& data,
                        bool is_last, const CompressionPolicy& policy);

// Original bytes of the record. Throws a Corruption TransferError if the
// payload does not inflate to exactly `length` bytes.
std::vector<uint8_t> decompressed_payload(const ChunkRecord& record);

// --- Wire codec (ChunkPacket) ---

std::string encode_chunk(const ChunkRecord& record);
// Throws ProtocolViolation for unparseable packets, unknown compression tags
// or a checksum that is not DIGEST_SIZE bytes.
ChunkRecord decode_chunk(const std::string& bytes);

} // namespace ferry
