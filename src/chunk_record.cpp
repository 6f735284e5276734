#include "chunk_record.hpp"
#include "errors.hpp"
#include "ferry.pb.h"

namespace ferry {

ChunkRecord make_record(uint64_t index, uint64_t byte_offset, const std::vector<uint8_t>& data,
                        bool is_last, const CompressionPolicy& policy) {
    ChunkRecord record;
    record.index = index;
    record.byte_offset = byte_offset;
    record.length = static_cast<uint32_t>(data.size());
    record.digest = checksum::digest(data);
    record.is_last = is_last;

    CompressedChunk compressed = compress_chunk(data, policy);
    record.compression = compressed.algorithm;
    record.payload = std::move(compressed.data);
    return record;
}

std::vector<uint8_t> decompressed_payload(const ChunkRecord& record) {
    return decompress(record.compression, record.payload.data(), record.payload.size(), record.length);
}

std::string encode_chunk(const ChunkRecord& record) {
    wire::ChunkPacket packet;
    packet.set_chunk_id(record.index);
    packet.set_byte_offset(record.byte_offset);
    packet.set_chunk_length(record.length);
    packet.set_checksum(record.digest.data(), record.digest.size());
    packet.set_end_of_file(record.is_last);
    packet.set_compression(static_cast<wire::CompressionAlgorithm>(record.compression));
    packet.set_data(record.payload.data(), record.payload.size());

    std::string out;
    if (!packet.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode chunk " + std::to_string(record.index));
    }
    return out;
}

ChunkRecord decode_chunk(const std::string& bytes) {
    wire::ChunkPacket packet;
    if (!packet.ParseFromString(bytes)) {
        throw ProtocolViolation("Failed to decode chunk packet of " + std::to_string(bytes.size()) + " bytes");
    }

    int tag = static_cast<int>(packet.compression());
    std::optional<CompressionAlgorithm> algorithm;
    if (tag >= 0 && tag <= 255) {
        algorithm = compression_from_u8(static_cast<uint8_t>(tag));
    }
    if (!algorithm) {
        throw ProtocolViolation("Chunk " + std::to_string(packet.chunk_id()) +
                                " uses unknown compression tag " + std::to_string(tag));
    }
    if (packet.checksum().size() != DIGEST_SIZE) {
        throw ProtocolViolation("Chunk " + std::to_string(packet.chunk_id()) + " carries a " +
                                std::to_string(packet.checksum().size()) + "-byte checksum");
    }

    ChunkRecord record;
    record.index = packet.chunk_id();
    record.byte_offset = packet.byte_offset();
    record.length = packet.chunk_length();
    record.digest.assign(packet.checksum().begin(), packet.checksum().end());
    record.is_last = packet.end_of_file();
    record.compression = *algorithm;
    record.payload.assign(packet.data().begin(), packet.data().end());
    return record;
}

} // namespace ferry
