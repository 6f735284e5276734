#pragma once

#include "checksum.hpp"
#include "chunk_bitmap.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// --- Resume handshake (RESUME channel) ---

struct ResumeRequest {
    std::string session_id;
    // Exactly one of the two forms is filled, whichever encodes smaller.
    std::vector<uint64_t> received_chunks;
    std::vector<uint8_t> received_bitmap;
    uint64_t last_chunk_id = 0;

    // Claimed indices in ascending order, whichever form was used.
    std::vector<uint64_t> claimed_chunks() const;
};

struct ResumeResponse {
    std::string session_id;
    bool accepted = false;
    std::vector<uint64_t> missing_chunks;
    uint64_t chunks_remaining = 0;
    std::optional<std::string> error;

    static ResumeResponse reject(const std::string& session_id, const std::string& reason);
};

ResumeRequest build_resume_request(const std::string& session_id, const ChunkBitmap& bitmap);

std::string encode_resume_request(const ResumeRequest& request);
ResumeRequest decode_resume_request(const std::string& bytes);
std::string encode_resume_response(const ResumeResponse& response);
ResumeResponse decode_resume_response(const std::string& bytes);

// --- Deduplication (HASH_CHECK channel) ---

struct HashCheckRequest {
    std::string session_id;
    std::vector<Digest> chunk_hashes;
};

struct HashCheckResponse {
    std::string session_id;
    std::vector<Digest> existing_hashes;
};

std::string encode_hash_check_request(const HashCheckRequest& request);
HashCheckRequest decode_hash_check_request(const std::string& bytes);
std::string encode_hash_check_response(const HashCheckResponse& response);
HashCheckResponse decode_hash_check_response(const std::string& bytes);

// --- Control channel ---

struct RetransmitRequest {
    std::string session_id;
    std::vector<ChunkBitmap::Gap> ranges;
    // Total still unknown: every index from open_from onward is wanted too.
    bool open_ended = false;
    uint64_t open_from = 0;

    // Expands the ranges (and the open tail, up to `total_chunks`).
    std::vector<uint64_t> indices(uint64_t total_chunks) const;
};

// At most `max_indices` missing indices, taken from the front and
// coalesced into ranges.
RetransmitRequest build_retransmit_request(const std::string& session_id, const ChunkBitmap& bitmap,
                                           size_t max_indices);

struct ChunkAck {
    std::string session_id;
    std::vector<uint64_t> chunk_ids;
};

struct TransferComplete {
    std::string session_id;
    bool ok = false;
    std::string error;
};

struct ControlMessage {
    enum class Type { Retransmit, Ack, Complete };

    Type type = Type::Ack;
    RetransmitRequest retransmit;
    ChunkAck ack;
    TransferComplete complete;
};

std::string encode_control(const RetransmitRequest& request);
std::string encode_control(const ChunkAck& ack);
std::string encode_control(const TransferComplete& complete);
// Throws ProtocolViolation for unparseable or empty messages.
ControlMessage decode_control(const std::string& bytes);

} // namespace ferry
