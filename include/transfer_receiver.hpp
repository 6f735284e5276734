#pragma once

#include "config.hpp"
#include "transport.hpp"
#include <filesystem>
#include <optional>

namespace ferry {

class ChunkIndex;
class TransferAssembler;

// Receiving side of one transfer: manifest, resume handshake, then chunks
// until the file is finalized. Missing chunks are requested when a data
// round ends or the link goes idle.
class TransferReceiver {
public:
    TransferReceiver(const Config& config, Transport& transport);

    // Final path on success. nullopt if no manifest arrived, the transfer
    // timed out (checkpoint kept) or finalization failed (reported to the
    // sender). Throws ProtocolViolation for an invalid manifest and IoError
    // for link or disk failures.
    std::optional<std::filesystem::path> receive_file();

    uint64_t chunks_received() const { return chunks_received_; }
    uint64_t duplicates() const { return duplicates_; }
    uint64_t rejected() const { return rejected_; }
    uint64_t chunks_copied() const { return chunks_copied_; }

private:
    // Answers the sender's hash check, copying offered chunks found in the
    // index into the .part file.
    void answer_hash_check(TransferAssembler& assembler, const ChunkIndex& index);
    void remember_chunks(const TransferAssembler& assembler, ChunkIndex& index);
    void handle_chunk(TransferAssembler& assembler, const std::string& payload);
    void request_missing(const TransferAssembler& assembler);
    void send_acks(TransferAssembler& assembler);
    void report(const std::string& session_id, bool ok, const std::string& error);

    const Config& config_;
    Transport& transport_;
    uint64_t chunks_received_ = 0;
    uint64_t duplicates_ = 0;
    uint64_t rejected_ = 0;
    uint64_t chunks_copied_ = 0;
    // Received count when missing chunks were last requested.
    std::optional<uint64_t> requested_at_;
};

} // namespace ferry
