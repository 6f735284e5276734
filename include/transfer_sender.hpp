#pragma once

#include "chunk_bitmap.hpp"
#include "config.hpp"
#include "manifest.hpp"
#include "protocol.hpp"
#include "session_store.hpp"
#include "transport.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

class ChunkPipeline;
class FileChunker;

// Sending side of one transfer: manifest, resume handshake, the data round,
// then acknowledgements and retransmissions until the receiver reports the
// outcome.
class TransferSender {
public:
    TransferSender(const Config& config, Transport& transport);

    // True once the receiver has confirmed the whole-file digest. False if
    // it reported a failure or the transfer timed out; the outgoing
    // checkpoint then stays in place. Throws IoError if the link fails.
    bool send_file(const std::string& path);

    const Manifest& manifest() const { return manifest_; }
    const ChunkBitmap& acknowledged() const { return acked_; }
    uint64_t chunks_sent() const { return chunks_sent_; }
    uint64_t chunks_retransmitted() const { return chunks_retransmitted_; }
    uint64_t chunks_deduplicated() const { return chunks_deduplicated_; }

private:
    // Drops the indices whose chunks the receiver copied locally. Every
    // index stays if no answer arrives in time.
    std::vector<uint64_t> skip_held_chunks(const std::vector<uint64_t>& indices);
    void send_round(ChunkPipeline& pipeline, const std::vector<uint64_t>& indices);
    void serve_retransmit(FileChunker& chunker, const RetransmitRequest& request);
    void handle_ack(const ChunkAck& ack);
    // Set once a TransferComplete arrives.
    std::optional<bool> handle_control(const InboundMessage& message, FileChunker& chunker);

    const Config& config_;
    Transport& transport_;
    SessionStore store_;
    Manifest manifest_;
    ChunkBitmap acked_;
    uint64_t chunks_sent_ = 0;
    uint64_t chunks_retransmitted_ = 0;
    uint64_t chunks_deduplicated_ = 0;
};

} // namespace ferry
