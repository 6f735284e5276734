#include "transfer_sender.hpp"
#include "chunk_pipeline.hpp"
#include "errors.hpp"
#include "file_chunker.hpp"
#include "resume_coordinator.hpp"
#include <iostream>
#include <set>

namespace ferry {

TransferSender::TransferSender(const Config& config, Transport& transport)
    : config_(config),
      transport_(transport),
      store_(config.outgoing_session_dir()) {}

bool TransferSender::send_file(const std::string& path) {
    manifest_ = build_manifest(path, config_.chunk_size);
    std::cout << "[Sender] Sending " << manifest_.file_name << " (" << manifest_.file_size << " bytes, "
              << manifest_.total_chunks << " chunks of " << manifest_.chunk_size << ") as session "
              << manifest_.session_id << std::endl;
    transport_.send(channel::MANIFEST, encode_manifest(manifest_), true);

    SenderResumeCoordinator resume(manifest_, store_, config_.resume_request_timeout());
    std::optional<std::vector<uint64_t>> wanted = resume.negotiate(transport_);
    acked_ = resume.take_bitmap();

    FileChunker chunker(path, config_.chunk_size, config_.compression_policy());
    if (chunker.total_chunks() != manifest_.total_chunks || chunker.file_size() != manifest_.file_size) {
        throw IoError(path, "file changed while the manifest was built");
    }
    ChunkPipeline pipeline(chunker, config_.worker_threads, config_.pipeline_batch);

    std::vector<uint64_t> indices;
    if (wanted) {
        indices = *wanted;
    } else {
        for (uint64_t i = 0; i < manifest_.total_chunks; ++i) {
            indices.push_back(i);
        }
    }
    indices = skip_held_chunks(indices);
    send_round(pipeline, indices);

    auto deadline = std::chrono::steady_clock::now() + config_.transfer_timeout();
    while (std::chrono::steady_clock::now() < deadline) {
        auto message = transport_.receive(channel::CONTROL, config_.idle_timeout());
        if (!message) {
            continue;
        }
        std::optional<bool> outcome = handle_control(*message, chunker);
        if (outcome) {
            return *outcome;
        }
    }

    std::cerr << "[Sender] Timed out after " << config_.transfer_timeout_ms << " ms with "
              << acked_.received_count() << "/" << manifest_.total_chunks
              << " chunks acknowledged, checkpoint kept" << std::endl;
    return false;
}

std::vector<uint64_t> TransferSender::skip_held_chunks(const std::vector<uint64_t>& indices) {
    // Sent even with dedup off so the receiver does not wait for it.
    HashCheckRequest request;
    request.session_id = manifest_.session_id;
    if (config_.dedup) {
        std::set<Digest> offered;
        for (uint64_t index : indices) {
            const Digest& hash = manifest_.chunk_hashes[index];
            if (offered.insert(hash).second) {
                request.chunk_hashes.push_back(hash);
            }
        }
    }
    transport_.send(channel::HASH_CHECK, encode_hash_check_request(request), true);

    auto reply = transport_.receive(channel::HASH_CHECK, config_.resume_request_timeout());
    if (!reply) {
        std::cerr << "[Sender] No hash check response, sending every chunk" << std::endl;
        return indices;
    }
    HashCheckResponse response;
    try {
        response = decode_hash_check_response(reply->payload);
    } catch (const ProtocolViolation& e) {
        std::cerr << "[Sender] Ignoring hash check response: " << e.what() << std::endl;
        return indices;
    }
    if (response.session_id != manifest_.session_id || response.existing_hashes.empty()) {
        return indices;
    }

    std::set<Digest> held(response.existing_hashes.begin(), response.existing_hashes.end());
    std::vector<uint64_t> remaining;
    for (uint64_t index : indices) {
        if (held.count(manifest_.chunk_hashes[index])) {
            ++chunks_deduplicated_;
        } else {
            remaining.push_back(index);
        }
    }
    std::cout << "[Sender] Receiver already holds " << chunks_deduplicated_ << " chunks, " << remaining.size()
              << " left to send" << std::endl;
    return remaining;
}

void TransferSender::send_round(ChunkPipeline& pipeline, const std::vector<uint64_t>& indices) {
    uint64_t bytes = 0;
    pipeline.run(indices, [&](ChunkRecord&& record) {
        bytes += record.payload.size();
        transport_.send(channel::DATA, encode_chunk(record));
        ++chunks_sent_;
        if (config_.verbose) {
            std::cout << "[Sender] Chunk " << record.index << " sent (" << record.payload.size() << "/"
                      << record.length << " bytes, " << to_string(record.compression) << ")" << std::endl;
        }
    });
    // End of round.
    transport_.send(channel::DATA, std::string(), true);
    std::cout << "[Sender] Round done: " << indices.size() << " chunks, " << bytes << " bytes on the wire"
              << std::endl;
}

void TransferSender::serve_retransmit(FileChunker& chunker, const RetransmitRequest& request) {
    std::vector<uint64_t> indices = request.indices(manifest_.total_chunks);
    size_t limit = config_.retransmit_batch;
    if (indices.size() > limit) {
        indices.resize(limit);
    }
    std::cout << "[Sender] Retransmitting " << indices.size() << " chunks" << std::endl;

    for (uint64_t index : indices) {
        chunker.seek_to_chunk(index);
        std::optional<ChunkRecord> record = chunker.next_chunk();
        if (!record) {
            break;
        }
        transport_.send(channel::DATA, encode_chunk(*record));
        ++chunks_sent_;
        ++chunks_retransmitted_;
    }
    transport_.send(channel::DATA, std::string(), true);
}

void TransferSender::handle_ack(const ChunkAck& ack) {
    for (uint64_t index : ack.chunk_ids) {
        if (index >= manifest_.total_chunks) {
            std::cerr << "[Sender] Ignoring acknowledgement of chunk " << index << " beyond the file" << std::endl;
            continue;
        }
        acked_.mark_received(index, index + 1 == manifest_.total_chunks);
    }
    try {
        store_.save_bitmap(manifest_.session_id, acked_);
    } catch (const IoError& e) {
        std::cerr << "[Sender] Checkpoint failed, continuing: " << e.what() << std::endl;
    }
    if (config_.verbose) {
        std::cout << "[Sender] " << acked_.received_count() << "/" << manifest_.total_chunks
                  << " chunks acknowledged" << std::endl;
    }
}

std::optional<bool> TransferSender::handle_control(const InboundMessage& message, FileChunker& chunker) {
    ControlMessage control;
    try {
        control = decode_control(message.payload);
    } catch (const ProtocolViolation& e) {
        std::cerr << "[Sender] Dropping control message: " << e.what() << std::endl;
        return std::nullopt;
    }

    switch (control.type) {
        case ControlMessage::Type::Ack:
            if (control.ack.session_id == manifest_.session_id) {
                handle_ack(control.ack);
            }
            return std::nullopt;
        case ControlMessage::Type::Retransmit:
            if (control.retransmit.session_id == manifest_.session_id) {
                serve_retransmit(chunker, control.retransmit);
            }
            return std::nullopt;
        case ControlMessage::Type::Complete:
            if (control.complete.session_id != manifest_.session_id) {
                return std::nullopt;
            }
            // The receiver has dropped its session in both cases.
            store_.remove(manifest_.session_id);
            if (control.complete.ok) {
                std::cout << "[Sender] Receiver confirmed " << manifest_.file_name << " (" << chunks_sent_
                          << " chunks sent, " << chunks_retransmitted_ << " retransmitted, " << chunks_deduplicated_
                          << " copied by the receiver)" << std::endl;
                return true;
            }
            std::cerr << "[Sender] Receiver reported failure: " << control.complete.error << std::endl;
            return false;
    }
    return std::nullopt;
}

} // namespace ferry
