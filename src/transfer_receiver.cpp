#include "transfer_receiver.hpp"
#include "chunk_index.hpp"
#include "chunk_record.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "protocol.hpp"
#include "resume_coordinator.hpp"
#include "transfer_assembler.hpp"
#include <iostream>
#include <map>
#include <set>

namespace ferry {

TransferReceiver::TransferReceiver(const Config& config, Transport& transport)
    : config_(config), transport_(transport) {}

std::optional<std::filesystem::path> TransferReceiver::receive_file() {
    auto message = transport_.receive(channel::MANIFEST, config_.transfer_timeout());
    if (!message) {
        std::cerr << "[Receiver] No manifest within " << config_.transfer_timeout_ms << " ms" << std::endl;
        return std::nullopt;
    }
    Manifest manifest = decode_manifest(message->payload);
    validate_manifest(manifest);
    std::cout << "[Receiver] Receiving " << manifest.file_name << " (" << manifest.file_size << " bytes, "
              << manifest.total_chunks << " chunks) as session " << manifest.session_id << std::endl;

    TransferAssembler assembler(manifest, SessionStore(config_.incoming_session_dir()), config_.output_dir,
                                config_.checkpoint_interval, config_.verbose);
    ReceiverResumeCoordinator resume(assembler, config_.resume_wait_timeout());
    resume.run(transport_);

    ChunkIndex index(config_.chunk_index_path());
    if (config_.dedup) {
        try {
            index.load();
        } catch (const TransferError& e) {
            std::cerr << "[Receiver] Chunk index unusable, starting empty: " << e.what() << std::endl;
        }
    }
    answer_hash_check(assembler, index);

    requested_at_.reset();
    auto deadline = std::chrono::steady_clock::now() + config_.transfer_timeout();
    try {
        if (assembler.is_complete()) {
            // Every chunk was already on disk.
            assembler.finalize();
        }
        while (!assembler.is_finalized()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                std::cerr << "[Receiver] Timed out at " << assembler.progress() << "%, checkpoint kept" << std::endl;
                return std::nullopt;
            }
            auto data = transport_.receive(channel::DATA, config_.idle_timeout());
            if (!data) {
                request_missing(assembler);
                continue;
            }
            if (data->fin) {
                // A round that brought nothing new waits for the idle timeout.
                if (!requested_at_ || *requested_at_ != assembler.bitmap().received_count()) {
                    request_missing(assembler);
                }
                continue;
            }
            handle_chunk(assembler, data->payload);
            send_acks(assembler);
        }
    } catch (const TransferError& e) {
        if (!assembler.finalize_error()) {
            throw;
        }
        std::cerr << "[Receiver] Finalization failed: " << e.what() << std::endl;
        send_acks(assembler);
        report(manifest.session_id, false, e.what());
        return std::nullopt;
    }

    send_acks(assembler);
    report(manifest.session_id, true, std::string());
    if (config_.dedup) {
        remember_chunks(assembler, index);
    }
    std::cout << "[Receiver] Complete: " << assembler.final_path().string() << " (" << chunks_received_
              << " chunks received, " << chunks_copied_ << " copied locally, " << duplicates_ << " duplicates, " << rejected_ << " rejected)" << std::endl;
    return assembler.final_path();
}

void TransferReceiver::answer_hash_check(TransferAssembler& assembler, const ChunkIndex& index) {
    const Manifest& manifest = assembler.manifest();
    HashCheckResponse response;
    response.session_id = manifest.session_id;

    auto message = transport_.receive(channel::HASH_CHECK, config_.resume_wait_timeout());
    if (!message) {
        std::cerr << "[Receiver] No hash check request, expecting every chunk" << std::endl;
        return;
    }
    HashCheckRequest request;
    try {
        request = decode_hash_check_request(message->payload);
    } catch (const ProtocolViolation& e) {
        std::cerr << "[Receiver] Ignoring hash check request: " << e.what() << std::endl;
        transport_.send(channel::HASH_CHECK, encode_hash_check_response(response), true);
        return;
    }

    if (config_.dedup && request.session_id == manifest.session_id && !request.chunk_hashes.empty()) {
        std::set<Digest> offered(request.chunk_hashes.begin(), request.chunk_hashes.end());
        // A digest is reported only if every missing chunk carrying it was copied.
        std::map<Digest, bool> copied;
        std::map<Digest, std::optional<std::vector<uint8_t>>> cache;
        for (uint64_t chunk : assembler.missing_chunks()) {
            const Digest& hash = manifest.chunk_hashes[chunk];
            if (!offered.count(hash)) {
                continue;
            }
            auto cached = cache.find(hash);
            if (cached == cache.end()) {
                cached = cache.emplace(hash, index.read_chunk(hash)).first;
            }
            bool ok = cached->second && assembler.adopt_chunk(chunk, *cached->second);
            if (ok) {
                ++chunks_copied_;
            }
            auto state = copied.find(hash);
            if (state == copied.end()) {
                copied.emplace(hash, ok);
            } else {
                state->second = state->second && ok;
            }
        }
        for (const auto& [hash, ok] : copied) {
            if (ok) {
                response.existing_hashes.push_back(hash);
            }
        }
    }

    if (chunks_copied_ > 0) {
        std::cout << "[Receiver] Copied " << chunks_copied_ << " chunks from earlier files" << std::endl;
        try {
            assembler.checkpoint();
        } catch (const IoError& e) {
            std::cerr << "[Receiver] Checkpoint failed, continuing: " << e.what() << std::endl;
        }
    }
    transport_.send(channel::HASH_CHECK, encode_hash_check_response(response), true);
    send_acks(assembler);
}

void TransferReceiver::remember_chunks(const TransferAssembler& assembler, ChunkIndex& index) {
    try {
        index.add_file(assembler.manifest(), std::filesystem::absolute(assembler.final_path()));
        index.save();
    } catch (const TransferError& e) {
        std::cerr << "[Receiver] Chunk index not updated: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[Receiver] Chunk index not updated: " << e.what() << std::endl;
    }
}

void TransferReceiver::handle_chunk(TransferAssembler& assembler, const std::string& payload) {
    try {
        ChunkRecord record = decode_chunk(payload);
        ReceivedChunkOutcome outcome = assembler.receive_chunk(record);
        if (outcome == ReceivedChunkOutcome::NewChunk) {
            ++chunks_received_;
        } else {
            ++duplicates_;
        }
    } catch (const ChecksumMismatch& e) {
        ++rejected_;
        std::cerr << "[Receiver] " << e.what() << ", chunk stays missing" << std::endl;
    } catch (const ProtocolViolation& e) {
        ++rejected_;
        std::cerr << "[Receiver] Rejected chunk: " << e.what() << std::endl;
    } catch (const TransferError& e) {
        if (e.kind() != ErrorKind::Corruption || assembler.finalize_error()) {
            throw;
        }
        // Payload that does not inflate.
        ++rejected_;
        std::cerr << "[Receiver] Rejected chunk: " << e.what() << std::endl;
    }
}

void TransferReceiver::request_missing(const TransferAssembler& assembler) {
    if (assembler.is_complete()) {
        return;
    }
    RetransmitRequest request =
        build_retransmit_request(assembler.manifest().session_id, assembler.bitmap(), config_.retransmit_batch);
    if (request.ranges.empty() && !request.open_ended) {
        return;
    }
    size_t count = 0;
    for (const auto& range : request.ranges) {
        count += static_cast<size_t>(range.second - range.first + 1);
    }
    std::cout << "[Receiver] Requesting " << count << " missing chunks in " << request.ranges.size()
              << " ranges (" << assembler.progress() << "% received)" << std::endl;
    transport_.send(channel::CONTROL, encode_control(request));
    requested_at_ = assembler.bitmap().received_count();
}

void TransferReceiver::send_acks(TransferAssembler& assembler) {
    std::vector<uint64_t> durable = assembler.take_durable();
    if (durable.empty()) {
        return;
    }
    ChunkAck ack;
    ack.session_id = assembler.manifest().session_id;
    ack.chunk_ids = std::move(durable);
    transport_.send(channel::CONTROL, encode_control(ack));
}

void TransferReceiver::report(const std::string& session_id, bool ok, const std::string& error) {
    TransferComplete complete;
    complete.session_id = session_id;
    complete.ok = ok;
    complete.error = error;
    transport_.send(channel::CONTROL, encode_control(complete));
}

} // namespace ferry
