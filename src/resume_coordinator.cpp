#include "resume_coordinator.hpp"
#include "errors.hpp"
#include "transfer_assembler.hpp"
#include <algorithm>
#include <iostream>

namespace ferry {

const char* to_string(SenderResumeState state) {
    switch (state) {
        case SenderResumeState::Fresh: return "Fresh";
        case SenderResumeState::AwaitingResumeResponse: return "AwaitingResumeResponse";
        case SenderResumeState::Resumed: return "Resumed";
    }
    return "unknown";
}

const char* to_string(ReceiverResumeState state) {
    switch (state) {
        case ReceiverResumeState::Fresh: return "Fresh";
        case ReceiverResumeState::EvaluatingResumeRequest: return "EvaluatingResumeRequest";
        case ReceiverResumeState::ResponseSent: return "ResponseSent";
    }
    return "unknown";
}

// --- Sender ---

SenderResumeCoordinator::SenderResumeCoordinator(const Manifest& manifest, const SessionStore& store,
                                                 std::chrono::milliseconds response_timeout)
    : manifest_(manifest),
      store_(store),
      response_timeout_(response_timeout),
      bitmap_(ChunkBitmap::with_exact_size(manifest.total_chunks)) {}

std::optional<std::vector<uint64_t>> SenderResumeCoordinator::negotiate(Transport& transport) {
    const std::string& id = manifest_.session_id;
    const uint64_t total = manifest_.total_chunks;

    std::optional<ChunkBitmap> saved;
    try {
        saved = store_.load_bitmap(id);
    } catch (const TransferError& e) {
        std::cerr << "[Resume] Ignoring unusable checkpoint: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!saved || saved->received_count() == 0) {
        std::cout << "[Resume] No checkpoint for session " << id << ", starting fresh" << std::endl;
        return std::nullopt;
    }
    if (saved->total_chunks() && *saved->total_chunks() != total) {
        std::cerr << "[Resume] Checkpoint of " << id << " is for " << *saved->total_chunks()
                  << " chunks, file has " << total << ", starting fresh" << std::endl;
        return std::nullopt;
    }
    for (uint64_t index : saved->get_received_chunks()) {
        if (index >= total) {
            std::cerr << "[Resume] Checkpoint of " << id << " claims chunk " << index
                      << " beyond the file, starting fresh" << std::endl;
            bitmap_.reset();
            return std::nullopt;
        }
        bitmap_.mark_received(index, index + 1 == total);
    }

    ResumeRequest request = build_resume_request(id, bitmap_);
    transport.send(channel::RESUME, encode_resume_request(request));
    state_ = SenderResumeState::AwaitingResumeResponse;
    std::cout << "[Resume] Sent resume request for " << id << " claiming " << bitmap_.received_count()
              << "/" << total << " chunks (" << (request.received_bitmap.empty() ? "list" : "bitmap")
              << " form)" << std::endl;

    auto message = transport.receive(channel::RESUME, response_timeout_);
    if (!message) {
        std::cout << "[Resume] No response within " << response_timeout_.count()
                  << " ms, sending every chunk" << std::endl;
        state_ = SenderResumeState::Fresh;
        return std::nullopt;
    }

    try {
        ResumeResponse response = decode_resume_response(message->payload);
        if (!response.accepted) {
            std::cerr << "[Resume] Receiver rejected resume: " << response.error.value_or("no reason given")
                      << std::endl;
            bitmap_.reset();
            state_ = SenderResumeState::Fresh;
            return std::nullopt;
        }
        std::vector<uint64_t> wanted = accept_response(response);

        // Acknowledged state is now exactly what the receiver confirmed.
        bitmap_ = ChunkBitmap::with_exact_size(total);
        size_t next = 0;
        for (uint64_t index = 0; index < total; ++index) {
            if (next < wanted.size() && wanted[next] == index) {
                ++next;
                continue;
            }
            bitmap_.mark_received(index, index + 1 == total);
        }

        state_ = SenderResumeState::Resumed;
        std::cout << "[Resume] Resumed " << id << ": " << wanted.size() << " of " << total
                  << " chunks still to send" << std::endl;
        return wanted;
    } catch (const ProtocolViolation& e) {
        std::cerr << "[Resume] Bad resume response, starting fresh: " << e.what() << std::endl;
        bitmap_.reset();
        state_ = SenderResumeState::Fresh;
        return std::nullopt;
    }
}

std::vector<uint64_t> SenderResumeCoordinator::accept_response(const ResumeResponse& response) const {
    if (response.session_id != manifest_.session_id) {
        throw ProtocolViolation("Resume response is for session " + response.session_id + ", expected " +
                                manifest_.session_id);
    }
    std::vector<uint64_t> wanted = response.missing_chunks;
    std::sort(wanted.begin(), wanted.end());
    wanted.erase(std::unique(wanted.begin(), wanted.end()), wanted.end());
    if (!wanted.empty() && wanted.back() >= manifest_.total_chunks) {
        throw ProtocolViolation("Resume response asks for chunk " + std::to_string(wanted.back()) +
                                " of a " + std::to_string(manifest_.total_chunks) + "-chunk file");
    }
    return wanted;
}

// --- Receiver ---

ReceiverResumeCoordinator::ReceiverResumeCoordinator(TransferAssembler& assembler,
                                                     std::chrono::milliseconds wait_timeout)
    : assembler_(assembler), wait_timeout_(wait_timeout) {}

bool ReceiverResumeCoordinator::run(Transport& transport) {
    auto message = transport.receive(channel::RESUME, wait_timeout_);
    if (!message) {
        std::cout << "[Resume] No resume request within " << wait_timeout_.count()
                  << " ms, treating as a fresh transfer" << std::endl;
        return false;
    }

    state_ = ReceiverResumeState::EvaluatingResumeRequest;
    ResumeResponse response;
    try {
        response = evaluate(decode_resume_request(message->payload));
    } catch (const TransferError& e) {
        response = ResumeResponse::reject(assembler_.manifest().session_id, e.what());
    }
    if (!response.accepted) {
        std::cerr << "[Resume] Rejecting resume: " << response.error.value_or("") << std::endl;
    }

    transport.send(channel::RESUME, encode_resume_response(response));
    state_ = ReceiverResumeState::ResponseSent;
    return response.accepted;
}

ResumeResponse ReceiverResumeCoordinator::evaluate(const ResumeRequest& request) {
    const Manifest& manifest = assembler_.manifest();
    if (request.session_id != manifest.session_id) {
        return ResumeResponse::reject(manifest.session_id, "session id " + request.session_id +
                                                           " does not match " + manifest.session_id);
    }

    std::vector<uint64_t> claims = request.claimed_chunks();
    if (!claims.empty() && claims.back() >= manifest.total_chunks) {
        return ResumeResponse::reject(manifest.session_id,
                                      "claimed chunk " + std::to_string(claims.back()) + " is beyond the " +
                                      std::to_string(manifest.total_chunks) + "-chunk file");
    }

    std::vector<uint64_t> unverified;
    for (uint64_t index : claims) {
        if (!assembler_.bitmap().is_received(index)) {
            unverified.push_back(index);
        }
    }
    if (!unverified.empty() && !assembler_.partial_file_existed()) {
        return ResumeResponse::reject(manifest.session_id,
                                      "no partial file to back " + std::to_string(unverified.size()) +
                                      " claimed chunks");
    }

    size_t restored = 0;
    for (uint64_t index : unverified) {
        if (assembler_.restore_chunk(index)) {
            ++restored;
        }
    }
    if (restored > 0) {
        try {
            assembler_.checkpoint();
        } catch (const IoError& e) {
            std::cerr << "[Resume] Checkpoint after restore failed, continuing: " << e.what() << std::endl;
        }
    }

    ResumeResponse response;
    response.session_id = manifest.session_id;
    response.accepted = true;
    response.missing_chunks = assembler_.missing_chunks();
    response.chunks_remaining = response.missing_chunks.size();

    std::cout << "[Resume] Accepted resume of " << manifest.session_id << ": " << claims.size()
              << " claimed, " << restored << " verified from " << assembler_.part_path().filename().string()
              << ", " << (unverified.size() - restored) << " unverifiable, "
              << response.chunks_remaining << " missing" << std::endl;
    return response;
}

} // namespace ferry
