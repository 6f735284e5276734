#pragma once

#include "chunk_bitmap.hpp"
#include "manifest.hpp"
#include "protocol.hpp"
#include "session_store.hpp"
#include "transport.hpp"
#include <chrono>
#include <optional>
#include <vector>

namespace ferry {

class TransferAssembler;

enum class SenderResumeState {
    Fresh,
    AwaitingResumeResponse,
    Resumed
};

enum class ReceiverResumeState {
    Fresh,
    EvaluatingResumeRequest,
    ResponseSent
};

const char* to_string(SenderResumeState state);
const char* to_string(ReceiverResumeState state);

// Sender half of the resume handshake. Every failure path (no checkpoint,
// corrupt checkpoint, rejection, timeout, bad response) ends in a fresh
// transfer; none of them is an error for the caller.
class SenderResumeCoordinator {
public:
    SenderResumeCoordinator(const Manifest& manifest, const SessionStore& store,
                            std::chrono::milliseconds response_timeout);

    // Indices to send. nullopt means every chunk.
    std::optional<std::vector<uint64_t>> negotiate(Transport& transport);

    // Applies a response to this session. Throws ProtocolViolation for a
    // foreign session id or an index outside the file.
    std::vector<uint64_t> accept_response(const ResumeResponse& response) const;

    SenderResumeState state() const { return state_; }

    // Acknowledged chunks: the checkpoint loaded by negotiate(), or an empty
    // exact-size bitmap. Reset if the receiver rejected the resume.
    ChunkBitmap take_bitmap() { return std::move(bitmap_); }

private:
    Manifest manifest_;
    const SessionStore& store_;
    std::chrono::milliseconds response_timeout_;
    SenderResumeState state_ = SenderResumeState::Fresh;
    ChunkBitmap bitmap_;
};

// Receiver half. Claims are only marked after the bytes in the .part file
// verify against the manifest.
class ReceiverResumeCoordinator {
public:
    ReceiverResumeCoordinator(TransferAssembler& assembler, std::chrono::milliseconds wait_timeout);

    // Waits for one request and answers it. Returns true if a resume was
    // accepted, false on timeout or rejection.
    bool run(Transport& transport);

    // Decides the response to a request and marks verified claims.
    ResumeResponse evaluate(const ResumeRequest& request);

    ReceiverResumeState state() const { return state_; }

private:
    TransferAssembler& assembler_;
    std::chrono::milliseconds wait_timeout_;
    ReceiverResumeState state_ = ReceiverResumeState::Fresh;
};

} // namespace ferry
