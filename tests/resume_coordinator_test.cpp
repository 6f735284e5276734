#include "chunk_pipeline.hpp"
#include "errors.hpp"
#include "file_chunker.hpp"
#include "loopback_transport.hpp"
#include "manifest.hpp"
#include "resume_coordinator.hpp"
#include "test_support.hpp"
#include "transfer_assembler.hpp"
#include <thread>

using namespace ferry;
using namespace std::chrono_literals;

namespace {

const uint32_t CHUNK = MIN_CHUNK_SIZE;

struct Source {
    std::filesystem::path dir;
    std::string path;
    Manifest manifest;
};

Source make_source(const std::string& name, uint64_t chunks) {
    Source s;
    s.dir = ferry_test::temp_dir(name);
    std::filesystem::create_directories(s.dir / "src");
    s.path = (s.dir / "src" / "data.bin").string();
    ferry_test::write_file(s.path, ferry_test::noise_bytes(CHUNK * chunks, static_cast<uint32_t>(chunks)));
    s.manifest = build_manifest(s.path, CHUNK);
    return s;
}

ResumeRequest claim(const std::string& session_id, const std::vector<uint64_t>& chunks) {
    ResumeRequest request;
    request.session_id = session_id;
    request.received_chunks = chunks;
    return request;
}

int handshake_sends_only_missing_chunks() {
    Source s = make_source("ferry_resume_handshake", 500);
    SessionStore incoming(s.dir / "incoming");
    SessionStore outgoing(s.dir / "outgoing");
    FileChunker chunker(s.path, CHUNK);

    // Both sides hold 300 of 500 chunks from an interrupted attempt.
    {
        TransferAssembler assembler(s.manifest, incoming, s.dir / "out");
        for (uint64_t i = 0; i < 300; ++i) {
            assembler.receive_chunk(chunker.read_chunk(i));
        }
        assembler.checkpoint();
    }
    ChunkBitmap acked = ChunkBitmap::with_exact_size(500);
    for (uint64_t i = 0; i < 300; ++i) {
        acked.mark_received(i, false);
    }
    outgoing.save_bitmap(s.manifest.session_id, acked);

    auto ends = LoopbackTransport::make_pair();
    TransferAssembler assembler(s.manifest, incoming, s.dir / "out");
    CHECK(assembler.bitmap().received_count() == 300);
    ReceiverResumeCoordinator receiver(assembler, 5000ms);
    bool receiver_accepted = false;
    std::thread receiver_thread([&]() { receiver_accepted = receiver.run(*ends.second); });

    SenderResumeCoordinator sender(s.manifest, outgoing, 5000ms);
    std::optional<std::vector<uint64_t>> wanted = sender.negotiate(*ends.first);
    receiver_thread.join();

    CHECK(receiver_accepted);
    CHECK(receiver.state() == ReceiverResumeState::ResponseSent);
    CHECK(sender.state() == SenderResumeState::Resumed);
    CHECK(wanted);
    CHECK(wanted->size() == 200);
    CHECK(wanted->front() == 300 && wanted->back() == 499);
    CHECK(sender.take_bitmap().received_count() == 300);

    // The data round covers exactly the missing indices.
    ChunkPipeline pipeline(chunker, 2, 16);
    std::vector<uint64_t> emitted;
    pipeline.run(*wanted, [&](ChunkRecord&& record) { emitted.push_back(record.index); });
    CHECK(emitted == *wanted);
    return 0;
}

int evaluate_rejects_bad_requests() {
    Source s = make_source("ferry_resume_reject", 4);
    TransferAssembler assembler(s.manifest, SessionStore(s.dir / "incoming"), s.dir / "out");
    ReceiverResumeCoordinator receiver(assembler, 100ms);

    ResumeResponse foreign = receiver.evaluate(claim("0123456789abcdef0123456789abcdef", {0}));
    CHECK(!foreign.accepted);
    CHECK(foreign.error);

    ResumeResponse beyond = receiver.evaluate(claim(s.manifest.session_id, {1, 10}));
    CHECK(!beyond.accepted);

    // Claims with no partial file behind them.
    CHECK(!assembler.partial_file_existed());
    ResumeResponse unbacked = receiver.evaluate(claim(s.manifest.session_id, {0, 1}));
    CHECK(!unbacked.accepted);
    CHECK(assembler.bitmap().received_count() == 0);

    // An empty claim is a plain fresh start.
    ResumeResponse empty = receiver.evaluate(claim(s.manifest.session_id, {}));
    CHECK(empty.accepted);
    CHECK(empty.missing_chunks.size() == 4);
    return 0;
}

int evaluate_verifies_claims_against_partial_file() {
    Source s = make_source("ferry_resume_verify", 4);
    SessionStore incoming(s.dir / "incoming");
    FileChunker chunker(s.path, CHUNK);
    {
        // Written but never checkpointed.
        TransferAssembler first(s.manifest, incoming, s.dir / "out", 100);
        first.receive_chunk(chunker.read_chunk(0));
        first.receive_chunk(chunker.read_chunk(1));
    }
    CHECK(!incoming.has_checkpoint(s.manifest.session_id));

    TransferAssembler assembler(s.manifest, incoming, s.dir / "out", 100);
    CHECK(assembler.partial_file_existed());
    ReceiverResumeCoordinator receiver(assembler, 100ms);

    ResumeResponse response = receiver.evaluate(claim(s.manifest.session_id, {0, 1, 2}));
    CHECK(response.accepted);
    CHECK(response.missing_chunks == std::vector<uint64_t>({2, 3}));
    CHECK(response.chunks_remaining == 2);
    CHECK(incoming.has_checkpoint(s.manifest.session_id));
    return 0;
}

int sender_without_checkpoint_starts_fresh() {
    Source s = make_source("ferry_resume_fresh", 3);
    auto ends = LoopbackTransport::make_pair();
    SessionStore outgoing(s.dir / "outgoing");

    SenderResumeCoordinator sender(s.manifest, outgoing, 100ms);
    CHECK(!sender.negotiate(*ends.first));
    CHECK(ends.first->messages_sent(channel::RESUME) == 0);
    CHECK(sender.state() == SenderResumeState::Fresh);
    CHECK(sender.take_bitmap().received_count() == 0);
    return 0;
}

int sender_falls_back_on_timeout_and_rejection() {
    Source s = make_source("ferry_resume_fallback", 3);
    SessionStore outgoing(s.dir / "outgoing");
    ChunkBitmap acked = ChunkBitmap::with_exact_size(3);
    acked.mark_received(0, false);
    outgoing.save_bitmap(s.manifest.session_id, acked);

    {
        auto ends = LoopbackTransport::make_pair();
        SenderResumeCoordinator sender(s.manifest, outgoing, 100ms);
        CHECK(!sender.negotiate(*ends.first));
        CHECK(ends.first->messages_sent(channel::RESUME) == 1);
        CHECK(sender.state() == SenderResumeState::Fresh);
    }

    {
        auto ends = LoopbackTransport::make_pair();
        std::thread peer([&]() {
            auto request = ends.second->receive(channel::RESUME, 5000ms);
            if (request) {
                ends.second->send(channel::RESUME,
                                  encode_resume_response(ResumeResponse::reject(s.manifest.session_id, "no")));
            }
        });
        SenderResumeCoordinator sender(s.manifest, outgoing, 5000ms);
        CHECK(!sender.negotiate(*ends.first));
        peer.join();
        CHECK(sender.state() == SenderResumeState::Fresh);
        CHECK(sender.take_bitmap().received_count() == 0);
    }

    // Corrupt checkpoint: fresh, nothing sent.
    std::filesystem::resize_file(outgoing.bitmap_path(s.manifest.session_id), 3);
    auto ends = LoopbackTransport::make_pair();
    SenderResumeCoordinator sender(s.manifest, outgoing, 100ms);
    CHECK(!sender.negotiate(*ends.first));
    CHECK(ends.first->messages_sent(channel::RESUME) == 0);
    return 0;
}

int response_must_match_session() {
    Source s = make_source("ferry_resume_accept", 3);
    SessionStore outgoing(s.dir / "outgoing");
    SenderResumeCoordinator sender(s.manifest, outgoing, 100ms);

    ResumeResponse response;
    response.session_id = s.manifest.session_id;
    response.accepted = true;
    response.missing_chunks = {2, 1, 2};
    CHECK(sender.accept_response(response) == std::vector<uint64_t>({1, 2}));

    response.missing_chunks = {3};
    CHECK_THROWS(sender.accept_response(response), ProtocolViolation);

    response.missing_chunks = {1};
    response.session_id = "someone-else";
    CHECK_THROWS(sender.accept_response(response), ProtocolViolation);
    CHECK(std::string(to_string(SenderResumeState::AwaitingResumeResponse)) == "AwaitingResumeResponse");
    return 0;
}

} // namespace

int main() {
    RUN(handshake_sends_only_missing_chunks);
    RUN(evaluate_rejects_bad_requests);
    RUN(evaluate_verifies_claims_against_partial_file);
    RUN(sender_without_checkpoint_starts_fresh);
    RUN(sender_falls_back_on_timeout_and_rejection);
    RUN(response_must_match_session);
    return 0;
}
