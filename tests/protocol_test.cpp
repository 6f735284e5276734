#include "errors.hpp"
#include "ferry.pb.h"
#include "protocol.hpp"
#include "test_support.hpp"

using namespace ferry;

namespace {

int sparse_claims_use_the_list() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(100000);
    bitmap.mark_received(5, false);
    bitmap.mark_received(90000, false);

    ResumeRequest request = build_resume_request("s1", bitmap);
    CHECK(request.received_bitmap.empty());
    CHECK(request.received_chunks == std::vector<uint64_t>({5, 90000}));
    CHECK(request.last_chunk_id == 90000);

    ResumeRequest decoded = decode_resume_request(encode_resume_request(request));
    CHECK(decoded.session_id == "s1");
    CHECK(decoded.claimed_chunks() == std::vector<uint64_t>({5, 90000}));
    return 0;
}

int dense_claims_use_the_bitmap() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(500);
    for (uint64_t i = 0; i < 300; ++i) {
        bitmap.mark_received(i, false);
    }
    ResumeRequest request = build_resume_request("s2", bitmap);
    CHECK(request.received_chunks.empty());
    // Bits up to index 299.
    CHECK(request.received_bitmap.size() == 38);

    std::vector<uint64_t> claimed = decode_resume_request(encode_resume_request(request)).claimed_chunks();
    CHECK(claimed.size() == 300);
    CHECK(claimed.front() == 0 && claimed.back() == 299);
    return 0;
}

int response_round_trip() {
    ResumeResponse response;
    response.session_id = "s3";
    response.accepted = true;
    response.missing_chunks = {4, 8, 15};
    response.chunks_remaining = 3;
    ResumeResponse decoded = decode_resume_response(encode_resume_response(response));
    CHECK(decoded.accepted);
    CHECK(decoded.missing_chunks == response.missing_chunks);
    CHECK(decoded.chunks_remaining == 3);
    CHECK(!decoded.error);

    ResumeResponse rejected = decode_resume_response(encode_resume_response(ResumeResponse::reject("s3", "nope")));
    CHECK(!rejected.accepted);
    CHECK(*rejected.error == "nope");
    return 0;
}

int retransmit_ranges_are_coalesced() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(20);
    for (uint64_t i = 0; i < 20; ++i) {
        if (i != 3 && i != 4 && i != 5 && i != 11 && i != 17) {
            bitmap.mark_received(i, i == 19);
        }
    }
    RetransmitRequest request = build_retransmit_request("s4", bitmap, 4);
    CHECK(!request.open_ended);
    CHECK(request.ranges.size() == 2);
    CHECK(request.ranges[0] == ChunkBitmap::Gap(3, 5));
    CHECK(request.ranges[1] == ChunkBitmap::Gap(11, 11));
    CHECK(request.indices(20) == std::vector<uint64_t>({3, 4, 5, 11}));

    ControlMessage decoded = decode_control(encode_control(request));
    CHECK(decoded.type == ControlMessage::Type::Retransmit);
    CHECK(decoded.retransmit.indices(20) == request.indices(20));
    return 0;
}

int unknown_total_asks_for_the_tail() {
    ChunkBitmap bitmap;
    bitmap.mark_received(0, false);
    bitmap.mark_received(2, false);
    RetransmitRequest request = build_retransmit_request("s5", bitmap, 10);
    CHECK(request.open_ended);
    CHECK(request.open_from == 3);
    CHECK(request.indices(6) == std::vector<uint64_t>({1, 3, 4, 5}));
    return 0;
}

int control_envelope() {
    ChunkAck ack;
    ack.session_id = "s6";
    ack.chunk_ids = {1, 2, 3};
    ControlMessage decoded_ack = decode_control(encode_control(ack));
    CHECK(decoded_ack.type == ControlMessage::Type::Ack);
    CHECK(decoded_ack.ack.chunk_ids == ack.chunk_ids);

    TransferComplete complete;
    complete.session_id = "s6";
    complete.ok = false;
    complete.error = "digest mismatch";
    ControlMessage decoded_complete = decode_control(encode_control(complete));
    CHECK(decoded_complete.type == ControlMessage::Type::Complete);
    CHECK(!decoded_complete.complete.ok);
    CHECK(decoded_complete.complete.error == "digest mismatch");

    CHECK_THROWS(decode_control(std::string()), ProtocolViolation);

    wire::ControlMessage reversed;
    auto* range = reversed.mutable_retransmit()->add_ranges();
    range->set_first(9);
    range->set_last(2);
    CHECK_THROWS(decode_control(reversed.SerializeAsString()), ProtocolViolation);
    return 0;
}

int hash_check_keeps_digests_whole() {
    HashCheckRequest request;
    request.session_id = "s1";
    request.chunk_hashes = {checksum::digest(std::string("a")), checksum::digest(std::string("b"))};
    HashCheckRequest decoded = decode_hash_check_request(encode_hash_check_request(request));
    CHECK(decoded.session_id == "s1");
    CHECK(decoded.chunk_hashes == request.chunk_hashes);

    HashCheckResponse empty = decode_hash_check_response(encode_hash_check_response(HashCheckResponse{"s1", {}}));
    CHECK(empty.existing_hashes.empty());
    CHECK_THROWS(decode_hash_check_response(std::string("\xff\xff\xff\xff\x0f", 5)), ProtocolViolation);
    return 0;
}

} // namespace

int main() {
    RUN(sparse_claims_use_the_list);
    RUN(dense_claims_use_the_bitmap);
    RUN(response_round_trip);
    RUN(retransmit_ranges_are_coalesced);
    RUN(unknown_total_asks_for_the_tail);
    RUN(control_envelope);
    RUN(hash_check_keeps_digests_whole);
    return 0;
}
