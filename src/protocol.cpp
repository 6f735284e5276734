#include "protocol.hpp"
#include "errors.hpp"
#include "ferry.pb.h"
#include <algorithm>

namespace ferry {

namespace {

size_t varint_size(uint64_t value) {
    size_t size = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++size;
    }
    return size;
}

std::vector<ChunkBitmap::Gap> coalesce(const std::vector<uint64_t>& sorted) {
    std::vector<ChunkBitmap::Gap> ranges;
    for (uint64_t index : sorted) {
        if (!ranges.empty() && ranges.back().second + 1 == index) {
            ranges.back().second = index;
        } else {
            ranges.emplace_back(index, index);
        }
    }
    return ranges;
}

} // namespace

// --- Resume ---

std::vector<uint64_t> ResumeRequest::claimed_chunks() const {
    if (!received_bitmap.empty()) {
        return ChunkBitmap::from_raw_bits(received_bitmap, received_bitmap.size() * 8)
            .get_received_chunks();
    }
    std::vector<uint64_t> claimed = received_chunks;
    std::sort(claimed.begin(), claimed.end());
    claimed.erase(std::unique(claimed.begin(), claimed.end()), claimed.end());
    return claimed;
}

ResumeResponse ResumeResponse::reject(const std::string& session_id, const std::string& reason) {
    ResumeResponse response;
    response.session_id = session_id;
    response.accepted = false;
    response.error = reason;
    return response;
}

ResumeRequest build_resume_request(const std::string& session_id, const ChunkBitmap& bitmap) {
    ResumeRequest request;
    request.session_id = session_id;
    request.last_chunk_id = bitmap.highest_received() ? *bitmap.highest_received() : 0;

    std::vector<uint64_t> received = bitmap.get_received_chunks();
    size_t list_cost = 0;
    for (uint64_t index : received) {
        list_cost += varint_size(index);
    }
    // Raw bits only need to reach the highest received index.
    size_t bitmap_cost = received.empty() ? 0 : static_cast<size_t>(request.last_chunk_id / 8 + 1);

    if (!received.empty() && bitmap_cost < list_cost) {
        const auto& bits = bitmap.raw_bits();
        request.received_bitmap.assign(bits.begin(), bits.begin() + bitmap_cost);
    } else {
        request.received_chunks = std::move(received);
    }
    return request;
}

std::string encode_resume_request(const ResumeRequest& request) {
    wire::ResumeRequest msg;
    msg.set_session_id(request.session_id);
    for (uint64_t index : request.received_chunks) {
        msg.add_received_chunks(index);
    }
    msg.set_received_bitmap(request.received_bitmap.data(), request.received_bitmap.size());
    msg.set_last_chunk_id(request.last_chunk_id);

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode resume request");
    }
    return out;
}

ResumeRequest decode_resume_request(const std::string& bytes) {
    wire::ResumeRequest msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed resume request");
    }
    ResumeRequest request;
    request.session_id = msg.session_id();
    request.received_chunks.assign(msg.received_chunks().begin(), msg.received_chunks().end());
    request.received_bitmap.assign(msg.received_bitmap().begin(), msg.received_bitmap().end());
    request.last_chunk_id = msg.last_chunk_id();
    return request;
}

std::string encode_resume_response(const ResumeResponse& response) {
    wire::ResumeResponse msg;
    msg.set_session_id(response.session_id);
    msg.set_accepted(response.accepted);
    for (uint64_t index : response.missing_chunks) {
        msg.add_missing_chunks(index);
    }
    msg.set_chunks_remaining(response.chunks_remaining);
    if (response.error) {
        msg.set_error(*response.error);
    }

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode resume response");
    }
    return out;
}

ResumeResponse decode_resume_response(const std::string& bytes) {
    wire::ResumeResponse msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed resume response");
    }
    ResumeResponse response;
    response.session_id = msg.session_id();
    response.accepted = msg.accepted();
    response.missing_chunks.assign(msg.missing_chunks().begin(), msg.missing_chunks().end());
    response.chunks_remaining = msg.chunks_remaining();
    if (!msg.error().empty()) {
        response.error = msg.error();
    }
    return response;
}

// --- Deduplication ---

std::string encode_hash_check_request(const HashCheckRequest& request) {
    wire::HashCheckRequest msg;
    msg.set_session_id(request.session_id);
    for (const Digest& hash : request.chunk_hashes) {
        msg.add_chunk_hashes(hash.data(), hash.size());
    }

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode hash check request");
    }
    return out;
}

HashCheckRequest decode_hash_check_request(const std::string& bytes) {
    wire::HashCheckRequest msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed hash check request");
    }
    HashCheckRequest request;
    request.session_id = msg.session_id();
    for (const std::string& hash : msg.chunk_hashes()) {
        request.chunk_hashes.emplace_back(hash.begin(), hash.end());
    }
    return request;
}

std::string encode_hash_check_response(const HashCheckResponse& response) {
    wire::HashCheckResponse msg;
    msg.set_session_id(response.session_id);
    for (const Digest& hash : response.existing_hashes) {
        msg.add_existing_hashes(hash.data(), hash.size());
    }

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode hash check response");
    }
    return out;
}

HashCheckResponse decode_hash_check_response(const std::string& bytes) {
    wire::HashCheckResponse msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed hash check response");
    }
    HashCheckResponse response;
    response.session_id = msg.session_id();
    for (const std::string& hash : msg.existing_hashes()) {
        response.existing_hashes.emplace_back(hash.begin(), hash.end());
    }
    return response;
}

// --- Retransmission ---

std::vector<uint64_t> RetransmitRequest::indices(uint64_t total_chunks) const {
    std::vector<uint64_t> out;
    for (const auto& range : ranges) {
        for (uint64_t i = range.first; i <= range.second && i < total_chunks; ++i) {
            out.push_back(i);
        }
    }
    if (open_ended) {
        for (uint64_t i = open_from; i < total_chunks; ++i) {
            out.push_back(i);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

RetransmitRequest build_retransmit_request(const std::string& session_id, const ChunkBitmap& bitmap,
                                           size_t max_indices) {
    RetransmitRequest request;
    request.session_id = session_id;

    if (bitmap.total_chunks()) {
        request.ranges = coalesce(bitmap.find_first_missing(max_indices));
        return request;
    }

    // End of file not seen yet: holes below the highest index, then the tail.
    uint64_t open_from = bitmap.highest_received() ? *bitmap.highest_received() + 1 : 0;
    std::vector<uint64_t> holes = bitmap.find_missing_in_range(0, open_from);
    if (holes.size() > max_indices) {
        holes.resize(max_indices);
    }
    request.ranges = coalesce(holes);
    request.open_ended = true;
    request.open_from = open_from;
    return request;
}

// --- Control envelope ---

namespace {

std::string serialize_control(const wire::ControlMessage& msg) {
    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode control message");
    }
    return out;
}

} // namespace

std::string encode_control(const RetransmitRequest& request) {
    wire::ControlMessage msg;
    auto* retransmit = msg.mutable_retransmit();
    retransmit->set_session_id(request.session_id);
    for (const auto& range : request.ranges) {
        auto* entry = retransmit->add_ranges();
        entry->set_first(range.first);
        entry->set_last(range.second);
    }
    retransmit->set_open_ended(request.open_ended);
    retransmit->set_open_from(request.open_from);
    return serialize_control(msg);
}

std::string encode_control(const ChunkAck& ack) {
    wire::ControlMessage msg;
    auto* entry = msg.mutable_ack();
    entry->set_session_id(ack.session_id);
    for (uint64_t index : ack.chunk_ids) {
        entry->add_chunk_ids(index);
    }
    return serialize_control(msg);
}

std::string encode_control(const TransferComplete& complete) {
    wire::ControlMessage msg;
    auto* entry = msg.mutable_complete();
    entry->set_session_id(complete.session_id);
    entry->set_ok(complete.ok);
    entry->set_error(complete.error);
    return serialize_control(msg);
}

ControlMessage decode_control(const std::string& bytes) {
    wire::ControlMessage msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed control message");
    }

    ControlMessage out;
    switch (msg.body_case()) {
        case wire::ControlMessage::kRetransmit: {
            const auto& in = msg.retransmit();
            out.type = ControlMessage::Type::Retransmit;
            out.retransmit.session_id = in.session_id();
            for (const auto& range : in.ranges()) {
                if (range.last() < range.first()) {
                    throw ProtocolViolation("Retransmit range " + std::to_string(range.first()) + ".." +
                                            std::to_string(range.last()) + " is reversed");
                }
                out.retransmit.ranges.emplace_back(range.first(), range.last());
            }
            out.retransmit.open_ended = in.open_ended();
            out.retransmit.open_from = in.open_from();
            break;
        }
        case wire::ControlMessage::kAck:
            out.type = ControlMessage::Type::Ack;
            out.ack.session_id = msg.ack().session_id();
            out.ack.chunk_ids.assign(msg.ack().chunk_ids().begin(), msg.ack().chunk_ids().end());
            break;
        case wire::ControlMessage::kComplete:
            out.type = ControlMessage::Type::Complete;
            out.complete.session_id = msg.complete().session_id();
            out.complete.ok = msg.complete().ok();
            out.complete.error = msg.complete().error();
            break;
        default:
            throw ProtocolViolation("Control message carries no payload");
    }
    return out;
}

} // namespace ferry
