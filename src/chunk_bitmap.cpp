#include "chunk_bitmap.hpp"
#include "errors.hpp"
#include "ferry/fs_utils.hpp"
#include <algorithm>
#include <limits>

namespace ferry {

namespace {

const uint64_t MAX_PERSISTED = std::numeric_limits<uint32_t>::max();

inline int popcount8(uint8_t byte) {
    return __builtin_popcount(byte);
}

// Saturates at the persisted bound instead of wrapping.
uint64_t next_power_of_two(uint64_t value) {
    uint64_t result = 1;
    while (result < value && result < MAX_PERSISTED) {
        result <<= 1;
    }
    return std::min(result, MAX_PERSISTED);
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
}

uint32_t get_u32(const std::vector<uint8_t>& in, size_t pos) {
    return static_cast<uint32_t>(in[pos]) |
           (static_cast<uint32_t>(in[pos + 1]) << 8) |
           (static_cast<uint32_t>(in[pos + 2]) << 16) |
           (static_cast<uint32_t>(in[pos + 3]) << 24);
}

} // namespace

ChunkBitmap::ChunkBitmap() = default;

ChunkBitmap::ChunkBitmap(uint64_t capacity_hint) {
    if (capacity_hint > 0) {
        capacity_ = next_power_of_two(capacity_hint);
        bits_.assign(capacity_to_bytes(capacity_), 0);
    }
}

ChunkBitmap ChunkBitmap::with_exact_size(uint64_t total_chunks) {
    if (total_chunks > MAX_PERSISTED) {
        throw ProtocolViolation("Total of " + std::to_string(total_chunks) +
                                " chunks does not fit the persisted format");
    }
    ChunkBitmap bitmap;
    bitmap.capacity_ = total_chunks;
    bitmap.bits_.assign(capacity_to_bytes(total_chunks), 0);
    bitmap.total_chunks_ = total_chunks;
    bitmap.exact_size_ = true;
    return bitmap;
}

bool ChunkBitmap::is_received(uint64_t index) const {
    if (index >= capacity_) {
        return false;
    }
    return (bits_[index >> 3] & (1u << (index & 7))) != 0;
}

bool ChunkBitmap::mark_received(uint64_t index, bool is_last) {
    // Validate everything before touching state.
    if (index >= MAX_PERSISTED) {
        throw ProtocolViolation("Chunk " + std::to_string(index) +
                                " is beyond the largest supported index " +
                                std::to_string(MAX_PERSISTED - 1));
    }
    if (total_chunks_ && index >= *total_chunks_) {
        throw ProtocolViolation("Chunk " + std::to_string(index) +
                                " is beyond the end of file (total " +
                                std::to_string(*total_chunks_) + ")");
    }
    if (is_last) {
        if (total_chunks_ && *total_chunks_ != index + 1) {
            throw ProtocolViolation("End-of-file flag on chunk " + std::to_string(index) +
                                    " conflicts with known total of " +
                                    std::to_string(*total_chunks_) + " chunks");
        }
        if (highest_ && *highest_ > index) {
            throw ProtocolViolation("End-of-file flag on chunk " + std::to_string(index) +
                                    " but chunk " + std::to_string(*highest_) +
                                    " was already received");
        }
    }
    if (index >= capacity_) {
        if (exact_size_) {
            throw ProtocolViolation("Chunk " + std::to_string(index) +
                                    " exceeds fixed bitmap size " + std::to_string(capacity_));
        }
        grow_to_fit(index);
    }

    if (is_last && !eof_seen_) {
        eof_seen_ = true;
        total_chunks_ = index + 1;
    }

    if (is_received(index)) {
        return false;
    }
    set_bit(index);
    return true;
}

void ChunkBitmap::set_bit(uint64_t index) {
    bits_[index >> 3] |= static_cast<uint8_t>(1u << (index & 7));
    ++received_count_;
    if (!highest_ || index > *highest_) {
        highest_ = index;
    }
}

void ChunkBitmap::grow_to_fit(uint64_t index) {
    uint64_t new_capacity = std::max(next_power_of_two(index + 1), std::min(capacity_ * 2, MAX_PERSISTED));

    // Explicit reallocate-and-copy so capacity_ stays the authoritative size.
    std::vector<uint8_t> grown(capacity_to_bytes(new_capacity), 0);
    std::copy(bits_.begin(), bits_.end(), grown.begin());
    bits_.swap(grown);
    capacity_ = new_capacity;
}

bool ChunkBitmap::is_complete() const {
    return total_chunks_.has_value() && received_count_ == *total_chunks_;
}

double ChunkBitmap::progress() const {
    if (!total_chunks_ || *total_chunks_ == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(received_count_) / static_cast<double>(*total_chunks_);
}

std::vector<uint64_t> ChunkBitmap::find_missing() const {
    std::vector<uint64_t> missing;
    uint64_t limit = scan_limit();
    for (uint64_t i = 0; i < limit; ++i) {
        if (!is_received(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::vector<uint64_t> ChunkBitmap::find_first_missing(size_t max_count) const {
    std::vector<uint64_t> missing;
    uint64_t limit = scan_limit();
    for (uint64_t i = 0; i < limit && missing.size() < max_count; ++i) {
        if (!is_received(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::vector<uint64_t> ChunkBitmap::find_missing_in_range(uint64_t lo, uint64_t hi) const {
    std::vector<uint64_t> missing;
    uint64_t limit = std::min(total_chunks_ ? *total_chunks_ : capacity_, hi);
    for (uint64_t i = lo; i < limit; ++i) {
        if (!is_received(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::vector<ChunkBitmap::Gap> ChunkBitmap::find_gaps() const {
    std::vector<Gap> gaps;
    uint64_t limit = scan_limit();
    std::optional<uint64_t> gap_start;
    for (uint64_t i = 0; i < limit; ++i) {
        if (!is_received(i)) {
            if (!gap_start) {
                gap_start = i;
            }
        } else if (gap_start) {
            gaps.emplace_back(*gap_start, i - 1);
            gap_start.reset();
        }
    }
    if (gap_start) {
        gaps.emplace_back(*gap_start, limit - 1);
    }
    return gaps;
}

std::vector<uint64_t> ChunkBitmap::get_received_chunks() const {
    std::vector<uint64_t> received;
    received.reserve(static_cast<size_t>(received_count_));
    for (size_t byte_idx = 0; byte_idx < bits_.size(); ++byte_idx) {
        uint8_t byte = bits_[byte_idx];
        if (byte == 0) {
            continue;
        }
        for (unsigned bit = 0; bit < 8; ++bit) {
            if (byte & (1u << bit)) {
                received.push_back(static_cast<uint64_t>(byte_idx) * 8 + bit);
            }
        }
    }
    return received;
}

void ChunkBitmap::reset() {
    std::fill(bits_.begin(), bits_.end(), 0);
    received_count_ = 0;
    // An exact-size total comes from the manifest, not from a chunk.
    if (!exact_size_) {
        total_chunks_.reset();
    }
    highest_.reset();
    eof_seen_ = false;
}

// --- Persistence ---

std::vector<uint8_t> ChunkBitmap::serialize() const {
    if (capacity_ > MAX_PERSISTED || (total_chunks_ && *total_chunks_ > MAX_PERSISTED)) {
        throw ProtocolViolation("Bitmap of " + std::to_string(capacity_) +
                                " chunks does not fit the persisted format");
    }
    std::vector<uint8_t> out;
    out.reserve(BITMAP_HEADER_SIZE + bits_.size());
    put_u32(out, static_cast<uint32_t>(total_chunks_ ? *total_chunks_ : 0));
    put_u32(out, static_cast<uint32_t>(received_count_));
    out.push_back(eof_seen_ ? 1 : 0);
    put_u32(out, static_cast<uint32_t>(capacity_));
    out.insert(out.end(), bits_.begin(), bits_.end());
    return out;
}

ChunkBitmap ChunkBitmap::deserialize(const std::vector<uint8_t>& data, const std::string& origin) {
    if (data.size() < BITMAP_HEADER_SIZE) {
        throw CorruptBitmap(origin, "file is " + std::to_string(data.size()) +
                                    " bytes, shorter than the header");
    }
    uint32_t total = get_u32(data, 0);
    uint32_t received = get_u32(data, 4);
    uint8_t eof_flag = data[8];
    uint32_t capacity = get_u32(data, 9);

    size_t expected_len = BITMAP_HEADER_SIZE + capacity_to_bytes(capacity);
    if (data.size() != expected_len) {
        throw CorruptBitmap(origin, "capacity " + std::to_string(capacity) + " needs " +
                                    std::to_string(expected_len) + " bytes, file has " +
                                    std::to_string(data.size()));
    }
    if (eof_flag > 1) {
        throw CorruptBitmap(origin, "invalid eof flag " + std::to_string(eof_flag));
    }
    if (total > capacity) {
        throw CorruptBitmap(origin, "total " + std::to_string(total) +
                                    " exceeds capacity " + std::to_string(capacity));
    }
    if (eof_flag && total == 0) {
        throw CorruptBitmap(origin, "eof flag set without a total");
    }

    ChunkBitmap bitmap;
    bitmap.capacity_ = capacity;
    bitmap.bits_.assign(data.begin() + BITMAP_HEADER_SIZE, data.end());
    if (total > 0) {
        bitmap.total_chunks_ = total;
    }
    bitmap.eof_seen_ = eof_flag != 0;

    uint64_t population = 0;
    for (size_t i = 0; i < bitmap.bits_.size(); ++i) {
        population += popcount8(bitmap.bits_[i]);
    }
    if (population != received) {
        throw CorruptBitmap(origin, "stored received_count " + std::to_string(received) +
                                    " but " + std::to_string(population) + " bits are set");
    }
    // Bits past the capacity (or the known total) must be clear.
    uint64_t bound = total > 0 ? total : capacity;
    for (uint64_t i = bound; i < static_cast<uint64_t>(bitmap.bits_.size()) * 8; ++i) {
        if (bitmap.bits_[i >> 3] & (1u << (i & 7))) {
            throw CorruptBitmap(origin, "bit " + std::to_string(i) + " set past bound " +
                                        std::to_string(bound));
        }
    }

    bitmap.received_count_ = population;
    for (uint64_t i = bound; i > 0; --i) {
        if (bitmap.is_received(i - 1)) {
            bitmap.highest_ = i - 1;
            break;
        }
    }
    return bitmap;
}

void ChunkBitmap::save_to_disk(const std::string& path) const {
    std::vector<uint8_t> data = serialize();
    util::atomic_write(path, data.data(), data.size());
}

ChunkBitmap ChunkBitmap::load_from_disk(const std::string& path) {
    return deserialize(util::read_file(path), path);
}

ChunkBitmap ChunkBitmap::from_raw_bits(const std::vector<uint8_t>& bits, uint64_t capacity) {
    if (capacity_to_bytes(capacity) != bits.size()) {
        throw ProtocolViolation("Bitmap of " + std::to_string(bits.size()) +
                                " bytes cannot hold capacity " + std::to_string(capacity));
    }
    ChunkBitmap bitmap;
    bitmap.capacity_ = capacity;
    bitmap.bits_ = bits;
    for (uint64_t i = capacity; i < static_cast<uint64_t>(bits.size()) * 8; ++i) {
        bitmap.bits_[i >> 3] &= static_cast<uint8_t>(~(1u << (i & 7)));
    }
    for (uint8_t byte : bitmap.bits_) {
        bitmap.received_count_ += popcount8(byte);
    }
    for (uint64_t i = capacity; i > 0; --i) {
        if (bitmap.is_received(i - 1)) {
            bitmap.highest_ = i - 1;
            break;
        }
    }
    return bitmap;
}

bool ChunkBitmap::operator==(const ChunkBitmap& other) const {
    return capacity_ == other.capacity_ &&
           received_count_ == other.received_count_ &&
           total_chunks_ == other.total_chunks_ &&
           eof_seen_ == other.eof_seen_ &&
           bits_ == other.bits_;
}

} // namespace ferry
