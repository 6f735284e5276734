#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

// Size of the fixed part of the persisted bitmap:
// [total_chunks u32][received_count u32][eof_seen u8][capacity u32]
const size_t BITMAP_HEADER_SIZE = 13;

// One bit per chunk index, set once the chunk has been durably accepted.
//
// Capacity grows by doubling (never shrinking) unless the bitmap was built
// with with_exact_size(). Not internally synchronized: one writer per
// transfer session.
class ChunkBitmap {
public:
    using Gap = std::pair<uint64_t, uint64_t>; // [first, last] inclusive

    // Empty bitmap, allocates on first mark.
    ChunkBitmap();
    // Pre-allocates the next power of two >= capacity_hint bits.
    explicit ChunkBitmap(uint64_t capacity_hint);
    // Exactly ceil(total/8) bytes, total known up front, never grows.
    static ChunkBitmap with_exact_size(uint64_t total_chunks);

    // Returns true if `index` was not marked before. Throws ProtocolViolation
    // (without mutating anything) for an index past the known end of file or
    // the persisted u32 range, or an end-of-file flag that contradicts the
    // one already seen.
    bool mark_received(uint64_t index, bool is_last);

    bool is_received(uint64_t index) const;
    bool is_complete() const;
    // 0..100, 0 while the total is unknown.
    double progress() const;

    std::vector<uint64_t> find_missing() const;
    std::vector<uint64_t> find_first_missing(size_t max_count) const;
    // Missing indices in [lo, hi), clipped to the total (or capacity if unknown).
    std::vector<uint64_t> find_missing_in_range(uint64_t lo, uint64_t hi) const;
    std::vector<Gap> find_gaps() const;
    std::vector<uint64_t> get_received_chunks() const;

    void reset();

    // Binary layout of BITMAP_HEADER_SIZE header plus raw bits. save_to_disk
    // returns only after the data is fsync'd; load_from_disk throws
    // CorruptBitmap for any inconsistency and IoError if unreadable.
    void save_to_disk(const std::string& path) const;
    static ChunkBitmap load_from_disk(const std::string& path);

    std::vector<uint8_t> serialize() const;
    static ChunkBitmap deserialize(const std::vector<uint8_t>& data, const std::string& origin);

    // Rebuilds a bitmap from raw bit bytes, as carried by a resume request.
    static ChunkBitmap from_raw_bits(const std::vector<uint8_t>& bits, uint64_t capacity);

    std::optional<uint64_t> total_chunks() const { return total_chunks_; }
    uint64_t received_count() const { return received_count_; }
    uint64_t capacity() const { return capacity_; }
    bool eof_seen() const { return eof_seen_; }
    bool exact_size() const { return exact_size_; }
    std::optional<uint64_t> highest_received() const { return highest_; }
    const std::vector<uint8_t>& raw_bits() const { return bits_; }
    size_t memory_usage() const { return bits_.size(); }

    bool operator==(const ChunkBitmap& other) const;
    bool operator!=(const ChunkBitmap& other) const { return !(*this == other); }

private:
    static size_t capacity_to_bytes(uint64_t capacity) {
        return static_cast<size_t>((capacity + 7) / 8);
    }

    void grow_to_fit(uint64_t index);
    void set_bit(uint64_t index);
    // Scan bound for missing-chunk queries: the total, or 0 if unknown.
    uint64_t scan_limit() const { return total_chunks_ ? *total_chunks_ : 0; }

    std::vector<uint8_t> bits_;
    uint64_t capacity_ = 0;
    uint64_t received_count_ = 0;
    std::optional<uint64_t> total_chunks_;
    std::optional<uint64_t> highest_;
    bool eof_seen_ = false;
    bool exact_size_ = false;
};

} // namespace ferry
