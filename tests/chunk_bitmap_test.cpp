#include "chunk_bitmap.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <limits>

using namespace ferry;

namespace {

int mark_reports_first_time_only() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(10);
    CHECK(bitmap.mark_received(4, false));
    CHECK(!bitmap.mark_received(4, false));
    CHECK(bitmap.received_count() == 1);
    CHECK(bitmap.is_received(4));
    CHECK(!bitmap.is_received(5));
    CHECK(!bitmap.is_received(1000));
    return 0;
}

int gaps_and_missing() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(10);
    for (uint64_t index : {0, 1, 2, 5, 6}) {
        bitmap.mark_received(index, false);
    }
    bitmap.mark_received(9, true);

    std::vector<ChunkBitmap::Gap> gaps = bitmap.find_gaps();
    CHECK(gaps.size() == 2);
    CHECK(gaps[0] == ChunkBitmap::Gap(3, 4));
    CHECK(gaps[1] == ChunkBitmap::Gap(7, 8));

    CHECK(bitmap.find_first_missing(3) == std::vector<uint64_t>({3, 4, 7}));
    CHECK(bitmap.find_missing() == std::vector<uint64_t>({3, 4, 7, 8}));
    CHECK(bitmap.find_missing_in_range(4, 8) == std::vector<uint64_t>({4, 7}));
    CHECK(bitmap.get_received_chunks() == std::vector<uint64_t>({0, 1, 2, 5, 6, 9}));
    CHECK(!bitmap.is_complete());
    CHECK(bitmap.progress() == 60.0);
    return 0;
}

int growth_and_eof() {
    ChunkBitmap bitmap;
    CHECK(bitmap.capacity() == 0);
    CHECK(!bitmap.total_chunks());
    CHECK(bitmap.progress() == 0.0);

    bitmap.mark_received(0, false);
    bitmap.mark_received(100, false);
    CHECK(bitmap.capacity() >= 101);
    CHECK(bitmap.is_received(0));
    CHECK(bitmap.is_received(100));
    CHECK(*bitmap.highest_received() == 100);
    // Total unknown: nothing is reported missing yet.
    CHECK(bitmap.find_missing().empty());

    bitmap.mark_received(120, true);
    CHECK(bitmap.eof_seen());
    CHECK(*bitmap.total_chunks() == 121);
    CHECK(bitmap.find_missing().size() == 121 - 3);

    // Past the end, or a second end of file elsewhere.
    CHECK_THROWS(bitmap.mark_received(121, false), ProtocolViolation);
    CHECK_THROWS(bitmap.mark_received(110, true), ProtocolViolation);
    CHECK(bitmap.received_count() == 3);
    return 0;
}

int huge_indices_are_rejected_untouched() {
    ChunkBitmap bitmap;
    bitmap.mark_received(3, false);
    uint64_t capacity = bitmap.capacity();

    CHECK_THROWS(bitmap.mark_received(std::numeric_limits<uint64_t>::max(), false), ProtocolViolation);
    CHECK_THROWS(bitmap.mark_received((uint64_t(1) << 63) + 1, false), ProtocolViolation);
    CHECK_THROWS(bitmap.mark_received(std::numeric_limits<uint32_t>::max(), true), ProtocolViolation);
    CHECK(bitmap.capacity() == capacity);
    CHECK(bitmap.received_count() == 1);
    CHECK(!bitmap.eof_seen());
    CHECK_THROWS(ChunkBitmap::with_exact_size(uint64_t(1) << 40), ProtocolViolation);
    return 0;
}

int eof_before_higher_chunk_is_rejected() {
    ChunkBitmap bitmap(16);
    bitmap.mark_received(12, false);
    CHECK_THROWS(bitmap.mark_received(5, true), ProtocolViolation);
    CHECK(!bitmap.eof_seen());
    CHECK(!bitmap.is_received(5));
    return 0;
}

int exact_size_never_grows() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(5);
    CHECK(bitmap.exact_size());
    CHECK(bitmap.memory_usage() == 1);
    CHECK_THROWS(bitmap.mark_received(5, false), ProtocolViolation);
    for (uint64_t i = 0; i < 5; ++i) {
        bitmap.mark_received(i, i == 4);
    }
    CHECK(bitmap.is_complete());
    CHECK(bitmap.progress() == 100.0);

    bitmap.reset();
    CHECK(bitmap.received_count() == 0);
    CHECK(*bitmap.total_chunks() == 5);
    CHECK(bitmap.find_missing().size() == 5);
    return 0;
}

int persistence_round_trip() {
    auto dir = ferry_test::temp_dir("ferry_bitmap_test");
    std::string path = (dir / "session.bitmap").string();

    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(10);
    for (uint64_t index : {0, 3, 7}) {
        bitmap.mark_received(index, false);
    }
    bitmap.mark_received(9, true);
    bitmap.save_to_disk(path);

    CHECK(std::filesystem::file_size(path) == BITMAP_HEADER_SIZE + 2);
    ChunkBitmap loaded = ChunkBitmap::load_from_disk(path);
    CHECK(loaded == bitmap);
    CHECK(loaded.get_received_chunks() == bitmap.get_received_chunks());
    CHECK(*loaded.highest_received() == 9);
    return 0;
}

int truncated_file_is_corrupt() {
    auto dir = ferry_test::temp_dir("ferry_bitmap_truncated");
    std::string path = (dir / "session.bitmap").string();

    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(10);
    bitmap.mark_received(2, false);
    bitmap.save_to_disk(path);
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 1);

    CHECK_THROWS(ChunkBitmap::load_from_disk(path), CorruptBitmap);
    CHECK_THROWS(ChunkBitmap::load_from_disk((dir / "missing.bitmap").string()), IoError);
    return 0;
}

int inconsistent_header_is_corrupt() {
    ChunkBitmap bitmap = ChunkBitmap::with_exact_size(10);
    bitmap.mark_received(1, false);
    bitmap.mark_received(2, false);
    std::vector<uint8_t> bytes = bitmap.serialize();

    std::vector<uint8_t> wrong_count = bytes;
    wrong_count[4] = 5;
    CHECK_THROWS(ChunkBitmap::deserialize(wrong_count, "memory"), CorruptBitmap);

    std::vector<uint8_t> bad_flag = bytes;
    bad_flag[8] = 2;
    CHECK_THROWS(ChunkBitmap::deserialize(bad_flag, "memory"), CorruptBitmap);

    std::vector<uint8_t> stray_bit = bytes;
    stray_bit[BITMAP_HEADER_SIZE + 1] |= 0x80; // bit 15, past the total of 10
    stray_bit[4] = 3;
    CHECK_THROWS(ChunkBitmap::deserialize(stray_bit, "memory"), CorruptBitmap);

    CHECK(ChunkBitmap::deserialize(bytes, "memory") == bitmap);
    return 0;
}

int raw_bits_rebuild() {
    ChunkBitmap bitmap = ChunkBitmap::from_raw_bits({0x0f, 0x01}, 12);
    CHECK(bitmap.received_count() == 5);
    CHECK(bitmap.get_received_chunks() == std::vector<uint64_t>({0, 1, 2, 3, 8}));
    CHECK_THROWS(ChunkBitmap::from_raw_bits({0x01}, 12), ProtocolViolation);
    return 0;
}

} // namespace

int main() {
    RUN(mark_reports_first_time_only);
    RUN(gaps_and_missing);
    RUN(growth_and_eof);
    RUN(huge_indices_are_rejected_untouched);
    RUN(eof_before_higher_chunk_is_rejected);
    RUN(exact_size_never_grows);
    RUN(persistence_round_trip);
    RUN(truncated_file_is_corrupt);
    RUN(inconsistent_header_is_corrupt);
    RUN(raw_bits_rebuild);
    return 0;
}
