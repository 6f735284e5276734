#include "errors.hpp"
#include "file_chunker.hpp"
#include "test_support.hpp"
#include <stdexcept>

using namespace ferry;

namespace {

const uint32_t CHUNK = MIN_CHUNK_SIZE;

int chunks_cover_file_in_order() {
    auto dir = ferry_test::temp_dir("ferry_chunker_order");
    std::vector<uint8_t> data = ferry_test::pattern_bytes(CHUNK * 3 + 100);
    ferry_test::write_file(dir / "src.bin", data);

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    CHECK(chunker.seekable());
    CHECK(*chunker.total_chunks() == 4);
    CHECK(chunker.file_size() == data.size());

    std::vector<uint8_t> rebuilt;
    uint64_t expected_index = 0;
    while (auto record = chunker.next_chunk()) {
        CHECK(record->index == expected_index);
        CHECK(record->byte_offset == expected_index * CHUNK);
        CHECK(record->is_last == (expected_index == 3));
        std::vector<uint8_t> bytes = decompressed_payload(*record);
        CHECK(checksum::verify(bytes, record->digest));
        rebuilt.insert(rebuilt.end(), bytes.begin(), bytes.end());
        ++expected_index;
    }
    CHECK(expected_index == 4);
    CHECK(rebuilt == data);
    CHECK(chunker.progress() == 100.0);
    CHECK(chunker.bytes_read() == data.size());
    CHECK(!chunker.next_chunk());
    return 0;
}

int exact_multiple_has_no_empty_tail() {
    auto dir = ferry_test::temp_dir("ferry_chunker_multiple");
    ferry_test::write_file(dir / "src.bin", ferry_test::noise_bytes(CHUNK * 2));

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    CHECK(*chunker.total_chunks() == 2);
    auto first = chunker.next_chunk();
    auto second = chunker.next_chunk();
    CHECK(first && !first->is_last);
    CHECK(second && second->is_last && second->length == CHUNK);
    CHECK(!chunker.next_chunk());
    return 0;
}

int empty_file_is_one_empty_chunk() {
    auto dir = ferry_test::temp_dir("ferry_chunker_empty");
    ferry_test::write_file(dir / "empty.bin", std::vector<uint8_t>());

    FileChunker chunker((dir / "empty.bin").string(), CHUNK);
    CHECK(*chunker.total_chunks() == 1);
    auto record = chunker.next_chunk();
    CHECK(record);
    CHECK(record->index == 0);
    CHECK(record->length == 0);
    CHECK(record->is_last);
    CHECK(!chunker.next_chunk());
    CHECK(chunk_count_for(0, CHUNK) == 1);
    return 0;
}

int seek_restrict_and_random_access() {
    auto dir = ferry_test::temp_dir("ferry_chunker_seek");
    std::vector<uint8_t> data = ferry_test::pattern_bytes(CHUNK * 8, 2);
    ferry_test::write_file(dir / "src.bin", data);

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    chunker.seek_to_chunk(5);
    auto record = chunker.next_chunk();
    CHECK(record->index == 5);
    CHECK(chunker.current_chunk() == 6);
    CHECK_THROWS(chunker.seek_to_chunk(9), std::out_of_range);

    chunker.reset();
    chunker.restrict_to({6, 1, 4});
    std::vector<uint64_t> produced;
    while (auto next = chunker.next_chunk()) {
        produced.push_back(next->index);
    }
    CHECK(produced == std::vector<uint64_t>({1, 4, 6}));

    chunker.clear_restriction();
    chunker.reset();
    CHECK(chunker.next_chunk()->index == 0);

    ChunkRecord direct = chunker.read_chunk(7);
    CHECK(direct.is_last);
    CHECK(decompressed_payload(direct) ==
          std::vector<uint8_t>(data.begin() + 7 * CHUNK, data.end()));
    // Random access leaves the cursor alone.
    CHECK(chunker.current_chunk() == 1);
    CHECK_THROWS(chunker.read_chunk(8), std::out_of_range);
    return 0;
}

int bad_arguments() {
    auto dir = ferry_test::temp_dir("ferry_chunker_args");
    ferry_test::write_file(dir / "src.bin", ferry_test::pattern_bytes(100));

    CHECK_THROWS(FileChunker((dir / "absent.bin").string(), CHUNK), IoError);
    CHECK_THROWS(FileChunker((dir / "src.bin").string(), MIN_CHUNK_SIZE - 1), ConfigError);
    CHECK_THROWS(FileChunker((dir / "src.bin").string(), MAX_CHUNK_SIZE + 1), ConfigError);

    FileChunker defaulted((dir / "src.bin").string());
    CHECK(defaulted.chunk_size() == DEFAULT_CHUNK_SIZE);
    return 0;
}

int compression_can_be_disabled() {
    auto dir = ferry_test::temp_dir("ferry_chunker_raw");
    ferry_test::write_file(dir / "src.bin", ferry_test::pattern_bytes(CHUNK * 2));

    FileChunker chunker((dir / "src.bin").string(), CHUNK, CompressionPolicy::disabled());
    auto record = chunker.next_chunk();
    CHECK(record->compression == CompressionAlgorithm::None);
    CHECK(record->payload.size() == CHUNK);
    return 0;
}

} // namespace

int main() {
    RUN(chunks_cover_file_in_order);
    RUN(exact_multiple_has_no_empty_tail);
    RUN(empty_file_is_one_empty_chunk);
    RUN(seek_restrict_and_random_access);
    RUN(bad_arguments);
    RUN(compression_can_be_disabled);
    return 0;
}
