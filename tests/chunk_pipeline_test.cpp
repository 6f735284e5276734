#include "chunk_pipeline.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <stdexcept>

using namespace ferry;

namespace {

const uint32_t CHUNK = MIN_CHUNK_SIZE;

int records_arrive_in_index_order() {
    auto dir = ferry_test::temp_dir("ferry_pipeline_order");
    std::vector<uint8_t> data = ferry_test::pattern_bytes(CHUNK * 37 + 9, 4);
    ferry_test::write_file(dir / "src.bin", data);

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    ChunkPipeline pipeline(chunker, 4, 5);
    CHECK(pipeline.worker_threads() == 4);

    std::vector<uint64_t> order;
    std::vector<uint8_t> rebuilt;
    pipeline.run_all([&](ChunkRecord&& record) {
        order.push_back(record.index);
        std::vector<uint8_t> bytes = decompressed_payload(record);
        rebuilt.insert(rebuilt.end(), bytes.begin(), bytes.end());
    });

    CHECK(order.size() == 38);
    for (size_t i = 0; i < order.size(); ++i) {
        CHECK(order[i] == i);
    }
    CHECK(rebuilt == data);
    return 0;
}

int subset_is_sorted_and_deduplicated() {
    auto dir = ferry_test::temp_dir("ferry_pipeline_subset");
    ferry_test::write_file(dir / "src.bin", ferry_test::noise_bytes(CHUNK * 20));

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    ChunkPipeline pipeline(chunker, 0, 3);
    CHECK(pipeline.worker_threads() >= 1);

    std::vector<uint64_t> order;
    pipeline.run({17, 2, 9, 2, 0, 19, 9}, [&](ChunkRecord&& record) { order.push_back(record.index); });
    CHECK(order == std::vector<uint64_t>({0, 2, 9, 17, 19}));
    return 0;
}

int worker_errors_reach_the_caller() {
    auto dir = ferry_test::temp_dir("ferry_pipeline_error");
    ferry_test::write_file(dir / "src.bin", ferry_test::noise_bytes(CHUNK * 4));

    FileChunker chunker((dir / "src.bin").string(), CHUNK);
    ChunkPipeline pipeline(chunker, 2, 8);
    size_t consumed = 0;
    CHECK_THROWS(pipeline.run({1, 2, 40}, [&](ChunkRecord&&) { ++consumed; }), std::out_of_range);
    CHECK(consumed == 0);
    return 0;
}

} // namespace

int main() {
    RUN(records_arrive_in_index_order);
    RUN(subset_is_sorted_and_deduplicated);
    RUN(worker_errors_reach_the_caller);
    return 0;
}
