#include "compressor.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace ferry;

namespace {

int every_algorithm_round_trips() {
    std::vector<uint8_t> data = ferry_test::pattern_bytes(200 * 1024, 11);
    const CompressionAlgorithm algorithms[] = {
        CompressionAlgorithm::None, CompressionAlgorithm::DeflateFast,
        CompressionAlgorithm::Deflate, CompressionAlgorithm::DeflateHigh};

    for (CompressionAlgorithm algorithm : algorithms) {
        std::vector<uint8_t> packed = compress(data.data(), data.size(), algorithm, default_level(algorithm));
        if (algorithm != CompressionAlgorithm::None) {
            CHECK(packed.size() < data.size());
        }
        std::vector<uint8_t> unpacked = decompress(algorithm, packed.data(), packed.size(), data.size());
        CHECK(unpacked == data);
    }
    return 0;
}

int selection_follows_chunk_size() {
    CompressionPolicy policy;
    CHECK(policy.select(0).algorithm == CompressionAlgorithm::None);
    CHECK(policy.select(4 * 1024).algorithm == CompressionAlgorithm::DeflateFast);
    CHECK(policy.select(512 * 1024).algorithm == CompressionAlgorithm::Deflate);
    CHECK(policy.select(2 * 1024 * 1024).algorithm == CompressionAlgorithm::DeflateHigh);
    CHECK(policy.select(2 * 1024 * 1024).level == 7);
    CHECK(policy.select(4 * 1024 * 1024).level == 8);
    CHECK(policy.select(8 * 1024 * 1024).level == 9);

    // Same input, same choice.
    CHECK(policy.select(300000).algorithm == policy.select(300000).algorithm);

    CompressionPolicy fixed;
    fixed.fixed = CompressionAlgorithm::DeflateHigh;
    CHECK(fixed.select(100).algorithm == CompressionAlgorithm::DeflateHigh);

    CHECK(CompressionPolicy::disabled().select(1024 * 1024).algorithm == CompressionAlgorithm::None);
    return 0;
}

int incompressible_data_stays_raw() {
    std::vector<uint8_t> noise = ferry_test::noise_bytes(64 * 1024);
    CompressedChunk chunk = compress_chunk(noise, CompressionPolicy());
    CHECK(chunk.algorithm == CompressionAlgorithm::None);
    CHECK(chunk.data == noise);

    std::vector<uint8_t> text = ferry_test::pattern_bytes(64 * 1024);
    CompressedChunk packed = compress_chunk(text, CompressionPolicy());
    CHECK(packed.algorithm != CompressionAlgorithm::None);
    CHECK(packed.data.size() < text.size());
    return 0;
}

int damaged_streams_are_corruption() {
    std::vector<uint8_t> data = ferry_test::pattern_bytes(32 * 1024);
    std::vector<uint8_t> packed = compress(data.data(), data.size(), CompressionAlgorithm::Deflate, 6);

    // Wrong declared size.
    bool thrown = false;
    try {
        decompress(CompressionAlgorithm::Deflate, packed.data(), packed.size(), data.size() - 1);
    } catch (const TransferError& e) {
        thrown = e.kind() == ErrorKind::Corruption;
    }
    CHECK(thrown);

    // Truncated stream.
    thrown = false;
    try {
        decompress(CompressionAlgorithm::Deflate, packed.data(), packed.size() / 2, data.size());
    } catch (const TransferError& e) {
        thrown = e.kind() == ErrorKind::Corruption;
    }
    CHECK(thrown);

    // Raw payload of the wrong length.
    CHECK_THROWS(decompress(CompressionAlgorithm::None, data.data(), 10, 11), TransferError);
    return 0;
}

int names_and_tags() {
    CHECK(compression_from_name("balanced") == CompressionAlgorithm::Deflate);
    CHECK(compression_from_name("none") == CompressionAlgorithm::None);
    CHECK_THROWS(compression_from_name("lz4"), ConfigError);
    CHECK(compression_from_u8(3) == CompressionAlgorithm::DeflateHigh);
    CHECK(!compression_from_u8(4));
    CHECK(std::string(to_string(CompressionAlgorithm::DeflateFast)) == "fast");
    return 0;
}

} // namespace

int main() {
    RUN(every_algorithm_round_trips);
    RUN(selection_follows_chunk_size);
    RUN(incompressible_data_stays_raw);
    RUN(damaged_streams_are_corruption);
    RUN(names_and_tags);
    return 0;
}
