#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// Wire tags, see CompressionAlgorithm in ferry.proto.
enum class CompressionAlgorithm : uint8_t {
    None = 0,
    DeflateFast = 1,  // low ratio, small chunks
    Deflate = 2,      // balanced default
    DeflateHigh = 3   // high ratio, large chunks, escalating level
};

const char* to_string(CompressionAlgorithm algorithm);
std::optional<CompressionAlgorithm> compression_from_u8(uint8_t value);
// Accepts "none", "fast", "balanced", "high". Throws ConfigError.
CompressionAlgorithm compression_from_name(const std::string& name);

struct CompressionChoice {
    CompressionAlgorithm algorithm = CompressionAlgorithm::None;
    int level = 0;
};

// Deterministic, size-driven algorithm selection.
struct CompressionPolicy {
    bool enabled = true;
    // Set to force one algorithm for every chunk instead of size-driven choice.
    std::optional<CompressionAlgorithm> fixed;
    size_t small_threshold = 64 * 1024;
    size_t large_threshold = 1024 * 1024;
    // Conditional mode: keep the original bytes unless compression saves at
    // least this fraction.
    bool conditional = true;
    double min_savings = 0.05;

    CompressionChoice select(size_t chunk_length) const;

    static CompressionPolicy disabled() {
        CompressionPolicy policy;
        policy.enabled = false;
        return policy;
    }
};

struct CompressedChunk {
    CompressionAlgorithm algorithm = CompressionAlgorithm::None;
    std::vector<uint8_t> data;
};

int default_level(CompressionAlgorithm algorithm);

// Raw deflate/inflate. compress() throws an Io-kind TransferError if zlib
// fails; decompress() throws a Corruption error when the stream is damaged
// or does not inflate to exactly `original_size` bytes.
std::vector<uint8_t> compress(const uint8_t* data, size_t len, CompressionAlgorithm algorithm, int level);
std::vector<uint8_t> decompress(CompressionAlgorithm algorithm, const uint8_t* data, size_t len,
                                size_t original_size);

// Applies the policy, including the conditional fallback to the original bytes.
CompressedChunk compress_chunk(const std::vector<uint8_t>& data, const CompressionPolicy& policy);

} // namespace ferry
