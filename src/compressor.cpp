#include "compressor.hpp"
#include "errors.hpp"
#include <utility>
#include <zlib.h>

namespace ferry {

const char* to_string(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::None: return "none";
        case CompressionAlgorithm::DeflateFast: return "fast";
        case CompressionAlgorithm::Deflate: return "balanced";
        case CompressionAlgorithm::DeflateHigh: return "high";
    }
    return "unknown";
}

std::optional<CompressionAlgorithm> compression_from_u8(uint8_t value) {
    switch (value) {
        case 0: return CompressionAlgorithm::None;
        case 1: return CompressionAlgorithm::DeflateFast;
        case 2: return CompressionAlgorithm::Deflate;
        case 3: return CompressionAlgorithm::DeflateHigh;
        default: return std::nullopt;
    }
}

CompressionAlgorithm compression_from_name(const std::string& name) {
    if (name == "none") return CompressionAlgorithm::None;
    if (name == "fast") return CompressionAlgorithm::DeflateFast;
    if (name == "balanced") return CompressionAlgorithm::Deflate;
    if (name == "high") return CompressionAlgorithm::DeflateHigh;
    throw ConfigError("Unknown compression algorithm '" + name + "'");
}

int default_level(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::None: return 0;
        case CompressionAlgorithm::DeflateFast: return 1;
        case CompressionAlgorithm::Deflate: return 6;
        case CompressionAlgorithm::DeflateHigh: return 9;
    }
    return Z_DEFAULT_COMPRESSION;
}

CompressionChoice CompressionPolicy::select(size_t chunk_length) const {
    if (!enabled || chunk_length == 0) {
        return {CompressionAlgorithm::None, 0};
    }
    if (fixed) {
        return {*fixed, default_level(*fixed)};
    }
    if (chunk_length < small_threshold) {
        return {CompressionAlgorithm::DeflateFast, 1};
    }
    if (chunk_length > large_threshold) {
        // Bigger chunks amortize more CPU per byte saved.
        int level = 7;
        if (chunk_length >= large_threshold * 8) {
            level = 9;
        } else if (chunk_length >= large_threshold * 4) {
            level = 8;
        }
        return {CompressionAlgorithm::DeflateHigh, level};
    }
    return {CompressionAlgorithm::Deflate, 6};
}

std::vector<uint8_t> compress(const uint8_t* data, size_t len, CompressionAlgorithm algorithm, int level) {
    if (algorithm == CompressionAlgorithm::None) {
        return std::vector<uint8_t>(data, data + len);
    }

    std::vector<uint8_t> buffer(compressBound(static_cast<uLong>(len)));

    z_stream stream = {};
    if (deflateInit(&stream, level) != Z_OK) {
        throw TransferError(ErrorKind::Io, "deflateInit failed at level " + std::to_string(level));
    }
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream.avail_in = static_cast<uInt>(len);
    stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream.avail_out = static_cast<uInt>(buffer.size());

    int rc = deflate(&stream, Z_FINISH);
    uLong produced = stream.total_out;
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw TransferError(ErrorKind::Io, "deflate failed with code " + std::to_string(rc));
    }
    buffer.resize(produced);
    return buffer;
}

std::vector<uint8_t> decompress(CompressionAlgorithm algorithm, const uint8_t* data, size_t len,
                                size_t original_size) {
    if (algorithm == CompressionAlgorithm::None) {
        if (len != original_size) {
            throw TransferError(ErrorKind::Corruption,
                                "Uncompressed payload is " + std::to_string(len) +
                                " bytes, expected " + std::to_string(original_size));
        }
        return std::vector<uint8_t>(data, data + len);
    }

    // One spare byte lets us detect payloads that inflate past original_size.
    std::vector<uint8_t> out(original_size + 1);

    z_stream stream = {};
    if (inflateInit(&stream) != Z_OK) {
        throw TransferError(ErrorKind::Io, "inflateInit failed");
    }
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream.avail_in = static_cast<uInt>(len);
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&stream, Z_FINISH);
    uLong produced = stream.total_out;
    inflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        throw TransferError(ErrorKind::Corruption,
                            std::string("Inflate failed (") + to_string(algorithm) +
                            "), zlib code " + std::to_string(rc));
    }
    if (produced != original_size) {
        throw TransferError(ErrorKind::Corruption,
                            "Payload inflated to " + std::to_string(produced) +
                            " bytes, expected " + std::to_string(original_size));
    }
    out.resize(produced);
    return out;
}

CompressedChunk compress_chunk(const std::vector<uint8_t>& data, const CompressionPolicy& policy) {
    CompressionChoice choice = policy.select(data.size());
    CompressedChunk result;
    if (choice.algorithm == CompressionAlgorithm::None) {
        result.data = data;
        return result;
    }

    std::vector<uint8_t> compressed = compress(data.data(), data.size(), choice.algorithm, choice.level);

    double saved = 1.0 - static_cast<double>(compressed.size()) / static_cast<double>(data.size());
    bool keep = compressed.size() < data.size() && (!policy.conditional || saved >= policy.min_savings);
    if (!keep) {
        result.data = data;
        return result;
    }
    result.algorithm = choice.algorithm;
    result.data = std::move(compressed);
    return result;
}

} // namespace ferry
