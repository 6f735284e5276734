#include "errors.hpp"
#include "ferry/hex_utils.hpp"

namespace ferry {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Corruption: return "corruption";
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::Io: return "I/O failure";
        case ErrorKind::Config: return "configuration";
    }
    return "unknown";
}

ChecksumMismatch::ChecksumMismatch(uint64_t chunk_index,
                                   const std::vector<uint8_t>& expected,
                                   const std::vector<uint8_t>& actual)
    : TransferError(ErrorKind::Corruption,
                    "Checksum mismatch on chunk " + std::to_string(chunk_index) +
                    ": expected " + util::to_hex(expected) +
                    ", got " + util::to_hex(actual)),
      chunk_index_(chunk_index),
      expected_(expected),
      actual_(actual) {}

} // namespace ferry
