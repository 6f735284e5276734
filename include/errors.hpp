#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry {

enum class ErrorKind {
    Corruption,
    ProtocolViolation,
    Io,
    Config
};

const char* to_string(ErrorKind kind);

// Base of every error the transfer engine raises.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// --- Corruption ---

class ChecksumMismatch : public TransferError {
public:
    ChecksumMismatch(uint64_t chunk_index,
                     const std::vector<uint8_t>& expected,
                     const std::vector<uint8_t>& actual);

    uint64_t chunk_index() const { return chunk_index_; }
    const std::vector<uint8_t>& expected() const { return expected_; }
    const std::vector<uint8_t>& actual() const { return actual_; }

private:
    uint64_t chunk_index_;
    std::vector<uint8_t> expected_;
    std::vector<uint8_t> actual_;
};

class CorruptBitmap : public TransferError {
public:
    CorruptBitmap(const std::string& path, const std::string& reason)
        : TransferError(ErrorKind::Corruption, "Corrupt bitmap file " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Reported by ChunkTable::verify_integrity with the first offending index.
class IntegrityError : public TransferError {
public:
    IntegrityError(uint64_t chunk_index, const std::string& reason)
        : TransferError(ErrorKind::Corruption,
                        "Integrity check failed at chunk " + std::to_string(chunk_index) + ": " + reason),
          chunk_index_(chunk_index) {}

    uint64_t chunk_index() const { return chunk_index_; }

private:
    uint64_t chunk_index_;
};

// --- Protocol ---

class ProtocolViolation : public TransferError {
public:
    explicit ProtocolViolation(const std::string& what)
        : TransferError(ErrorKind::ProtocolViolation, what) {}
};

// --- I/O ---

class IoError : public TransferError {
public:
    IoError(const std::string& path, const std::string& what)
        : TransferError(ErrorKind::Io, what + " (" + path + ")"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// --- Configuration ---

class ConfigError : public TransferError {
public:
    explicit ConfigError(const std::string& what)
        : TransferError(ErrorKind::Config, what) {}
};

} // namespace ferry
