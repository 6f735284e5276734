#pragma once

#include "chunk_bitmap.hpp"
#include "chunk_record.hpp"
#include "chunk_table.hpp"
#include "manifest.hpp"
#include "session_store.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

const uint32_t DEFAULT_CHECKPOINT_INTERVAL = 10;

enum class ReceivedChunkOutcome {
    NewChunk,
    DuplicateIgnored
};

const char* to_string(ReceivedChunkOutcome outcome);

// Receiver side of one session. Owns the destination's .part file, the
// bitmap and the chunk table, and keeps them in lockstep.
//
// Construction restores the last checkpoint from the store if it is usable;
// an unusable one is reported on stderr and discarded. Destroying the
// assembler before completion leaves the checkpoint and the .part file in
// place for the next attempt.
class TransferAssembler {
public:
    TransferAssembler(const Manifest& manifest, SessionStore store, const std::filesystem::path& output_dir,
                      uint32_t checkpoint_interval = DEFAULT_CHECKPOINT_INTERVAL, bool verbose = false);

    TransferAssembler(const TransferAssembler&) = delete;
    TransferAssembler& operator=(const TransferAssembler&) = delete;

    // Verifies, writes and records one chunk. Duplicates are a no-op.
    // Throws ChecksumMismatch (nothing is written or marked),
    // ProtocolViolation for a record that does not fit the manifest, IoError,
    // and on the completing chunk whatever finalize() throws.
    ReceivedChunkOutcome receive_chunk(const ChunkRecord& record);

    // Re-reads a chunk from the .part file and marks it if it matches the
    // manifest digest. Used to validate resume claims. Returns false if the
    // bytes on disk do not verify.
    bool restore_chunk(uint64_t index);

    // Writes a chunk copied from another local file, verified against the
    // manifest digest like a restored one. Queued for acknowledgement.
    // Returns false if the bytes do not verify.
    bool adopt_chunk(uint64_t index, const std::vector<uint8_t>& data);

    // Durable flush: .part data, then table, then bitmap. Throws IoError.
    void checkpoint();

    // Indices made durable by checkpoints since the previous call.
    std::vector<uint64_t> take_durable();

    // Integrity check, rename to the final name and whole-file digest check.
    // Removes the persisted session on success. Throws IntegrityError or a
    // Corruption TransferError (the file goes back to .part).
    std::filesystem::path finalize();

    std::vector<uint64_t> missing_chunks() const { return bitmap_.find_missing(); }
    double progress() const { return bitmap_.progress(); }
    bool is_complete() const { return bitmap_.is_complete(); }
    bool is_finalized() const { return finalized_; }
    // Reason of the last failed finalize(), if any.
    const std::optional<std::string>& finalize_error() const { return finalize_error_; }

    const ChunkBitmap& bitmap() const { return bitmap_; }
    const ChunkTable& table() const { return table_; }
    const Manifest& manifest() const { return manifest_; }
    const SessionStore& store() const { return store_; }
    const std::filesystem::path& part_path() const { return part_path_; }
    const std::filesystem::path& final_path() const { return final_path_; }
    bool has_partial_file() const;
    // Whether a .part file from an earlier attempt was found on construction.
    bool partial_file_existed() const { return partial_file_existed_; }

private:
    void start_fresh();
    void restore_checkpoint();
    void prepare_part_file();
    void validate_layout(const ChunkRecord& record) const;
    void write_at(uint64_t offset, const std::vector<uint8_t>& data);
    std::vector<uint8_t> read_at(uint64_t offset, uint32_t length) const;
    void record_chunk(const ChunkMetadata& metadata);
    std::filesystem::path finalize_checked();

    Manifest manifest_;
    SessionStore store_;
    std::filesystem::path part_path_;
    std::filesystem::path final_path_;
    uint32_t checkpoint_interval_;
    bool verbose_;

    ChunkBitmap bitmap_;
    ChunkTable table_;
    uint32_t since_checkpoint_ = 0;
    std::vector<uint64_t> pending_ack_;
    std::vector<uint64_t> durable_;
    bool partial_file_existed_ = false;
    bool finalized_ = false;
    std::optional<std::string> finalize_error_;
};

} // namespace ferry
