#include "transfer_assembler.hpp"
#include "errors.hpp"
#include "ferry/fs_utils.hpp"
#include "ferry/hex_utils.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ferry {

const char* to_string(ReceivedChunkOutcome outcome) {
    switch (outcome) {
        case ReceivedChunkOutcome::NewChunk: return "new";
        case ReceivedChunkOutcome::DuplicateIgnored: return "duplicate";
    }
    return "unknown";
}

TransferAssembler::TransferAssembler(const Manifest& manifest, SessionStore store,
                                     const std::filesystem::path& output_dir,
                                     uint32_t checkpoint_interval, bool verbose)
    : manifest_(manifest),
      store_(std::move(store)),
      part_path_(output_dir / (manifest.file_name + ".part")),
      final_path_(output_dir / manifest.file_name),
      checkpoint_interval_(checkpoint_interval > 0 ? checkpoint_interval : 1),
      verbose_(verbose) {
    start_fresh();
    if (store_.has_checkpoint(manifest_.session_id)) {
        restore_checkpoint();
    }
    prepare_part_file();
}

void TransferAssembler::start_fresh() {
    bitmap_ = ChunkBitmap::with_exact_size(manifest_.total_chunks);
    table_ = ChunkTable();
    table_.set_file_info(manifest_.file_size, manifest_.total_chunks);
}

void TransferAssembler::restore_checkpoint() {
    const std::string& id = manifest_.session_id;
    try {
        ChunkBitmap saved = *store_.load_bitmap(id);
        std::optional<ChunkTable> saved_table = store_.load_table(id);
        if (!saved_table) {
            throw TransferError(ErrorKind::Corruption, "bitmap has no chunk table beside it");
        }
        if (!has_partial_file()) {
            throw IoError(part_path_.string(), "partial file is missing");
        }
        if (saved.total_chunks() != manifest_.total_chunks) {
            throw TransferError(ErrorKind::Corruption, "checkpoint total does not match the manifest");
        }

        // The table is written first, so it may hold entries the bitmap
        // never confirmed. The bitmap is authoritative.
        for (uint64_t index : saved.get_received_chunks()) {
            auto metadata = saved_table->get(index);
            if (!metadata) {
                throw TransferError(ErrorKind::Corruption,
                                    "chunk " + std::to_string(index) + " is in the bitmap but not the table");
            }
            if (metadata->byte_offset != manifest_.chunk_offset(index) ||
                metadata->chunk_length != manifest_.chunk_length(index) ||
                !checksum::equal(metadata->checksum, manifest_.chunk_hashes[index])) {
                throw TransferError(ErrorKind::Corruption,
                                    "chunk " + std::to_string(index) + " metadata does not match the manifest");
            }
            record_chunk(*metadata);
        }
        std::cout << "[Assembler] Restored checkpoint of " << id << ": " << bitmap_.received_count()
                  << "/" << manifest_.total_chunks << " chunks" << std::endl;
    } catch (const TransferError& e) {
        std::cerr << "[Assembler] Discarding checkpoint of " << id << ": " << e.what() << std::endl;
        store_.remove(id);
        start_fresh();
    }
}

void TransferAssembler::prepare_part_file() {
    std::error_code ec;
    partial_file_existed_ = std::filesystem::exists(part_path_, ec);
    if (!partial_file_existed_) {
        if (part_path_.has_parent_path()) {
            std::filesystem::create_directories(part_path_.parent_path(), ec);
            if (ec) {
                throw IoError(part_path_.parent_path().string(), "cannot create output directory: " + ec.message());
            }
        }
        std::ofstream create(part_path_, std::ios::binary);
        if (!create.is_open()) {
            throw IoError(part_path_.string(), "cannot create partial file");
        }
    }
    // Pre-sized so out-of-order chunks can be written at any offset.
    std::filesystem::resize_file(part_path_, manifest_.file_size, ec);
    if (ec) {
        throw IoError(part_path_.string(), "cannot size partial file: " + ec.message());
    }
}

bool TransferAssembler::has_partial_file() const {
    std::error_code ec;
    return std::filesystem::exists(part_path_, ec);
}

void TransferAssembler::validate_layout(const ChunkRecord& record) const {
    if (record.index >= manifest_.total_chunks) {
        throw ProtocolViolation("Chunk " + std::to_string(record.index) + " is beyond the end of " +
                                manifest_.file_name + " (" + std::to_string(manifest_.total_chunks) + " chunks)");
    }
    if (record.byte_offset != manifest_.chunk_offset(record.index) ||
        record.length != manifest_.chunk_length(record.index)) {
        throw ProtocolViolation("Chunk " + std::to_string(record.index) + " covers [" +
                                std::to_string(record.byte_offset) + ", +" + std::to_string(record.length) +
                                ") which does not match the manifest layout");
    }
    bool should_be_last = record.index + 1 == manifest_.total_chunks;
    if (record.is_last != should_be_last) {
        throw ProtocolViolation("Chunk " + std::to_string(record.index) +
                                (record.is_last ? " carries" : " lacks") + " the end-of-file flag");
    }
}

ReceivedChunkOutcome TransferAssembler::receive_chunk(const ChunkRecord& record) {
    if (bitmap_.is_received(record.index) || finalized_) {
        if (verbose_) {
            std::cout << "[Assembler] Duplicate chunk " << record.index << " ignored" << std::endl;
        }
        return ReceivedChunkOutcome::DuplicateIgnored;
    }
    validate_layout(record);

    const Digest& expected = manifest_.chunk_hashes[record.index];
    if (!checksum::equal(record.digest, expected)) {
        throw ChecksumMismatch(record.index, expected, record.digest);
    }
    std::vector<uint8_t> data = decompressed_payload(record);
    Digest actual = checksum::digest(data);
    if (!checksum::equal(actual, expected)) {
        throw ChecksumMismatch(record.index, expected, actual);
    }

    write_at(record.byte_offset, data);
    record_chunk(record.metadata());
    pending_ack_.push_back(record.index);
    ++since_checkpoint_;

    if (verbose_) {
        std::cout << "[Assembler] Chunk " << record.index << " stored (" << record.length << " bytes, "
                  << to_string(record.compression) << "), " << bitmap_.received_count() << "/"
                  << manifest_.total_chunks << std::endl;
    }

    if (bitmap_.is_complete()) {
        // The completion checkpoint is not optional.
        checkpoint();
        finalize();
    } else if (since_checkpoint_ >= checkpoint_interval_ || record.is_last) {
        try {
            checkpoint();
        } catch (const IoError& e) {
            std::cerr << "[Assembler] Checkpoint failed, continuing: " << e.what() << std::endl;
        }
    }
    return ReceivedChunkOutcome::NewChunk;
}

bool TransferAssembler::restore_chunk(uint64_t index) {
    if (index >= manifest_.total_chunks) {
        throw ProtocolViolation("Cannot restore chunk " + std::to_string(index) + " of a " +
                                std::to_string(manifest_.total_chunks) + "-chunk file");
    }
    if (bitmap_.is_received(index)) {
        return true;
    }

    uint64_t offset = manifest_.chunk_offset(index);
    uint32_t length = manifest_.chunk_length(index);
    std::vector<uint8_t> data = read_at(offset, length);
    if (data.size() != length || !checksum::verify(data, manifest_.chunk_hashes[index])) {
        return false;
    }

    ChunkMetadata metadata;
    metadata.chunk_number = index;
    metadata.byte_offset = offset;
    metadata.chunk_length = length;
    metadata.checksum = manifest_.chunk_hashes[index];
    metadata.end_of_file = index + 1 == manifest_.total_chunks;
    record_chunk(metadata);
    ++since_checkpoint_;
    return true;
}

bool TransferAssembler::adopt_chunk(uint64_t index, const std::vector<uint8_t>& data) {
    if (index >= manifest_.total_chunks) {
        throw ProtocolViolation("Cannot adopt chunk " + std::to_string(index) + " of a " +
                                std::to_string(manifest_.total_chunks) + "-chunk file");
    }
    if (bitmap_.is_received(index)) {
        return true;
    }

    uint64_t offset = manifest_.chunk_offset(index);
    uint32_t length = manifest_.chunk_length(index);
    if (data.size() != length || !checksum::verify(data, manifest_.chunk_hashes[index])) {
        return false;
    }
    write_at(offset, data);

    ChunkMetadata metadata;
    metadata.chunk_number = index;
    metadata.byte_offset = offset;
    metadata.chunk_length = length;
    metadata.checksum = manifest_.chunk_hashes[index];
    metadata.end_of_file = index + 1 == manifest_.total_chunks;
    record_chunk(metadata);
    pending_ack_.push_back(index);
    ++since_checkpoint_;
    return true;
}

void TransferAssembler::record_chunk(const ChunkMetadata& metadata) {
    table_.insert(metadata);
    bitmap_.mark_received(metadata.chunk_number, metadata.end_of_file);
}

void TransferAssembler::write_at(uint64_t offset, const std::vector<uint8_t>& data) {
    std::fstream file(part_path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file.is_open()) {
        throw IoError(part_path_.string(), "cannot open partial file for writing");
    }
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw IoError(part_path_.string(), "write of " + std::to_string(data.size()) + " bytes at offset " +
                                           std::to_string(offset) + " failed");
    }
}

std::vector<uint8_t> TransferAssembler::read_at(uint64_t offset, uint32_t length) const {
    std::ifstream file(part_path_, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(part_path_.string(), "cannot open partial file for reading");
    }
    std::vector<uint8_t> data(length);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(data.data()), length);
    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

void TransferAssembler::checkpoint() {
    util::fsync_file(part_path_);
    store_.save(manifest_.session_id, bitmap_, table_);
    durable_.insert(durable_.end(), pending_ack_.begin(), pending_ack_.end());
    pending_ack_.clear();
    since_checkpoint_ = 0;
    if (verbose_) {
        std::cout << "[Assembler] Checkpoint " << manifest_.session_id << " at "
                  << bitmap_.received_count() << "/" << manifest_.total_chunks << std::endl;
    }
}

std::vector<uint64_t> TransferAssembler::take_durable() {
    std::vector<uint64_t> out;
    out.swap(durable_);
    return out;
}

std::filesystem::path TransferAssembler::finalize() {
    if (finalized_) {
        return final_path_;
    }
    if (!bitmap_.is_complete()) {
        throw std::logic_error("finalize called with " + std::to_string(bitmap_.find_missing().size()) +
                               " chunks still missing");
    }
    try {
        return finalize_checked();
    } catch (const TransferError& e) {
        finalize_error_ = e.what();
        throw;
    }
}

std::filesystem::path TransferAssembler::finalize_checked() {
    table_.verify_integrity();

    util::fsync_file(part_path_);
    std::error_code ec;
    std::filesystem::rename(part_path_, final_path_, ec);
    if (ec) {
        throw IoError(final_path_.string(), "cannot rename partial file: " + ec.message());
    }

    Digest actual = digest_file(final_path_.string());
    if (!checksum::equal(actual, manifest_.file_hash)) {
        std::filesystem::rename(final_path_, part_path_, ec);
        if (ec) {
            std::cerr << "[Assembler] Cannot move " << final_path_ << " back to " << part_path_
                      << ": " << ec.message() << std::endl;
        }
        store_.remove(manifest_.session_id);
        start_fresh();
        pending_ack_.clear();
        durable_.clear();
        throw TransferError(ErrorKind::Corruption,
                            "Whole-file digest mismatch for " + final_path_.string() + ": expected " +
                            util::to_hex(manifest_.file_hash) + ", got " + util::to_hex(actual));
    }

    store_.remove(manifest_.session_id);
    finalized_ = true;
    finalize_error_.reset();
    std::cout << "[Assembler] Finalized " << final_path_.string() << " (" << manifest_.total_chunks
              << " chunks, " << manifest_.file_size << " bytes)" << std::endl;
    return final_path_;
}

} // namespace ferry
