#include "chunk_table.hpp"
#include "errors.hpp"
#include "ferry/fs_utils.hpp"
#include "ferry/hex_utils.hpp"
#include "ferry.pb.h"
#include <algorithm>
#include <sstream>

namespace ferry {

void ChunkTable::set_file_info(uint64_t total_size, uint64_t total_chunks) {
    total_size_ = total_size;
    total_chunks_ = total_chunks;
}

void ChunkTable::insert(const ChunkMetadata& metadata) {
    chunks_[metadata.chunk_number] = metadata;
    if (metadata.end_of_file && !total_chunks_) {
        total_chunks_ = metadata.chunk_number + 1;
    }
}

bool ChunkTable::remove(uint64_t chunk_number) {
    return chunks_.erase(chunk_number) != 0;
}

void ChunkTable::clear() {
    chunks_.clear();
}

std::optional<ChunkMetadata> ChunkTable::get(uint64_t chunk_number) const {
    auto it = chunks_.find(chunk_number);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<uint64_t> ChunkTable::chunk_numbers() const {
    std::vector<uint64_t> numbers;
    numbers.reserve(chunks_.size());
    for (const auto& entry : chunks_) {
        numbers.push_back(entry.first);
    }
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

std::vector<uint64_t> ChunkTable::missing_chunks() const {
    std::vector<uint64_t> missing;
    if (!total_chunks_) {
        return missing;
    }
    for (uint64_t chunk_num = 0; chunk_num < *total_chunks_; ++chunk_num) {
        if (!chunks_.count(chunk_num)) {
            missing.push_back(chunk_num);
        }
    }
    return missing;
}

std::vector<ChunkMetadata> ChunkTable::sorted_entries() const {
    std::vector<ChunkMetadata> entries;
    entries.reserve(chunks_.size());
    for (const auto& entry : chunks_) {
        entries.push_back(entry.second);
    }
    std::sort(entries.begin(), entries.end(),
        [](const ChunkMetadata& a, const ChunkMetadata& b) {
            return a.chunk_number < b.chunk_number;
        });
    return entries;
}

uint64_t ChunkTable::bytes_stored() const {
    uint64_t total = 0;
    for (const auto& entry : chunks_) {
        total += entry.second.chunk_length;
    }
    return total;
}

std::optional<ChunkMetadata> ChunkTable::last_chunk() const {
    for (const auto& entry : chunks_) {
        if (entry.second.end_of_file) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool ChunkTable::is_complete() const {
    return total_chunks_.has_value() && chunks_.size() == *total_chunks_;
}

void ChunkTable::verify_integrity() const {
    if (chunks_.empty()) {
        throw IntegrityError(0, "table is empty");
    }

    std::vector<ChunkMetadata> sorted = sorted_entries();
    uint64_t expected_offset = 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        const ChunkMetadata& metadata = sorted[i];
        if (metadata.chunk_number != i) {
            throw IntegrityError(i, "chunk missing, next present chunk is " +
                                    std::to_string(metadata.chunk_number));
        }
        if (metadata.byte_offset != expected_offset) {
            throw IntegrityError(metadata.chunk_number,
                                 "starts at offset " + std::to_string(metadata.byte_offset) +
                                 ", expected " + std::to_string(expected_offset));
        }
        bool is_final = (i + 1 == sorted.size());
        if (metadata.end_of_file && !is_final) {
            throw IntegrityError(metadata.chunk_number, "end-of-file flag set on a non-final chunk");
        }
        expected_offset = metadata.end_offset();
    }

    const ChunkMetadata& final_entry = sorted.back();
    if (total_chunks_ && sorted.size() < *total_chunks_) {
        throw IntegrityError(sorted.size(), "chunk missing at end of file (expected " +
                                            std::to_string(*total_chunks_) + " chunks)");
    }
    if (!final_entry.end_of_file) {
        throw IntegrityError(final_entry.chunk_number, "final chunk lacks the end-of-file flag");
    }
    if (total_size_ != 0 && expected_offset != total_size_) {
        throw IntegrityError(final_entry.chunk_number,
                             "chunks cover " + std::to_string(expected_offset) +
                             " bytes, file size is " + std::to_string(total_size_));
    }
}

// --- Serialization ---

void ChunkTable::to_snapshot(wire::ChunkTableSnapshot& snapshot) const {
    snapshot.set_total_size(total_size_);
    snapshot.set_total_known(total_chunks_.has_value());
    snapshot.set_total_chunks(total_chunks_ ? *total_chunks_ : 0);
    for (const auto& metadata : sorted_entries()) {
        auto* entry = snapshot.add_entries();
        entry->set_chunk_number(metadata.chunk_number);
        entry->set_byte_offset(metadata.byte_offset);
        entry->set_chunk_length(metadata.chunk_length);
        entry->set_checksum(metadata.checksum.data(), metadata.checksum.size());
        entry->set_end_of_file(metadata.end_of_file);
    }
}

std::string ChunkTable::serialize() const {
    wire::ChunkTableSnapshot snapshot;
    to_snapshot(snapshot);
    std::string out;
    if (!snapshot.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to serialize chunk table");
    }
    return out;
}

ChunkTable ChunkTable::deserialize(const std::string& data) {
    wire::ChunkTableSnapshot snapshot;
    if (!snapshot.ParseFromString(data)) {
        throw TransferError(ErrorKind::Corruption, "Chunk table snapshot cannot be parsed");
    }
    ChunkTable table;
    table.total_size_ = snapshot.total_size();
    if (snapshot.total_known()) {
        table.total_chunks_ = snapshot.total_chunks();
    }
    for (const auto& entry : snapshot.entries()) {
        ChunkMetadata metadata;
        metadata.chunk_number = entry.chunk_number();
        metadata.byte_offset = entry.byte_offset();
        metadata.chunk_length = entry.chunk_length();
        metadata.checksum.assign(entry.checksum().begin(), entry.checksum().end());
        metadata.end_of_file = entry.end_of_file();
        if (table.chunks_.count(metadata.chunk_number)) {
            throw TransferError(ErrorKind::Corruption,
                                "Chunk table snapshot lists chunk " +
                                std::to_string(metadata.chunk_number) + " twice");
        }
        table.chunks_[metadata.chunk_number] = metadata;
    }
    return table;
}

std::string ChunkTable::to_text() const {
    std::ostringstream out;
    out << "# chunks=" << chunks_.size()
        << " total=" << (total_chunks_ ? std::to_string(*total_chunks_) : std::string("unknown"))
        << " size=" << total_size_ << "\n";
    for (const auto& metadata : sorted_entries()) {
        out << metadata.chunk_number << " " << metadata.byte_offset << " "
            << metadata.chunk_length << " " << util::to_hex(metadata.checksum)
            << (metadata.end_of_file ? " eof" : "") << "\n";
    }
    return out.str();
}

void ChunkTable::save_to_disk(const std::string& path) const {
    util::atomic_write(path, serialize());
}

ChunkTable ChunkTable::load_from_disk(const std::string& path) {
    std::vector<uint8_t> data = util::read_file(path);
    return deserialize(std::string(data.begin(), data.end()));
}

bool ChunkTable::operator==(const ChunkTable& other) const {
    return total_size_ == other.total_size_ &&
           total_chunks_ == other.total_chunks_ &&
           chunks_ == other.chunks_;
}

} // namespace ferry
