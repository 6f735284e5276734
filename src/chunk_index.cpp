#include "chunk_index.hpp"
#include "errors.hpp"
#include "ferry/fs_utils.hpp"
#include "ferry.pb.h"
#include "manifest.hpp"
#include <fstream>
#include <system_error>
#include <utility>

namespace ferry {

ChunkIndex::ChunkIndex(std::filesystem::path index_file) : index_file_(std::move(index_file)) {}

void ChunkIndex::load() {
    std::error_code ec;
    if (!std::filesystem::exists(index_file_, ec)) {
        index_.clear();
        return;
    }
    std::vector<uint8_t> raw = util::read_file(index_file_);
    wire::ChunkIndexSnapshot snapshot;
    if (!snapshot.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        throw TransferError(ErrorKind::Corruption,
                            "Chunk index " + index_file_.string() + " cannot be parsed");
    }
    std::map<Digest, std::vector<ChunkLocation>> loaded;
    for (const auto& entry : snapshot.entries()) {
        ChunkLocation location;
        location.file_path = entry.file_path();
        location.byte_offset = entry.byte_offset();
        location.length = entry.length();
        loaded[Digest(entry.digest().begin(), entry.digest().end())].push_back(location);
    }
    index_.swap(loaded);
}

void ChunkIndex::save() const {
    wire::ChunkIndexSnapshot snapshot;
    for (const auto& [digest, places] : index_) {
        for (const ChunkLocation& location : places) {
            auto* entry = snapshot.add_entries();
            entry->set_digest(digest.data(), digest.size());
            entry->set_file_path(location.file_path.string());
            entry->set_byte_offset(location.byte_offset);
            entry->set_length(location.length);
        }
    }
    std::string out;
    if (!snapshot.SerializeToString(&out)) {
        throw IoError(index_file_.string(), "Failed to serialize chunk index");
    }
    std::error_code ec;
    std::filesystem::create_directories(index_file_.parent_path(), ec);
    if (ec) {
        throw IoError(index_file_.parent_path().string(), "Cannot create directory: " + ec.message());
    }
    util::atomic_write(index_file_, out);
}

void ChunkIndex::add_chunk(const Digest& digest, const ChunkLocation& location) {
    auto& places = index_[digest];
    for (const ChunkLocation& known : places) {
        if (known.file_path == location.file_path && known.byte_offset == location.byte_offset) {
            return;
        }
    }
    places.push_back(location);
}

void ChunkIndex::add_file(const Manifest& manifest, const std::filesystem::path& file_path) {
    remove_file(file_path);
    for (uint64_t index = 0; index < manifest.total_chunks; ++index) {
        ChunkLocation location;
        location.file_path = file_path;
        location.byte_offset = manifest.chunk_offset(index);
        location.length = manifest.chunk_length(index);
        add_chunk(manifest.chunk_hashes[index], location);
    }
}

void ChunkIndex::remove_file(const std::filesystem::path& file_path) {
    for (auto it = index_.begin(); it != index_.end();) {
        auto& places = it->second;
        for (auto place = places.begin(); place != places.end();) {
            if (place->file_path == file_path) {
                place = places.erase(place);
            } else {
                ++place;
            }
        }
        if (places.empty()) {
            it = index_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ChunkIndex::contains(const Digest& digest) const {
    return index_.count(digest) != 0;
}

std::vector<ChunkLocation> ChunkIndex::locations(const Digest& digest) const {
    auto it = index_.find(digest);
    if (it == index_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Digest> ChunkIndex::existing(const std::vector<Digest>& hashes) const {
    std::vector<Digest> found;
    for (const Digest& hash : hashes) {
        if (contains(hash)) {
            found.push_back(hash);
        }
    }
    return found;
}

std::optional<std::vector<uint8_t>> ChunkIndex::read_chunk(const Digest& digest) const {
    auto it = index_.find(digest);
    if (it == index_.end()) {
        return std::nullopt;
    }
    for (const ChunkLocation& location : it->second) {
        std::ifstream in(location.file_path, std::ios::binary);
        if (!in) {
            continue;
        }
        in.seekg(static_cast<std::streamoff>(location.byte_offset));
        std::vector<uint8_t> data(location.length);
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!in || static_cast<size_t>(in.gcount()) != data.size()) {
            continue;
        }
        if (checksum::verify(data, digest)) {
            return data;
        }
    }
    return std::nullopt;
}

} // namespace ferry
