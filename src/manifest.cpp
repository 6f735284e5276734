#include "manifest.hpp"
#include "errors.hpp"
#include "ferry.pb.h"
#include "ferry/fs_utils.hpp"
#include "ferry/hex_utils.hpp"
#include "file_chunker.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ferry {

namespace {

const size_t SESSION_ID_BYTES = 16;

void to_message(const Manifest& manifest, wire::Manifest& msg) {
    msg.set_session_id(manifest.session_id);
    msg.set_file_name(manifest.file_name);
    msg.set_file_size(manifest.file_size);
    msg.set_chunk_size(manifest.chunk_size);
    msg.set_total_chunks(manifest.total_chunks);
    msg.set_file_hash(manifest.file_hash.data(), manifest.file_hash.size());
    for (const auto& hash : manifest.chunk_hashes) {
        msg.add_chunk_hashes(hash.data(), hash.size());
    }
}

Manifest from_message(const wire::Manifest& msg) {
    Manifest manifest;
    manifest.session_id = msg.session_id();
    manifest.file_name = msg.file_name();
    manifest.file_size = msg.file_size();
    manifest.chunk_size = msg.chunk_size();
    manifest.total_chunks = msg.total_chunks();
    manifest.file_hash.assign(msg.file_hash().begin(), msg.file_hash().end());
    for (const auto& hash : msg.chunk_hashes()) {
        manifest.chunk_hashes.emplace_back(hash.begin(), hash.end());
    }
    return manifest;
}

} // namespace

uint32_t Manifest::chunk_length(uint64_t index) const {
    uint64_t offset = chunk_offset(index);
    if (offset >= file_size) {
        return 0;
    }
    uint64_t remaining = file_size - offset;
    return static_cast<uint32_t>(remaining < chunk_size ? remaining : chunk_size);
}

std::string session_id_for(const std::string& file_name, uint64_t file_size, const Digest& file_hash) {
    StreamHasher hasher;
    hasher.update(reinterpret_cast<const uint8_t*>(file_name.data()), file_name.size());
    uint8_t size_bytes[8];
    for (int i = 0; i < 8; ++i) {
        size_bytes[i] = static_cast<uint8_t>((file_size >> (8 * i)) & 0xff);
    }
    hasher.update(size_bytes, sizeof(size_bytes));
    hasher.update(file_hash);
    Digest id = hasher.finish();
    return util::to_hex(id.data(), SESSION_ID_BYTES);
}

Manifest build_manifest(const std::string& file_path, uint32_t chunk_size) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(file_path, "cannot open file to build manifest");
    }

    Manifest manifest;
    manifest.file_name = std::filesystem::path(file_path).filename().string();
    manifest.chunk_size = chunk_size;

    // Calculate the hash of the entire file and of every chunk in one pass
    StreamHasher file_hasher;
    std::vector<uint8_t> buffer(chunk_size);
    uint64_t file_size = 0;
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), chunk_size);
        std::streamsize count = file.gcount();
        if (count > 0) {
            manifest.chunk_hashes.push_back(checksum::digest(buffer.data(), static_cast<size_t>(count)));
            file_hasher.update(buffer.data(), static_cast<size_t>(count));
            file_size += static_cast<uint64_t>(count);
        }
    }
    if (file.bad()) {
        throw IoError(file_path, "read failed while building manifest");
    }
    if (manifest.chunk_hashes.empty()) {
        manifest.chunk_hashes.push_back(checksum::digest(nullptr, 0));
    }

    manifest.file_size = file_size;
    manifest.total_chunks = chunk_count_for(file_size, chunk_size);
    manifest.file_hash = file_hasher.finish();
    manifest.session_id = session_id_for(manifest.file_name, manifest.file_size, manifest.file_hash);
    return manifest;
}

std::string manifest_path_for(const std::string& file_path) {
    return file_path + ".ferry";
}

std::string encode_manifest(const Manifest& manifest) {
    wire::Manifest msg;
    to_message(manifest, msg);
    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw ProtocolViolation("Failed to encode manifest for " + manifest.file_name);
    }
    return out;
}

Manifest decode_manifest(const std::string& bytes) {
    wire::Manifest msg;
    if (!msg.ParseFromString(bytes)) {
        throw ProtocolViolation("Malformed manifest");
    }
    return from_message(msg);
}

void save_manifest(const Manifest& manifest, const std::string& path) {
    util::atomic_write(path, encode_manifest(manifest));
}

Manifest load_manifest(const std::string& path) {
    std::vector<uint8_t> data = util::read_file(path);
    wire::Manifest msg;
    if (!msg.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        throw TransferError(ErrorKind::Corruption, "Manifest file " + path + " cannot be parsed");
    }
    return from_message(msg);
}

void validate_manifest(const Manifest& manifest) {
    if (manifest.file_name.empty() || manifest.file_name == "." || manifest.file_name == ".." ||
        manifest.file_name.find('/') != std::string::npos ||
        manifest.file_name.find('\\') != std::string::npos) {
        throw ProtocolViolation("Manifest file name '" + manifest.file_name + "' is not a plain name");
    }
    if (manifest.chunk_size < MIN_CHUNK_SIZE || manifest.chunk_size > MAX_CHUNK_SIZE) {
        throw ProtocolViolation("Manifest chunk size " + std::to_string(manifest.chunk_size) + " is out of range");
    }
    uint64_t expected_total = chunk_count_for(manifest.file_size, manifest.chunk_size);
    if (manifest.total_chunks != expected_total) {
        throw ProtocolViolation("Manifest declares " + std::to_string(manifest.total_chunks) +
                                " chunks, size " + std::to_string(manifest.file_size) + " needs " +
                                std::to_string(expected_total));
    }
    if (manifest.chunk_hashes.size() != manifest.total_chunks) {
        throw ProtocolViolation("Manifest carries " + std::to_string(manifest.chunk_hashes.size()) +
                                " chunk digests for " + std::to_string(manifest.total_chunks) + " chunks");
    }
    if (manifest.file_hash.size() != DIGEST_SIZE) {
        throw ProtocolViolation("Manifest file digest is " + std::to_string(manifest.file_hash.size()) + " bytes");
    }
    for (size_t i = 0; i < manifest.chunk_hashes.size(); ++i) {
        if (manifest.chunk_hashes[i].size() != DIGEST_SIZE) {
            throw ProtocolViolation("Manifest digest of chunk " + std::to_string(i) + " is " +
                                    std::to_string(manifest.chunk_hashes[i].size()) + " bytes");
        }
    }
    std::string expected_id = session_id_for(manifest.file_name, manifest.file_size, manifest.file_hash);
    if (manifest.session_id != expected_id) {
        throw ProtocolViolation("Manifest session id " + manifest.session_id + " does not match its contents");
    }
}

} // namespace ferry
