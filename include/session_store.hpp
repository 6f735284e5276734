#pragma once

#include "chunk_bitmap.hpp"
#include "chunk_table.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace ferry {

// Persisted state of one side of a transfer: the bitmap (checkpoint) and
// the chunk table snapshot, named after the session id.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path directory);

    std::filesystem::path bitmap_path(const std::string& session_id) const;
    std::filesystem::path table_path(const std::string& session_id) const;
    const std::filesystem::path& directory() const { return directory_; }

    bool has_checkpoint(const std::string& session_id) const;

    // Table first, then bitmap: the bitmap never claims more than the table
    // holds. Throws IoError; an earlier checkpoint survives a failed one.
    void save(const std::string& session_id, const ChunkBitmap& bitmap, const ChunkTable& table) const;
    void save_bitmap(const std::string& session_id, const ChunkBitmap& bitmap) const;

    // nullopt if there is no bitmap file. Throws CorruptBitmap or IoError.
    std::optional<ChunkBitmap> load_bitmap(const std::string& session_id) const;
    // nullopt if there is no table file. Throws a Corruption TransferError.
    std::optional<ChunkTable> load_table(const std::string& session_id) const;

    // Deletes both files. Returns false if neither existed.
    bool remove(const std::string& session_id) const;

private:
    std::filesystem::path directory_;
};

} // namespace ferry
