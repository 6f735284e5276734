#include "session_store.hpp"
#include "errors.hpp"
#include "ferry/fs_utils.hpp"

namespace ferry {

SessionStore::SessionStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path SessionStore::bitmap_path(const std::string& session_id) const {
    return directory_ / (session_id + ".bitmap");
}

std::filesystem::path SessionStore::table_path(const std::string& session_id) const {
    return directory_ / (session_id + ".table");
}

bool SessionStore::has_checkpoint(const std::string& session_id) const {
    std::error_code ec;
    return std::filesystem::exists(bitmap_path(session_id), ec);
}

void SessionStore::save(const std::string& session_id, const ChunkBitmap& bitmap,
                        const ChunkTable& table) const {
    table.save_to_disk(table_path(session_id).string());
    bitmap.save_to_disk(bitmap_path(session_id).string());
}

void SessionStore::save_bitmap(const std::string& session_id, const ChunkBitmap& bitmap) const {
    bitmap.save_to_disk(bitmap_path(session_id).string());
}

std::optional<ChunkBitmap> SessionStore::load_bitmap(const std::string& session_id) const {
    if (!has_checkpoint(session_id)) {
        return std::nullopt;
    }
    return ChunkBitmap::load_from_disk(bitmap_path(session_id).string());
}

std::optional<ChunkTable> SessionStore::load_table(const std::string& session_id) const {
    std::error_code ec;
    auto path = table_path(session_id);
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    return ChunkTable::load_from_disk(path.string());
}

bool SessionStore::remove(const std::string& session_id) const {
    // Bitmap first so a half-removed session never looks resumable.
    bool removed_bitmap = util::remove_if_exists(bitmap_path(session_id));
    bool removed_table = util::remove_if_exists(table_path(session_id));
    return removed_bitmap || removed_table;
}

} // namespace ferry
