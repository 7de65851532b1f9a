#pragma once

#include "admedia/media_types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace admedia {

/// Persists raw media bytes as <dir>/<key><ext>, one directory per media kind.
class BlobStore {
public:
    BlobStore(std::filesystem::path images_dir, std::filesystem::path videos_dir);

    /// File extension (with dot) for a content type. Unknown types fall back
    /// to ".jpg" for images and ".mp4" for videos.
    static const char* extension_for(MediaKind kind, std::string_view content_type);

    std::filesystem::path path_for(const std::string& key, MediaKind kind,
                                   std::string_view content_type) const;

    /// Write (or overwrite) the blob for `key`. The kind's directory is created
    /// before the write. Throws CacheError(StorageWriteFailure) on any I/O error.
    std::filesystem::path write(const std::string& key, MediaKind kind,
                                std::string_view content_type,
                                std::span<const uint8_t> data);

    bool exists(const std::filesystem::path& path) const;

    /// Best-effort delete. Returns true if a file was actually removed.
    bool remove(const std::filesystem::path& path);

    std::optional<std::vector<uint8_t>> read(const std::filesystem::path& path) const;

    const std::filesystem::path& images_dir() const { return images_dir_; }
    const std::filesystem::path& videos_dir() const { return videos_dir_; }

private:
    const std::filesystem::path& dir_for(MediaKind kind) const;

    std::filesystem::path images_dir_;
    std::filesystem::path videos_dir_;
};

}  // namespace admedia
