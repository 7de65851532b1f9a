#include "admedia/blob_store.hpp"
#include "admedia/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <utility>

namespace admedia {

namespace {

struct ExtensionMapping {
    const char* content_type;
    const char* extension;
};

constexpr ExtensionMapping IMAGE_EXTENSIONS[] = {
    {"image/jpeg", ".jpg"},
    {"image/jpg", ".jpg"},
    {"image/png", ".png"},
    {"image/gif", ".gif"},
    {"image/webp", ".webp"},
};

constexpr ExtensionMapping VIDEO_EXTENSIONS[] = {
    {"video/mp4", ".mp4"},
    {"video/quicktime", ".mov"},
    {"video/webm", ".webm"},
    {"video/x-msvideo", ".avi"},
    {"video/3gpp", ".3gp"},
};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

BlobStore::BlobStore(std::filesystem::path images_dir, std::filesystem::path videos_dir)
    : images_dir_(std::move(images_dir)), videos_dir_(std::move(videos_dir)) {}

const char* BlobStore::extension_for(MediaKind kind, std::string_view content_type) {
    auto type = to_lower(content_type);
    if (kind == MediaKind::Video) {
        for (const auto& m : VIDEO_EXTENSIONS) {
            if (type == m.content_type) return m.extension;
        }
        return ".mp4";
    }
    for (const auto& m : IMAGE_EXTENSIONS) {
        if (type == m.content_type) return m.extension;
    }
    return ".jpg";
}

const std::filesystem::path& BlobStore::dir_for(MediaKind kind) const {
    return kind == MediaKind::Video ? videos_dir_ : images_dir_;
}

std::filesystem::path BlobStore::path_for(const std::string& key, MediaKind kind,
                                          std::string_view content_type) const {
    return dir_for(kind) / (key + extension_for(kind, content_type));
}

std::filesystem::path BlobStore::write(const std::string& key, MediaKind kind,
                                       std::string_view content_type,
                                       std::span<const uint8_t> data) {
    auto path = path_for(key, kind, content_type);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw CacheError(ErrorKind::StorageWriteFailure,
                         "cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    // Write to temp file then rename (atomic)
    auto temp_path = path.string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw CacheError(ErrorKind::StorageWriteFailure, "cannot create " + temp_path);
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            std::filesystem::remove(temp_path, ec);
            throw CacheError(ErrorKind::StorageWriteFailure, "failed to write " + temp_path);
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw CacheError(ErrorKind::StorageWriteFailure,
                         "failed to rename into " + path.string() + ": " + ec.message());
    }
    return path;
}

bool BlobStore::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

bool BlobStore::remove(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::remove(path, ec) && !ec;
}

std::optional<std::vector<uint8_t>> BlobStore::read(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return std::nullopt;

    auto size = file.tellg();
    if (size < 0) return std::nullopt;

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) return std::nullopt;
    return data;
}

}  // namespace admedia
