#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace admedia {

enum class MediaKind {
    Image,
    Video,
};

/// "image" or "video", as persisted in the metadata store.
const char* media_kind_name(MediaKind kind);
std::optional<MediaKind> parse_media_kind(std::string_view name);

/// Analysis documents are schema-flexible; the cache only looks inside them
/// when deriving the quick-filter fields.
using AnalysisPayload = nlohmann::json;

/// Seconds since the Unix epoch.
int64_t now_epoch();

/// Strongly-typed fields extracted from an analysis payload at attach time.
struct QuickFilters {
    std::vector<std::string> dominant_colors;
    bool has_people = false;
    std::vector<std::string> text_elements;
};

/// Extract the quick-filter fields:
///   colors.dominant_colors  -> dominant_colors (string items, in order)
///   people_description      -> has_people (non-blank string)
///   text_elements           -> flattened strings of every category
/// Fields of unexpected shape are skipped.
QuickFilters derive_quick_filters(const AnalysisPayload& analysis);

/// One cached media item, keyed by the digest of its source URL.
struct CacheEntry {
    std::string key;
    std::string original_url;
    std::filesystem::path storage_path;
    MediaKind media_kind = MediaKind::Image;
    std::string content_type;
    uint64_t size_bytes = 0;
    int64_t created_at = 0;
    int64_t last_accessed_at = 0;

    std::optional<std::string> brand_name;
    std::optional<std::string> ad_id;

    std::optional<AnalysisPayload> analysis;
    std::optional<int64_t> analysis_cached_at;

    // Derived from `analysis`; empty/false when no analysis is attached.
    std::vector<std::string> dominant_colors;
    bool has_people = false;
    std::vector<std::string> text_elements;

    // Video only
    std::optional<double> duration_seconds;
    std::optional<bool> has_audio;
};

/// Input to CacheService::put / put_batch.
struct MediaPut {
    std::string url;
    std::vector<uint8_t> data;
    std::string content_type;
    MediaKind media_kind = MediaKind::Image;
    std::optional<std::string> brand_name;
    std::optional<std::string> ad_id;
    std::optional<AnalysisPayload> analysis;
    std::optional<double> duration_seconds;
    std::optional<bool> has_audio;
};

/// All set filters must match. An unset or empty string filter matches everything.
struct SearchFilters {
    std::optional<std::string> brand_name;
    std::optional<bool> has_people;
    std::optional<std::string> color_substring;
    std::optional<MediaKind> media_kind;
};

struct KindStats {
    uint64_t count = 0;
    uint64_t bytes = 0;
    uint64_t analyzed = 0;
};

struct CacheStats {
    uint64_t total_count = 0;
    uint64_t total_bytes = 0;
    uint64_t analyzed_count = 0;
    uint64_t distinct_brands = 0;
    KindStats images;
    KindStats videos;
    std::optional<double> avg_video_duration_seconds;
    uint64_t max_cache_bytes = 0;  // configured limit, reporting only

    double total_size_mb() const { return static_cast<double>(total_bytes) / (1024.0 * 1024.0); }
    double total_size_gb() const { return total_size_mb() / 1024.0; }
};

/// Row removed by age-based eviction; enough to delete its blob.
struct EvictedEntry {
    std::string key;
    std::filesystem::path storage_path;
    MediaKind media_kind = MediaKind::Image;
    uint64_t size_bytes = 0;
};

struct EvictionReport {
    uint64_t files_removed = 0;
    uint64_t bytes_freed = 0;
    uint64_t images_removed = 0;
    uint64_t videos_removed = 0;
    uint64_t blobs_missing = 0;  // blob deletions that were no-ops
};

}  // namespace admedia
