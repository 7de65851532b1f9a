#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace admedia {

/// Configuration for the media cache and its network collaborators.
/// Passed explicitly to every component; there is no global instance.
struct CacheConfig {
    // Cache layout. Empty paths are derived from cache_root by apply_defaults().
    std::filesystem::path cache_root;   // Default: $HOME/.cache/facebook-ads-mcp
    std::filesystem::path db_path;      // <cache_root>/media_cache.db
    std::filesystem::path images_dir;   // <cache_root>/images
    std::filesystem::path videos_dir;   // <cache_root>/videos

    // Maintenance
    int max_age_days = 30;
    uint64_t max_cache_size_gb = 10;  // reported in stats, not enforced

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Fetcher
    size_t fetch_timeout_secs = 30;
    uint64_t fetch_max_bytes = 512ULL * 1024 * 1024;  // 512 MB
    std::string user_agent = "admedia-cache/1.0";

    // Media analysis (Gemini)
    std::string gemini_api_key;
    std::string gemini_model = "gemini-2.5-flash";
    std::string gemini_endpoint = "https://generativelanguage.googleapis.com/v1beta";
    size_t analysis_timeout_secs = 120;
    // Videos, and anything larger than this, go through the File API instead
    // of being inlined into the request
    uint64_t analysis_inline_max_bytes = 20ULL * 1024 * 1024;
    size_t upload_poll_interval_ms = 2000;
    size_t upload_processing_timeout_secs = 300;
    std::string analysis_prompt =
        "Describe this advertisement creative. Respond with a JSON object with the keys "
        "\"colors\" (with \"dominant_colors\"), \"people_description\" and \"text_elements\".";

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill unset values from GEMINI_API_KEY and ADMEDIA_CACHE_DIR.
    void apply_env();

    /// Derive cache_root, db_path, images_dir and videos_dir.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    uint64_t max_cache_bytes() const { return max_cache_size_gb * 1024ULL * 1024 * 1024; }
};

}  // namespace admedia
