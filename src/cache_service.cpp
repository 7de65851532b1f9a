#include "admedia/cache_service.hpp"
#include "admedia/errors.hpp"
#include "admedia/log.hpp"
#include "admedia/url_identity.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace admedia {

namespace {

constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

void validate_url(const std::string& url) {
    if (url.empty() || url.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw CacheError(ErrorKind::InvalidInput, "media URL must not be empty");
    }
}

}  // namespace

CacheService::CacheService(const CacheConfig& config, Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , blobs_(config.images_dir, config.videos_dir)
    , metadata_(config.db_path) {
    if (!clock_) clock_ = now_epoch;
}

std::string CacheService::open() {
    if (opened_) return {};

    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    std::filesystem::create_directories(config_.cache_root, ec);
    if (ec) return "Failed to create cache_root: " + ec.message();
    std::filesystem::create_directories(config_.images_dir, ec);
    if (ec) return "Failed to create images_dir: " + ec.message();
    std::filesystem::create_directories(config_.videos_dir, ec);
    if (ec) return "Failed to create videos_dir: " + ec.message();

    try {
        metadata_.open();
    } catch (const std::exception& e) {
        return std::string("Failed to open metadata store: ") + e.what();
    }

    opened_ = true;
    log_info("Media cache initialized at %s (db=%s)",
             config_.cache_root.c_str(), config_.db_path.c_str());
    return {};
}

void CacheService::require_open() const {
    if (!opened_) {
        throw CacheError(ErrorKind::StorageWriteFailure, "media cache is not open");
    }
}

int64_t CacheService::now() const {
    return clock_();
}

CacheEntry CacheService::make_entry(const MediaPut& item, const std::string& key,
                                    const std::filesystem::path& path, int64_t now) const {
    CacheEntry entry;
    entry.key = key;
    entry.original_url = item.url;
    entry.storage_path = path;
    entry.media_kind = item.media_kind;
    entry.content_type = item.content_type;
    entry.size_bytes = item.data.size();
    entry.created_at = now;
    entry.last_accessed_at = now;
    entry.brand_name = item.brand_name;
    entry.ad_id = item.ad_id;
    if (item.analysis) {
        entry.analysis = item.analysis;
        entry.analysis_cached_at = now;
        auto filters = derive_quick_filters(*item.analysis);
        entry.dominant_colors = std::move(filters.dominant_colors);
        entry.has_people = filters.has_people;
        entry.text_elements = std::move(filters.text_elements);
    }
    entry.duration_seconds = item.duration_seconds;
    entry.has_audio = item.has_audio;
    return entry;
}

// --- Lookups ---

std::optional<CacheEntry> CacheService::get_cached(const std::string& url,
                                                   std::optional<MediaKind> kind) {
    validate_url(url);
    require_open();

    auto key = identify(url);
    auto entry = metadata_.get(key, kind);
    if (!entry) {
        std::lock_guard lock(counters_mutex_);
        counters_.misses++;
        log_debug("Cache miss: %s", url.c_str());
        return std::nullopt;
    }

    if (!blobs_.exists(entry->storage_path)) {
        metadata_.remove(key, entry->created_at);
        log_warn("Cached file missing, removed from metadata: %s", entry->storage_path.c_str());
        std::lock_guard lock(counters_mutex_);
        counters_.stale_purged++;
        counters_.misses++;
        return std::nullopt;
    }

    auto ts = now();
    metadata_.touch(key, ts);
    entry->last_accessed_at = std::max(entry->last_accessed_at, ts);

    {
        std::lock_guard lock(counters_mutex_);
        counters_.hits++;
    }
    log_debug("Cache hit: %s", url.c_str());
    return entry;
}

std::unordered_map<std::string, std::optional<CacheEntry>> CacheService::get_cached_batch(
    const std::vector<std::string>& urls, std::optional<MediaKind> kind) {
    for (const auto& url : urls) validate_url(url);
    require_open();

    std::unordered_map<std::string, std::optional<CacheEntry>> results;
    if (urls.empty()) return results;

    // key -> url; identical URLs share one key
    std::unordered_map<std::string, std::string> key_to_url;
    std::vector<std::string> keys;
    for (const auto& url : urls) {
        results.emplace(url, std::nullopt);
        auto key = identify(url);
        if (key_to_url.emplace(key, url).second) keys.push_back(std::move(key));
    }

    auto rows = metadata_.get_batch(keys, kind);

    std::vector<std::pair<std::string, int64_t>> stale;
    std::vector<std::string> hit_keys;
    auto ts = now();
    for (auto& [key, row] : rows) {
        if (!row) continue;
        if (!blobs_.exists(row->storage_path)) {
            log_warn("Cached file missing, removed from metadata: %s", row->storage_path.c_str());
            stale.emplace_back(key, row->created_at);
            continue;
        }
        row->last_accessed_at = std::max(row->last_accessed_at, ts);
        hit_keys.push_back(key);
        results[key_to_url[key]] = std::move(row);
    }

    metadata_.remove_batch(stale);
    metadata_.touch_batch(hit_keys, ts);

    {
        std::lock_guard lock(counters_mutex_);
        counters_.hits += hit_keys.size();
        counters_.misses += keys.size() - hit_keys.size();
        counters_.stale_purged += stale.size();
    }

    log_info("Batch cache lookup: %zu/%zu cache hits", hit_keys.size(), keys.size());
    return results;
}

// --- Writes ---

std::filesystem::path CacheService::put(const MediaPut& item) {
    validate_url(item.url);
    require_open();

    auto key = identify(item.url);

    // Previous-row lookup, blob write, row replace and old-blob cleanup form
    // one step; a concurrent re-put must not remove the blob this one stores.
    std::lock_guard replace_lock(replace_mutex_);
    auto previous = metadata_.get(key);

    auto path = blobs_.write(key, item.media_kind, item.content_type,
                             std::span<const uint8_t>(item.data));

    // Blob is on disk; a metadata failure below leaves a harmless orphan.
    metadata_.put(make_entry(item, key, path, now()));

    // A different content type may have moved the blob to another extension
    if (previous && previous->storage_path != path) {
        blobs_.remove(previous->storage_path);
    }

    {
        std::lock_guard lock(counters_mutex_);
        counters_.puts++;
        counters_.put_bytes += item.data.size();
    }
    log_info("Cached %s: %s -> %s", media_kind_name(item.media_kind),
             item.url.c_str(), path.c_str());
    return path;
}

std::vector<std::filesystem::path> CacheService::put_batch(const std::vector<MediaPut>& items) {
    for (const auto& item : items) validate_url(item.url);
    require_open();

    std::vector<std::filesystem::path> paths;
    if (items.empty()) return paths;

    std::vector<std::string> keys;
    keys.reserve(items.size());
    for (const auto& item : items) keys.push_back(identify(item.url));

    std::lock_guard replace_lock(replace_mutex_);
    auto previous = metadata_.get_batch(keys);

    // Blobs first: nothing below may reference bytes that were never written
    paths.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        paths.push_back(blobs_.write(keys[i], items[i].media_kind, items[i].content_type,
                                     std::span<const uint8_t>(items[i].data)));
    }

    auto ts = now();
    std::vector<CacheEntry> entries;
    entries.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        entries.push_back(make_entry(items[i], keys[i], paths[i], ts));
    }
    size_t failed = metadata_.put_batch(entries);

    if (failed > 0) {
        {
            std::lock_guard lock(counters_mutex_);
            counters_.puts += items.size() - failed;
        }
        throw CacheError(ErrorKind::StorageWriteFailure,
                         std::to_string(failed) + " of " + std::to_string(items.size()) +
                             " metadata rows failed to write");
    }

    // The last occurrence of a key wins; drop blobs no row points at any more
    std::unordered_map<std::string, std::filesystem::path> final_paths;
    for (size_t i = 0; i < items.size(); ++i) final_paths[keys[i]] = paths[i];
    std::unordered_set<std::string> obsolete;
    for (size_t i = 0; i < items.size(); ++i) {
        if (paths[i] != final_paths[keys[i]]) obsolete.insert(paths[i].string());
        const auto& prev = previous[keys[i]];
        if (prev && prev->storage_path != final_paths[keys[i]]) {
            obsolete.insert(prev->storage_path.string());
        }
    }
    for (const auto& p : obsolete) blobs_.remove(p);

    {
        std::lock_guard lock(counters_mutex_);
        counters_.puts += items.size();
        for (const auto& item : items) counters_.put_bytes += item.data.size();
    }

    log_info("Batch cached %zu media files", items.size());
    return paths;
}

bool CacheService::attach_analysis(const std::string& url, const AnalysisPayload& analysis) {
    validate_url(url);
    require_open();

    auto key = identify(url);
    if (!metadata_.update_analysis(key, analysis, now())) {
        log_warn("No cached media for %s, analysis not attached", url.c_str());
        return false;
    }

    {
        std::lock_guard lock(counters_mutex_);
        counters_.analyses_attached++;
    }
    log_info("Updated analysis results for: %s", url.c_str());
    return true;
}

// --- Queries ---

std::vector<CacheEntry> CacheService::search(const SearchFilters& filters) {
    require_open();
    return metadata_.search(filters);
}

CacheStats CacheService::stats() {
    require_open();
    auto s = metadata_.stats();
    s.max_cache_bytes = config_.max_cache_bytes();
    return s;
}

std::optional<std::vector<uint8_t>> CacheService::read_blob(const CacheEntry& entry) const {
    return blobs_.read(entry.storage_path);
}

// --- Eviction ---

EvictionReport CacheService::evict_older_than(int max_age_days) {
    if (max_age_days < 0) {
        throw CacheError(ErrorKind::InvalidInput, "max_age_days must be >= 0");
    }
    require_open();

    int64_t cutoff = now() - static_cast<int64_t>(max_age_days) * SECONDS_PER_DAY;

    // Rows go first so no reader can be handed an entry whose blob is being deleted
    std::lock_guard replace_lock(replace_mutex_);
    auto evicted = metadata_.delete_older_than(cutoff);

    EvictionReport report;
    for (const auto& e : evicted) {
        if (!blobs_.remove(e.storage_path)) {
            report.blobs_missing++;
        }
        report.files_removed++;
        report.bytes_freed += e.size_bytes;
        if (e.media_kind == MediaKind::Video) {
            report.videos_removed++;
        } else {
            report.images_removed++;
        }
    }

    {
        std::lock_guard lock(counters_mutex_);
        counters_.evictions += report.files_removed;
        counters_.eviction_bytes += report.bytes_freed;
    }

    log_info("Cleanup completed: removed %lu images and %lu videos (%lu bytes, %lu blobs already missing)",
             report.images_removed, report.videos_removed, report.bytes_freed, report.blobs_missing);
    return report;
}

// --- Stats ---

CacheService::Counters CacheService::counters() const {
    std::lock_guard lock(counters_mutex_);
    Counters c = counters_;
    c.corrupt_analyses = metadata_.corrupt_payloads_seen();
    return c;
}

}  // namespace admedia
