#pragma once

#include "admedia/blob_store.hpp"
#include "admedia/cache_config.hpp"
#include "admedia/media_types.hpp"
#include "admedia/metadata_store.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace admedia {

/// Media cache façade: owns the blob store and the metadata store and is the
/// only writer to either.
///
/// Entry lifecycle: absent -> present -> present with analysis (re-analysis
/// overwrites) -> absent, via age-based eviction or via the self-healing purge
/// that drops a row whose blob has gone missing.
///
/// Reads degrade to "not found" (stale rows, corrupt payloads). Writes throw
/// CacheError and are never retried.
class CacheService {
public:
    /// Returns seconds since the epoch. Defaults to the system clock.
    using Clock = std::function<int64_t()>;

    explicit CacheService(const CacheConfig& config, Clock clock = {});

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    /// Create the media directories and open the metadata store.
    /// Returns error message on failure, empty string on success.
    std::string open();

    /// Hit only if the row exists, matches `kind` (when given) and its blob is
    /// on disk. A row pointing at a missing blob is purged and reported as a miss.
    std::optional<CacheEntry> get_cached(const std::string& url,
                                         std::optional<MediaKind> kind = std::nullopt);

    /// One lookup for all URLs. The result has exactly one slot per distinct
    /// input URL.
    std::unordered_map<std::string, std::optional<CacheEntry>> get_cached_batch(
        const std::vector<std::string>& urls,
        std::optional<MediaKind> kind = std::nullopt);

    /// Store bytes and metadata for a URL, replacing any previous entry.
    /// @return path of the stored blob.
    std::filesystem::path put(const MediaPut& item);

    /// Write every blob, then all metadata rows in one transaction. A blob
    /// failure throws before any metadata is written.
    /// @return blob paths in input order.
    std::vector<std::filesystem::path> put_batch(const std::vector<MediaPut>& items);

    /// Attach (or replace) the analysis of an existing entry.
    /// @return false if the URL is not cached; no entry is created.
    bool attach_analysis(const std::string& url, const AnalysisPayload& analysis);

    std::vector<CacheEntry> search(const SearchFilters& filters);

    CacheStats stats();

    /// Remove every entry created more than `max_age_days` ago, blobs included.
    EvictionReport evict_older_than(int max_age_days);

    /// Read the stored bytes of an entry.
    std::optional<std::vector<uint8_t>> read_blob(const CacheEntry& entry) const;

    // --- Statistics ---

    struct Counters {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t stale_purged = 0;
        uint64_t puts = 0;
        uint64_t put_bytes = 0;
        uint64_t analyses_attached = 0;
        uint64_t evictions = 0;
        uint64_t eviction_bytes = 0;
        uint64_t corrupt_analyses = 0;
    };
    Counters counters() const;

    const CacheConfig& config() const { return config_; }

private:
    void require_open() const;
    int64_t now() const;
    CacheEntry make_entry(const MediaPut& item, const std::string& key,
                          const std::filesystem::path& path, int64_t now) const;

    CacheConfig config_;
    Clock clock_;

    BlobStore blobs_;
    MetadataStore metadata_;
    bool opened_ = false;

    // Serializes writers that replace or delete blobs (put, put_batch, eviction)
    std::mutex replace_mutex_;

    mutable std::mutex counters_mutex_;
    Counters counters_;
};

}  // namespace admedia
