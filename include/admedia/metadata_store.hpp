#pragma once

#include "admedia/media_types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace admedia {

/// SQLite-backed record store, one row per cache key.
///
/// Two connections share the WAL-mode database file: a writer, used under
/// write_mutex_ with BEGIN IMMEDIATE for multi-row changes, and a reader,
/// used under read_mutex_. Readers never wait on writers and always observe
/// whole committed rows.
///
/// Single-row writes throw CacheError(StorageWriteFailure). Batch writes are
/// fail-soft per row: failures are logged and counted, the rest commit.
class MetadataStore {
public:
    explicit MetadataStore(std::filesystem::path db_path);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /// Open the database and create the schema if absent.
    /// Throws CacheError(StorageWriteFailure) on failure.
    void open();
    bool is_open() const { return writer_ != nullptr; }

    std::optional<CacheEntry> get(const std::string& key,
                                  std::optional<MediaKind> kind = std::nullopt);

    /// Every requested key is present in the result; absent rows map to nullopt.
    std::unordered_map<std::string, std::optional<CacheEntry>> get_batch(
        const std::vector<std::string>& keys,
        std::optional<MediaKind> kind = std::nullopt);

    /// Insert or replace by key. If the entry carries an analysis, its
    /// quick-filter fields are recomputed from it.
    void put(const CacheEntry& entry);

    /// Insert or replace all entries in one transaction.
    /// @return number of rows that failed to write.
    size_t put_batch(const std::vector<CacheEntry>& entries);

    /// Replace the analysis payload, its derived fields and analysis_cached_at.
    /// @return false if no row exists for `key`.
    bool update_analysis(const std::string& key, const AnalysisPayload& analysis, int64_t now);

    /// Most recently accessed first.
    std::vector<CacheEntry> search(const SearchFilters& filters);

    /// Delete every row created before `cutoff` and return what was deleted.
    std::vector<EvictedEntry> delete_older_than(int64_t cutoff);

    /// Delete the row for `key` only if it is still the generation identified
    /// by `created_at` (a concurrent re-put keeps its row).
    bool remove(const std::string& key, int64_t created_at);

    /// Same as remove() for several rows, in one transaction.
    size_t remove_batch(const std::vector<std::pair<std::string, int64_t>>& rows);

    /// Advance last_accessed_at to `now` (never moves it backwards).
    void touch(const std::string& key, int64_t now);
    void touch_batch(const std::vector<std::string>& keys, int64_t now);

    CacheStats stats();

    /// Number of analysis payloads that failed to parse on read.
    uint64_t corrupt_payloads_seen() const { return corrupt_payloads_.load(); }

private:
    void prepare_statements();
    CacheEntry read_row(sqlite3_stmt* stmt);
    bool bind_and_insert(const CacheEntry& entry);

    std::filesystem::path db_path_;

    std::mutex write_mutex_;
    sqlite3* writer_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_update_analysis_ = nullptr;
    sqlite3_stmt* stmt_touch_ = nullptr;
    sqlite3_stmt* stmt_remove_ = nullptr;

    std::mutex read_mutex_;
    sqlite3* reader_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;

    std::atomic<uint64_t> corrupt_payloads_{0};
};

}  // namespace admedia
