#include "admedia/metadata_store.hpp"
#include "admedia/errors.hpp"
#include "admedia/log.hpp"

#include <algorithm>
#include <chrono>
#include <sqlite3.h>
#include <thread>
#include <utility>

namespace admedia {

namespace {

constexpr const char* SCHEMA = R"(
CREATE TABLE IF NOT EXISTS media_entries (
    key TEXT PRIMARY KEY,
    original_url TEXT NOT NULL,
    storage_path TEXT NOT NULL,
    media_kind TEXT NOT NULL DEFAULT 'image',
    content_type TEXT NOT NULL DEFAULT '',
    size_bytes INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    last_accessed_at INTEGER NOT NULL,
    brand_name TEXT,
    ad_id TEXT,
    analysis TEXT,
    analysis_cached_at INTEGER,
    dominant_colors TEXT,
    has_people INTEGER,
    text_elements TEXT,
    duration_seconds REAL,
    has_audio INTEGER
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_brand_name ON media_entries(brand_name);
CREATE INDEX IF NOT EXISTS idx_ad_id ON media_entries(ad_id);
CREATE INDEX IF NOT EXISTS idx_last_accessed ON media_entries(last_accessed_at);
CREATE INDEX IF NOT EXISTS idx_has_people ON media_entries(has_people);
CREATE INDEX IF NOT EXISTS idx_dominant_colors ON media_entries(dominant_colors);
CREATE INDEX IF NOT EXISTS idx_media_kind ON media_entries(media_kind);
CREATE INDEX IF NOT EXISTS idx_created_at ON media_entries(created_at);
)";

// Column order shared by every SELECT that feeds read_row()
constexpr const char* ENTRY_COLUMNS =
    "key, original_url, storage_path, media_kind, content_type, size_bytes, "
    "created_at, last_accessed_at, brand_name, ad_id, analysis, analysis_cached_at, "
    "dominant_colors, has_people, text_elements, duration_seconds, has_audio";

// SQLite's default host parameter limit is 999 on older builds
constexpr size_t BATCH_CHUNK = 500;

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

sqlite3_stmt* prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw CacheError(ErrorKind::StorageWriteFailure,
                         std::string("cannot prepare statement: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

bool column_is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

std::string join_colors(const std::vector<std::string>& colors) {
    std::string out;
    for (size_t i = 0; i < colors.size(); ++i) {
        if (i > 0) out += ',';
        out += colors[i];
    }
    return out;
}

std::vector<std::string> split_colors(const std::string& joined) {
    std::vector<std::string> colors;
    if (joined.empty()) return colors;
    size_t start = 0;
    while (true) {
        size_t comma = joined.find(',', start);
        if (comma == std::string::npos) {
            colors.push_back(joined.substr(start));
            return colors;
        }
        colors.push_back(joined.substr(start, comma - start));
        start = comma + 1;
    }
}

std::string escape_like(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Bindings 2-6 of the analysis UPDATE and 11-15 of the INSERT share this layout.
struct AnalysisColumns {
    std::string analysis;
    std::string dominant_colors;
    bool has_people = false;
    std::string text_elements;
};

AnalysisColumns analysis_columns(const AnalysisPayload& analysis) {
    auto filters = derive_quick_filters(analysis);
    AnalysisColumns cols;
    cols.analysis = dump_json(analysis);
    cols.dominant_colors = join_colors(filters.dominant_colors);
    cols.has_people = filters.has_people;
    cols.text_elements = dump_json(nlohmann::json(filters.text_elements));
    return cols;
}

}  // namespace

MetadataStore::MetadataStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

MetadataStore::~MetadataStore() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_update_analysis_) sqlite3_finalize(stmt_update_analysis_);
    if (stmt_touch_) sqlite3_finalize(stmt_touch_);
    if (stmt_remove_) sqlite3_finalize(stmt_remove_);
    if (stmt_get_) sqlite3_finalize(stmt_get_);

    if (reader_) sqlite3_close(reader_);
    if (writer_) {
        sqlite3_exec(writer_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(writer_);
    }
}

void MetadataStore::open() {
    if (writer_) return;

    int rc = sqlite3_open(db_path_.c_str(), &writer_);
    if (rc != SQLITE_OK) {
        std::string msg = writer_ ? sqlite3_errmsg(writer_) : "out of memory";
        sqlite3_close(writer_);
        writer_ = nullptr;
        throw CacheError(ErrorKind::StorageWriteFailure, "cannot open metadata store: " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(writer_, "PRAGMA journal_mode=WAL");
    sql_exec(writer_, "PRAGMA synchronous=NORMAL");
    sql_exec(writer_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(writer_, SCHEMA)) {
        throw CacheError(ErrorKind::StorageWriteFailure,
                         "cannot create schema in " + db_path_.string());
    }

    rc = sqlite3_open_v2(db_path_.c_str(), &reader_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = reader_ ? sqlite3_errmsg(reader_) : "out of memory";
        sqlite3_close(reader_);
        reader_ = nullptr;
        throw CacheError(ErrorKind::StorageWriteFailure, "cannot open metadata reader: " + msg);
    }
    sql_exec(reader_, "PRAGMA busy_timeout=5000");

    prepare_statements();
}

void MetadataStore::prepare_statements() {
    stmt_insert_ = prepare(writer_,
        std::string("INSERT OR REPLACE INTO media_entries (") + ENTRY_COLUMNS + ") "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17)");

    stmt_update_analysis_ = prepare(writer_,
        "UPDATE media_entries SET analysis = ?2, analysis_cached_at = ?3, "
        "dominant_colors = ?4, has_people = ?5, text_elements = ?6 WHERE key = ?1");

    stmt_touch_ = prepare(writer_,
        "UPDATE media_entries SET last_accessed_at = MAX(last_accessed_at, ?2) WHERE key = ?1");

    stmt_remove_ = prepare(writer_,
        "DELETE FROM media_entries WHERE key = ?1 AND created_at = ?2");

    stmt_get_ = prepare(reader_,
        std::string("SELECT ") + ENTRY_COLUMNS +
        " FROM media_entries WHERE key = ?1 AND (?2 IS NULL OR media_kind = ?2)");
}

// --- Row mapping ---

CacheEntry MetadataStore::read_row(sqlite3_stmt* stmt) {
    CacheEntry e;
    e.key = column_text(stmt, 0);
    e.original_url = column_text(stmt, 1);
    e.storage_path = column_text(stmt, 2);
    e.media_kind = parse_media_kind(column_text(stmt, 3)).value_or(MediaKind::Image);
    e.content_type = column_text(stmt, 4);
    e.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    e.created_at = sqlite3_column_int64(stmt, 6);
    e.last_accessed_at = sqlite3_column_int64(stmt, 7);
    if (!column_is_null(stmt, 8)) e.brand_name = column_text(stmt, 8);
    if (!column_is_null(stmt, 9)) e.ad_id = column_text(stmt, 9);

    if (!column_is_null(stmt, 10)) {
        auto parsed = nlohmann::json::parse(column_text(stmt, 10), nullptr, false);
        if (parsed.is_discarded()) {
            corrupt_payloads_++;
            log_warn("Corrupt analysis payload for %s, treating as unanalyzed", e.key.c_str());
        } else {
            e.analysis = std::move(parsed);
            if (!column_is_null(stmt, 11)) e.analysis_cached_at = sqlite3_column_int64(stmt, 11);
        }
    }

    // Quick filters only describe a payload that is actually readable
    if (e.analysis) {
        if (!column_is_null(stmt, 12)) e.dominant_colors = split_colors(column_text(stmt, 12));
        e.has_people = !column_is_null(stmt, 13) && sqlite3_column_int(stmt, 13) != 0;
        if (!column_is_null(stmt, 14)) {
            auto texts = nlohmann::json::parse(column_text(stmt, 14), nullptr, false);
            if (texts.is_array()) {
                for (const auto& t : texts) {
                    if (t.is_string()) e.text_elements.push_back(t.get<std::string>());
                }
            }
        }
    }

    if (!column_is_null(stmt, 15)) e.duration_seconds = sqlite3_column_double(stmt, 15);
    if (!column_is_null(stmt, 16)) e.has_audio = sqlite3_column_int(stmt, 16) != 0;
    return e;
}

bool MetadataStore::bind_and_insert(const CacheEntry& entry) {
    sqlite3_reset(stmt_insert_);
    sqlite3_clear_bindings(stmt_insert_);

    bind_text(stmt_insert_, 1, entry.key);
    bind_text(stmt_insert_, 2, entry.original_url);
    bind_text(stmt_insert_, 3, entry.storage_path.string());
    sqlite3_bind_text(stmt_insert_, 4, media_kind_name(entry.media_kind), -1, SQLITE_STATIC);
    bind_text(stmt_insert_, 5, entry.content_type);
    sqlite3_bind_int64(stmt_insert_, 6, static_cast<int64_t>(entry.size_bytes));
    sqlite3_bind_int64(stmt_insert_, 7, entry.created_at);
    sqlite3_bind_int64(stmt_insert_, 8, entry.last_accessed_at);
    bind_optional_text(stmt_insert_, 9, entry.brand_name);
    bind_optional_text(stmt_insert_, 10, entry.ad_id);

    if (entry.analysis) {
        auto cols = analysis_columns(*entry.analysis);
        bind_text(stmt_insert_, 11, cols.analysis);
        sqlite3_bind_int64(stmt_insert_, 12, entry.analysis_cached_at.value_or(entry.created_at));
        bind_text(stmt_insert_, 13, cols.dominant_colors);
        sqlite3_bind_int(stmt_insert_, 14, cols.has_people ? 1 : 0);
        bind_text(stmt_insert_, 15, cols.text_elements);
    }
    // Unbound analysis columns stay NULL after sqlite3_clear_bindings()

    if (entry.duration_seconds) sqlite3_bind_double(stmt_insert_, 16, *entry.duration_seconds);
    if (entry.has_audio) sqlite3_bind_int(stmt_insert_, 17, *entry.has_audio ? 1 : 0);

    int rc = sql_step_retry(stmt_insert_);
    sqlite3_reset(stmt_insert_);
    return rc == SQLITE_DONE;
}

// --- Reads ---

std::optional<CacheEntry> MetadataStore::get(const std::string& key,
                                             std::optional<MediaKind> kind) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    sqlite3_reset(stmt_get_);
    sqlite3_clear_bindings(stmt_get_);
    bind_text(stmt_get_, 1, key);
    if (kind) sqlite3_bind_text(stmt_get_, 2, media_kind_name(*kind), -1, SQLITE_STATIC);

    std::optional<CacheEntry> result;
    int rc = sql_step_retry(stmt_get_);
    if (rc == SQLITE_ROW) {
        result = read_row(stmt_get_);
    } else if (rc != SQLITE_DONE) {
        log_error("Metadata lookup failed for %s: %s", key.c_str(), sqlite3_errmsg(reader_));
    }
    sqlite3_reset(stmt_get_);
    return result;
}

std::unordered_map<std::string, std::optional<CacheEntry>> MetadataStore::get_batch(
    const std::vector<std::string>& keys, std::optional<MediaKind> kind) {
    std::unordered_map<std::string, std::optional<CacheEntry>> results;
    std::vector<std::string> unique;
    unique.reserve(keys.size());
    for (const auto& k : keys) {
        if (results.emplace(k, std::nullopt).second) unique.push_back(k);
    }
    if (unique.empty()) return results;

    std::lock_guard<std::mutex> lock(read_mutex_);

    // One read transaction so every chunk sees the same snapshot
    sql_exec(reader_, "BEGIN");
    for (size_t offset = 0; offset < unique.size(); offset += BATCH_CHUNK) {
        size_t n = std::min(BATCH_CHUNK, unique.size() - offset);

        std::string sql = std::string("SELECT ") + ENTRY_COLUMNS +
                          " FROM media_entries WHERE key IN (";
        for (size_t i = 0; i < n; ++i) {
            sql += (i == 0) ? "?" : ",?";
        }
        sql += ")";
        if (kind) sql += " AND media_kind = ?";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(reader_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            log_error("Batch lookup prepare failed: %s", sqlite3_errmsg(reader_));
            sqlite3_finalize(stmt);
            continue;
        }
        for (size_t i = 0; i < n; ++i) {
            bind_text(stmt, static_cast<int>(i + 1), unique[offset + i]);
        }
        if (kind) {
            sqlite3_bind_text(stmt, static_cast<int>(n + 1), media_kind_name(*kind), -1, SQLITE_STATIC);
        }

        int rc;
        while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
            auto entry = read_row(stmt);
            auto key = entry.key;
            results[key] = std::move(entry);
        }
        if (rc != SQLITE_DONE) {
            log_error("Batch lookup failed: %s", sqlite3_errmsg(reader_));
        }
        sqlite3_finalize(stmt);
    }
    sql_exec(reader_, "COMMIT");
    return results;
}

std::vector<CacheEntry> MetadataStore::search(const SearchFilters& filters) {
    std::string sql = std::string("SELECT ") + ENTRY_COLUMNS + " FROM media_entries WHERE 1=1";
    bool by_brand = filters.brand_name && !filters.brand_name->empty();
    bool by_color = filters.color_substring && !filters.color_substring->empty();
    if (by_brand) sql += " AND brand_name = ?";
    if (filters.has_people) sql += " AND has_people = ?";
    if (by_color) sql += " AND dominant_colors LIKE ? ESCAPE '\\'";
    if (filters.media_kind) sql += " AND media_kind = ?";
    sql += " ORDER BY last_accessed_at DESC, created_at DESC, key ASC";

    std::vector<CacheEntry> results;
    std::lock_guard<std::mutex> lock(read_mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(reader_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("Search prepare failed: %s", sqlite3_errmsg(reader_));
        sqlite3_finalize(stmt);
        return results;
    }

    int idx = 1;
    if (by_brand) bind_text(stmt, idx++, *filters.brand_name);
    if (filters.has_people) sqlite3_bind_int(stmt, idx++, *filters.has_people ? 1 : 0);
    if (by_color) {
        bind_text(stmt, idx++, "%" + escape_like(*filters.color_substring) + "%");
    }
    if (filters.media_kind) {
        sqlite3_bind_text(stmt, idx++, media_kind_name(*filters.media_kind), -1, SQLITE_STATIC);
    }

    int rc;
    while ((rc = sql_step_retry(stmt)) == SQLITE_ROW) {
        auto entry = read_row(stmt);
        // A row whose payload no longer parses has no quick filters to match
        if ((filters.has_people || by_color) && !entry.analysis) continue;
        results.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        log_error("Search failed: %s", sqlite3_errmsg(reader_));
    }
    sqlite3_finalize(stmt);
    return results;
}

CacheStats MetadataStore::stats() {
    CacheStats s;
    std::lock_guard<std::mutex> lock(read_mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(reader_,
            "SELECT COUNT(*), "
            "  TOTAL(size_bytes), "
            "  SUM(CASE WHEN json_valid(analysis) THEN 1 ELSE 0 END), "
            "  COUNT(DISTINCT brand_name), "
            "  SUM(CASE WHEN media_kind = 'image' THEN 1 ELSE 0 END), "
            "  TOTAL(CASE WHEN media_kind = 'image' THEN size_bytes ELSE 0 END), "
            "  SUM(CASE WHEN media_kind = 'image' AND json_valid(analysis) THEN 1 ELSE 0 END), "
            "  SUM(CASE WHEN media_kind = 'video' THEN 1 ELSE 0 END), "
            "  TOTAL(CASE WHEN media_kind = 'video' THEN size_bytes ELSE 0 END), "
            "  SUM(CASE WHEN media_kind = 'video' AND json_valid(analysis) THEN 1 ELSE 0 END), "
            "  AVG(CASE WHEN media_kind = 'video' THEN duration_seconds END) "
            "FROM media_entries",
            -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("Stats prepare failed: %s", sqlite3_errmsg(reader_));
        sqlite3_finalize(stmt);
        return s;
    }

    if (sql_step_retry(stmt) == SQLITE_ROW) {
        auto u64 = [&](int col) { return static_cast<uint64_t>(sqlite3_column_int64(stmt, col)); };
        s.total_count = u64(0);
        s.total_bytes = u64(1);
        s.analyzed_count = u64(2);
        s.distinct_brands = u64(3);
        s.images = {u64(4), u64(5), u64(6)};
        s.videos = {u64(7), u64(8), u64(9)};
        if (!column_is_null(stmt, 10)) s.avg_video_duration_seconds = sqlite3_column_double(stmt, 10);
    } else {
        log_error("Stats query failed: %s", sqlite3_errmsg(reader_));
    }
    sqlite3_finalize(stmt);
    return s;
}

// --- Writes ---

void MetadataStore::put(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!bind_and_insert(entry)) {
        throw CacheError(ErrorKind::StorageWriteFailure,
                         "metadata write failed for " + entry.key + ": " + sqlite3_errmsg(writer_));
    }
}

size_t MetadataStore::put_batch(const std::vector<CacheEntry>& entries) {
    if (entries.empty()) return 0;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!sql_exec(writer_, "BEGIN IMMEDIATE")) {
        throw CacheError(ErrorKind::StorageWriteFailure, "cannot begin metadata batch");
    }

    size_t failed = 0;
    for (const auto& entry : entries) {
        if (!bind_and_insert(entry)) {
            log_error("Batch metadata write failed for %s (%s): %s",
                      entry.key.c_str(), entry.original_url.c_str(), sqlite3_errmsg(writer_));
            ++failed;
        }
    }

    if (!sql_exec(writer_, "COMMIT")) {
        sql_exec(writer_, "ROLLBACK");
        throw CacheError(ErrorKind::StorageWriteFailure, "cannot commit metadata batch");
    }
    return failed;
}

bool MetadataStore::update_analysis(const std::string& key, const AnalysisPayload& analysis,
                                    int64_t now) {
    auto cols = analysis_columns(analysis);

    std::lock_guard<std::mutex> lock(write_mutex_);
    sqlite3_reset(stmt_update_analysis_);
    bind_text(stmt_update_analysis_, 1, key);
    bind_text(stmt_update_analysis_, 2, cols.analysis);
    sqlite3_bind_int64(stmt_update_analysis_, 3, now);
    bind_text(stmt_update_analysis_, 4, cols.dominant_colors);
    sqlite3_bind_int(stmt_update_analysis_, 5, cols.has_people ? 1 : 0);
    bind_text(stmt_update_analysis_, 6, cols.text_elements);

    int rc = sql_step_retry(stmt_update_analysis_);
    sqlite3_reset(stmt_update_analysis_);
    if (rc != SQLITE_DONE) {
        throw CacheError(ErrorKind::StorageWriteFailure,
                         "analysis update failed for " + key + ": " + sqlite3_errmsg(writer_));
    }
    return sqlite3_changes(writer_) > 0;
}

std::vector<EvictedEntry> MetadataStore::delete_older_than(int64_t cutoff) {
    std::vector<EvictedEntry> deleted;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!sql_exec(writer_, "BEGIN IMMEDIATE")) {
        throw CacheError(ErrorKind::StorageWriteFailure, "cannot begin eviction");
    }

    sqlite3_stmt* select_stmt = nullptr;
    sqlite3_prepare_v2(writer_,
        "SELECT key, storage_path, media_kind, size_bytes FROM media_entries WHERE created_at < ?1",
        -1, &select_stmt, nullptr);
    sqlite3_bind_int64(select_stmt, 1, cutoff);
    int rc;
    while ((rc = sql_step_retry(select_stmt)) == SQLITE_ROW) {
        EvictedEntry e;
        e.key = column_text(select_stmt, 0);
        e.storage_path = column_text(select_stmt, 1);
        e.media_kind = parse_media_kind(column_text(select_stmt, 2)).value_or(MediaKind::Image);
        e.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(select_stmt, 3));
        deleted.push_back(std::move(e));
    }
    sqlite3_finalize(select_stmt);

    bool ok = (rc == SQLITE_DONE);
    if (ok) {
        sqlite3_stmt* delete_stmt = nullptr;
        sqlite3_prepare_v2(writer_, "DELETE FROM media_entries WHERE created_at < ?1",
                           -1, &delete_stmt, nullptr);
        sqlite3_bind_int64(delete_stmt, 1, cutoff);
        ok = sql_step_retry(delete_stmt) == SQLITE_DONE;
        sqlite3_finalize(delete_stmt);
    }

    if (!ok || !sql_exec(writer_, "COMMIT")) {
        std::string msg = sqlite3_errmsg(writer_);
        sql_exec(writer_, "ROLLBACK");
        throw CacheError(ErrorKind::StorageWriteFailure, "eviction failed: " + msg);
    }
    return deleted;
}

bool MetadataStore::remove(const std::string& key, int64_t created_at) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sqlite3_reset(stmt_remove_);
    bind_text(stmt_remove_, 1, key);
    sqlite3_bind_int64(stmt_remove_, 2, created_at);
    int rc = sql_step_retry(stmt_remove_);
    sqlite3_reset(stmt_remove_);
    if (rc != SQLITE_DONE) {
        log_error("Failed to remove metadata for %s: %s", key.c_str(), sqlite3_errmsg(writer_));
        return false;
    }
    return sqlite3_changes(writer_) > 0;
}

size_t MetadataStore::remove_batch(const std::vector<std::pair<std::string, int64_t>>& rows) {
    if (rows.empty()) return 0;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!sql_exec(writer_, "BEGIN IMMEDIATE")) return 0;

    size_t removed = 0;
    for (const auto& [key, created_at] : rows) {
        sqlite3_reset(stmt_remove_);
        bind_text(stmt_remove_, 1, key);
        sqlite3_bind_int64(stmt_remove_, 2, created_at);
        if (sql_step_retry(stmt_remove_) == SQLITE_DONE) {
            removed += static_cast<size_t>(sqlite3_changes(writer_));
        } else {
            log_error("Failed to remove metadata for %s: %s", key.c_str(), sqlite3_errmsg(writer_));
        }
    }
    sqlite3_reset(stmt_remove_);

    if (!sql_exec(writer_, "COMMIT")) {
        sql_exec(writer_, "ROLLBACK");
        return 0;
    }
    return removed;
}

void MetadataStore::touch(const std::string& key, int64_t now) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sqlite3_reset(stmt_touch_);
    bind_text(stmt_touch_, 1, key);
    sqlite3_bind_int64(stmt_touch_, 2, now);
    if (sql_step_retry(stmt_touch_) != SQLITE_DONE) {
        log_warn("Failed to update access time for %s: %s", key.c_str(), sqlite3_errmsg(writer_));
    }
    sqlite3_reset(stmt_touch_);
}

void MetadataStore::touch_batch(const std::vector<std::string>& keys, int64_t now) {
    if (keys.empty()) return;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!sql_exec(writer_, "BEGIN IMMEDIATE")) return;
    for (const auto& key : keys) {
        sqlite3_reset(stmt_touch_);
        bind_text(stmt_touch_, 1, key);
        sqlite3_bind_int64(stmt_touch_, 2, now);
        if (sql_step_retry(stmt_touch_) != SQLITE_DONE) {
            log_warn("Failed to update access time for %s: %s", key.c_str(), sqlite3_errmsg(writer_));
        }
    }
    sqlite3_reset(stmt_touch_);
    if (!sql_exec(writer_, "COMMIT")) sql_exec(writer_, "ROLLBACK");
}

}  // namespace admedia
