/*
 * docpipe C++17 - Analysis store implementation
 *
 * WAL-mode SQLite with a single processed_files table.
 */
#include <docpipe/store/analysis_store.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

AnalysisStore::AnalysisStore(int64_t ttl_ms) : db_(nullptr), ttl_ms_(ttl_ms) {}

AnalysisStore::~AnalysisStore() {
    close();
}

bool AnalysisStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:") {
        size_t slash = db_path.rfind('/');
        if (slash != std::string::npos && slash > 0 && !ensure_directory(db_path.substr(0, slash), 0700)) {
            LOG_ERROR("[AnalysisStore] Failed to create parent directory for '%s'", db_path.c_str());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AnalysisStore] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[AnalysisStore] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[AnalysisStore] Database opened: %s", db_path.c_str());
    return true;
}

void AnalysisStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool AnalysisStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[AnalysisStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool AnalysisStore::init_tables() {
    return exec_sql(
        "CREATE TABLE IF NOT EXISTS processed_files ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  file_hash TEXT NOT NULL,"
        "  model TEXT NOT NULL,"
        "  max_tokens INTEGER NOT NULL,"
        "  analysis_json TEXT NOT NULL,"
        "  chunk_count INTEGER NOT NULL DEFAULT 0,"
        "  stats_json TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL,"
        "  access_count INTEGER NOT NULL DEFAULT 1,"
        "  last_accessed INTEGER NOT NULL,"
        "  UNIQUE(file_hash, model, max_tokens)"
        ")") &&
        exec_sql("CREATE INDEX IF NOT EXISTS idx_processed_files_expires ON processed_files(expires_at)");
}

bool AnalysisStore::put(const AnalysisRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "INSERT INTO processed_files "
        "(file_hash, model, max_tokens, analysis_json, chunk_count, stats_json,"
        " created_at, expires_at, access_count, last_accessed) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, 1, ?) "
        "ON CONFLICT(file_hash, model, max_tokens) DO UPDATE SET "
        "  analysis_json = excluded.analysis_json,"
        "  chunk_count = excluded.chunk_count,"
        "  stats_json = excluded.stats_json,"
        "  expires_at = excluded.expires_at,"
        "  access_count = processed_files.access_count + 1,"
        "  last_accessed = excluded.last_accessed";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[AnalysisStore] put prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    const int64_t now = current_timestamp_ms();
    const std::string analysis = record.analysis.to_json().dump();
    const std::string stats = record.stats.dump();
    sqlite3_bind_text(stmt, 1, record.file_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.model.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, record.max_tokens);
    sqlite3_bind_text(stmt, 4, analysis.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, record.chunk_count);
    sqlite3_bind_text(stmt, 6, stats.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, now);
    sqlite3_bind_int64(stmt, 8, now + ttl_ms_);
    sqlite3_bind_int64(stmt, 9, now);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[AnalysisStore] put step failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    LOG_DEBUG("[AnalysisStore] Stored analysis %.12s model=%s max_tokens=%lld",
              record.file_hash.c_str(), record.model.c_str(), static_cast<long long>(record.max_tokens));
    return true;
}

bool AnalysisStore::get(const std::string& file_hash, const std::string& model, int64_t max_tokens,
                        AnalysisRecord& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "SELECT analysis_json, chunk_count, stats_json, created_at, expires_at, access_count "
        "FROM processed_files WHERE file_hash = ? AND model = ? AND max_tokens = ? AND expires_at > ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[AnalysisStore] get prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    const int64_t now = current_timestamp_ms();
    sqlite3_bind_text(stmt, 1, file_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, model.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, max_tokens);
    sqlite3_bind_int64(stmt, 4, now);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* analysis = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const char* stats = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        Json analysis_json = Json::parse(analysis ? analysis : "", nullptr, false);
        Json stats_json = Json::parse(stats ? stats : "", nullptr, false);

        AnalysisRecord record;
        if (!analysis_json.is_discarded() && TokenAnalysis::from_json(analysis_json, record.analysis)) {
            record.file_hash = file_hash;
            record.model = model;
            record.max_tokens = max_tokens;
            record.chunk_count = sqlite3_column_int64(stmt, 1);
            record.stats = stats_json.is_discarded() ? Json::object() : stats_json;
            record.created_at = sqlite3_column_int64(stmt, 3);
            record.expires_at = sqlite3_column_int64(stmt, 4);
            record.access_count = sqlite3_column_int64(stmt, 5) + 1;
            out = record;
            found = true;
        } else {
            LOG_WARN("[AnalysisStore] Ignoring unreadable row for %.12s", file_hash.c_str());
        }
    }
    sqlite3_finalize(stmt);
    if (!found) return false;

    const char* bump =
        "UPDATE processed_files SET access_count = access_count + 1, last_accessed = ? "
        "WHERE file_hash = ? AND model = ? AND max_tokens = ?";
    if (sqlite3_prepare_v2(db_, bump, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, now);
        sqlite3_bind_text(stmt, 2, file_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, model.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, max_tokens);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN("[AnalysisStore] access bump failed: %s", sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
    } else {
        LOG_WARN("[AnalysisStore] access bump prepare failed: %s", sqlite3_errmsg(db_));
    }
    return true;
}

int AnalysisStore::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM processed_files WHERE expires_at <= ?", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[AnalysisStore] cleanup prepare failed: %s", sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, current_timestamp_ms());
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[AnalysisStore] cleanup failed: %s", sqlite3_errmsg(db_));
        return 0;
    }
    int removed = sqlite3_changes(db_);
    if (removed) LOG_INFO("[AnalysisStore] Removed %d expired analyses", removed);
    return removed;
}

int AnalysisStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM processed_files", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return n;
}

} // namespace docpipe
