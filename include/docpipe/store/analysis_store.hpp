/*
 * docpipe C++17 - Analysis store
 *
 * Optional SQLite persistence that lets repeated submissions of the same
 * content reuse a token analysis. Keyed by (file hash, model, chunk
 * budget). Holds analysis and chunk statistics only, never document text.
 */
#ifndef docpipe_STORE_ANALYSIS_STORE_HPP
#define docpipe_STORE_ANALYSIS_STORE_HPP

#include <docpipe/tokens/token_counter.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace docpipe {

struct AnalysisRecord {
    std::string file_hash;      // sha256 hex of the source bytes
    std::string model;          // canonical model id
    int64_t max_tokens;         // chunk budget used
    TokenAnalysis analysis;
    int64_t chunk_count;
    Json stats;                 // ChunkingStats::to_json()
    int64_t created_at;         // unix ms
    int64_t expires_at;         // unix ms
    int64_t access_count;

    AnalysisRecord()
        : max_tokens(0), chunk_count(0), stats(Json::object()), created_at(0), expires_at(0)
        , access_count(0) {}
};

class AnalysisStore {
public:
    explicit AnalysisStore(int64_t ttl_ms = 6LL * 60 * 60 * 1000);
    ~AnalysisStore();

    // ":memory:" for an in-process database
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Insert or refresh; an existing row keeps counting accesses
    bool put(const AnalysisRecord& record);

    // Unexpired row; bumps access_count and last_accessed
    bool get(const std::string& file_hash, const std::string& model, int64_t max_tokens,
             AnalysisRecord& out);

    int cleanup_expired();
    int count();

private:
    AnalysisStore(const AnalysisStore&);
    AnalysisStore& operator=(const AnalysisStore&);

    bool exec_sql(const std::string& sql);
    bool init_tables();

    sqlite3* db_;
    int64_t ttl_ms_;
    std::mutex mutex_;
};

} // namespace docpipe

#endif // docpipe_STORE_ANALYSIS_STORE_HPP
