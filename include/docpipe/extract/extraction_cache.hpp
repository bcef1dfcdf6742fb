/*
 * docpipe C++17 - Extraction result cache
 *
 * Bounded LRU of ExtractionResult keyed by content fingerprint
 * (sha256 of the bytes plus the format). Entries expire after a TTL.
 * Safe to share between concurrent jobs.
 */
#ifndef docpipe_EXTRACT_EXTRACTION_CACHE_HPP
#define docpipe_EXTRACT_EXTRACTION_CACHE_HPP

#include <docpipe/core/types.hpp>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace docpipe {

struct CacheStats {
    size_t size;
    size_t capacity;
    uint64_t hits;
    uint64_t misses;
    uint64_t evictions;
    uint64_t expirations;

    CacheStats() : size(0), capacity(0), hits(0), misses(0), evictions(0), expirations(0) {}

    Json to_json() const;
};

class ExtractionCache {
public:
    typedef std::function<int64_t()> Clock;

    // clock defaults to the monotonic millisecond clock
    ExtractionCache(size_t capacity, int64_t ttl_ms, Clock clock = Clock());

    static std::string make_key(const std::string& bytes, DocumentFormat format);
    static std::string key_for_hash(const std::string& sha256_hex, DocumentFormat format);

    bool get(const std::string& key, ExtractionResult& out);
    void put(const std::string& key, const ExtractionResult& value);

    size_t purge_expired();
    void clear();

    CacheStats stats() const;

private:
    struct Entry {
        std::string key;
        ExtractionResult value;
        int64_t expires_at;
    };
    typedef std::list<Entry> EntryList;

    size_t capacity_;
    int64_t ttl_ms_;
    Clock clock_;

    mutable std::mutex mutex_;
    EntryList lru_;     // front = most recently used
    std::unordered_map<std::string, EntryList::iterator> index_;
    uint64_t hits_;
    uint64_t misses_;
    uint64_t evictions_;
    uint64_t expirations_;
};

} // namespace docpipe

#endif // docpipe_EXTRACT_EXTRACTION_CACHE_HPP
