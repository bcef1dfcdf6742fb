#include <docpipe/extract/extraction_cache.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

Json CacheStats::to_json() const {
    Json j;
    j["size"] = size;
    j["capacity"] = capacity;
    j["hits"] = hits;
    j["misses"] = misses;
    j["evictions"] = evictions;
    j["expirations"] = expirations;
    return j;
}

ExtractionCache::ExtractionCache(size_t capacity, int64_t ttl_ms, Clock clock)
    : capacity_(capacity == 0 ? 1 : capacity)
    , ttl_ms_(ttl_ms)
    , clock_(clock ? clock : Clock(monotonic_ms))
    , hits_(0), misses_(0), evictions_(0), expirations_(0) {}

std::string ExtractionCache::make_key(const std::string& bytes, DocumentFormat format) {
    return key_for_hash(sha256_hex(bytes), format);
}

std::string ExtractionCache::key_for_hash(const std::string& sha256, DocumentFormat format) {
    return sha256 + ":" + format_name(format);
}

bool ExtractionCache::get(const std::string& key, ExtractionResult& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, EntryList::iterator>::iterator it = index_.find(key);
    if (it == index_.end()) {
        misses_++;
        return false;
    }
    if (it->second->expires_at <= clock_()) {
        lru_.erase(it->second);
        index_.erase(it);
        expirations_++;
        misses_++;
        return false;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    out = it->second->value;
    hits_++;
    return true;
}

void ExtractionCache::put(const std::string& key, const ExtractionResult& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t expires_at = clock_() + ttl_ms_;

    std::unordered_map<std::string, EntryList::iterator>::iterator it = index_.find(key);
    if (it != index_.end()) {
        it->second->value = value;
        it->second->expires_at = expires_at;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    while (lru_.size() >= capacity_) {
        index_.erase(lru_.back().key);
        lru_.pop_back();
        evictions_++;
    }
    Entry entry;
    entry.key = key;
    entry.value = value;
    entry.expires_at = expires_at;
    lru_.push_front(entry);
    index_[key] = lru_.begin();
}

size_t ExtractionCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    size_t removed = 0;
    for (EntryList::iterator it = lru_.begin(); it != lru_.end();) {
        if (it->expires_at <= now) {
            index_.erase(it->key);
            it = lru_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    expirations_ += removed;
    if (removed) LOG_DEBUG("[ExtractionCache] Purged %zu expired entries", removed);
    return removed;
}

void ExtractionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

CacheStats ExtractionCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.size = lru_.size();
    s.capacity = capacity_;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.expirations = expirations_;
    return s;
}

} // namespace docpipe
