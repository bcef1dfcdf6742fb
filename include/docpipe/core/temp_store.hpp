/*
 * docpipe C++17 - Secure temp store
 *
 * Private directory (0700) holding one owner-only file (0600) per job.
 * Files are named secure_<job>_<ms>.tmp; the TTL sweep only ever
 * deletes files matching that pattern.
 */
#ifndef docpipe_CORE_TEMP_STORE_HPP
#define docpipe_CORE_TEMP_STORE_HPP

#include <cstdint>
#include <string>

namespace docpipe {

class TempStore {
public:
    explicit TempStore(const std::string& dir);

    // Create the directory and enforce its mode
    bool init();

    bool create(const std::string& job_id, const std::string& bytes, std::string& path_out);
    bool read(const std::string& path, std::string& out) const;
    bool remove(const std::string& path);

    // Delete secure_*.tmp files whose mtime is older than ttl_ms
    size_t sweep(int64_t ttl_ms);
    size_t count() const;

    const std::string& dir() const { return dir_; }

    static std::string default_dir();
    static bool is_managed_name(const std::string& file_name);

private:
    std::string dir_;
};

// Removes the file on scope exit unless released
class TempFileGuard {
public:
    TempFileGuard(TempStore& store, const std::string& path) : store_(store), path_(path) {}
    ~TempFileGuard() { if (!path_.empty()) store_.remove(path_); }

    void release() { path_.clear(); }

private:
    TempFileGuard(const TempFileGuard&);
    TempFileGuard& operator=(const TempFileGuard&);

    TempStore& store_;
    std::string path_;
};

} // namespace docpipe

#endif // docpipe_CORE_TEMP_STORE_HPP
