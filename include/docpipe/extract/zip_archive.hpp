/*
 * docpipe C++17 - ZIP container reader
 *
 * Read-only view over an in-memory ZIP (the OOXML container), backed by
 * libzip. Entry-count, entry-size, total-output and compression-ratio
 * limits are checked against the directory before anything is inflated,
 * and reads stop at the declared size so a hostile archive cannot exhaust
 * memory.
 */
#ifndef docpipe_EXTRACT_ZIP_ARCHIVE_HPP
#define docpipe_EXTRACT_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct zip;

namespace docpipe {

struct ZipEntry {
    std::string name;
    uint64_t index;                 // libzip entry index
    uint16_t method;                // 0 = stored, 8 = deflate
    uint16_t encryption;            // 0 = none
    uint64_t compressed_size;
    uint64_t uncompressed_size;

    ZipEntry()
        : index(0), method(0), encryption(0), compressed_size(0), uncompressed_size(0) {}

    bool encrypted() const { return encryption != 0; }
};

struct ZipLimits {
    size_t max_entries;             // central directory records
    uint64_t max_entry_size;        // declared or inflated bytes per entry
    uint64_t max_total_inflated;    // across all reads from one archive
    uint64_t max_ratio;             // uncompressed / compressed
    uint64_t ratio_threshold;       // ratio check applies above this size

    ZipLimits()
        : max_entries(2000), max_entry_size(50ULL * 1024 * 1024)
        , max_total_inflated(200ULL * 1024 * 1024), max_ratio(100)
        , ratio_threshold(1024 * 1024) {}
};

class ZipArchive {
public:
    explicit ZipArchive(const ZipLimits& limits = ZipLimits());
    ~ZipArchive();

    // `data` must outlive the archive
    bool open(const std::string& data);
    void close();

    bool has(const std::string& name) const;
    bool read(const std::string& name, std::string& out);

    // Entry names starting with prefix, in directory order
    std::vector<std::string> names_with_prefix(const std::string& prefix) const;

    const std::vector<ZipEntry>& entries() const { return entries_; }
    const std::string& last_error() const { return last_error_; }

private:
    ZipArchive(const ZipArchive&);
    ZipArchive& operator=(const ZipArchive&);

    bool fail(const std::string& error);
    bool check_limits(const ZipEntry& entry);

    ZipLimits limits_;
    struct zip* archive_;
    std::vector<ZipEntry> entries_;
    std::map<std::string, size_t> index_;
    uint64_t total_inflated_;
    std::string last_error_;
};

} // namespace docpipe

#endif // docpipe_EXTRACT_ZIP_ARCHIVE_HPP
