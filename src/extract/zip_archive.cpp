#include <docpipe/extract/zip_archive.hpp>
#include <docpipe/core/logger.hpp>
#include <zip.h>
#include <algorithm>

namespace docpipe {

namespace {

std::string error_text(zip_error_t* error) {
    std::string text = zip_error_strerror(error);
    zip_error_fini(error);
    return text;
}

} // anonymous namespace

ZipArchive::ZipArchive(const ZipLimits& limits)
    : limits_(limits), archive_(nullptr), total_inflated_(0) {}

ZipArchive::~ZipArchive() {
    close();
}

bool ZipArchive::fail(const std::string& error) {
    last_error_ = error;
    return false;
}

void ZipArchive::close() {
    if (archive_) {
        // Read-only: discard never writes back to the source buffer
        zip_discard(archive_);
        archive_ = nullptr;
    }
    entries_.clear();
    index_.clear();
    total_inflated_ = 0;
}

bool ZipArchive::open(const std::string& data) {
    close();

    // libzip opens a zero-length source as a new empty archive
    if (data.empty()) {
        return fail("archive is empty");
    }

    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* source = zip_source_buffer_create(data.data(), data.size(), 0, &error);
    if (!source) {
        return fail("cannot create archive source: " + error_text(&error));
    }

    zip_t* archive = zip_open_from_source(source, ZIP_RDONLY, &error);
    if (!archive) {
        zip_source_free(source);
        return fail("not a readable ZIP archive: " + error_text(&error));
    }
    zip_error_fini(&error);
    archive_ = archive;

    zip_int64_t count = zip_get_num_entries(archive_, 0);
    if (count < 0) {
        close();
        return fail("cannot count archive entries");
    }
    if (static_cast<uint64_t>(count) > limits_.max_entries) {
        close();
        return fail("archive has " + std::to_string(count) + " entries (max " +
                    std::to_string(limits_.max_entries) + ")");
    }

    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive_, static_cast<zip_uint64_t>(i), 0, &st) != 0 ||
            !(st.valid & ZIP_STAT_NAME)) {
            LOG_WARN("[ZipArchive] Skipping unreadable directory record %lld: %s",
                     static_cast<long long>(i), zip_strerror(archive_));
            continue;
        }

        ZipEntry e;
        e.name = st.name;
        if (e.name.empty() || e.name[e.name.size() - 1] == '/') {
            continue;   // directory entry
        }
        e.index = static_cast<uint64_t>(i);
        e.method = (st.valid & ZIP_STAT_COMP_METHOD) ? st.comp_method : 0;
        e.encryption = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) ? st.encryption_method : 0;
        e.compressed_size = (st.valid & ZIP_STAT_COMP_SIZE) ? st.comp_size : 0;
        e.uncompressed_size = (st.valid & ZIP_STAT_SIZE) ? st.size : 0;

        index_[e.name] = entries_.size();
        entries_.push_back(e);
    }

    LOG_DEBUG("[ZipArchive] Opened archive: %zu entries", entries_.size());
    return true;
}

bool ZipArchive::has(const std::string& name) const {
    return index_.find(name) != index_.end();
}

std::vector<std::string> ZipArchive::names_with_prefix(const std::string& prefix) const {
    std::vector<std::string> names;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name.compare(0, prefix.size(), prefix) == 0) {
            names.push_back(entries_[i].name);
        }
    }
    return names;
}

bool ZipArchive::check_limits(const ZipEntry& e) {
    if (e.encrypted()) {
        return fail("entry '" + e.name + "' is encrypted");
    }
    if (e.method != ZIP_CM_STORE && e.method != ZIP_CM_DEFLATE) {
        return fail("entry '" + e.name + "' uses unsupported compression method " + std::to_string(e.method));
    }
    if (e.uncompressed_size > limits_.max_entry_size) {
        return fail("entry '" + e.name + "' too large (" + std::to_string(e.uncompressed_size) + " bytes)");
    }
    if (e.uncompressed_size > limits_.ratio_threshold &&
        e.uncompressed_size > e.compressed_size * limits_.max_ratio) {
        return fail("entry '" + e.name + "' exceeds compression ratio limit");
    }
    if (total_inflated_ + e.uncompressed_size > limits_.max_total_inflated) {
        return fail("archive exceeds total decompressed size limit");
    }
    return true;
}

bool ZipArchive::read(const std::string& name, std::string& out) {
    out.clear();
    if (!archive_) {
        return fail("archive not open");
    }
    std::map<std::string, size_t>::const_iterator it = index_.find(name);
    if (it == index_.end()) {
        return fail("entry '" + name + "' not found");
    }
    const ZipEntry& e = entries_[it->second];
    if (!check_limits(e)) {
        return false;
    }

    zip_file_t* file = zip_fopen_index(archive_, e.index, 0);
    if (!file) {
        return fail("cannot open '" + name + "': " + zip_strerror(archive_));
    }

    // One byte of headroom: any output past the declared size marks a liar
    std::string buffer(static_cast<size_t>(e.uncompressed_size) + 1, '\0');
    size_t produced = 0;
    while (produced < buffer.size()) {
        zip_int64_t n = zip_fread(file, &buffer[produced], buffer.size() - produced);
        if (n < 0) {
            std::string error = zip_file_strerror(file);
            zip_fclose(file);
            return fail("read failed for '" + name + "': " + error);
        }
        if (n == 0) break;
        produced += static_cast<size_t>(n);
    }
    zip_fclose(file);

    if (produced > e.uncompressed_size) {
        return fail("entry '" + name + "' inflates beyond its declared size");
    }
    buffer.resize(produced);
    total_inflated_ += produced;
    out.swap(buffer);
    return true;
}

} // namespace docpipe
