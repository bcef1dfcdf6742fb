#include <docpipe/core/temp_store.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace docpipe {

namespace {
const char* const FILE_PREFIX = "secure_";
const char* const FILE_SUFFIX = ".tmp";
}

TempStore::TempStore(const std::string& dir) : dir_(dir.empty() ? default_dir() : dir) {}

std::string TempStore::default_dir() {
    const char* tmp = getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return join_path(base, "docpipe_secure_temp");
}

bool TempStore::is_managed_name(const std::string& file_name) {
    return starts_with(file_name, FILE_PREFIX) && ends_with(file_name, FILE_SUFFIX) &&
           file_name.find('/') == std::string::npos;
}

bool TempStore::init() {
    if (!ensure_directory(dir_, 0700)) {
        LOG_ERROR("[TempStore] Failed to create directory: %s (%s)", dir_.c_str(), strerror(errno));
        return false;
    }
    if (chmod(dir_.c_str(), 0700) != 0) {
        LOG_ERROR("[TempStore] Failed to restrict directory: %s (%s)", dir_.c_str(), strerror(errno));
        return false;
    }
    LOG_DEBUG("[TempStore] Using %s", dir_.c_str());
    return true;
}

bool TempStore::create(const std::string& job_id, const std::string& bytes, std::string& path_out) {
    std::string name = std::string(FILE_PREFIX) + job_id + "_" +
                       std::to_string(current_timestamp_ms()) + FILE_SUFFIX;
    std::string path = join_path(dir_, name);

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_ERROR("[TempStore] Failed to create %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    if (fchmod(fd, 0600) != 0) {
        LOG_WARN("[TempStore] fchmod failed on %s: %s", path.c_str(), strerror(errno));
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[TempStore] Write failed on %s: %s", path.c_str(), strerror(errno));
            close(fd);
            unlink(path.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (close(fd) != 0) {
        LOG_ERROR("[TempStore] Close failed on %s: %s", path.c_str(), strerror(errno));
        unlink(path.c_str());
        return false;
    }

    path_out = path;
    return true;
}

bool TempStore::read(const std::string& path, std::string& out) const {
    out.clear();
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR("[TempStore] Failed to open %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    char buffer[65536];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[TempStore] Read failed on %s: %s", path.c_str(), strerror(errno));
            close(fd);
            return false;
        }
        if (n == 0) break;
        out.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return true;
}

bool TempStore::remove(const std::string& path) {
    if (unlink(path.c_str()) != 0) {
        if (errno == ENOENT) return true;
        LOG_WARN("[TempStore] Failed to delete %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    return true;
}

size_t TempStore::sweep(int64_t ttl_ms) {
    DIR* d = opendir(dir_.c_str());
    if (!d) return 0;

    const int64_t now = current_timestamp_ms();
    size_t removed = 0;
    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        std::string name = entry->d_name;
        if (!is_managed_name(name)) continue;

        std::string path = join_path(dir_, name);
        struct stat st;
        if (lstat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        int64_t mtime_ms = static_cast<int64_t>(st.st_mtime) * 1000;
        if (now - mtime_ms > ttl_ms && remove(path)) {
            removed++;
        }
    }
    closedir(d);

    if (removed) LOG_INFO("[TempStore] Swept %zu expired temp files", removed);
    return removed;
}

size_t TempStore::count() const {
    DIR* d = opendir(dir_.c_str());
    if (!d) return 0;
    size_t n = 0;
    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        if (is_managed_name(entry->d_name)) n++;
    }
    closedir(d);
    return n;
}

} // namespace docpipe
