#ifndef docpipe_CORE_UTILS_HPP
#define docpipe_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace docpipe {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds (wall clock)
int64_t current_timestamp_ms();

// Milliseconds from a monotonic clock; use for deadlines and TTLs
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Case-insensitive substring search, returns npos when absent
size_t find_ci(const std::string& haystack, const std::string& needle, size_t from = 0);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Replace invalid UTF-8 sequences with U+FFFD; control characters are kept
std::string sanitize_utf8(const std::string& s);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

// Number of whitespace-separated words
size_t count_words(const std::string& s);

// First max_chars code points, with "..." appended if anything was cut
std::string make_preview(const std::string& s, size_t max_chars);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create a directory and its parents; newly created levels get `mode`
bool ensure_directory(const std::string& path, unsigned int mode);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(const std::string& data);

} // namespace docpipe

#endif // docpipe_CORE_UTILS_HPP
