/*
 * docpipe C++17 - Signature & type validator
 *
 * Fail-closed checks run before any extractor sees the bytes: size,
 * file name, declared MIME type, magic number, and a pattern scan of
 * the leading bytes for script injection.
 */
#ifndef docpipe_SECURITY_VALIDATOR_HPP
#define docpipe_SECURITY_VALIDATOR_HPP

#include <docpipe/core/types.hpp>
#include <string>

namespace docpipe {

struct ValidationPolicy {
    size_t max_file_size;       // bytes
    size_t max_name_length;     // bytes
    size_t scan_bytes;          // leading bytes checked for injection patterns

    ValidationPolicy()
        : max_file_size(50 * 1024 * 1024), max_name_length(255), scan_bytes(10240) {}
};

// Name of the first suspicious pattern found in text[0, limit), or empty.
// Shared with the content sanitizer's post-substitution re-scan, which also
// counts handlers written with spaces before '='.
std::string detect_suspicious_content(const std::string& text, size_t limit = std::string::npos,
                                      bool spaced_handlers = false);

// Position of a word-bounded "on<word>=" at or after `from` ("on<word>\s*="
// with allow_space); `length` receives the matched length
size_t find_event_handler(const std::string& text, size_t from, size_t limit, size_t& length,
                          bool allow_space = false);

// Map anything outside [A-Za-z0-9._-] to '_' and cap at 100 characters
std::string sanitize_file_name(const std::string& name);

class Validator {
public:
    explicit Validator(const ValidationPolicy& policy = ValidationPolicy());

    // Resolved format on success, VALIDATION error otherwise
    Result<DocumentFormat> validate(const SourceDocument& doc) const;

    bool check_file_name(const std::string& name, std::string& error) const;
    static bool check_signature(const std::string& bytes, DocumentFormat format);

    const ValidationPolicy& policy() const { return policy_; }

private:
    ValidationPolicy policy_;
};

} // namespace docpipe

#endif // docpipe_SECURITY_VALIDATOR_HPP
