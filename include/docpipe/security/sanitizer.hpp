/*
 * docpipe C++17 - Content sanitizer
 *
 * Replaces markup-injection patterns in extracted text with inert
 * markers. Applying it twice gives the same text. Anything still
 * suspicious after substitution rejects the document.
 */
#ifndef docpipe_SECURITY_SANITIZER_HPP
#define docpipe_SECURITY_SANITIZER_HPP

#include <docpipe/core/types.hpp>
#include <string>

namespace docpipe {

struct SanitizeReport {
    size_t scripts;
    size_t uris;
    size_t event_handlers;
    size_t control_chars;

    SanitizeReport() : scripts(0), uris(0), event_handlers(0), control_chars(0) {}

    size_t total() const { return scripts + uris + event_handlers + control_chars; }
};

class ContentSanitizer {
public:
    static const char* const SCRIPT_MARKER;
    static const char* const JAVASCRIPT_MARKER;
    static const char* const VBSCRIPT_MARKER;
    static const char* const EVENT_HANDLER_MARKER;

    // Substitution only, no re-scan
    std::string neutralize(const std::string& text, SanitizeReport* report = nullptr) const;

    // neutralize() then re-scan; CONTENT_REJECTED when patterns persist
    Result<std::string> sanitize(const std::string& text, SanitizeReport* report = nullptr) const;
};

} // namespace docpipe

#endif // docpipe_SECURITY_SANITIZER_HPP
