#include <docpipe/security/sanitizer.hpp>
#include <docpipe/security/validator.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

const char* const ContentSanitizer::SCRIPT_MARKER = "[SCRIPT_REMOVED]";
const char* const ContentSanitizer::JAVASCRIPT_MARKER = "[JAVASCRIPT_REMOVED]";
const char* const ContentSanitizer::VBSCRIPT_MARKER = "[VBSCRIPT_REMOVED]";
const char* const ContentSanitizer::EVENT_HANDLER_MARKER = "[EVENT_HANDLER_REMOVED]";

namespace {

size_t replace_all_ci(std::string& text, const std::string& needle, const std::string& marker) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = find_ci(text, needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), marker);
        pos += marker.size();
        count++;
    }
    return count;
}

// <script ...> ... </script> blocks; an unclosed block is left for the re-scan
size_t replace_script_blocks(std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = find_ci(text, "<script", pos)) != std::string::npos) {
        size_t close = find_ci(text, "</script", pos + 7);
        if (close == std::string::npos) break;
        size_t end = text.find('>', close);
        end = end == std::string::npos ? text.size() : end + 1;
        text.replace(pos, end - pos, ContentSanitizer::SCRIPT_MARKER);
        pos += std::string(ContentSanitizer::SCRIPT_MARKER).size();
        count++;
    }
    return count;
}

} // anonymous namespace

std::string ContentSanitizer::neutralize(const std::string& text, SanitizeReport* report) const {
    SanitizeReport local;
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c < 0x20 && c != '\n' && c != '\t' && c != '\r') || c == 0x7F) {
            local.control_chars++;
            continue;
        }
        out += static_cast<char>(c);
    }

    local.scripts = replace_script_blocks(out);
    local.uris = replace_all_ci(out, "javascript:", JAVASCRIPT_MARKER);
    local.uris += replace_all_ci(out, "vbscript:", VBSCRIPT_MARKER);

    size_t pos = 0;
    size_t length = 0;
    const std::string handler_marker = EVENT_HANDLER_MARKER;
    while ((pos = find_event_handler(out, pos, out.size(), length, true)) != std::string::npos) {
        out.replace(pos, length, handler_marker);
        pos += handler_marker.size();
        local.event_handlers++;
    }

    if (report) *report = local;
    return trim(out);
}

Result<std::string> ContentSanitizer::sanitize(const std::string& text, SanitizeReport* report) const {
    SanitizeReport local;
    std::string clean = neutralize(text, &local);
    if (report) *report = local;

    if (local.total()) {
        LOG_INFO("[Sanitizer] Neutralized %zu scripts, %zu URIs, %zu handlers, %zu control chars",
                 local.scripts, local.uris, local.event_handlers, local.control_chars);
    }

    std::string residual = detect_suspicious_content(clean, std::string::npos, true);
    if (!residual.empty()) {
        LOG_WARN("[Sanitizer] Content rejected, %s persists after sanitization", residual.c_str());
        return Result<std::string>::fail(ErrorKind::CONTENT_REJECTED,
            "Content contains malicious patterns after sanitization: " + residual);
    }
    return Result<std::string>::ok(clean);
}

} // namespace docpipe
