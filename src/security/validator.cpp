#include <docpipe/security/validator.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace docpipe {

namespace {

const size_t MAX_SANITIZED_NAME = 100;

const char* const RESERVED_NAMES[] = {
    "con", "prn", "aux", "nul",
    "com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
    "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"
};

const char* const PLAIN_PATTERNS[][2] = {
    {"javascript:", "javascript URI"},
    {"vbscript:", "vbscript URI"},
    {"<script", "script tag"},
    {"%3Cscript", "encoded script tag"},
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

size_t find_event_handler(const std::string& text, size_t from, size_t limit, size_t& length,
                          bool allow_space) {
    size_t end = std::min(limit, text.size());
    size_t pos = from;
    while (pos + 2 < end) {
        pos = find_ci(text, "on", pos);
        if (pos == std::string::npos || pos + 2 >= end) return std::string::npos;
        if (pos > 0 && is_word_char(text[pos - 1])) {
            pos += 1;
            continue;
        }
        size_t p = pos + 2;
        while (p < end && is_word_char(text[p])) ++p;
        if (p == pos + 2) {
            pos += 2;
            continue;
        }
        while (allow_space && p < end && std::isspace(static_cast<unsigned char>(text[p]))) ++p;
        if (p < end && text[p] == '=') {
            length = p + 1 - pos;
            return pos;
        }
        pos += 2;
    }
    return std::string::npos;
}

std::string detect_suspicious_content(const std::string& text, size_t limit, bool spaced_handlers) {
    const std::string window = limit < text.size() ? text.substr(0, limit) : text;
    for (size_t i = 0; i < sizeof(PLAIN_PATTERNS) / sizeof(PLAIN_PATTERNS[0]); ++i) {
        if (find_ci(window, PLAIN_PATTERNS[i][0]) != std::string::npos) {
            return PLAIN_PATTERNS[i][1];
        }
    }
    size_t length = 0;
    if (find_event_handler(window, 0, window.size(), length, spaced_handlers) != std::string::npos) {
        return "inline event handler";
    }
    return "";
}

std::string sanitize_file_name(const std::string& name) {
    std::string out;
    out.reserve(std::min(name.size(), MAX_SANITIZED_NAME));
    for (size_t i = 0; i < name.size() && out.size() < MAX_SANITIZED_NAME; ++i) {
        char c = name[i];
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        out += keep ? c : '_';
    }
    return out;
}

Validator::Validator(const ValidationPolicy& policy) : policy_(policy) {}

bool Validator::check_file_name(const std::string& name, std::string& error) const {
    if (name.empty()) {
        error = "File name is required";
        return false;
    }
    if (name.size() > policy_.max_name_length) {
        error = "File name too long (" + std::to_string(name.size()) + " > " +
                std::to_string(policy_.max_name_length) + ")";
        return false;
    }
    if (name.find("..") != std::string::npos) {
        error = "File name contains path traversal sequence";
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (c < 0x20 || c == 0x7F) {
            error = "File name contains control characters";
            return false;
        }
        if (std::string("<>:\"|?*").find(static_cast<char>(c)) != std::string::npos) {
            error = std::string("File name contains invalid character '") + static_cast<char>(c) + "'";
            return false;
        }
    }

    std::string base = to_lower(name.substr(0, name.find('.')));
    for (size_t i = 0; i < sizeof(RESERVED_NAMES) / sizeof(RESERVED_NAMES[0]); ++i) {
        if (base == RESERVED_NAMES[i]) {
            error = "File name is a reserved device name";
            return false;
        }
    }
    return true;
}

bool Validator::check_signature(const std::string& bytes, DocumentFormat format) {
    switch (format) {
        case DocumentFormat::PDF:
            return bytes.compare(0, 4, "%PDF") == 0;
        case DocumentFormat::DOCX:
        case DocumentFormat::XLSX:
        case DocumentFormat::PPTX:
            return bytes.size() >= 4 && bytes.compare(0, 4, std::string("PK\x03\x04", 4)) == 0;
        case DocumentFormat::TEXT:
            return true;
    }
    return false;
}

Result<DocumentFormat> Validator::validate(const SourceDocument& doc) const {
    if (doc.bytes.empty()) {
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION, "File is empty");
    }
    if (doc.size() > policy_.max_file_size) {
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION,
            "File too large: " + std::to_string(doc.size()) + " bytes (max " +
            std::to_string(policy_.max_file_size) + ")");
    }

    std::string error;
    if (!check_file_name(doc.name, error)) {
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION, error);
    }

    DocumentFormat format;
    if (!format_from_mime(doc.mime_type, format)) {
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION,
            "Unsupported file type: " + doc.mime_type);
    }

    if (!check_signature(doc.bytes, format)) {
        LOG_WARN("[Validator] Signature mismatch for '%s' declared as %s",
                 sanitize_file_name(doc.name).c_str(), format_name(format));
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION,
            std::string("File content does not match declared type ") + format_name(format));
    }

    std::string pattern = detect_suspicious_content(doc.bytes, policy_.scan_bytes);
    if (!pattern.empty()) {
        LOG_WARN("[Validator] Suspicious content (%s) in '%s'",
                 pattern.c_str(), sanitize_file_name(doc.name).c_str());
        return Result<DocumentFormat>::fail(ErrorKind::VALIDATION,
            "File contains suspicious content: " + pattern);
    }

    return Result<DocumentFormat>::ok(format);
}

} // namespace docpipe
