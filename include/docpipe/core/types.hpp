/*
 * docpipe C++17 - Shared pipeline types
 *
 * Error taxonomy, document formats, the Result<T> carrier used between
 * stages, and the cooperative cancellation token checked by long-running
 * extraction and chunking loops.
 */
#ifndef docpipe_CORE_TYPES_HPP
#define docpipe_CORE_TYPES_HPP

#include <docpipe/core/config.hpp>
#include <string>
#include <atomic>
#include <utility>

namespace docpipe {

// ============================================================================
// Errors
// ============================================================================

enum class ErrorKind {
    VALIDATION,         // rejected before extraction
    EXTRACTION,         // whole-document parse failure
    CAPACITY,           // concurrency ceiling reached (retriable)
    TIMEOUT,            // step or job deadline exceeded
    CHUNKING,           // invalid chunking parameters or input
    CONTENT_REJECTED    // suspicious content survived sanitization
};

const char* error_kind_name(ErrorKind kind);

struct ProcessingError {
    ErrorKind kind;
    std::string message;
    std::string job_id;     // correlation id, empty outside a job
    bool retriable;

    ProcessingError() : kind(ErrorKind::VALIDATION), retriable(false) {}
    ProcessingError(ErrorKind k, const std::string& msg, const std::string& job = "")
        : kind(k), message(msg), job_id(job), retriable(k == ErrorKind::CAPACITY) {}

    std::string to_string() const;
    Json to_json() const;
};

template<typename T>
struct Result {
    bool success;
    T value;
    ProcessingError error;

    Result() : success(false) {}

    static Result ok(T v) {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result fail(const ProcessingError& e) {
        Result r;
        r.success = false;
        r.error = e;
        return r;
    }

    static Result fail(ErrorKind kind, const std::string& message) {
        return fail(ProcessingError(kind, message));
    }
};

// ============================================================================
// Documents
// ============================================================================

enum class DocumentFormat {
    PDF,
    DOCX,
    XLSX,
    PPTX,
    TEXT
};

// Map a declared MIME type to a format; false for unsupported types
bool format_from_mime(const std::string& mime_type, DocumentFormat& out);

const char* format_name(DocumentFormat format);
const char* format_mime_type(DocumentFormat format);

struct SourceDocument {
    std::string bytes;          // raw file contents
    std::string mime_type;      // declared by the caller
    std::string name;           // declared file name

    size_t size() const { return bytes.size(); }
};

struct ExtractionResult {
    std::string text;           // normalized UTF-8
    Json metadata;              // format-specific unit counts and flags
    DocumentFormat format;
    bool truncated;             // text was cut at the global length cap

    ExtractionResult() : metadata(Json::object()), format(DocumentFormat::TEXT), truncated(false) {}
};

// ============================================================================
// Cancellation
// ============================================================================

class CancelToken {
public:
    CancelToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    CancelToken(const CancelToken&);
    CancelToken& operator=(const CancelToken&);

    std::atomic<bool> cancelled_;
};

} // namespace docpipe

#endif // docpipe_CORE_TYPES_HPP
