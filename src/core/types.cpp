#include <docpipe/core/types.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::EXTRACTION: return "extraction";
        case ErrorKind::CAPACITY: return "capacity";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CHUNKING: return "chunking";
        case ErrorKind::CONTENT_REJECTED: return "content_rejected";
    }
    return "unknown";
}

std::string ProcessingError::to_string() const {
    std::string out = std::string(error_kind_name(kind)) + ": " + message;
    if (!job_id.empty()) {
        out += " (job " + job_id + ")";
    }
    return out;
}

Json ProcessingError::to_json() const {
    Json j;
    j["kind"] = error_kind_name(kind);
    j["message"] = message;
    j["jobId"] = job_id;
    j["retriable"] = retriable;
    return j;
}

bool format_from_mime(const std::string& mime_type, DocumentFormat& out) {
    std::string mime = to_lower(trim(mime_type));
    // Drop parameters such as "; charset=utf-8"
    size_t semi = mime.find(';');
    if (semi != std::string::npos) {
        mime = trim(mime.substr(0, semi));
    }

    if (mime == "application/pdf") {
        out = DocumentFormat::PDF;
    } else if (mime == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
        out = DocumentFormat::DOCX;
    } else if (mime == "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet") {
        out = DocumentFormat::XLSX;
    } else if (mime == "application/vnd.openxmlformats-officedocument.presentationml.presentation") {
        out = DocumentFormat::PPTX;
    } else if (mime == "text/plain") {
        out = DocumentFormat::TEXT;
    } else {
        return false;
    }
    return true;
}

const char* format_name(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::PDF: return "pdf";
        case DocumentFormat::DOCX: return "docx";
        case DocumentFormat::XLSX: return "xlsx";
        case DocumentFormat::PPTX: return "pptx";
        case DocumentFormat::TEXT: return "txt";
    }
    return "unknown";
}

const char* format_mime_type(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::PDF: return "application/pdf";
        case DocumentFormat::DOCX: return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
        case DocumentFormat::XLSX: return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
        case DocumentFormat::PPTX: return "application/vnd.openxmlformats-officedocument.presentationml.presentation";
        case DocumentFormat::TEXT: return "text/plain";
    }
    return "application/octet-stream";
}

} // namespace docpipe
