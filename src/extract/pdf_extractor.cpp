#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>
#include <algorithm>
#include <climits>
#include <memory>
#include <mutex>

namespace docpipe {

namespace {

const size_t MAX_INFO_VALUE = 200;

const char* const INFO_KEYS[][2] = {
    {"Title", "title"},
    {"Author", "author"},
    {"Subject", "subject"},
    {"Creator", "creator"},
    {"Producer", "producer"},
    {"CreationDate", "creationDate"},
};

void forward_poppler_message(const std::string& message, void*) {
    LOG_DEBUG("[PdfExtractor] poppler: %s", message.c_str());
}

// poppler prints parse errors to stderr unless redirected
void route_poppler_messages() {
    static std::once_flag once;
    std::call_once(once, []() {
        poppler::set_debug_error_function(forward_poppler_message, nullptr);
    });
}

std::string to_utf8(const poppler::ustring& s) {
    poppler::byte_array bytes = s.to_utf8();
    return std::string(bytes.begin(), bytes.end());
}

} // anonymous namespace

// ============================================================================
// PdfExtractor
// ============================================================================

Result<ExtractionResult> PdfExtractor::extract(const std::string& bytes, const CancelToken& cancel) const {
    if (bytes.compare(0, 5, "%PDF-") != 0) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "Missing PDF header");
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "PDF too large to parse");
    }
    route_poppler_messages();

    // The document reads from `bytes` directly; it must not outlive this call
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_raw_data(bytes.data(), static_cast<int>(bytes.size())));
    if (!doc) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "Unreadable or corrupt PDF");
    }
    if (doc->is_locked()) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "PDF is password protected");
    }

    const int page_count = doc->pages();
    if (page_count <= 0) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "PDF contains no pages");
    }

    const size_t total_pages = static_cast<size_t>(page_count);
    const size_t to_process = std::min(total_pages, limits_.max_pdf_pages);
    if (total_pages > limits_.max_pdf_pages) {
        LOG_WARN("[PdfExtractor] PDF has %zu pages, processing first %zu", total_pages, to_process);
    }

    std::string text;
    size_t failed = 0;
    for (size_t i = 0; i < to_process; ++i) {
        if (cancel.cancelled()) {
            return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
        }

        std::unique_ptr<poppler::page> page(doc->create_page(static_cast<int>(i)));
        if (!page) {
            LOG_WARN("[PdfExtractor] Skipping page %zu: page could not be loaded", i + 1);
            failed++;
            continue;
        }

        std::string page_text = trim(to_utf8(page->text()));
        if (!page_text.empty()) {
            text += page_text;
            text += "\n\n";
        }
    }

    ExtractionResult result;
    result.text = text;
    result.metadata["pages"] = total_pages;
    result.metadata["processedPages"] = to_process;
    result.metadata["processingLimited"] = total_pages > to_process;
    if (failed) result.metadata["failedPages"] = failed;

    for (size_t k = 0; k < sizeof(INFO_KEYS) / sizeof(INFO_KEYS[0]); ++k) {
        std::string value = trim(sanitize_utf8(to_utf8(doc->info_key(INFO_KEYS[k][0]))));
        if (!value.empty()) {
            result.metadata[INFO_KEYS[k][1]] = truncate_safe(value, MAX_INFO_VALUE);
        }
    }

    LOG_DEBUG("[PdfExtractor] %zu/%zu pages processed, %zu failed", to_process, total_pages, failed);
    return Result<ExtractionResult>::ok(result);
}

} // namespace docpipe
