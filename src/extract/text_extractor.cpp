#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>

namespace docpipe {

namespace {
const size_t BINARY_SCAN_BYTES = 1000;
}

Result<ExtractionResult> TextExtractor::extract(const std::string& bytes, const CancelToken& cancel) const {
    size_t scan = std::min(bytes.size(), BINARY_SCAN_BYTES);
    if (bytes.find('\0') < scan) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "File appears to be binary, not plain text");
    }
    if (cancel.cancelled()) {
        return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
    }

    ExtractionResult result;
    size_t offset = starts_with(bytes, "\xEF\xBB\xBF") ? 3 : 0;
    result.text = sanitize_utf8(bytes.substr(offset));
    result.metadata["encoding"] = "utf-8";
    result.metadata["lines"] = std::count(result.text.begin(), result.text.end(), '\n') + 1;
    return Result<ExtractionResult>::ok(result);
}

} // namespace docpipe
