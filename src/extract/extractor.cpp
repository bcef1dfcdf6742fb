#include <docpipe/extract/extractor.hpp>
#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

std::unique_ptr<Extractor> make_extractor(DocumentFormat format, const ExtractionLimits& limits) {
    switch (format) {
        case DocumentFormat::PDF:  return std::unique_ptr<Extractor>(new PdfExtractor(limits));
        case DocumentFormat::DOCX: return std::unique_ptr<Extractor>(new DocxExtractor(limits));
        case DocumentFormat::XLSX: return std::unique_ptr<Extractor>(new XlsxExtractor(limits));
        case DocumentFormat::PPTX: return std::unique_ptr<Extractor>(new PptxExtractor(limits));
        case DocumentFormat::TEXT: return std::unique_ptr<Extractor>(new TextExtractor(limits));
    }
    return std::unique_ptr<Extractor>();
}

std::string normalize_extracted_text(const std::string& text) {
    std::string clean = sanitize_utf8(text);

    // Line endings and control characters
    std::string unified;
    unified.reserve(clean.size());
    for (size_t i = 0; i < clean.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(clean[i]);
        if (c == '\r') {
            unified += '\n';
            if (i + 1 < clean.size() && clean[i + 1] == '\n') ++i;
        } else if (c == '\n' || c == '\t' || (c >= 0x20 && c != 0x7F)) {
            unified += static_cast<char>(c);
        }
    }

    // Per line: collapse horizontal whitespace runs, trim
    std::string out;
    out.reserve(unified.size());
    size_t newlines = 0;
    size_t start = 0;
    while (start <= unified.size()) {
        size_t end = unified.find('\n', start);
        if (end == std::string::npos) end = unified.size();

        std::string line;
        bool in_space = false;
        size_t space_run = 0;
        char last_space = ' ';
        for (size_t i = start; i < end; ++i) {
            char c = unified[i];
            if (c == ' ' || c == '\t') {
                if (!in_space) last_space = c;
                in_space = true;
                space_run++;
                continue;
            }
            if (in_space) {
                line += space_run >= 2 ? ' ' : last_space;
                in_space = false;
                space_run = 0;
            }
            line += c;
        }
        line = trim(line);

        if (line.empty()) {
            newlines++;
        } else {
            if (!out.empty()) {
                out.append(newlines >= 2 ? 2 : 1, '\n');
            }
            out += line;
            newlines = 1;
        }

        if (end == unified.size()) break;
        start = end + 1;
    }
    return out;
}

Result<ExtractionResult> extract_document(const std::string& bytes,
                                          DocumentFormat format,
                                          const ExtractionLimits& limits,
                                          const CancelToken& cancel) {
    std::unique_ptr<Extractor> extractor = make_extractor(format, limits);
    if (!extractor) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "No extractor for format");
    }

    Result<ExtractionResult> r = extractor->extract(bytes, cancel);
    if (!r.success) return r;
    if (cancel.cancelled()) {
        return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
    }

    ExtractionResult& result = r.value;
    result.format = format;
    result.text = normalize_extracted_text(result.text);

    if (result.text.size() > limits.max_text_length) {
        size_t original = result.text.size();
        result.text = truncate_safe(result.text, limits.max_text_length);
        result.truncated = true;
        result.metadata["truncated"] = true;
        result.metadata["originalLength"] = original;
        LOG_WARN("[Extract] %s text truncated from %zu to %zu bytes",
                 extractor->name(), original, result.text.size());
    }

    if (trim(result.text).empty()) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            std::string("No text content found in ") + format_name(format) + " document");
    }

    result.metadata["format"] = format_name(format);
    result.metadata["characters"] = utf8_length(result.text);
    LOG_DEBUG("[Extract] %s: %zu bytes of text", extractor->name(), result.text.size());
    return r;
}

} // namespace docpipe
