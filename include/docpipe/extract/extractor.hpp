/*
 * docpipe C++17 - Format extractors
 *
 * One extractor per document format, selected by make_extractor() over
 * DocumentFormat. Every extractor returns normalized UTF-8 text plus
 * format metadata, caps its unit count, and skips a bad sub-unit (page,
 * sheet, slide) with a warning rather than failing the document.
 */
#ifndef docpipe_EXTRACT_EXTRACTOR_HPP
#define docpipe_EXTRACT_EXTRACTOR_HPP

#include <docpipe/core/types.hpp>
#include <docpipe/extract/zip_archive.hpp>
#include <memory>
#include <string>

namespace docpipe {

struct ExtractionLimits {
    size_t max_text_length;         // bytes of normalized text
    size_t max_pdf_pages;
    size_t max_sheets;
    size_t max_sheet_chars;
    size_t max_sheet_rows;
    size_t max_sheet_columns;
    size_t max_slides;
    size_t max_slide_chars;
    size_t max_xml_depth;           // presentation tree walk
    size_t max_xml_children;
    size_t max_xml_text_run;
    ZipLimits zip;

    ExtractionLimits()
        : max_text_length(10 * 1024 * 1024)
        , max_pdf_pages(1000)
        , max_sheets(50)
        , max_sheet_chars(100000)
        , max_sheet_rows(10000)
        , max_sheet_columns(1024)
        , max_slides(500)
        , max_slide_chars(10000)
        , max_xml_depth(10)
        , max_xml_children(50)
        , max_xml_text_run(1000) {}
};

class Extractor {
public:
    explicit Extractor(const ExtractionLimits& limits) : limits_(limits) {}
    virtual ~Extractor() {}

    virtual DocumentFormat format() const = 0;
    virtual const char* name() const = 0;

    // Raw text + metadata; normalization and the length cap are applied by
    // extract_document()
    virtual Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const = 0;

protected:
    ExtractionLimits limits_;
};

std::unique_ptr<Extractor> make_extractor(DocumentFormat format, const ExtractionLimits& limits);

// Line endings to \n, control characters stripped, runs of spaces/tabs and
// blank lines collapsed, lines and the whole text trimmed
std::string normalize_extracted_text(const std::string& text);

// Dispatch, normalize, truncate to the global cap and reject empty output
Result<ExtractionResult> extract_document(const std::string& bytes,
                                          DocumentFormat format,
                                          const ExtractionLimits& limits,
                                          const CancelToken& cancel);

} // namespace docpipe

#endif // docpipe_EXTRACT_EXTRACTOR_HPP
