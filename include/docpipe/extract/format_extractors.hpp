/*
 * docpipe C++17 - Concrete extractors
 */
#ifndef docpipe_EXTRACT_FORMAT_EXTRACTORS_HPP
#define docpipe_EXTRACT_FORMAT_EXTRACTORS_HPP

#include <docpipe/extract/extractor.hpp>

namespace docpipe {

class PdfExtractor : public Extractor {
public:
    explicit PdfExtractor(const ExtractionLimits& limits) : Extractor(limits) {}
    DocumentFormat format() const override { return DocumentFormat::PDF; }
    const char* name() const override { return "pdf"; }
    Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const override;
};

class DocxExtractor : public Extractor {
public:
    explicit DocxExtractor(const ExtractionLimits& limits) : Extractor(limits) {}
    DocumentFormat format() const override { return DocumentFormat::DOCX; }
    const char* name() const override { return "docx"; }
    Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const override;
};

class XlsxExtractor : public Extractor {
public:
    explicit XlsxExtractor(const ExtractionLimits& limits) : Extractor(limits) {}
    DocumentFormat format() const override { return DocumentFormat::XLSX; }
    const char* name() const override { return "xlsx"; }
    Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const override;

    // Strip < > : " ' and cap at 50 characters
    static std::string sanitize_sheet_name(const std::string& name);
};

class PptxExtractor : public Extractor {
public:
    explicit PptxExtractor(const ExtractionLimits& limits) : Extractor(limits) {}
    DocumentFormat format() const override { return DocumentFormat::PPTX; }
    const char* name() const override { return "pptx"; }
    Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const override;
};

class TextExtractor : public Extractor {
public:
    explicit TextExtractor(const ExtractionLimits& limits) : Extractor(limits) {}
    DocumentFormat format() const override { return DocumentFormat::TEXT; }
    const char* name() const override { return "text"; }
    Result<ExtractionResult> extract(const std::string& bytes, const CancelToken& cancel) const override;
};

} // namespace docpipe

#endif // docpipe_EXTRACT_FORMAT_EXTRACTORS_HPP
