#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/extract/xml_reader.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>

namespace docpipe {

namespace {
const char* const DOCUMENT_PART = "word/document.xml";
const size_t CHARS_PER_PAGE = 2000;
const size_t BODY_MAX_DEPTH = 64;
}

Result<ExtractionResult> DocxExtractor::extract(const std::string& bytes, const CancelToken& cancel) const {
    ZipArchive zip(limits_.zip);
    if (!zip.open(bytes)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "Invalid Word document container: " + zip.last_error());
    }

    std::string xml;
    if (!zip.read(DOCUMENT_PART, xml)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "Failed to read Word document body: " + zip.last_error());
    }

    XmlDocument doc;
    if (!doc.parse(xml)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "Failed to parse Word document body: " + doc.last_error());
    }

    std::string text;
    std::string paragraph;
    size_t paragraphs = 0;
    bool cancelled = false;

    XmlWalkLimits walk;
    walk.max_depth = BODY_MAX_DEPTH;

    XmlVisitor visitor;
    visitor.enter = [&](const xmlNode* node, size_t) -> WalkAction {
        if (node->type != XML_ELEMENT_NODE) return WalkAction::DESCEND;
        std::string tag = local_name(node);
        if (tag == "t") {
            paragraph += element_text(node);
            return WalkAction::SKIP_CHILDREN;
        }
        if (tag == "tab") {
            paragraph += '\t';
        } else if (tag == "br" || tag == "cr") {
            paragraph += '\n';
        } else if (tag == "delText" || tag == "instrText") {
            return WalkAction::SKIP_CHILDREN;
        } else if (tag == "p" && cancel.cancelled()) {
            cancelled = true;
            return WalkAction::STOP;
        }
        return WalkAction::DESCEND;
    };
    visitor.leave = [&](const xmlNode* node, size_t) {
        if (local_name(node) != "p") return;
        if (!trim(paragraph).empty()) {
            text += paragraph;
            text += '\n';
            paragraphs++;
        }
        paragraph.clear();
    };
    walk_xml(doc.root(), walk, visitor);

    if (cancelled) {
        return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
    }
    if (!paragraph.empty()) text += paragraph;

    ExtractionResult result;
    result.text = text;
    result.metadata["paragraphs"] = paragraphs;
    result.metadata["estimatedPages"] = (utf8_length(text) + CHARS_PER_PAGE - 1) / CHARS_PER_PAGE;
    LOG_DEBUG("[DocxExtractor] %zu paragraphs", paragraphs);
    return Result<ExtractionResult>::ok(result);
}

} // namespace docpipe
