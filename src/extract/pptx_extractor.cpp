#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/extract/xml_reader.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cstdlib>

namespace docpipe {

namespace {

const char* const SLIDE_PREFIX = "ppt/slides/slide";

// "ppt/slides/slide7.xml" -> 7, 0 when the name is not a slide part
long slide_number(const std::string& part) {
    const size_t prefix_len = std::string(SLIDE_PREFIX).size();
    if (part.size() <= prefix_len + 4 || !ends_with(part, ".xml")) return 0;
    std::string digits = part.substr(prefix_len, part.size() - prefix_len - 4);
    if (digits.empty() || digits.size() > 6 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return 0;
    }
    return std::strtol(digits.c_str(), nullptr, 10);
}

struct SlidePart {
    long number;
    std::string part;
};

} // anonymous namespace

Result<ExtractionResult> PptxExtractor::extract(const std::string& bytes, const CancelToken& cancel) const {
    ZipArchive zip(limits_.zip);
    if (!zip.open(bytes)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "Invalid presentation container: " + zip.last_error());
    }

    std::vector<SlidePart> slides;
    std::vector<std::string> parts = zip.names_with_prefix(SLIDE_PREFIX);
    for (size_t i = 0; i < parts.size(); ++i) {
        long n = slide_number(parts[i]);
        if (n > 0) slides.push_back(SlidePart{n, parts[i]});
    }
    if (slides.empty()) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "Presentation contains no slides");
    }
    std::sort(slides.begin(), slides.end(), [](const SlidePart& a, const SlidePart& b) {
        return a.number < b.number;
    });

    XmlWalkLimits walk;
    walk.max_depth = limits_.max_xml_depth;
    walk.max_children = limits_.max_xml_children;
    walk.max_text_length = limits_.max_xml_text_run;

    std::string text;
    size_t processed = 0;
    size_t skipped = 0;

    for (size_t i = 0; i < slides.size() && i < limits_.max_slides; ++i) {
        if (cancel.cancelled()) {
            return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
        }
        const SlidePart& slide = slides[i];

        std::string xml;
        if (!zip.read(slide.part, xml)) {
            LOG_WARN("[PptxExtractor] Skipping slide %ld: %s", slide.number, zip.last_error().c_str());
            skipped++;
            continue;
        }
        if (has_unsafe_declarations(xml)) {
            LOG_WARN("[PptxExtractor] Skipping slide %ld: DOCTYPE/ENTITY declaration", slide.number);
            skipped++;
            continue;
        }
        XmlDocument doc;
        if (!doc.parse(xml)) {
            LOG_WARN("[PptxExtractor] Skipping slide %ld: %s", slide.number, doc.last_error().c_str());
            skipped++;
            continue;
        }

        std::string slide_text;
        XmlVisitor visitor;
        visitor.enter = [&](const xmlNode* node, size_t) -> WalkAction {
            if (slide_text.size() >= limits_.max_slide_chars) return WalkAction::STOP;
            if (node->type == XML_ELEMENT_NODE && local_name(node) == "t") {
                std::string run = truncate_safe(element_text(node), walk.max_text_length);
                slide_text += truncate_safe(run, limits_.max_slide_chars - slide_text.size());
                return WalkAction::SKIP_CHILDREN;
            }
            return WalkAction::DESCEND;
        };
        visitor.leave = [&](const xmlNode* node, size_t) {
            if (local_name(node) == "p" && !slide_text.empty() &&
                slide_text[slide_text.size() - 1] != '\n' &&
                slide_text.size() < limits_.max_slide_chars) {
                slide_text += '\n';
            }
        };
        walk_xml(doc.root(), walk, visitor);

        text += "\n=== Slide " + std::to_string(slide.number) + " ===\n";
        text += slide_text;
        processed++;
    }

    if (slides.size() > limits_.max_slides) {
        LOG_WARN("[PptxExtractor] Presentation has %zu slides, processed first %zu",
                 slides.size(), limits_.max_slides);
    }
    if (processed == 0) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "No readable slides in presentation");
    }

    ExtractionResult result;
    result.text = text;
    result.metadata["totalSlides"] = slides.size();
    result.metadata["processedSlides"] = processed;
    result.metadata["skippedSlides"] = skipped;
    return Result<ExtractionResult>::ok(result);
}

} // namespace docpipe
