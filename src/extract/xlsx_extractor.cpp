#include <docpipe/extract/format_extractors.hpp>
#include <docpipe/extract/xml_reader.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cstdlib>
#include <map>

namespace docpipe {

namespace {

const char* const WORKBOOK_PART = "xl/workbook.xml";
const char* const WORKBOOK_RELS_PART = "xl/_rels/workbook.xml.rels";
const char* const SHARED_STRINGS_PART = "xl/sharedStrings.xml";
const char* const WORKSHEET_PREFIX = "xl/worksheets/sheet";
const size_t MAX_SHEET_NAME = 50;

struct SheetRef {
    std::string name;
    std::string part;
};

const xmlNode* child_element(const xmlNode* node, const char* name) {
    if (!node) return nullptr;
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (c->type == XML_ELEMENT_NODE && local_name(c) == name) return c;
    }
    return nullptr;
}

// Text of a shared-string or inline-string item: direct <t> plus rich-text runs
std::string string_item_text(const xmlNode* si) {
    std::string out;
    for (const xmlNode* c = si->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;
        std::string tag = local_name(c);
        if (tag == "t") {
            out += element_text(c);
        } else if (tag == "r") {
            const xmlNode* t = child_element(c, "t");
            if (t) out += element_text(t);
        }
    }
    return out;
}

// "BC12" -> 54 (zero-based); -1 when there is no column part
long column_index(const std::string& ref) {
    long col = 0;
    size_t i = 0;
    for (; i < ref.size(); ++i) {
        char c = ref[i];
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        if (c < 'A' || c > 'Z') break;
        col = col * 26 + (c - 'A' + 1);
        if (col > 1000000) return -1;
    }
    return i == 0 ? -1 : col - 1;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
    std::string out = "\"";
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '"') out += '"';
        out += value[i];
    }
    out += '"';
    return out;
}

// "xl/worksheets/sheet12.xml" -> 12
long sheet_number(const std::string& part) {
    size_t pos = part.find_first_of("0123456789", std::string(WORKSHEET_PREFIX).size());
    return pos == std::string::npos ? 0 : std::strtol(part.c_str() + pos, nullptr, 10);
}

std::string resolve_target(const std::string& target) {
    if (starts_with(target, "/")) return target.substr(1);
    return "xl/" + target;
}

std::vector<SheetRef> list_sheets(ZipArchive& zip) {
    std::vector<SheetRef> sheets;
    std::string workbook, rels;
    if (zip.read(WORKBOOK_PART, workbook) && zip.read(WORKBOOK_RELS_PART, rels)) {
        XmlDocument rels_doc, book_doc;
        if (rels_doc.parse(rels) && book_doc.parse(workbook)) {
            std::map<std::string, std::string> targets;
            for (const xmlNode* r = rels_doc.root() ? rels_doc.root()->children : nullptr; r; r = r->next) {
                if (r->type == XML_ELEMENT_NODE && local_name(r) == "Relationship") {
                    targets[attribute(r, "Id")] = resolve_target(attribute(r, "Target"));
                }
            }
            const xmlNode* list = child_element(book_doc.root(), "sheets");
            for (const xmlNode* s = list ? list->children : nullptr; s; s = s->next) {
                if (s->type != XML_ELEMENT_NODE || local_name(s) != "sheet") continue;
                std::map<std::string, std::string>::const_iterator it = targets.find(attribute(s, "id"));
                if (it == targets.end()) continue;
                SheetRef ref;
                ref.name = attribute(s, "name");
                ref.part = it->second;
                sheets.push_back(ref);
            }
        }
    }
    if (!sheets.empty()) return sheets;

    std::vector<std::string> parts = zip.names_with_prefix(WORKSHEET_PREFIX);
    std::sort(parts.begin(), parts.end(), [](const std::string& a, const std::string& b) {
        return sheet_number(a) < sheet_number(b);
    });
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!ends_with(parts[i], ".xml")) continue;
        SheetRef ref;
        ref.name = "Sheet" + std::to_string(sheet_number(parts[i]));
        ref.part = parts[i];
        sheets.push_back(ref);
    }
    return sheets;
}

std::vector<std::string> load_shared_strings(ZipArchive& zip) {
    std::vector<std::string> strings;
    std::string xml;
    if (!zip.has(SHARED_STRINGS_PART)) return strings;
    if (!zip.read(SHARED_STRINGS_PART, xml)) {
        LOG_WARN("[XlsxExtractor] Shared strings unreadable: %s", zip.last_error().c_str());
        return strings;
    }
    XmlDocument doc;
    if (!doc.parse(xml)) {
        LOG_WARN("[XlsxExtractor] Shared strings unparseable: %s", doc.last_error().c_str());
        return strings;
    }
    for (const xmlNode* si = doc.root() ? doc.root()->children : nullptr; si; si = si->next) {
        if (si->type == XML_ELEMENT_NODE && local_name(si) == "si") {
            strings.push_back(string_item_text(si));
        }
    }
    return strings;
}

} // anonymous namespace

std::string XlsxExtractor::sanitize_sheet_name(const std::string& name) {
    std::string out;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '<' || c == '>' || c == ':' || c == '"' || c == '\'') continue;
        out += c;
    }
    return truncate_safe(out, MAX_SHEET_NAME);
}

Result<ExtractionResult> XlsxExtractor::extract(const std::string& bytes, const CancelToken& cancel) const {
    ZipArchive zip(limits_.zip);
    if (!zip.open(bytes)) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION,
            "Invalid spreadsheet container: " + zip.last_error());
    }

    std::vector<SheetRef> sheets = list_sheets(zip);
    if (sheets.empty()) {
        return Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "Spreadsheet contains no worksheets");
    }
    std::vector<std::string> shared = load_shared_strings(zip);

    std::string text;
    size_t processed = 0;
    size_t total_rows = 0;
    Json names = Json::array();

    for (size_t s = 0; s < sheets.size() && s < limits_.max_sheets; ++s) {
        if (cancel.cancelled()) {
            return Result<ExtractionResult>::fail(ErrorKind::TIMEOUT, "Extraction cancelled");
        }
        const SheetRef& sheet = sheets[s];
        std::string display = sanitize_sheet_name(sheet.name);

        std::string xml;
        if (!zip.read(sheet.part, xml)) {
            LOG_WARN("[XlsxExtractor] Skipping sheet '%s': %s", display.c_str(), zip.last_error().c_str());
            continue;
        }
        XmlDocument doc;
        if (!doc.parse(xml)) {
            LOG_WARN("[XlsxExtractor] Skipping sheet '%s': %s", display.c_str(), doc.last_error().c_str());
            continue;
        }

        std::string body;
        size_t rows = 0;
        bool capped = false;
        const xmlNode* data = child_element(doc.root(), "sheetData");
        for (const xmlNode* row = data ? data->children : nullptr; row && !capped; row = row->next) {
            if (row->type != XML_ELEMENT_NODE || local_name(row) != "row") continue;
            if (rows >= limits_.max_sheet_rows) {
                capped = true;
                break;
            }

            std::vector<std::string> cells;
            long next_col = 0;
            for (const xmlNode* c = row->children; c; c = c->next) {
                if (c->type != XML_ELEMENT_NODE || local_name(c) != "c") continue;
                long col = column_index(attribute(c, "r"));
                if (col < 0) col = next_col;
                next_col = col + 1;
                if (static_cast<size_t>(col) >= limits_.max_sheet_columns) continue;

                std::string type = attribute(c, "t");
                const xmlNode* v = child_element(c, "v");
                std::string raw = v ? element_text(v) : "";
                std::string value;
                if (type == "s") {
                    char* end = nullptr;
                    unsigned long idx = std::strtoul(raw.c_str(), &end, 10);
                    if (end != raw.c_str() && idx < shared.size()) value = shared[idx];
                } else if (type == "inlineStr") {
                    const xmlNode* is = child_element(c, "is");
                    if (is) value = string_item_text(is);
                } else if (type == "b") {
                    value = raw == "1" ? "TRUE" : "FALSE";
                } else {
                    value = raw;    // number, str, e
                }

                if (cells.size() <= static_cast<size_t>(col)) cells.resize(col + 1);
                cells[col] = value;
            }

            bool empty = true;
            for (size_t i = 0; i < cells.size() && empty; ++i) {
                if (!cells[i].empty()) empty = false;
            }
            if (empty) continue;

            std::string line;
            for (size_t i = 0; i < cells.size(); ++i) {
                if (i) line += ',';
                line += csv_field(cells[i]);
            }
            if (body.size() + line.size() + 1 > limits_.max_sheet_chars) {
                capped = true;
                break;
            }
            body += line;
            body += '\n';
            rows++;
        }

        if (capped) {
            LOG_WARN("[XlsxExtractor] Sheet '%s' truncated at %zu rows", display.c_str(), rows);
        }
        text += "\n=== Sheet: " + display + " ===\n";
        text += body;
        total_rows += rows;
        processed++;
        names.push_back(display);
    }

    if (sheets.size() > limits_.max_sheets) {
        LOG_WARN("[XlsxExtractor] Workbook has %zu sheets, processed first %zu",
                 sheets.size(), limits_.max_sheets);
    }

    ExtractionResult result;
    result.text = text;
    result.metadata["totalSheets"] = sheets.size();
    result.metadata["processedSheets"] = processed;
    result.metadata["totalRows"] = total_rows;
    result.metadata["sheetNames"] = names;
    return Result<ExtractionResult>::ok(result);
}

} // namespace docpipe
