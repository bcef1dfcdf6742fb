#include <docpipe/extract/xml_reader.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <climits>
#include <mutex>
#include <vector>

namespace docpipe {

namespace {

std::once_flag g_parser_init;

const int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOCDATA;

} // anonymous namespace

bool has_unsafe_declarations(const std::string& xml) {
    return find_ci(xml, "<!DOCTYPE") != std::string::npos ||
           find_ci(xml, "<!ENTITY") != std::string::npos;
}

// ============================================================================
// XmlDocument
// ============================================================================

XmlDocument::XmlDocument() : doc_(nullptr) {
    std::call_once(g_parser_init, []() { xmlInitParser(); });
}

XmlDocument::~XmlDocument() {
    if (doc_) xmlFreeDoc(doc_);
}

bool XmlDocument::parse(const std::string& xml) {
    if (doc_) {
        xmlFreeDoc(doc_);
        doc_ = nullptr;
    }
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        last_error_ = "document too large";
        return false;
    }
    if (has_unsafe_declarations(xml)) {
        last_error_ = "document contains DOCTYPE or ENTITY declarations";
        return false;
    }

    doc_ = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "part.xml", nullptr, PARSE_OPTIONS);
    if (!doc_) {
        last_error_ = "malformed XML";
        return false;
    }
    if (doc_->intSubset || doc_->extSubset) {
        xmlFreeDoc(doc_);
        doc_ = nullptr;
        last_error_ = "document declares a DTD";
        return false;
    }
    return true;
}

xmlNode* XmlDocument::root() const {
    return doc_ ? xmlDocGetRootElement(doc_) : nullptr;
}

// ============================================================================
// Node helpers
// ============================================================================

std::string local_name(const xmlNode* node) {
    if (!node || !node->name) return "";
    return reinterpret_cast<const char*>(node->name);
}

std::string attribute(const xmlNode* node, const char* name) {
    if (!node || node->type != XML_ELEMENT_NODE) return "";
    for (const xmlAttr* a = node->properties; a; a = a->next) {
        if (a->name && xmlStrcmp(a->name, reinterpret_cast<const xmlChar*>(name)) == 0) {
            const xmlNode* v = a->children;
            if (v && v->content) return reinterpret_cast<const char*>(v->content);
            return "";
        }
    }
    return "";
}

std::string element_text(const xmlNode* node) {
    std::string out;
    if (!node) return out;
    for (const xmlNode* c = node->children; c; c = c->next) {
        if ((c->type == XML_TEXT_NODE || c->type == XML_CDATA_SECTION_NODE) && c->content) {
            out += reinterpret_cast<const char*>(c->content);
        }
    }
    return out;
}

// ============================================================================
// Walker
// ============================================================================

XmlWalkStats walk_xml(const xmlNode* root, const XmlWalkLimits& limits, const XmlVisitor& visitor) {
    XmlWalkStats stats;
    if (!root) return stats;

    struct Frame {
        const xmlNode* node;
        size_t depth;
        bool leaving;
    };

    std::vector<Frame> stack;
    stack.push_back(Frame{root, 0, false});

    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();

        if (frame.leaving) {
            if (visitor.leave) visitor.leave(frame.node, frame.depth);
            continue;
        }

        if (frame.depth > limits.max_depth) {
            stats.depth_skips++;
            continue;
        }
        stats.nodes_visited++;

        WalkAction action = visitor.enter ? visitor.enter(frame.node, frame.depth) : WalkAction::DESCEND;
        if (action == WalkAction::STOP) break;
        if (frame.node->type != XML_ELEMENT_NODE) continue;

        stack.push_back(Frame{frame.node, frame.depth, true});
        if (action == WalkAction::SKIP_CHILDREN) continue;

        // Collect up to max_children, then push in reverse for document order
        std::vector<const xmlNode*> children;
        for (const xmlNode* c = frame.node->children; c; c = c->next) {
            if (c->type != XML_ELEMENT_NODE && c->type != XML_TEXT_NODE &&
                c->type != XML_CDATA_SECTION_NODE) {
                continue;
            }
            if (children.size() >= limits.max_children) {
                stats.fanout_skips++;
                break;
            }
            children.push_back(c);
        }
        for (size_t i = children.size(); i > 0; --i) {
            stack.push_back(Frame{children[i - 1], frame.depth + 1, false});
        }
    }

    if (stats.depth_skips || stats.fanout_skips) {
        LOG_DEBUG("[XmlReader] Walk limits hit: %zu depth skips, %zu fan-out skips",
                  stats.depth_skips, stats.fanout_skips);
    }
    return stats;
}

} // namespace docpipe
