/*
 * docpipe C++17 - Hardened XML reader
 *
 * Thin RAII layer over libxml2 for OOXML parts. Documents are parsed
 * without network access, DTD loading or entity substitution, and any
 * part carrying a DOCTYPE is refused. Trees are walked with an explicit
 * stack so hostile nesting cannot exhaust the call stack.
 */
#ifndef docpipe_EXTRACT_XML_READER_HPP
#define docpipe_EXTRACT_XML_READER_HPP

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <functional>
#include <string>

namespace docpipe {

// Case-insensitive scan for <!DOCTYPE or <!ENTITY
bool has_unsafe_declarations(const std::string& xml);

class XmlDocument {
public:
    XmlDocument();
    ~XmlDocument();

    bool parse(const std::string& xml);

    xmlNode* root() const;
    const std::string& last_error() const { return last_error_; }

private:
    XmlDocument(const XmlDocument&);
    XmlDocument& operator=(const XmlDocument&);

    xmlDoc* doc_;
    std::string last_error_;
};

// Element name without namespace prefix ("w:t" -> "t")
std::string local_name(const xmlNode* node);

// Attribute by local name, empty when absent
std::string attribute(const xmlNode* node, const char* name);

// Concatenated text content of a node's direct text children
std::string element_text(const xmlNode* node);

enum class WalkAction {
    DESCEND,
    SKIP_CHILDREN,
    STOP
};

struct XmlWalkLimits {
    size_t max_depth;           // elements below this depth are skipped
    size_t max_children;        // per-node fan-out
    size_t max_text_length;     // per text node, longer runs are cut

    XmlWalkLimits() : max_depth(64), max_children(100000), max_text_length(1000000) {}
};

struct XmlWalkStats {
    size_t nodes_visited;
    size_t depth_skips;
    size_t fanout_skips;

    XmlWalkStats() : nodes_visited(0), depth_skips(0), fanout_skips(0) {}
};

// enter() runs for every element and text node in document order;
// leave() runs after an element's children were visited
struct XmlVisitor {
    std::function<WalkAction(const xmlNode* node, size_t depth)> enter;
    std::function<void(const xmlNode* node, size_t depth)> leave;
};

XmlWalkStats walk_xml(const xmlNode* root, const XmlWalkLimits& limits, const XmlVisitor& visitor);

} // namespace docpipe

#endif // docpipe_EXTRACT_XML_READER_HPP
