/*
 * docpipe tests - in-memory ZIP / OOXML builders
 */
#ifndef docpipe_TESTS_ZIP_FIXTURE_HPP
#define docpipe_TESTS_ZIP_FIXTURE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace docpipe {
namespace testing_support {

struct FixtureEntry {
    std::string name;
    std::string data;
    bool deflate;
    uint16_t flags;                 // bit 0 marks the entry encrypted
    uint16_t method_override;       // 0xFFFF keeps the real method
    int64_t declared_size;          // -1 keeps the real uncompressed size

    FixtureEntry() : deflate(true), flags(0), method_override(0xFFFF), declared_size(-1) {}
};

class ZipBuilder {
public:
    ZipBuilder& add(const std::string& name, const std::string& data, bool deflate = true);
    ZipBuilder& add(const FixtureEntry& entry);

    std::string build() const;

private:
    std::vector<FixtureEntry> entries_;
};

std::string make_docx(const std::vector<std::string>& paragraphs);

// rows of cells; every cell becomes a shared string except numeric-looking ones
std::string make_xlsx(const std::vector<std::pair<std::string, std::vector<std::vector<std::string> > > >& sheets);

// one text run per slide; a raw xml override replaces slide N's markup
std::string make_pptx(const std::vector<std::string>& slide_texts);
std::string slide_xml(const std::string& text);

std::string make_pdf(const std::vector<std::string>& page_lines, bool compress);

// One page drawn with an Identity-H Type0 font: the content stream holds
// glyph ids and only the ToUnicode CMap recovers the characters
std::string make_identity_h_pdf(const std::u16string& text);

} // namespace testing_support
} // namespace docpipe

#endif // docpipe_TESTS_ZIP_FIXTURE_HPP
