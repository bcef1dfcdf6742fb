#include "zip_fixture.hpp"
#include <zlib.h>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace docpipe {
namespace testing_support {

namespace {

void put_u16(std::string& out, uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

void put_u32(std::string& out, uint32_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 24) & 0xFF);
}

std::string raw_deflate(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
    return out;
}

std::string zlib_compress(const std::string& data) {
    uLongf len = compressBound(static_cast<uLong>(data.size()));
    std::string out(len, '\0');
    if (compress2(reinterpret_cast<Bytef*>(&out[0]), &len,
                  reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()), 9) != Z_OK) {
        throw std::runtime_error("compress2 failed");
    }
    out.resize(len);
    return out;
}

std::string xml_escape(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        switch (s[i]) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += s[i];
        }
    }
    return out;
}

const char* const XML_DECL = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

} // anonymous namespace

ZipBuilder& ZipBuilder::add(const std::string& name, const std::string& data, bool deflate) {
    FixtureEntry e;
    e.name = name;
    e.data = data;
    e.deflate = deflate;
    return add(e);
}

ZipBuilder& ZipBuilder::add(const FixtureEntry& entry) {
    entries_.push_back(entry);
    return *this;
}

std::string ZipBuilder::build() const {
    std::string out;
    std::string directory;

    for (size_t i = 0; i < entries_.size(); ++i) {
        const FixtureEntry& e = entries_[i];
        std::string payload = e.deflate ? raw_deflate(e.data) : e.data;
        uint16_t method = e.method_override != 0xFFFF ? e.method_override : (e.deflate ? 8 : 0);
        uint32_t crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0),
            reinterpret_cast<const Bytef*>(e.data.data()), static_cast<uInt>(e.data.size())));
        uint32_t usize = e.declared_size >= 0 ? static_cast<uint32_t>(e.declared_size)
                                              : static_cast<uint32_t>(e.data.size());
        uint32_t offset = static_cast<uint32_t>(out.size());

        put_u32(out, 0x04034b50);
        put_u16(out, 20);
        put_u16(out, e.flags);
        put_u16(out, method);
        put_u16(out, 0);
        put_u16(out, 0);
        put_u32(out, crc);
        put_u32(out, static_cast<uint32_t>(payload.size()));
        put_u32(out, usize);
        put_u16(out, static_cast<uint16_t>(e.name.size()));
        put_u16(out, 0);
        out += e.name;
        out += payload;

        put_u32(directory, 0x02014b50);
        put_u16(directory, 20);
        put_u16(directory, 20);
        put_u16(directory, e.flags);
        put_u16(directory, method);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, crc);
        put_u32(directory, static_cast<uint32_t>(payload.size()));
        put_u32(directory, usize);
        put_u16(directory, static_cast<uint16_t>(e.name.size()));
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, 0);
        put_u32(directory, offset);
        directory += e.name;
    }

    uint32_t dir_offset = static_cast<uint32_t>(out.size());
    out += directory;
    put_u32(out, 0x06054b50);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u32(out, static_cast<uint32_t>(directory.size()));
    put_u32(out, dir_offset);
    put_u16(out, 0);
    return out;
}

std::string make_docx(const std::vector<std::string>& paragraphs) {
    std::string body = std::string(XML_DECL) +
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>";
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        body += "<w:p><w:r><w:t xml:space=\"preserve\">" + xml_escape(paragraphs[i]) + "</w:t></w:r></w:p>";
    }
    body += "</w:body></w:document>";

    ZipBuilder zip;
    zip.add("[Content_Types].xml", std::string(XML_DECL) + "<Types/>");
    zip.add("word/document.xml", body);
    return zip.build();
}

std::string make_xlsx(const std::vector<std::pair<std::string, std::vector<std::vector<std::string> > > >& sheets) {
    std::vector<std::string> shared;
    std::string workbook = std::string(XML_DECL) +
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"><sheets>";
    std::string rels = std::string(XML_DECL) +
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";

    ZipBuilder zip;
    for (size_t s = 0; s < sheets.size(); ++s) {
        std::string n = std::to_string(s + 1);
        workbook += "<sheet name=\"" + xml_escape(sheets[s].first) + "\" sheetId=\"" + n + "\" r:id=\"rId" + n + "\"/>";
        rels += "<Relationship Id=\"rId" + n + "\" Type=\"worksheet\" Target=\"worksheets/sheet" + n + ".xml\"/>";

        std::string data = std::string(XML_DECL) +
            "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>";
        const std::vector<std::vector<std::string> >& rows = sheets[s].second;
        for (size_t r = 0; r < rows.size(); ++r) {
            data += "<row r=\"" + std::to_string(r + 1) + "\">";
            for (size_t c = 0; c < rows[r].size(); ++c) {
                std::string ref = std::string(1, static_cast<char>('A' + c)) + std::to_string(r + 1);
                const std::string& v = rows[r][c];
                if (v.empty()) continue;
                if (v.find_first_not_of("0123456789.") == std::string::npos) {
                    data += "<c r=\"" + ref + "\"><v>" + v + "</v></c>";
                } else {
                    data += "<c r=\"" + ref + "\" t=\"s\"><v>" + std::to_string(shared.size()) + "</v></c>";
                    shared.push_back(v);
                }
            }
            data += "</row>";
        }
        data += "</sheetData></worksheet>";
        zip.add("xl/worksheets/sheet" + n + ".xml", data);
    }
    workbook += "</sheets></workbook>";
    rels += "</Relationships>";

    std::string sst = std::string(XML_DECL) +
        "<sst xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">";
    for (size_t i = 0; i < shared.size(); ++i) {
        sst += "<si><t>" + xml_escape(shared[i]) + "</t></si>";
    }
    sst += "</sst>";

    zip.add("xl/workbook.xml", workbook);
    zip.add("xl/_rels/workbook.xml.rels", rels);
    zip.add("xl/sharedStrings.xml", sst);
    return zip.build();
}

std::string slide_xml(const std::string& text) {
    return std::string(XML_DECL) +
        "<p:sld xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
        "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\">"
        "<p:cSld><p:spTree><p:sp><p:txBody><a:p><a:r><a:t>" + xml_escape(text) +
        "</a:t></a:r></a:p></p:txBody></p:sp></p:spTree></p:cSld></p:sld>";
}

std::string make_pptx(const std::vector<std::string>& slide_texts) {
    ZipBuilder zip;
    zip.add("[Content_Types].xml", std::string(XML_DECL) + "<Types/>");
    for (size_t i = 0; i < slide_texts.size(); ++i) {
        zip.add("ppt/slides/slide" + std::to_string(i + 1) + ".xml", slide_xml(slide_texts[i]));
    }
    return zip.build();
}

namespace {

// Objects are numbered from 1 in order; the trailer points /Info at `info`
std::string assemble_pdf(const std::vector<std::string>& objects, size_t info) {
    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(out.size());
        out += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    size_t xref = out.size();
    out += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (size_t i = 0; i < offsets.size(); ++i) {
        char line[32];
        snprintf(line, sizeof(line), "%010zu 00000 n \n", offsets[i]);
        out += line;
    }
    out += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R";
    if (info) out += " /Info " + std::to_string(info) + " 0 R";
    out += " >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return out;
}

std::string stream_object(const std::string& content) {
    return "<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "\nendstream";
}

std::string hex4(unsigned v) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%04X", v & 0xFFFF);
    return buf;
}

} // anonymous namespace

std::string make_pdf(const std::vector<std::string>& page_lines, bool compress) {
    std::vector<std::string> objects;
    const size_t pages = page_lines.size();
    // 1 catalog, 2 pages, 3 font, then (page, content) pairs, then info
    std::string kids;
    for (size_t i = 0; i < pages; ++i) {
        kids += std::to_string(4 + i * 2) + " 0 R ";
    }
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
    for (size_t i = 0; i < pages; ++i) {
        std::string content = "BT /F1 12 Tf 72 720 Td (" + page_lines[i] + ") Tj ET\n";
        std::string filter;
        if (compress) {
            content = zlib_compress(content);
            filter = " /Filter /FlateDecode";
        }
        objects.push_back("<< /Type /Page /Parent 2 0 R /Resources << /Font << /F1 3 0 R >> >> "
                          "/Contents " + std::to_string(5 + i * 2) + " 0 R >>");
        objects.push_back("<< /Length " + std::to_string(content.size()) + filter + " >>\nstream\n" +
                          content + "\nendstream");
    }
    objects.push_back("<< /Title (Quarterly Report) /Author (Finance Team) /Keywords (not exported) >>");
    return assemble_pdf(objects, objects.size());
}

std::string make_identity_h_pdf(const std::u16string& text) {
    // Glyph i + 1 draws text[i]; only the ToUnicode map knows the characters
    std::string glyphs;
    std::string bfchars;
    for (size_t i = 0; i < text.size(); ++i) {
        glyphs += hex4(static_cast<unsigned>(i + 1));
        bfchars += "<" + hex4(static_cast<unsigned>(i + 1)) + "> <" + hex4(text[i]) + ">\n";
    }
    std::string cmap =
        "/CIDInit /ProcSet findresource begin\n"
        "12 dict begin\n"
        "begincmap\n"
        "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n"
        "/CMapName /Adobe-Identity-UCS def\n"
        "/CMapType 2 def\n"
        "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n" +
        std::to_string(text.size()) + " beginbfchar\n" + bfchars + "endbfchar\n"
        "endcmap\n"
        "CMapName currentdict /CMap defineresource pop\n"
        "end\nend\n";

    std::vector<std::string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [6 0 R] /Count 1 >>");
    objects.push_back("<< /Type /Font /Subtype /Type0 /BaseFont /FixtureCID /Encoding /Identity-H "
                      "/DescendantFonts [4 0 R] /ToUnicode 5 0 R >>");
    objects.push_back("<< /Type /Font /Subtype /CIDFontType2 /BaseFont /FixtureCID "
                      "/CIDSystemInfo << /Registry (Adobe) /Ordering (Identity) /Supplement 0 >> "
                      "/DW 600 >>");
    objects.push_back(stream_object(cmap));
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                      "/Resources << /Font << /F1 3 0 R >> >> /Contents 7 0 R >>");
    objects.push_back(stream_object("BT /F1 12 Tf 72 720 Td <" + glyphs + "> Tj ET\n"));
    return assemble_pdf(objects, 0);
}

} // namespace testing_support
} // namespace docpipe
