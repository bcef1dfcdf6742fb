#include <gtest/gtest.h>
#include <docpipe/security/sanitizer.hpp>
#include <docpipe/security/validator.hpp>
#include "zip_fixture.hpp"

using namespace docpipe;

namespace {

const char* const PDF_MIME = "application/pdf";
const char* const DOCX_MIME = "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
const char* const XLSX_MIME = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
const char* const PPTX_MIME = "application/vnd.openxmlformats-officedocument.presentationml.presentation";

SourceDocument doc(const std::string& bytes, const std::string& mime, const std::string& name) {
    SourceDocument d;
    d.bytes = bytes;
    d.mime_type = mime;
    d.name = name;
    return d;
}

} // anonymous namespace

class ValidatorTest : public ::testing::Test {
protected:
    Validator validator_;
};

TEST_F(ValidatorTest, AcceptsMatchingSignatures) {
    std::vector<std::string> paras(1, "hello");
    std::string docx = testing_support::make_docx(paras);

    Result<DocumentFormat> pdf = validator_.validate(doc("%PDF-1.4\n...", PDF_MIME, "report.pdf"));
    ASSERT_TRUE(pdf.success) << pdf.error.message;
    EXPECT_EQ(pdf.value, DocumentFormat::PDF);

    Result<DocumentFormat> word = validator_.validate(doc(docx, DOCX_MIME, "memo.docx"));
    ASSERT_TRUE(word.success) << word.error.message;
    EXPECT_EQ(word.value, DocumentFormat::DOCX);

    Result<DocumentFormat> text = validator_.validate(doc("plain words", "text/plain; charset=utf-8", "notes.txt"));
    ASSERT_TRUE(text.success) << text.error.message;
    EXPECT_EQ(text.value, DocumentFormat::TEXT);
}

TEST_F(ValidatorTest, RejectsSignatureMismatch) {
    const std::string zip_magic("PK\x03\x04rest-of-archive", 19);
    const std::string pdf_magic = "%PDF-1.7 body";
    const std::string junk = "GIF89a not what it claims";

    EXPECT_FALSE(validator_.validate(doc(zip_magic, PDF_MIME, "a.pdf")).success);
    EXPECT_FALSE(validator_.validate(doc(junk, PDF_MIME, "a.pdf")).success);
    EXPECT_FALSE(validator_.validate(doc(pdf_magic, DOCX_MIME, "a.docx")).success);
    EXPECT_FALSE(validator_.validate(doc(junk, XLSX_MIME, "a.xlsx")).success);
    EXPECT_FALSE(validator_.validate(doc(pdf_magic, PPTX_MIME, "a.pptx")).success);
    EXPECT_FALSE(validator_.validate(doc("PK", DOCX_MIME, "short.docx")).success);

    Result<DocumentFormat> r = validator_.validate(doc(zip_magic, PDF_MIME, "a.pdf"));
    EXPECT_EQ(r.error.kind, ErrorKind::VALIDATION);
    EXPECT_NE(r.error.message.find("does not match"), std::string::npos);
}

TEST_F(ValidatorTest, RejectsEmptyOversizedAndUnsupported) {
    EXPECT_FALSE(validator_.validate(doc("", "text/plain", "empty.txt")).success);
    EXPECT_FALSE(validator_.validate(doc("data", "application/zip", "a.zip")).success);
    EXPECT_FALSE(validator_.validate(doc("data", "image/png", "a.png")).success);

    ValidationPolicy policy;
    policy.max_file_size = 10;
    Validator small(policy);
    EXPECT_TRUE(small.validate(doc("0123456789", "text/plain", "ok.txt")).success);
    Result<DocumentFormat> big = small.validate(doc("0123456789A", "text/plain", "big.txt"));
    ASSERT_FALSE(big.success);
    EXPECT_NE(big.error.message.find("too large"), std::string::npos);
}

TEST_F(ValidatorTest, FileNameRules) {
    std::string error;
    EXPECT_TRUE(validator_.check_file_name("Quarterly Report (final).pdf", error));
    EXPECT_FALSE(validator_.check_file_name("", error));
    EXPECT_FALSE(validator_.check_file_name(std::string(256, 'n'), error));
    EXPECT_FALSE(validator_.check_file_name("../../etc/passwd", error));
    EXPECT_FALSE(validator_.check_file_name("bad\x01name.txt", error));
    EXPECT_FALSE(validator_.check_file_name("what?.txt", error));
    EXPECT_FALSE(validator_.check_file_name("a|b.txt", error));
    EXPECT_FALSE(validator_.check_file_name("CON.txt", error));
    EXPECT_FALSE(validator_.check_file_name("lpt1", error));
    EXPECT_TRUE(validator_.check_file_name("console.txt", error));
}

TEST_F(ValidatorTest, ScriptInLeadingBytesRejected) {
    Result<DocumentFormat> r = validator_.validate(
        doc("hello <SCRIPT>alert(1)</SCRIPT>", "text/plain", "x.txt"));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::VALIDATION);

    EXPECT_FALSE(validator_.validate(doc("<a onClick=\"go()\">", "text/plain", "x.txt")).success);

    // Only the leading scan window is checked
    std::string late(20000, 'a');
    late += " javascript:void(0)";
    EXPECT_TRUE(validator_.validate(doc(late, "text/plain", "late.txt")).success);
}

TEST(SuspiciousContentTest, EventHandlersNeedWordBoundary) {
    EXPECT_EQ(detect_suspicious_content("img onerror=x"), "inline event handler");
    EXPECT_EQ(detect_suspicious_content("conversion=done"), "");
    EXPECT_EQ(detect_suspicious_content("turn on = off"), "");
    EXPECT_EQ(detect_suspicious_content("url %3Cscript%3E"), "encoded script tag");
}

TEST_F(ValidatorTest, AssignmentsAfterOnWordsAreAccepted) {
    Result<DocumentFormat> r = validator_.validate(
        doc("settings:\none = 1\nonly = x\nonline =true\n", "text/plain", "settings.txt"));
    EXPECT_TRUE(r.success) << r.error.message;

    EXPECT_EQ(detect_suspicious_content("one = 1"), "");
    EXPECT_EQ(detect_suspicious_content("onclick = go()", std::string::npos, true), "inline event handler");
}

TEST(FileNameSanitizeTest, ReplacesUnsafeCharacters) {
    EXPECT_EQ(sanitize_file_name("my report (v2).pdf"), "my_report__v2_.pdf");
    EXPECT_EQ(sanitize_file_name(std::string(300, 'a')).size(), 100u);
}

// ============================================================================
// Sanitizer
// ============================================================================

class SanitizerTest : public ::testing::Test {
protected:
    ContentSanitizer sanitizer_;
};

TEST_F(SanitizerTest, NeutralizesInjectionPatterns) {
    SanitizeReport report;
    std::string out = sanitizer_.neutralize(
        "Intro <script type=\"text/javascript\">steal()</script> then "
        "<a href=\"JavaScript:run()\" onclick=\"x()\">link</a> and vbscript:msgbox",
        &report);
    EXPECT_EQ(out.find("steal"), std::string::npos);
    EXPECT_NE(out.find(ContentSanitizer::SCRIPT_MARKER), std::string::npos);
    EXPECT_NE(out.find(ContentSanitizer::JAVASCRIPT_MARKER), std::string::npos);
    EXPECT_NE(out.find(ContentSanitizer::VBSCRIPT_MARKER), std::string::npos);
    EXPECT_NE(out.find(ContentSanitizer::EVENT_HANDLER_MARKER), std::string::npos);
    EXPECT_EQ(report.scripts, 1u);
    EXPECT_EQ(report.uris, 2u);
    EXPECT_EQ(report.event_handlers, 1u);
}

TEST_F(SanitizerTest, NeutralizesHandlersWithSpacesBeforeEquals) {
    SanitizeReport report;
    Result<std::string> r = sanitizer_.sanitize("<img src=x onerror = \"steal()\">", &report);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_NE(r.value.find(ContentSanitizer::EVENT_HANDLER_MARKER), std::string::npos);
    EXPECT_EQ(r.value.find("onerror"), std::string::npos);
    EXPECT_EQ(report.event_handlers, 1u);
}

TEST_F(SanitizerTest, Idempotent) {
    const char* inputs[] = {
        "plain text stays put",
        "<script>a()</script><SCRIPT>b()</SCRIPT>",
        "x onload=1 y onmouseover = 2 javascript:javascript:",
        "tabs\tand\nnewlines\x02 with control",
    };
    for (size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
        std::string once = sanitizer_.neutralize(inputs[i]);
        EXPECT_EQ(sanitizer_.neutralize(once), once) << inputs[i];
    }
}

TEST_F(SanitizerTest, StripsControlCharactersAndTrims) {
    SanitizeReport report;
    Result<std::string> r = sanitizer_.sanitize("  a\x01" "b\x7F" "c\n\td  ", &report);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, "abc\n\td");
    EXPECT_EQ(report.control_chars, 2u);
}

TEST_F(SanitizerTest, UnclosedScriptIsRejected) {
    Result<std::string> r = sanitizer_.sanitize("before <script src=evil.js and no closing tag");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::CONTENT_REJECTED);
}

TEST_F(SanitizerTest, EncodedScriptIsRejected) {
    Result<std::string> r = sanitizer_.sanitize("link: %3Cscript%3Ealert(1)%3C/script%3E");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::CONTENT_REJECTED);
}

TEST_F(SanitizerTest, CleanTextPassesUnchanged) {
    const std::string text = "Revenue rose 4% on strong demand; margins held.";
    Result<std::string> r = sanitizer_.sanitize(text);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, text);
}
