#include <gtest/gtest.h>
#include "core/accepted_redaction_set.hpp"
#include "extraction/docx_package.hpp"
#include "extraction/text_extractor.hpp"
#include "redaction/docx_redactor.hpp"
#include "test_support.hpp"

namespace {

using docredact::core::AcceptedRedactionSet;
using docredact::core::FormatKind;
using docredact::core::RedactionKind;
using docredact::extraction::DocxPackage;
using docredact::extraction::TextExtractor;
using docredact::redaction::DocxRedactor;

const char* kBlock = "\xE2\x96\x88";

DocxRedactor makeRedactor() {
    return DocxRedactor(kBlock, "Calibri", 11);
}

TEST(DocxRedactorTest, ContactParagraphLosesName) {
    // The name is split over two runs, as Word often does.
    std::vector<uint8_t> docx = docredact::test::MakeDocx({"Contact: Ja|ne Roe", "Unrelated line"});
    AcceptedRedactionSet set;
    set.Add({"Jane Roe", RedactionKind::PII, 90, ""});

    std::vector<uint8_t> out = makeRedactor().Apply(docx, set);

    DocxPackage package(out);
    std::string xml = package.ReadEntry("word/document.xml");
    EXPECT_EQ(xml.find("Jane Roe"), std::string::npos);
    EXPECT_EQ(xml.find("Ja<"), std::string::npos);
    EXPECT_NE(xml.find("w:ascii=\"Calibri\""), std::string::npos);
    EXPECT_NE(xml.find("w:val=\"22\""), std::string::npos);

    std::string text = TextExtractor().Extract(out, FormatKind::Docx);
    EXPECT_EQ(text.find("Jane Roe"), std::string::npos);
    std::string masked;
    for (int i = 0; i < 8; ++i) {
        masked += kBlock;
    }
    EXPECT_NE(text.find("Contact: " + masked), std::string::npos);
    EXPECT_NE(text.find("Unrelated line"), std::string::npos);
}

TEST(DocxRedactorTest, NoMatchReturnsInputBytes) {
    std::vector<uint8_t> docx = docredact::test::MakeDocx({"Nothing sensitive here"});
    AcceptedRedactionSet set;
    set.Add({"Jane Roe", RedactionKind::PII, 90, ""});
    EXPECT_EQ(makeRedactor().Apply(docx, set), docx);
}

TEST(DocxRedactorTest, MaskUsesOneGlyphPerCodePoint) {
    DocxRedactor redactor = makeRedactor();
    // "Zoë" is three code points in four bytes.
    std::string masked = redactor.Mask("Hi Zo\xC3\xAB!", {"Zo\xC3\xAB"});
    EXPECT_EQ(masked, std::string("Hi ") + kBlock + kBlock + kBlock + "!");
}

TEST(DocxRedactorTest, UnchangedPartsAreCopied) {
    std::map<std::string, std::string> entries;
    entries["word/document.xml"] = docredact::test::MakeDocumentXml({"Account 998877"});
    entries["word/styles.xml"] = "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"/>";
    std::vector<uint8_t> docx = docredact::test::MakeZip(entries);

    AcceptedRedactionSet set;
    set.Add({"998877", RedactionKind::Financial, 90, ""});
    std::vector<uint8_t> out = makeRedactor().Apply(docx, set);

    DocxPackage package(out);
    EXPECT_EQ(package.ReadEntry("word/styles.xml"), entries["word/styles.xml"]);
    EXPECT_EQ(package.ReadEntry("word/document.xml").find("998877"), std::string::npos);
}

TEST(DocxRedactorTest, MaskHandlesLongParagraphs) {
    std::string text;
    std::string expected;
    for (int i = 0; i < 100000; ++i) {
        text += "pin 77 ";
        expected += std::string("pin ") + kBlock + kBlock + " ";
    }
    EXPECT_EQ(makeRedactor().Mask(text, {"77"}), expected);
}

} // anonymous namespace
