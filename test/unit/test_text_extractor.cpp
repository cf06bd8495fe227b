#include <gtest/gtest.h>
#include "core/document.hpp"
#include "core/errors.hpp"
#include "extraction/text_extractor.hpp"
#include "test_support.hpp"

namespace {

using docredact::core::Document;
using docredact::core::FormatKind;
using docredact::extraction::TextExtractor;

TEST(TextExtractorTest, PdfPagesInOrder) {
    std::vector<uint8_t> pdf = docredact::test::MakePdf({
        docredact::test::TextAt(72, 700, "First"),
        docredact::test::TextAt(72, 700, "Second"),
    });
    TextExtractor extractor;
    std::vector<std::string> pages = extractor.ExtractPdfPages(pdf);
    ASSERT_EQ(pages.size(), (size_t)2);
    EXPECT_NE(pages[0].find("First"), std::string::npos);
    EXPECT_NE(pages[1].find("Second"), std::string::npos);

    std::string all = extractor.Extract(pdf, FormatKind::Pdf);
    EXPECT_LT(all.find("First"), all.find("Second"));
}

TEST(TextExtractorTest, ExtractionIsIdempotent) {
    TextExtractor extractor;
    Document pdf(docredact::test::MakePdf({docredact::test::TextAt(72, 700, "Stable text")}), FormatKind::Pdf);
    EXPECT_EQ(extractor.Extract(pdf), extractor.Extract(pdf));

    Document docx(docredact::test::MakeDocx({"One", "Two"}), FormatKind::Docx);
    EXPECT_EQ(extractor.Extract(docx), extractor.Extract(docx));
    EXPECT_EQ(extractor.Extract(docx), "One\nTwo");

    Document text(docredact::test::Bytes("as is\n"), FormatKind::Text);
    EXPECT_EQ(extractor.Extract(text), "as is\n");
}

TEST(TextExtractorTest, FailuresAreExtractionErrors) {
    TextExtractor extractor;
    EXPECT_THROW(extractor.Extract(docredact::test::Bytes("not a pdf"), FormatKind::Pdf),
                 docredact::core::ExtractionError);

    std::vector<uint8_t> zip = docredact::test::MakeZip({{"word/other.xml", "<x/>"}});
    EXPECT_THROW(extractor.Extract(zip, FormatKind::Docx), docredact::core::ExtractionError);

    std::vector<uint8_t> broken = docredact::test::MakeZip({{"word/document.xml", "<w:document"}});
    EXPECT_THROW(extractor.Extract(broken, FormatKind::Docx), docredact::core::ExtractionError);

    std::vector<uint8_t> latin1 = {'c', 'a', 'f', 0xE9};
    EXPECT_THROW(extractor.Extract(latin1, FormatKind::Text), docredact::core::ExtractionError);
}

} // anonymous namespace
