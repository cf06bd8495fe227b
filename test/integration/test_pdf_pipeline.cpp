#include <gtest/gtest.h>
#include <memory>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include "config/engine_config.hpp"
#include "core/accepted_redaction_set.hpp"
#include "core/document.hpp"
#include "core/errors.hpp"
#include "engine/redaction_engine.hpp"
#include "extraction/text_extractor.hpp"
#include "layout/layout_analyzer.hpp"
#include "redaction/pdf_redactor.hpp"
#include "test_support.hpp"

namespace {

using docredact::config::EngineConfig;
using docredact::core::AcceptedRedactionSet;
using docredact::core::Document;
using docredact::core::FormatKind;
using docredact::core::RedactionKind;
using docredact::test::MakePdf;
using docredact::test::TextAt;

EngineConfig quietConfig() {
    EngineConfig cfg;
    cfg.logLevel = "WARN";
    return cfg;
}

std::vector<uint8_t> ssnPdf() {
    return MakePdf({TextAt(72, 700, "SSN:") + TextAt(200, 700, "123-45-6789") + TextAt(72, 650, "Keep this line"),
                    TextAt(72, 700, "Second page 123-45-6789 again")});
}

AcceptedRedactionSet ssnSet() {
    AcceptedRedactionSet set;
    set.Add({"123-45-6789", RedactionKind::PII, 95, "SSN"});
    return set;
}

// The text is drawn by a form XObject; the page stream only invokes it.
std::vector<uint8_t> formXObjectPdf(const std::string& formContent) {
    QPDF pdf;
    pdf.emptyPDF();

    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", pdf.makeIndirectObject(QPDFObjectHandle::parse(
                                "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>")));
    QPDFObjectHandle formResources = QPDFObjectHandle::newDictionary();
    formResources.replaceKey("/Font", fonts);

    QPDFObjectHandle form = QPDFObjectHandle::newStream(&pdf, formContent);
    form.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    form.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    form.getDict().replaceKey("/BBox", QPDFObjectHandle::parse("[0 0 612 792]"));
    form.getDict().replaceKey("/Resources", formResources);

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Fm1", form);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page >>"));
    page.replaceKey("/MediaBox", QPDFObjectHandle::parse("[0 0 612 792]"));
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, "q /Fm1 Do Q\n"));
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(page), false);

    QPDFWriter writer(pdf);
    writer.setOutputMemory();
    writer.write();
    std::unique_ptr<Buffer> out(writer.getBuffer());
    return std::vector<uint8_t>(out->getBuffer(), out->getBuffer() + out->getSize());
}

TEST(PdfPipelineTest, RedactsEveryPageAndVerifies) {
    docredact::engine::RedactionEngine engine(quietConfig());
    Document original(ssnPdf(), FormatKind::Pdf);
    ASSERT_NE(engine.Preview(original).find("123-45-6789"), std::string::npos);

    auto artifact = engine.Redact(original, ssnSet());
    EXPECT_TRUE(artifact.Verification().verified);
    EXPECT_EQ(artifact.Format(), FormatKind::Pdf);
    EXPECT_EQ(artifact.Sha256().size(), (size_t)64);

    std::string text = engine.Preview(Document(artifact.Bytes(), FormatKind::Pdf));
    EXPECT_EQ(text.find("123-45-6789"), std::string::npos);
    EXPECT_NE(text.find("SSN:"), std::string::npos);
    EXPECT_NE(text.find("Keep this line"), std::string::npos);
    EXPECT_NE(text.find("Second page"), std::string::npos);
    EXPECT_NE(text.find("again"), std::string::npos);
}

TEST(PdfPipelineTest, OutputIsEncryptedButOpensWithoutPassword) {
    docredact::engine::RedactionEngine engine(quietConfig());
    auto artifact = engine.Redact(Document(ssnPdf(), FormatKind::Pdf), ssnSet());

    QPDF pdf;
    pdf.processMemoryFile("redacted.pdf", reinterpret_cast<const char*>(artifact.Bytes().data()),
                          artifact.Bytes().size());
    EXPECT_TRUE(pdf.isEncrypted());
    EXPECT_TRUE(pdf.allowAccessibility());
    EXPECT_FALSE(pdf.allowModifyAll());
}

TEST(PdfPipelineTest, NoHitLeavesBytesUntouched) {
    EngineConfig cfg = quietConfig();
    std::vector<uint8_t> bytes = ssnPdf();
    AcceptedRedactionSet set;
    set.Add({"not in the document", RedactionKind::Custom, 100, ""});
    EXPECT_EQ(docredact::redaction::PdfRedactor(cfg).Apply(bytes, set), bytes);
}

TEST(PdfPipelineTest, MarksCoverTheLiteral) {
    EngineConfig cfg = quietConfig();
    std::vector<uint8_t> bytes = ssnPdf();
    auto layout = docredact::layout::LayoutAnalyzer(cfg).Analyze(bytes);
    auto marks = docredact::redaction::PdfRedactor(cfg).CollectMarks(bytes, ssnSet(), layout);

    ASSERT_EQ(marks.count(0), (size_t)1);
    ASSERT_EQ(marks.count(1), (size_t)1);
    bool covered = false;
    for (const auto& rect : marks[0]) {
        // Baseline at y=700 in user space is y=92 from the top.
        if (rect.x0 <= 200.0 && rect.x1 > 250.0 && rect.y0 < 92.0 && rect.y1 > 85.0)
            covered = true;
        EXPECT_GT(rect.x0, 150.0);
    }
    EXPECT_TRUE(covered);
}

TEST(PdfPipelineTest, StandardFontsLeaveNoFragmentOfTheLiteral) {
    docredact::engine::RedactionEngine engine(quietConfig());
    for (const std::string font : {"Times-Roman", "Times-Bold", "Helvetica-Bold"}) {
        SCOPED_TRACE(font);
        // One Tj, so every glyph after "Account " is placed by computed advances.
        Document original(MakePdf({TextAt(72, 700, "Account 123-45-6789 closed") + TextAt(72, 650, "Other line")},
                                  font),
                          FormatKind::Pdf);
        ASSERT_NE(engine.Preview(original).find("123-45-6789"), std::string::npos);

        auto artifact = engine.Redact(original, ssnSet());
        EXPECT_TRUE(artifact.Verification().verified);

        std::string text = engine.Preview(Document(artifact.Bytes(), FormatKind::Pdf));
        EXPECT_EQ(text.find("6789"), std::string::npos);
        EXPECT_EQ(text.find("45-6"), std::string::npos);
        EXPECT_EQ(text.find("123"), std::string::npos);
        EXPECT_NE(text.find("Account"), std::string::npos);
        EXPECT_NE(text.find("closed"), std::string::npos);
        EXPECT_NE(text.find("Other line"), std::string::npos);
    }
}

TEST(PdfPipelineTest, UnknownFontMetricsFailClosed) {
    EngineConfig cfg = quietConfig();
    // Not a standard 14 font and no /Widths: glyph advances would be guesses.
    std::vector<uint8_t> bytes = MakePdf({TextAt(72, 700, "Ref 123-45-6789 end")}, "CustomSans");
    EXPECT_THROW(docredact::redaction::PdfRedactor(cfg).Apply(bytes, ssnSet()),
                 docredact::core::ApplicationError);
}

TEST(PdfPipelineTest, TextLeftUnderAMarkFailsTheRedaction) {
    EngineConfig cfg = quietConfig();
    std::vector<uint8_t> bytes = formXObjectPdf(TextAt(72, 700, "Ref 123-45-6789"));
    ASSERT_NE(docredact::engine::RedactionEngine(cfg).Preview(Document(bytes, FormatKind::Pdf)).find("123-45-6789"),
              std::string::npos);
    EXPECT_THROW(docredact::redaction::PdfRedactor(cfg).Apply(bytes, ssnSet()),
                 docredact::core::ApplicationError);
}

} // anonymous namespace
