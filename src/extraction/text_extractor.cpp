#include "extraction/text_extractor.hpp"
#include "core/errors.hpp"
#include "extraction/docx_package.hpp"
#include "extraction/poppler_support.hpp"
#include "extraction/wordml.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace docredact {
namespace extraction {

std::string TextExtractor::Extract(const std::vector<uint8_t>& bytes, core::FormatKind format) const {
    switch (format) {
    case core::FormatKind::Pdf:
        return extractPdf(bytes);
    case core::FormatKind::Docx:
        return extractDocx(bytes);
    case core::FormatKind::Text:
        return extractText(bytes);
    }
    throw core::ExtractionError("unknown format");
}

std::vector<std::string> TextExtractor::ExtractPdfPages(const std::vector<uint8_t>& bytes) const {
    std::unique_ptr<poppler::document> doc = OpenPdf<core::ExtractionError>(bytes);

    std::vector<std::string> pages;
    const int pageCount = doc->pages();
    pages.reserve(static_cast<size_t>(pageCount));
    for (int i = 0; i < pageCount; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            throw core::ExtractionError("cannot open page " + std::to_string(i + 1));
        }
        pages.push_back(ToUtf8(page->text(poppler::rectf(), poppler::page::raw_order_layout)));
    }
    return pages;
}

std::string TextExtractor::extractPdf(const std::vector<uint8_t>& bytes) const {
    std::vector<std::string> pages = ExtractPdfPages(bytes);
    std::string out;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += pages[i];
    }
    util::logger::debug("[TextExtractor] PDF pages=" + std::to_string(pages.size()) +
                        " chars=" + std::to_string(out.size()));
    return out;
}

std::string TextExtractor::extractDocx(const std::vector<uint8_t>& bytes) const {
    DocxPackage package(bytes);
    if (!package.HasEntry(DocxPackage::kMainDocumentPart)) {
        throw core::ExtractionError("package has no word/document.xml");
    }

    std::string out;
    bool first = true;
    for (const auto& partName : package.TextPartNames()) {
        pugi::xml_document xml;
        wordml::LoadPart<core::ExtractionError>(xml, package.ReadEntry(partName), partName);
        for (const auto& paragraph : wordml::Paragraphs(xml)) {
            if (!first)
                out += '\n';
            out += wordml::ParagraphText(paragraph);
            first = false;
        }
    }
    util::logger::debug("[TextExtractor] DOCX chars=" + std::to_string(out.size()));
    return out;
}

std::string TextExtractor::extractText(const std::vector<uint8_t>& bytes) const {
    if (!util::utf8::isValid(bytes.data(), bytes.size())) {
        throw core::ExtractionError("text input is not valid UTF-8");
    }
    return std::string(bytes.begin(), bytes.end());
}

} // namespace extraction
} // namespace docredact
