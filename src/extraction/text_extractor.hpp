#ifndef DOCREDACT_EXTRACTION_TEXT_EXTRACTOR_HPP
#define DOCREDACT_EXTRACTION_TEXT_EXTRACTOR_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "core/document.hpp"
#include "core/types.hpp"

namespace docredact {
namespace extraction {

/*
  TextExtractor
  --------------------------------------------------------
  Produces the flat text view of a document. The same view is
  used for matching, preview and post-redaction verification,
  so it must be deterministic: the same bytes always give the
  same string.

    Pdf   page text (poppler, raw content order) joined by '\n'
    Docx  paragraph text of document.xml, then headers, footers,
          footnotes, endnotes and comments, joined by '\n'
    Text  the bytes, which must be valid UTF-8

  Every failure is reported as core::ExtractionError.
*/
class TextExtractor {
  public:
    std::string Extract(const core::Document& document) const {
        return Extract(document.Bytes(), document.Format());
    }

    std::string Extract(const std::vector<uint8_t>& bytes, core::FormatKind format) const;

    // Per-page text of a PDF, in page order.
    std::vector<std::string> ExtractPdfPages(const std::vector<uint8_t>& bytes) const;

  private:
    std::string extractPdf(const std::vector<uint8_t>& bytes) const;
    std::string extractDocx(const std::vector<uint8_t>& bytes) const;
    std::string extractText(const std::vector<uint8_t>& bytes) const;
};

} // namespace extraction
} // namespace docredact

#endif // DOCREDACT_EXTRACTION_TEXT_EXTRACTOR_HPP
