#ifndef DOCREDACT_REDACTION_DOCX_REDACTOR_HPP
#define DOCREDACT_REDACTION_DOCX_REDACTOR_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <pugixml.hpp>
#include "core/accepted_redaction_set.hpp"

namespace docredact {
namespace redaction {

/*
  DocxRedactor
  --------------------------------------------------------
  Rewrites WordprocessingML paragraphs that contain accepted
  text. The paragraph keeps its w:pPr; every other child is
  dropped and replaced by a single run holding the paragraph
  text with each accepted span turned into filler glyphs (one
  per code point), in the redaction font, bold and black.

  Because the original runs are removed, no fragment of a
  redacted value survives in w:t, w:instrText or field codes
  of that paragraph. Paragraphs with a tracked deletion
  (w:delText) containing accepted text are rewritten too.

  Parts that do not change are copied byte for byte. If no
  part changes, the input bytes are returned unchanged.
*/
class DocxRedactor {
  public:
    DocxRedactor(std::string fillerGlyph, std::string fontName, unsigned int fontSizePt)
        : m_fillerGlyph(std::move(fillerGlyph)), m_fontName(std::move(fontName)),
          m_fontSizePt(fontSizePt) {}

    std::vector<uint8_t> Apply(const std::vector<uint8_t>& bytes,
                               const core::AcceptedRedactionSet& accepted) const;

    // Rewrites matching paragraphs of one loaded part. Returns the number
    // of paragraphs rewritten.
    size_t RedactPart(pugi::xml_document& part, const std::vector<std::string>& literals) const;

    // Paragraph text with each claimed span replaced by filler glyphs.
    std::string Mask(const std::string& text, const std::vector<std::string>& literals) const;

  private:
    void rewriteParagraph(pugi::xml_node paragraph, const std::string& maskedText) const;

    std::string m_fillerGlyph;
    std::string m_fontName;
    unsigned int m_fontSizePt;
};

} // namespace redaction
} // namespace docredact

#endif // DOCREDACT_REDACTION_DOCX_REDACTOR_HPP
