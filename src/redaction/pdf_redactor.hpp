#ifndef DOCREDACT_REDACTION_PDF_REDACTOR_HPP
#define DOCREDACT_REDACTION_PDF_REDACTOR_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "config/engine_config.hpp"
#include "core/accepted_redaction_set.hpp"
#include "core/types.hpp"
#include "layout/layout_types.hpp"

namespace docredact {
namespace redaction {

/*
  PdfRedactor
  --------------------------------------------------------
  True content redaction for PDF pages.

  1. Locate: every accepted text is searched on every page
     with poppler's phrase search and, through the layout's
     text blocks, by whole-token containment. Each hit box
     grows by the configured padding and becomes a mark.
  2. Remove: the page content is re-tokenized with qpdf while
     the graphics and text state (cm q Q BT Tf Tc Tw Tz TL Ts
     Td TD Tm T*) are tracked. Every glyph whose centre lies
     inside a mark is dropped from its Tj/TJ/'/" operator and
     replaced by a TJ displacement of the same advance, so the
     remaining glyphs do not move.
  3. Cover: an opaque black rectangle is painted over each
     mark, outside any state the original content left open.
  4. Write: qpdf writes the result with AES-256 (R6), an empty
     user password, a random or configured owner password, and
     only accessibility, printing and copying permitted.
  5. Check: the written file is reopened with poppler and any
     character whose box centre lies inside a mark fails the
     redaction with core::ApplicationError. This also catches
     text drawn by form XObjects, which step 2 does not rewrite.

  Glyph centres need exact advances. Fonts carry them in
  /Widths or /W; the standard 14 base fonts get them from
  their AFM tables. Text whose advances are guessed fails
  with core::ApplicationError if it shares a line with a
  mark.

  A document with no hit at all is returned unchanged.
*/
class PdfRedactor {
  public:
    explicit PdfRedactor(const config::EngineConfig& config) : m_config(config) {}

    std::vector<uint8_t> Apply(const std::vector<uint8_t>& bytes,
                               const core::AcceptedRedactionSet& accepted) const;

    // Same as above with a layout computed earlier for these bytes.
    std::vector<uint8_t> Apply(const std::vector<uint8_t>& bytes,
                               const core::AcceptedRedactionSet& accepted,
                               const layout::DocumentLayout& layout) const;

    // Padded marks per page index, in page space (top-left origin).
    std::map<int, std::vector<core::Rect>> CollectMarks(const std::vector<uint8_t>& bytes,
                                                        const core::AcceptedRedactionSet& accepted,
                                                        const layout::DocumentLayout& layout) const;

  private:
    std::vector<uint8_t> rewrite(const std::vector<uint8_t>& bytes,
                                 const std::map<int, std::vector<core::Rect>>& marks) const;
    void checkMarksClear(const std::vector<uint8_t>& redacted,
                         const std::map<int, std::vector<core::Rect>>& marks) const;

    config::EngineConfig m_config;
};

} // namespace redaction
} // namespace docredact

#endif // DOCREDACT_REDACTION_PDF_REDACTOR_HPP
