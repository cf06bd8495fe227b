#ifndef DOCREDACT_REDACTION_REDACTION_APPLIER_HPP
#define DOCREDACT_REDACTION_REDACTION_APPLIER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "config/engine_config.hpp"
#include "core/accepted_redaction_set.hpp"
#include "core/document.hpp"
#include "core/errors.hpp"
#include "redaction/docx_redactor.hpp"
#include "redaction/pdf_redactor.hpp"
#include "redaction/text_redactor.hpp"
#include "util/logger.hpp"

namespace docredact {
namespace redaction {

/*
  RedactionApplier
  --------------------------------
  Routes a document to the redactor for its format and returns the
  redacted bytes. The input Document is never modified; each redactor
  works on a working copy.

  Any failure is fatal for the call and surfaces as
  core::ApplicationError, so no partial output is ever returned.
*/
class RedactionApplier
{
public:
    explicit RedactionApplier(const config::EngineConfig& config)
        : m_config(config)
    {}

    std::vector<uint8_t> Apply(const core::Document& document, const core::AcceptedRedactionSet& accepted) const
    {
        util::logger::info("[RedactionApplier] Applying " + std::to_string(accepted.Size()) + " redaction(s) to "
                           + core::ToString(document.Format()) + " input of " + std::to_string(document.Size())
                           + " bytes");
        const std::vector<uint8_t> working = document.WorkingCopy();
        try {
            switch (document.Format()) {
            case core::FormatKind::Pdf:
                return PdfRedactor(m_config).Apply(working, accepted);
            case core::FormatKind::Docx:
                return DocxRedactor(m_config.docxFillerGlyph, m_config.docxRedactionFont,
                                    m_config.docxRedactionFontSize)
                    .Apply(working, accepted);
            case core::FormatKind::Text:
                return TextRedactor(m_config.textRedactionMarker).Apply(working, accepted);
            }
        }
        catch (const core::ApplicationError&) {
            throw;
        }
        catch (const core::RedactionError& e) {
            throw core::ApplicationError(e.what());
        }
        throw core::ApplicationError("unknown document format");
    }

private:
    config::EngineConfig m_config;
};

} // namespace redaction
} // namespace docredact

#endif // DOCREDACT_REDACTION_REDACTION_APPLIER_HPP
