#ifndef DOCREDACT_VERIFICATION_REDACTION_VERIFIER_HPP
#define DOCREDACT_VERIFICATION_REDACTION_VERIFIER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "core/accepted_redaction_set.hpp"
#include "core/types.hpp"
#include "extraction/text_extractor.hpp"
#include "util/logger.hpp"

namespace docredact {
namespace verification {

/*
  RedactionVerifier
  --------------------------------
  Post-apply gate. The redacted bytes are extracted again with the same
  TextExtractor used for the original, and every accepted literal still
  found in that text is reported. The check is strict: a literal that
  happens to occur inside the replacement marker also fails.
*/
class RedactionVerifier
{
public:
    core::VerificationResult Verify(const std::vector<uint8_t>& redactedBytes, core::FormatKind format,
                                    const core::AcceptedRedactionSet& accepted) const
    {
        const std::string text = m_extractor.Extract(redactedBytes, format);
        std::vector<std::string> surviving;
        for (const auto& literal : accepted.Literals()) {
            if (text.find(literal) != std::string::npos) {
                surviving.push_back(literal);
            }
        }
        if (surviving.empty()) {
            util::logger::info("[RedactionVerifier] Verified: no accepted text remains.");
            return core::VerificationResult::Verified();
        }
        util::logger::error("[RedactionVerifier] " + std::to_string(surviving.size())
                            + " accepted text(s) still present after redaction.");
        return core::VerificationResult::Failed(std::move(surviving));
    }

private:
    extraction::TextExtractor m_extractor;
};

} // namespace verification
} // namespace docredact

#endif // DOCREDACT_VERIFICATION_REDACTION_VERIFIER_HPP
