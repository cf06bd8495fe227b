#ifndef DOCREDACT_ENGINE_REDACTION_ENGINE_HPP
#define DOCREDACT_ENGINE_REDACTION_ENGINE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "audit/report_generator.hpp"
#include "config/engine_config.hpp"
#include "core/accepted_redaction_set.hpp"
#include "core/document.hpp"
#include "core/types.hpp"
#include "layout/layout_types.hpp"

namespace docredact {
namespace engine {

/*
  RedactedArtifact
  ----
  Output of a redaction that passed verification. Only the engine
  can create one, so holding an artifact means the bytes were
  checked.
*/
class RedactedArtifact {
  public:
    const std::vector<uint8_t>& Bytes() const { return m_bytes; }
    core::FormatKind Format() const { return m_format; }
    const std::string& Sha256() const { return m_sha256; }
    // Destination path when written by RedactToFile, empty otherwise.
    const std::string& Path() const { return m_path; }
    const core::VerificationResult& Verification() const { return m_verification; }

  private:
    friend class RedactionEngine;
    RedactedArtifact(std::vector<uint8_t> bytes, core::FormatKind format, std::string sha256,
                     core::VerificationResult verification)
        : m_bytes(std::move(bytes)), m_format(format), m_sha256(std::move(sha256)),
          m_verification(std::move(verification)) {}

    std::vector<uint8_t> m_bytes;
    core::FormatKind m_format;
    std::string m_sha256;
    std::string m_path;
    core::VerificationResult m_verification;
};

/*
  RedactionEngine
  --------------------------------------------------------
  Entry point of the library. One call handles one document
  and nothing is shared between calls.

    Load          resolve the format and read the bytes
    Preview       flat text of a document
    AnalyzeLayout page geometry of a PDF
    Redact        apply the accepted set, then verify; an
                  unverified result never leaves this call
    RedactToFile  same, written through a secure temp file
                  beside the destination, verified from disk
                  and renamed into place only on success

  An empty accepted set is a SessionError. When an audit
  database is configured, every committed file is recorded.
*/
class RedactionEngine {
  public:
    explicit RedactionEngine(const config::EngineConfig& config);

    core::Document Load(const std::string& path) const;
    std::string Preview(const core::Document& document) const;
    layout::DocumentLayout AnalyzeLayout(const core::Document& document) const;

    RedactedArtifact Redact(const core::Document& document, const core::AcceptedRedactionSet& accepted) const;

    RedactedArtifact RedactToFile(const std::string& inputPath, const core::AcceptedRedactionSet& accepted,
                                  const std::string& outputPath) const;

    // Human-readable summary of a finished run.
    std::string Report(const core::Document& original, const RedactedArtifact& artifact,
                       const core::AcceptedRedactionSet& accepted,
                       const audit::ReportGenerator& generator) const;

    const config::EngineConfig& Config() const { return m_config; }

  private:
    std::vector<uint8_t> applyAndVerify(const core::Document& document, const core::AcceptedRedactionSet& accepted,
                                        core::VerificationResult& verification) const;
    void recordAudit(const core::Document& original, const RedactedArtifact& artifact,
                     const core::AcceptedRedactionSet& accepted) const;

    config::EngineConfig m_config;
};

} // namespace engine
} // namespace docredact

#endif // DOCREDACT_ENGINE_REDACTION_ENGINE_HPP
