#include "engine/redaction_engine.hpp"
#include "audit/audit_store.hpp"
#include "core/errors.hpp"
#include "core/file_type_resolver.hpp"
#include "extraction/text_extractor.hpp"
#include "layout/layout_analyzer.hpp"
#include "redaction/redaction_applier.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/secure_temp_file.hpp"
#include "verification/redaction_verifier.hpp"
#include <stdexcept>
#include <sys/stat.h>

namespace docredact {
namespace engine {

namespace {

bool pathExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

void requireNonEmpty(const core::AcceptedRedactionSet& accepted) {
    if (accepted.Empty())
        throw core::SessionError("no accepted redactions to apply");
}

} // namespace

RedactionEngine::RedactionEngine(const config::EngineConfig& config) : m_config(config) {
    util::logger::setLogLevel(util::logger::parseLogLevel(m_config.logLevel));
    if (!m_config.logFile.empty())
        util::logger::enableFileOutput(m_config.logFile);
}

core::Document RedactionEngine::Load(const std::string& path) const {
    core::FileTypeResolver resolver(m_config.maxInputBytes);
    const core::FormatKind format = resolver.Resolve(path);
    core::Document document(core::Document::ReadFileBytes(path), format, path);
    util::logger::info("[RedactionEngine] Loaded " + core::ToString(format) + " document, " +
                       std::to_string(document.Size()) + " bytes.");
    return document;
}

std::string RedactionEngine::Preview(const core::Document& document) const {
    return extraction::TextExtractor().Extract(document);
}

layout::DocumentLayout RedactionEngine::AnalyzeLayout(const core::Document& document) const {
    return layout::LayoutAnalyzer(m_config).Analyze(document);
}

RedactedArtifact RedactionEngine::Redact(const core::Document& document,
                                         const core::AcceptedRedactionSet& accepted) const {
    core::VerificationResult verification;
    std::vector<uint8_t> bytes = applyAndVerify(document, accepted, verification);
    std::string digest = util::hashing::sha256(bytes);
    return RedactedArtifact(std::move(bytes), document.Format(), std::move(digest), std::move(verification));
}

RedactedArtifact RedactionEngine::RedactToFile(const std::string& inputPath,
                                               const core::AcceptedRedactionSet& accepted,
                                               const std::string& outputPath) const {
    requireNonEmpty(accepted);
    if (pathExists(outputPath))
        throw core::InputError(core::InputErrorCode::OutputExists, "refusing to overwrite " + outputPath);

    const core::Document document = Load(inputPath);
    const std::vector<uint8_t> redacted = redaction::RedactionApplier(m_config).Apply(document, accepted);

    std::vector<uint8_t> onDisk;
    try {
        util::SecureTempFile temp(outputPath);
        temp.write(redacted);
        onDisk = temp.readBack();

        // The bytes that will be committed are the ones verified.
        core::VerificationResult verification =
            verification::RedactionVerifier().Verify(onDisk, document.Format(), accepted);
        if (!verification.verified)
            throw core::VerificationFailure(verification.surviving);

        std::string digest = util::hashing::sha256(onDisk);
        if (!temp.commit(outputPath))
            throw core::InputError(core::InputErrorCode::OutputExists, "destination appeared during redaction: " +
                                                                          outputPath);

        RedactedArtifact artifact(std::move(onDisk), document.Format(), std::move(digest), std::move(verification));
        artifact.m_path = outputPath;
        util::logger::info("[RedactionEngine] Wrote verified output (" + std::to_string(artifact.Bytes().size()) +
                           " bytes).");
        recordAudit(document, artifact, accepted);
        return artifact;
    } catch (const core::RedactionError&) {
        throw;
    } catch (const std::runtime_error& e) {
        // Temp file I/O; the destructor has already removed the temp file.
        throw core::ApplicationError(e.what());
    }
}

std::string RedactionEngine::Report(const core::Document& original, const RedactedArtifact& artifact,
                                    const core::AcceptedRedactionSet& accepted,
                                    const audit::ReportGenerator& generator) const {
    audit::ReportInput input;
    input.originalPath = original.SourcePath();
    input.redactedPath = artifact.Path();
    input.originalSha256 = util::hashing::sha256(original.Bytes());
    input.redactedSha256 = artifact.Sha256();
    input.format = artifact.Format();
    input.verified = artifact.Verification().verified;
    input.survivingCount = artifact.Verification().surviving.size();
    input.accepted = accepted;
    return generator.Generate(input);
}

std::vector<uint8_t> RedactionEngine::applyAndVerify(const core::Document& document,
                                                     const core::AcceptedRedactionSet& accepted,
                                                     core::VerificationResult& verification) const {
    requireNonEmpty(accepted);
    std::vector<uint8_t> redacted = redaction::RedactionApplier(m_config).Apply(document, accepted);
    verification = verification::RedactionVerifier().Verify(redacted, document.Format(), accepted);
    if (!verification.verified)
        throw core::VerificationFailure(verification.surviving);
    return redacted;
}

void RedactionEngine::recordAudit(const core::Document& original, const RedactedArtifact& artifact,
                                  const core::AcceptedRedactionSet& accepted) const {
    if (m_config.auditDatabasePath.empty())
        return;

    audit::AuditRecord record;
    record.originalPath = original.SourcePath();
    record.redactedPath = artifact.Path();
    record.originalSha256 = util::hashing::sha256(original.Bytes());
    record.redactedSha256 = artifact.Sha256();
    record.format = core::ToString(artifact.Format());
    record.redactionCount = accepted.Size();
    try {
        record.redactedText = extraction::TextExtractor().Extract(artifact.Bytes(), artifact.Format());
    } catch (const core::ExtractionError& e) {
        util::logger::warn(std::string("[RedactionEngine] Audit entry stored without text: ") + e.what());
    }

    // The output is already committed at this point.
    if (audit::AuditStore(m_config.auditDatabasePath).Record(record) < 0)
        util::logger::error("[RedactionEngine] Audit entry could not be recorded.");
}

} // namespace engine
} // namespace docredact
