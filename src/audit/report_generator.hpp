#ifndef DOCREDACT_AUDIT_REPORT_GENERATOR_HPP
#define DOCREDACT_AUDIT_REPORT_GENERATOR_HPP

#include <sstream>
#include <string>
#include "core/accepted_redaction_set.hpp"
#include "core/types.hpp"

namespace docredact {
namespace audit {

// What a report describes: one verified (or rejected) redaction run.
struct ReportInput {
    std::string originalPath;
    std::string redactedPath;
    std::string originalSha256;
    std::string redactedSha256;
    core::FormatKind format = core::FormatKind::Text;
    bool verified = false;
    size_t survivingCount = 0;
    core::AcceptedRedactionSet accepted;
};

/*
  ReportGenerator
  ----
  Turns a ReportInput into a document for the operator. Reports
  never contain the redacted literals, only their metadata.
*/
class ReportGenerator {
  public:
    virtual ~ReportGenerator() = default;
    virtual std::string Generate(const ReportInput& input) const = 0;
};

class TextReportGenerator : public ReportGenerator {
  public:
    std::string Generate(const ReportInput& input) const override {
        std::ostringstream out;
        out << "Redaction report\n";
        out << "================\n";
        out << "Original : " << input.originalPath << "\n";
        out << "  sha256 : " << input.originalSha256 << "\n";
        out << "Redacted : " << input.redactedPath << "\n";
        out << "  sha256 : " << input.redactedSha256 << "\n";
        out << "Format   : " << core::ToString(input.format) << "\n";
        if (input.verified) {
            out << "Verdict  : VERIFIED\n";
        } else {
            out << "Verdict  : FAILED (" << input.survivingCount << " accepted text(s) survived)\n";
        }
        out << "\nRedactions (" << input.accepted.Size() << "):\n";
        size_t index = 1;
        for (const auto& item : input.accepted) {
            out << "  #" << index++ << "  " << core::ToString(item.kind) << "  confidence " << item.confidence
                << "%  length " << item.text.size();
            if (!item.reason.empty())
                out << "  reason: " << item.reason;
            out << "\n";
        }
        return out.str();
    }
};

} // namespace audit
} // namespace docredact

#endif // DOCREDACT_AUDIT_REPORT_GENERATOR_HPP
