#ifndef DOCREDACT_REDACTION_TEXT_REDACTOR_HPP
#define DOCREDACT_REDACTION_TEXT_REDACTOR_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include "core/accepted_redaction_set.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace docredact {
namespace redaction {

/*
  TextRedactor
  --------------------------------
  Plain text redaction by substitution.

  Every occurrence of every accepted literal is collected, then the spans
  are swept in position order. A span inside an earlier one is absorbed;
  a span that only partly overlaps one is merged into it. Spans that
  merely touch stay separate. The output is built in a single forward
  pass over the surviving spans.
*/
class TextRedactor
{
public:
    explicit TextRedactor(std::string marker = "[REDACTED]")
        : m_marker(std::move(marker))
    {}

    struct Span
    {
        size_t begin;
        size_t end;
    };

    // -------------------------------------------------------------------------
    // Claimed spans for the given literals, sorted by position, disjoint.
    // -------------------------------------------------------------------------
    static std::vector<Span> ClaimSpans(const std::string& text, const std::vector<std::string>& literals)
    {
        std::vector<Span> found;
        for (const auto& literal : literals) {
            if (literal.empty()) {
                continue;
            }
            // Overlapping occurrences of the same literal are all collected.
            for (size_t pos = text.find(literal); pos != std::string::npos; pos = text.find(literal, pos + 1)) {
                found.push_back(Span{pos, pos + literal.size()});
            }
        }
        std::sort(found.begin(), found.end(), [](const Span& a, const Span& b) {
            if (a.begin != b.begin) return a.begin < b.begin;
            return a.end > b.end;
        });

        std::vector<Span> claimed;
        for (const auto& span : found) {
            if (!claimed.empty() && span.begin < claimed.back().end) {
                claimed.back().end = std::max(claimed.back().end, span.end);
            }
            else {
                claimed.push_back(span);
            }
        }
        return claimed;
    }

    // Replaces every span with `replacement(span)`, copying the text between.
    template <typename ReplacementFn>
    static std::string Substitute(const std::string& text, const std::vector<Span>& spans, ReplacementFn replacement)
    {
        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const auto& span : spans) {
            out.append(text, cursor, span.begin - cursor);
            out += replacement(span);
            cursor = span.end;
        }
        out.append(text, cursor, std::string::npos);
        return out;
    }

    std::string Redact(const std::string& text, const core::AcceptedRedactionSet& accepted) const
    {
        std::vector<Span> spans = ClaimSpans(text, accepted.Literals());
        std::string out = Substitute(text, spans, [this](const Span&) -> const std::string& { return m_marker; });
        util::logger::info("[TextRedactor] Replaced " + std::to_string(spans.size()) + " span(s).");
        return out;
    }

    std::vector<uint8_t> Apply(const std::vector<uint8_t>& bytes, const core::AcceptedRedactionSet& accepted) const
    {
        if (!util::utf8::isValid(bytes.data(), bytes.size())) {
            throw core::ApplicationError("text input is not valid UTF-8");
        }
        std::string redacted = Redact(std::string(bytes.begin(), bytes.end()), accepted);
        return std::vector<uint8_t>(redacted.begin(), redacted.end());
    }

    const std::string& Marker() const { return m_marker; }

private:
    std::string m_marker;
};

} // namespace redaction
} // namespace docredact

#endif // DOCREDACT_REDACTION_TEXT_REDACTOR_HPP
