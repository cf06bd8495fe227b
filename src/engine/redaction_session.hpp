#ifndef DOCREDACT_ENGINE_REDACTION_SESSION_HPP
#define DOCREDACT_ENGINE_REDACTION_SESSION_HPP

#include <string>
#include <vector>
#include "core/accepted_redaction_set.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "matching/match_resolver.hpp"
#include "matching/suggestion_provider.hpp"
#include "util/logger.hpp"

namespace docredact {
namespace engine {

/*
  RedactionSession
  --------------------------------
  Operator state for one document between loading and applying:

    pending suggestions   last result of RequestSuggestions
    pending contextual    last result of ProposeContextual, together with
                          the custom request that produced it
    accepted              the AcceptedRedactionSet handed to the engine

  Nothing moves into the accepted set without an explicit Accept or Add.
  Accepting a duplicate (text, kind) returns false and leaves the set
  unchanged.
*/
class RedactionSession
{
public:
    explicit RedactionSession(std::string documentText)
        : m_documentText(std::move(documentText))
    {}

    const std::string& DocumentText() const { return m_documentText; }

    const std::vector<core::RedactionRequest>& RequestSuggestions(matching::SuggestionProvider& provider,
                                                                  int sensitivity)
    {
        m_suggestions = provider.Suggest(m_documentText, sensitivity);
        util::logger::info("[RedactionSession] " + std::to_string(m_suggestions.size()) + " suggestion(s) pending");
        return m_suggestions;
    }

    bool AcceptSuggestion(size_t index)
    {
        if (index >= m_suggestions.size()) {
            throw core::SessionError("suggestion index " + std::to_string(index) + " out of range");
        }
        return accept(m_suggestions[index]);
    }

    bool AddCustom(const std::string& text, core::RedactionKind kind, const std::string& reason = std::string())
    {
        return accept(core::RedactionRequest{text, kind, 100, reason});
    }

    // -------------------------------------------------------------------------
    // Asks the provider for spans related to `text`. The request itself is
    // remembered so AcceptContextual can give matches its kind and reason.
    // -------------------------------------------------------------------------
    const std::vector<core::ContextualMatch>& ProposeContextual(matching::SuggestionProvider& provider,
                                                                const std::string& text,
                                                                core::RedactionKind kind,
                                                                const std::string& reason = std::string())
    {
        if (text.empty()) {
            throw core::SessionError("contextual search needs a non-empty seed");
        }
        m_pendingCustom = core::RedactionRequest{text, kind, 100, reason};
        m_contextual = m_resolver.FindContextual(provider, m_documentText, text, kind);
        util::logger::info("[RedactionSession] " + std::to_string(m_contextual.size())
                           + " contextual match(es) pending");
        return m_contextual;
    }

    bool AcceptContextual(size_t index)
    {
        if (index >= m_contextual.size()) {
            throw core::SessionError("contextual match index " + std::to_string(index) + " out of range");
        }
        const core::ContextualMatch& match = m_contextual[index];
        const std::string& reason = m_pendingCustom.reason.empty() ? match.reason : m_pendingCustom.reason;
        return accept(core::RedactionRequest{match.text, m_pendingCustom.kind, match.confidence, reason});
    }

    core::RedactionRequest Remove(size_t index) { return m_accepted.RemoveAt(index); }

    const std::vector<core::RedactionRequest>& PendingSuggestions() const { return m_suggestions; }
    const std::vector<core::ContextualMatch>& PendingContextual() const { return m_contextual; }
    const core::AcceptedRedactionSet& Accepted() const { return m_accepted; }

private:
    bool accept(const core::RedactionRequest& request)
    {
        if (!m_accepted.Add(request)) {
            util::logger::warn("[RedactionSession] Redaction of kind " + core::ToString(request.kind)
                               + " is already in the list");
            return false;
        }
        util::logger::debug("[RedactionSession] Accepted " + core::ToString(request.kind) + " redaction, length "
                            + std::to_string(request.text.size()));
        return true;
    }

    std::string m_documentText;
    matching::MatchResolver m_resolver;
    std::vector<core::RedactionRequest> m_suggestions;
    std::vector<core::ContextualMatch> m_contextual;
    core::RedactionRequest m_pendingCustom;
    core::AcceptedRedactionSet m_accepted;
};

} // namespace engine
} // namespace docredact

#endif // DOCREDACT_ENGINE_REDACTION_SESSION_HPP
