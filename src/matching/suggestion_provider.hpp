#ifndef DOCREDACT_MATCHING_SUGGESTION_PROVIDER_HPP
#define DOCREDACT_MATCHING_SUGGESTION_PROVIDER_HPP

#include <string>
#include <vector>
#include "core/types.hpp"

namespace docredact {
namespace matching {

/*
  SuggestionProvider
  --------------------------------
  Source of candidate redactions. Implementations may be a language model
  client or a rule set; the engine only relies on this contract:

    Suggest(text, sensitivity)     candidates for the whole document.
                                   sensitivity 0..100, higher means more
                                   (and less certain) candidates.
    FindContextual(text, seed, k)  spans that refer to the same thing as
                                   seed (variants, abbreviations, ...).

  Confidence and reason are opaque metadata. Nothing a provider returns
  is applied without an explicit accept.
*/
class SuggestionProvider
{
public:
    virtual ~SuggestionProvider() = default;

    virtual std::vector<core::RedactionRequest> Suggest(const std::string& documentText, int sensitivity) = 0;

    virtual std::vector<core::ContextualMatch> FindContextual(const std::string& documentText,
                                                              const std::string& seedText,
                                                              core::RedactionKind kind) = 0;
};

} // namespace matching
} // namespace docredact

#endif // DOCREDACT_MATCHING_SUGGESTION_PROVIDER_HPP
