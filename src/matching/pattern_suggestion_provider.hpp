#ifndef DOCREDACT_MATCHING_PATTERN_SUGGESTION_PROVIDER_HPP
#define DOCREDACT_MATCHING_PATTERN_SUGGESTION_PROVIDER_HPP

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "matching/suggestion_provider.hpp"
#include "util/logger.hpp"

/**
 * @file pattern_suggestion_provider.hpp
 * @brief A deterministic SuggestionProvider built on regular expressions.
 *
 * DESIGN GOALS:
 *   - Detect common sensitive values: SSNs, phone numbers, e-mail addresses,
 *     payment card numbers (Luhn checked) and credential assignments.
 *   - Every detector carries a fixed confidence. A candidate is returned when
 *     confidence >= 100 - sensitivity, so sensitivity 0 yields only certain
 *     hits and 100 yields everything.
 *   - Contextual variants of a seed are generated from simple name and
 *     number rules and proposed only when they occur in the document.
 *
 * USAGE EXAMPLE:
 *   @code
 *   docredact::matching::PatternSuggestionProvider provider;
 *   auto candidates = provider.Suggest(text, 50);
 *   @endcode
 */

namespace docredact {
namespace matching {

/**
 * @class PatternSuggestionProvider
 * @brief Rule-based candidate generator used when no model-backed provider is attached.
 */
class PatternSuggestionProvider : public SuggestionProvider
{
public:
    PatternSuggestionProvider() = default;
    ~PatternSuggestionProvider() override = default;

    /**
     * @brief Scan @p documentText and return candidates in order of first appearance.
     * @param sensitivity 0..100, clamped.
     */
    std::vector<core::RedactionRequest> Suggest(const std::string &documentText, int sensitivity) override
    {
        const int threshold = 100 - std::max(0, std::min(100, sensitivity));

        struct Hit
        {
            size_t pos;
            core::RedactionRequest request;
        };
        std::vector<Hit> hits;

        auto scan = [&](const std::regex &pattern, core::RedactionKind kind, int confidence,
                        const std::string &reason, int group, bool luhn) {
            if (confidence < threshold) {
                return;
            }
            for (auto it = std::sregex_iterator(documentText.begin(), documentText.end(), pattern);
                 it != std::sregex_iterator(); ++it) {
                const std::smatch &m = *it;
                std::string value = m.str(group);
                if (value.empty() || (luhn && !passesLuhn(value))) {
                    continue;
                }
                hits.push_back(Hit{static_cast<size_t>(m.position(group)),
                                   core::RedactionRequest{value, kind, confidence, reason}});
            }
        };

        // Patterns below follow the ones used for PII scrubbing elsewhere in
        // this codebase, extended with card numbers and credentials.
        static const std::regex ssnRegex(R"(\b\d{3}-\d{2}-\d{4}\b)");
        static const std::regex phoneRegex(R"((\(\d{3}\)\s?\d{3}-\d{4}|\b\d{3}-\d{3}-\d{4}\b))");
        static const std::regex emailRegex(R"([\w\.\-+]+@[\w\-]+(\.[\w\-]+)+)");
        static const std::regex cardRegex(R"(\b\d{4}[ -]?\d{4}[ -]?\d{4}[ -]?\d{1,4}\b)");
        static const std::regex credentialRegex(
            R"((?:password|passwd|pwd|api[_-]?key|secret|token)\s*[:=]\s*([^\s,;]+))", std::regex::icase);

        scan(ssnRegex, core::RedactionKind::PII, 95, "Matches the US social security number format", 0, false);
        scan(emailRegex, core::RedactionKind::PII, 90, "E-mail address", 0, false);
        scan(phoneRegex, core::RedactionKind::PII, 85, "Matches a US phone number format", 0, false);
        scan(cardRegex, core::RedactionKind::Financial, 90, "Payment card number (Luhn valid)", 0, true);
        scan(credentialRegex, core::RedactionKind::Credentials, 80, "Value assigned to a credential field", 1, false);

        std::stable_sort(hits.begin(), hits.end(), [](const Hit &a, const Hit &b) { return a.pos < b.pos; });

        std::vector<core::RedactionRequest> out;
        for (auto &hit : hits) {
            if (std::find(out.begin(), out.end(), hit.request) == out.end()) {
                out.push_back(std::move(hit.request));
            }
        }
        util::logger::info("[PatternSuggestionProvider] " + std::to_string(out.size())
                           + " candidate(s) at sensitivity " + std::to_string(sensitivity));
        return out;
    }

    /**
     * @brief Variants of @p seedText that appear verbatim in @p documentText.
     */
    std::vector<core::ContextualMatch> FindContextual(const std::string &documentText,
                                                      const std::string &seedText,
                                                      core::RedactionKind kind) override
    {
        std::vector<core::ContextualMatch> proposals;
        auto propose = [&](const std::string &variant, int confidence, const std::string &reason) {
            if (variant.empty() || variant == seedText || documentText.find(variant) == std::string::npos) {
                return;
            }
            for (const auto &p : proposals) {
                if (p.text == variant) {
                    return;
                }
            }
            proposals.push_back(core::ContextualMatch{variant, confidence, reason});
        };

        propose(toUpper(seedText), 90, "Upper-case form of the selected text");
        propose(toLower(seedText), 85, "Lower-case form of the selected text");

        std::vector<std::string> parts = splitWords(seedText);
        if (isNumeric(seedText)) {
            std::string digits;
            for (char c : seedText) {
                if (std::isdigit(static_cast<unsigned char>(c))) {
                    digits += c;
                }
            }
            propose(digits, 90, "Same number without separators");
            propose(replaceSeparators(seedText, ' '), 90, "Same number with spaces");
            propose(replaceSeparators(seedText, '-'), 90, "Same number with dashes");
            propose(replaceSeparators(seedText, '.'), 85, "Same number with dots");
        }
        else if (parts.size() >= 2 && kind != core::RedactionKind::Credentials) {
            const std::string &first = parts.front();
            const std::string &last = parts.back();
            static const char *honorifics[] = {"Mr. ", "Mrs. ", "Ms. ", "Dr. ", "Mr ", "Mrs ", "Ms ", "Dr "};
            for (const char *h : honorifics) {
                propose(std::string(h) + last, 85, "Honorific with surname");
            }
            propose(first.substr(0, 1) + ". " + last, 80, "Initial with surname");
            propose(last + ", " + first, 85, "Surname-first form");
            propose(toTitle(seedText), 85, "Title-case form of the selected text");
            propose(last, 60, "Surname alone");
            propose(first, 50, "Given name alone");
        }

        util::logger::debug("[PatternSuggestionProvider] " + std::to_string(proposals.size())
                            + " contextual variant(s) for a seed of length " + std::to_string(seedText.size()));
        return proposals;
    }

private:
    static bool passesLuhn(const std::string &value)
    {
        std::vector<int> digits;
        for (char c : value) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits.push_back(c - '0');
            }
        }
        if (digits.size() < 13 || digits.size() > 19) {
            return false;
        }
        int sum = 0;
        bool doubleIt = false;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            int d = *it;
            if (doubleIt) {
                d *= 2;
                if (d > 9) {
                    d -= 9;
                }
            }
            sum += d;
            doubleIt = !doubleIt;
        }
        return sum % 10 == 0;
    }

    static bool isNumeric(const std::string &s)
    {
        bool anyDigit = false;
        for (char c : s) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isdigit(uc)) {
                anyDigit = true;
            }
            else if (c != '-' && c != ' ' && c != '.' && c != '(' && c != ')') {
                return false;
            }
        }
        return anyDigit;
    }

    static std::string replaceSeparators(const std::string &s, char sep)
    {
        std::string out;
        for (char c : s) {
            if (c == '-' || c == ' ' || c == '.') {
                out += sep;
            }
            else {
                out += c;
            }
        }
        return out;
    }

    static std::vector<std::string> splitWords(const std::string &s)
    {
        std::vector<std::string> parts;
        std::istringstream in(s);
        std::string w;
        while (in >> w) {
            parts.push_back(w);
        }
        return parts;
    }

    static std::string toUpper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    static std::string toLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string toTitle(std::string s)
    {
        bool startOfWord = true;
        for (auto &ch : s) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (std::isalpha(c)) {
                ch = static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c));
                startOfWord = false;
            }
            else {
                startOfWord = true;
            }
        }
        return s;
    }
};

} // namespace matching
} // namespace docredact

#endif // DOCREDACT_MATCHING_PATTERN_SUGGESTION_PROVIDER_HPP
