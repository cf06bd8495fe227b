#ifndef DOCREDACT_MATCHING_MATCH_RESOLVER_HPP
#define DOCREDACT_MATCHING_MATCH_RESOLVER_HPP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "layout/layout_types.hpp"
#include "matching/suggestion_provider.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace docredact {
namespace matching {

/*
  MatchResolver
  --------------------------------
  Turns a request into concrete locations.

    Resolve         exact, case-sensitive, non-overlapping byte matches
                    in a flat text, left to right.
    FindContextual  asks a SuggestionProvider for related spans and
                    cleans the answer (no empties, no seed, no repeats).
    LocateInLayout  maps a phrase to page regions through the layout's
                    text blocks. A word that merely contains the target
                    counts only when the target sits on word boundaries
                    inside it ("555" in "(555)", not "John" in "Johnson").
*/
class MatchResolver
{
public:
    std::vector<core::Occurrence> Resolve(const std::string& flatText, const core::RedactionRequest& request) const
    {
        std::vector<core::Occurrence> out;
        const std::string& needle = request.text;
        if (needle.empty() || flatText.empty()) {
            return out;
        }
        size_t pos = flatText.find(needle);
        while (pos != std::string::npos) {
            out.push_back(core::Occurrence{needle, pos, needle.size()});
            pos = flatText.find(needle, pos + needle.size());
        }
        return out;
    }

    std::vector<core::ContextualMatch> FindContextual(SuggestionProvider& provider,
                                                      const std::string& flatText,
                                                      const std::string& seedText,
                                                      core::RedactionKind kind) const
    {
        std::vector<core::ContextualMatch> cleaned;
        if (seedText.empty()) {
            return cleaned;
        }
        for (auto& match : provider.FindContextual(flatText, seedText, kind)) {
            if (match.text.empty() || match.text == seedText) {
                continue;
            }
            bool seen = std::any_of(cleaned.begin(), cleaned.end(),
                                    [&](const core::ContextualMatch& m) { return m.text == match.text; });
            if (!seen) {
                cleaned.push_back(std::move(match));
            }
        }
        util::logger::debug("[MatchResolver] Contextual proposals: " + std::to_string(cleaned.size()));
        return cleaned;
    }

    // -------------------------------------------------------------------------
    // Regions covering `text` on every page. Multi-word phrases match across
    // consecutive words of one block and yield one region per line.
    // -------------------------------------------------------------------------
    std::vector<core::PageRegion> LocateInLayout(const layout::DocumentLayout& documentLayout,
                                                 const std::string& text) const
    {
        std::vector<core::PageRegion> regions;
        std::vector<std::string> tokens = splitWhitespace(text);
        if (tokens.empty()) {
            return regions;
        }

        for (const auto& page : documentLayout.pages) {
            for (const auto& block : page.textBlocks) {
                const auto& words = block.words;
                if (words.size() < tokens.size()) {
                    continue;
                }
                for (size_t start = 0; start + tokens.size() <= words.size(); ++start) {
                    std::vector<core::Rect> pieces;
                    if (!matchAt(words, start, tokens, pieces)) {
                        continue;
                    }
                    appendLineRegions(page.pageIndex, pieces, regions);
                }
            }
        }
        return regions;
    }

    // True when `target` occurs in `word` with non-alphanumeric (or no)
    // characters on both sides. Reports the byte offset through pos.
    static bool ContainsOnWordBoundary(const std::string& word, const std::string& target, size_t& pos)
    {
        if (target.empty()) {
            return false;
        }
        size_t at = word.find(target);
        while (at != std::string::npos) {
            bool leftOk = (at == 0) || !isWordByte(static_cast<unsigned char>(word[at - 1]));
            size_t end = at + target.size();
            bool rightOk = (end == word.size()) || !isWordByte(static_cast<unsigned char>(word[end]));
            if (leftOk && rightOk) {
                pos = at;
                return true;
            }
            at = word.find(target, at + 1);
        }
        return false;
    }

private:
    static bool isWordByte(unsigned char c)
    {
        return c >= 0x80 || std::isalnum(c) != 0;
    }

    static std::vector<std::string> splitWhitespace(const std::string& text)
    {
        std::vector<std::string> tokens;
        std::istringstream in(text);
        std::string tok;
        while (in >> tok) {
            tokens.push_back(tok);
        }
        return tokens;
    }

    // Horizontal slice of a word box covering bytes [from, to) of its text,
    // proportional to code point positions.
    static core::Rect subBox(const layout::PositionedWord& word, size_t from, size_t to)
    {
        const size_t total = util::utf8::codePointCount(word.text);
        if (total == 0 || (from == 0 && to >= word.text.size())) {
            return word.bbox;
        }
        const double before = static_cast<double>(util::utf8::codePointCount(word.text.substr(0, from)));
        const double upto = static_cast<double>(util::utf8::codePointCount(word.text.substr(0, to)));
        const double w = word.bbox.Width();
        core::Rect r = word.bbox;
        r.x0 = word.bbox.x0 + w * before / static_cast<double>(total);
        r.x1 = word.bbox.x0 + w * upto / static_cast<double>(total);
        return r;
    }

    static bool matchAt(const std::vector<layout::PositionedWord>& words, size_t start,
                        const std::vector<std::string>& tokens, std::vector<core::Rect>& pieces)
    {
        const size_t n = tokens.size();
        if (n == 1) {
            size_t pos = 0;
            const auto& w = words[start];
            if (w.text == tokens[0]) {
                pieces.push_back(w.bbox);
                return true;
            }
            if (ContainsOnWordBoundary(w.text, tokens[0], pos)) {
                pieces.push_back(subBox(w, pos, pos + tokens[0].size()));
                return true;
            }
            return false;
        }

        // First word must end with the first token, last word must start
        // with the last token, and the words between must be equal.
        const auto& first = words[start];
        const auto& last = words[start + n - 1];
        const std::string& t0 = tokens.front();
        const std::string& tn = tokens.back();
        if (first.text.size() < t0.size() || last.text.size() < tn.size()) {
            return false;
        }
        const size_t firstPos = first.text.size() - t0.size();
        if (first.text.compare(firstPos, t0.size(), t0) != 0 ||
            (firstPos > 0 && isWordByte(static_cast<unsigned char>(first.text[firstPos - 1])))) {
            return false;
        }
        if (last.text.compare(0, tn.size(), tn) != 0 ||
            (tn.size() < last.text.size() && isWordByte(static_cast<unsigned char>(last.text[tn.size()])))) {
            return false;
        }
        for (size_t i = 1; i + 1 < n; ++i) {
            if (words[start + i].text != tokens[i]) {
                return false;
            }
        }

        pieces.push_back(subBox(first, firstPos, first.text.size()));
        for (size_t i = 1; i + 1 < n; ++i) {
            pieces.push_back(words[start + i].bbox);
        }
        pieces.push_back(subBox(last, 0, tn.size()));
        return true;
    }

    // Pieces on the same line (vertical centres within half a height) are
    // unioned into one region.
    static void appendLineRegions(int pageIndex, const std::vector<core::Rect>& pieces,
                                  std::vector<core::PageRegion>& regions)
    {
        std::vector<core::Rect> lines;
        for (const auto& piece : pieces) {
            bool merged = false;
            const double cy = (piece.y0 + piece.y1) / 2.0;
            for (auto& line : lines) {
                const double lineCy = (line.y0 + line.y1) / 2.0;
                if (std::fabs(cy - lineCy) <= std::max(piece.Height(), line.Height()) / 2.0) {
                    line = line.Union(piece);
                    merged = true;
                    break;
                }
            }
            if (!merged) {
                lines.push_back(piece);
            }
        }
        for (const auto& line : lines) {
            regions.push_back(core::PageRegion{pageIndex, line});
        }
    }
};

} // namespace matching
} // namespace docredact

#endif // DOCREDACT_MATCHING_MATCH_RESOLVER_HPP
