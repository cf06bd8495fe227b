#ifndef DOCREDACT_LAYOUT_LAYOUT_TYPES_HPP
#define DOCREDACT_LAYOUT_LAYOUT_TYPES_HPP

#include <map>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace docredact {
namespace layout {

/*
  Layout value types. Geometry is page space: origin top-left, points.
  These exist for the duration of one analysis.
*/

struct PositionedWord
{
    std::string text;
    int page = 0;
    core::Rect bbox;          // x0, top, x1, bottom
    std::string fontName;
    double fontSize = 0.0;

    double Top() const { return bbox.y0; }
    double Bottom() const { return bbox.y1; }
};

struct TextBlock
{
    std::vector<PositionedWord> words;
    core::Rect bbox;
    double averageFontSize = 0.0;
    std::string dominantFont;

    std::string Text() const
    {
        std::string out;
        for (size_t i = 0; i < words.size(); ++i) {
            if (i > 0) out += ' ';
            out += words[i].text;
        }
        return out;
    }
};

struct Column
{
    double minX = 0.0;
    double maxX = 0.0;
    std::vector<PositionedWord> words;
};

struct ReadingZone
{
    double top = 0.0;
    double bottom = 0.0;
    std::vector<PositionedWord> words;
    std::string text;
};

enum class TextDirection
{
    LeftToRight,
    RightToLeft,
    Mixed
};

inline std::string ToString(TextDirection dir)
{
    switch (dir) {
        case TextDirection::LeftToRight: return "ltr";
        case TextDirection::RightToLeft: return "rtl";
        case TextDirection::Mixed:       return "mixed";
    }
    return "ltr";
}

struct FontDistribution
{
    double minSize = 0.0;
    double maxSize = 0.0;
    double medianSize = 0.0;
    double meanSize = 0.0;
    std::map<std::string, size_t> fontCounts;
};

struct PageLayout
{
    int pageIndex = 0;
    double width = 0.0;
    double height = 0.0;
    std::vector<Column> columns;
    TextDirection textDirection = TextDirection::LeftToRight;
    std::vector<ReadingZone> readingZones;
    std::vector<TextBlock> textBlocks;
    size_t wordCount = 0;
    double verticalSpread = 0.0;
    FontDistribution fontDistribution;
    double layoutComplexity = 0.0;
};

struct DocumentLayout
{
    std::vector<PageLayout> pages;
    int totalPages = 0;
    double layoutComplexity = 0.0;
};

} // namespace layout
} // namespace docredact

#endif // DOCREDACT_LAYOUT_LAYOUT_TYPES_HPP
