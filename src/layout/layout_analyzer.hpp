#ifndef DOCREDACT_LAYOUT_LAYOUT_ANALYZER_HPP
#define DOCREDACT_LAYOUT_LAYOUT_ANALYZER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "config/engine_config.hpp"
#include "core/document.hpp"
#include "core/types.hpp"
#include "layout/layout_types.hpp"

namespace docredact {
namespace layout {

// One text box as reported by the PDF text layer, before word merging.
struct TextFragment {
    std::string text;
    core::Rect bbox;
    std::string fontName;
    double fontSize = 0.0;
    bool hasSpaceAfter = true;
};

// Positioned words of one page, ready for clustering. A page whose
// text could not be read is marked failed and analyses to an empty layout.
struct PageWords {
    int index = 0;
    double width = 0.0;
    double height = 0.0;
    std::vector<PositionedWord> words;
    bool failed = false;
};

/*
  LayoutAnalyzer
  --------------------------------------------------------
  Recovers page geometry from a PDF:

    1. positioned words per page (poppler text boxes, with
       fragmented boxes merged back into words)
    2. columns: 1-D k-means over word x0, k picked by
       silhouette among clusterings whose column x-ranges do
       not overlap
    3. text direction, reading zones, text blocks and page
       statistics

  Word extraction walks the pages sequentially because a
  poppler document is not safe to share between threads. The
  per-page clustering then runs on a bounded ThreadPool and the
  results are collected in page order.

  A page that fails is logged and returned as an empty layout.
  When analysisTimeoutMs is set, the deadline is checked before
  each page is read and before each page is queued; once it has
  passed, queued pages are skipped and core::AnalysisTimeout is
  thrown.
*/
class LayoutAnalyzer {
  public:
    explicit LayoutAnalyzer(const config::EngineConfig& config) : m_config(config) {}

    DocumentLayout Analyze(const core::Document& document) const;
    DocumentLayout Analyze(const std::vector<uint8_t>& pdfBytes) const;

    // Clusters pages whose words are already positioned, in page order.
    // The timeout clock starts on entry.
    DocumentLayout AnalyzeWords(std::vector<PageWords> pages) const;

    // Pure per-page analysis over already positioned words. Throws
    // core::LayoutAnalysisError for a word with non-finite geometry.
    PageLayout AnalyzePage(int pageIndex, double width, double height,
                           std::vector<PositionedWord> words) const;

    // Joins fragments that continue a word: same line, starting within
    // the tolerance of the previous fragment's end, no space between.
    static std::vector<PositionedWord> MergeFragments(const std::vector<TextFragment>& fragments,
                                                      int pageIndex, double tolerance);

  private:
    DocumentLayout clusterPages(std::vector<PageWords> pages,
                                std::chrono::steady_clock::time_point started) const;
    std::vector<Column> detectColumns(const std::vector<PositionedWord>& words) const;
    static TextDirection detectDirection(const std::vector<PositionedWord>& words);
    std::vector<ReadingZone> buildReadingZones(const std::vector<PositionedWord>& words) const;
    std::vector<TextBlock> buildTextBlocks(const std::vector<PositionedWord>& words) const;
    static FontDistribution fontDistribution(const std::vector<PositionedWord>& words);

    config::EngineConfig m_config;
};

} // namespace layout
} // namespace docredact

#endif // DOCREDACT_LAYOUT_LAYOUT_ANALYZER_HPP
