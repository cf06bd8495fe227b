#include "layout/layout_analyzer.hpp"
#include "core/errors.hpp"
#include "extraction/poppler_support.hpp"
#include "layout/kmeans.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <limits>
#include <set>

namespace docredact {
namespace layout {

namespace {

PageLayout emptyLayout(const PageWords& page) {
    PageLayout empty;
    empty.pageIndex = page.index;
    empty.width = page.width;
    empty.height = page.height;
    return empty;
}

bool finiteGeometry(const PositionedWord& w) {
    return std::isfinite(w.bbox.x0) && std::isfinite(w.bbox.y0) && std::isfinite(w.bbox.x1) &&
           std::isfinite(w.bbox.y1) && std::isfinite(w.fontSize);
}

bool byTopThenX(const PositionedWord& a, const PositionedWord& b) {
    if (a.Top() != b.Top())
        return a.Top() < b.Top();
    return a.bbox.x0 < b.bbox.x0;
}

// Gap between a word and a block along x; zero when they overlap.
double horizontalGap(const core::Rect& word, const core::Rect& block) {
    return std::max(0.0, std::max(word.x0 - block.x1, block.x0 - word.x1));
}

std::vector<TextFragment> readFragments(const poppler::page& page) {
    std::vector<TextFragment> fragments;
    for (const auto& box : page.text_list(poppler::page::text_list_include_font)) {
        TextFragment frag;
        frag.text = extraction::ToUtf8(box.text());
        if (frag.text.empty())
            continue;
        poppler::rectf r = box.bbox();
        frag.bbox = core::Rect{r.left(), r.top(), r.right(), r.bottom()};
        frag.fontName = box.get_font_name();
        frag.fontSize = box.get_font_size();
        frag.hasSpaceAfter = box.has_space_after();
        fragments.push_back(std::move(frag));
    }
    return fragments;
}

} // namespace

DocumentLayout LayoutAnalyzer::Analyze(const core::Document& document) const {
    if (document.Format() != core::FormatKind::Pdf) {
        throw core::LayoutAnalysisError("layout analysis applies to PDF documents only");
    }
    return Analyze(document.Bytes());
}

DocumentLayout LayoutAnalyzer::Analyze(const std::vector<uint8_t>& pdfBytes) const {
    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    const bool bounded = m_config.analysisTimeoutMs > 0;
    const auto deadline = started + std::chrono::milliseconds(m_config.analysisTimeoutMs);

    std::unique_ptr<poppler::document> doc = extraction::OpenPdf<core::ExtractionError>(pdfBytes);
    const int pageCount = doc->pages();

    std::vector<PageWords> pages(static_cast<size_t>(pageCount));
    for (int i = 0; i < pageCount; ++i) {
        PageWords& in = pages[static_cast<size_t>(i)];
        in.index = i;
        if (bounded && Clock::now() > deadline) {
            throw core::AnalysisTimeout("word extraction exceeded " +
                                        std::to_string(m_config.analysisTimeoutMs) + " ms");
        }
        try {
            std::unique_ptr<poppler::page> page(doc->create_page(i));
            if (!page) {
                throw core::LayoutAnalysisError("cannot open page");
            }
            poppler::rectf rect = page->page_rect();
            in.width = rect.width();
            in.height = rect.height();
            in.words = MergeFragments(readFragments(*page), i, m_config.wordMergeTolerance);
        } catch (const std::exception& ex) {
            util::logger::warn("[LayoutAnalyzer] Page " + std::to_string(i + 1) +
                               " text extraction failed: " + ex.what());
            in.failed = true;
            in.words.clear();
        }
    }
    return clusterPages(std::move(pages), started);
}

DocumentLayout LayoutAnalyzer::AnalyzeWords(std::vector<PageWords> pages) const {
    return clusterPages(std::move(pages), std::chrono::steady_clock::now());
}

DocumentLayout LayoutAnalyzer::clusterPages(std::vector<PageWords> pages,
                                            std::chrono::steady_clock::time_point started) const {
    using Clock = std::chrono::steady_clock;
    const bool bounded = m_config.analysisTimeoutMs > 0;
    const auto deadline = started + std::chrono::milliseconds(m_config.analysisTimeoutMs);
    const std::string limit = std::to_string(m_config.analysisTimeoutMs) + " ms";

    // Declared before the pool: ~ThreadPool runs every queued task, and
    // once this is set they return without clustering.
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    util::ThreadPool pool(m_config.layoutWorkerThreads, m_config.layoutQueueCapacity);
    std::vector<std::future<PageLayout>> futures;
    futures.reserve(pages.size());
    for (auto& in : pages) {
        if (bounded && Clock::now() > deadline) {
            cancelled->store(true);
            throw core::AnalysisTimeout("layout analysis exceeded " + limit + " before page " +
                                        std::to_string(in.index + 1) + " was queued");
        }
        futures.push_back(pool.enqueue([this, cancelled, bounded, deadline](PageWords page) -> PageLayout {
            if (page.failed || cancelled->load() || (bounded && Clock::now() > deadline)) {
                return emptyLayout(page);
            }
            try {
                return AnalyzePage(page.index, page.width, page.height, std::move(page.words));
            } catch (const std::exception& ex) {
                util::logger::warn("[LayoutAnalyzer] Page " + std::to_string(page.index + 1) +
                                   " analysis failed: " + ex.what());
                return emptyLayout(page);
            }
        }, std::move(in)));
    }

    DocumentLayout layout;
    layout.totalPages = static_cast<int>(pages.size());
    layout.pages.reserve(futures.size());
    for (auto& fut : futures) {
        // A page skipped for the deadline is ready, but the clock has passed it.
        if (bounded && (fut.wait_until(deadline) != std::future_status::ready || Clock::now() > deadline)) {
            cancelled->store(true);
            throw core::AnalysisTimeout("layout analysis exceeded " + limit);
        }
        layout.pages.push_back(fut.get());
        layout.layoutComplexity += layout.pages.back().layoutComplexity;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    util::logger::info("[LayoutAnalyzer] Analyzed " + std::to_string(layout.pages.size()) + " page(s) in " +
                       std::to_string(elapsed.count()) + " ms");
    return layout;
}

std::vector<PositionedWord> LayoutAnalyzer::MergeFragments(const std::vector<TextFragment>& fragments,
                                                           int pageIndex, double tolerance) {
    std::vector<PositionedWord> words;
    bool previousHadSpace = true;
    for (const auto& frag : fragments) {
        bool joins = false;
        if (!words.empty() && !previousHadSpace) {
            const PositionedWord& last = words.back();
            joins = std::fabs(frag.bbox.x0 - last.bbox.x1) <= tolerance &&
                    std::fabs(frag.bbox.y0 - last.bbox.y0) <= tolerance;
        }
        if (joins) {
            PositionedWord& last = words.back();
            last.text += frag.text;
            last.bbox = last.bbox.Union(frag.bbox);
            last.fontSize = std::max(last.fontSize, frag.fontSize);
        } else {
            PositionedWord word;
            word.text = frag.text;
            word.page = pageIndex;
            word.bbox = frag.bbox;
            word.fontName = frag.fontName;
            word.fontSize = frag.fontSize;
            words.push_back(std::move(word));
        }
        previousHadSpace = frag.hasSpaceAfter;
    }
    return words;
}

PageLayout LayoutAnalyzer::AnalyzePage(int pageIndex, double width, double height,
                                       std::vector<PositionedWord> words) const {
    PageLayout page;
    page.pageIndex = pageIndex;
    page.width = width;
    page.height = height;
    page.wordCount = words.size();
    if (words.empty()) {
        return page;
    }
    for (const auto& w : words) {
        if (!finiteGeometry(w)) {
            throw core::LayoutAnalysisError("word \"" + w.text + "\" has non-finite geometry");
        }
    }

    page.columns = detectColumns(words);
    page.textDirection = detectDirection(words);
    page.readingZones = buildReadingZones(words);
    page.textBlocks = buildTextBlocks(words);
    page.fontDistribution = fontDistribution(words);

    double minTop = std::numeric_limits<double>::max();
    double maxBottom = std::numeric_limits<double>::lowest();
    for (const auto& w : words) {
        minTop = std::min(minTop, w.Top());
        maxBottom = std::max(maxBottom, w.Bottom());
    }
    page.verticalSpread = maxBottom - minTop;

    page.layoutComplexity = 0.5 * static_cast<double>(page.columns.size()) +
                            page.verticalSpread / 100.0 +
                            (page.textDirection == TextDirection::Mixed ? 1.0 : 0.0);

    util::logger::debug("[LayoutAnalyzer] Page " + std::to_string(pageIndex + 1) + ": " +
                        std::to_string(page.wordCount) + " words, " +
                        std::to_string(page.columns.size()) + " column(s), " +
                        std::to_string(page.readingZones.size()) + " zone(s), " +
                        std::to_string(page.textBlocks.size()) + " block(s)");
    return page;
}

std::vector<Column> LayoutAnalyzer::detectColumns(const std::vector<PositionedWord>& words) const {
    std::vector<double> xs;
    xs.reserve(words.size());
    std::set<double> distinct;
    for (const auto& w : words) {
        xs.push_back(w.bbox.x0);
        distinct.insert(w.bbox.x0);
    }

    const size_t n = words.size();
    int bestK = 1;
    std::vector<int> bestLabels(n, 0);
    double bestScore = -std::numeric_limits<double>::max();

    if (distinct.size() >= 2) {
        const int maxK = static_cast<int>(std::min<size_t>(m_config.maxColumns, n - 1));
        for (int k = 2; k <= maxK; ++k) {
            if (static_cast<size_t>(k) > distinct.size())
                break;
            KMeansResult km = kmeans1d(xs, k, m_config.clusterSeed, 10);

            // Admissible only if the columns' x-ranges are disjoint.
            std::vector<double> lo(static_cast<size_t>(k), std::numeric_limits<double>::max());
            std::vector<double> hi(static_cast<size_t>(k), std::numeric_limits<double>::lowest());
            for (size_t i = 0; i < n; ++i) {
                size_t c = static_cast<size_t>(km.labels[i]);
                lo[c] = std::min(lo[c], words[i].bbox.x0);
                hi[c] = std::max(hi[c], words[i].bbox.x1);
            }
            bool admissible = true;
            for (size_t c = 0; c < lo.size() && admissible; ++c) {
                if (lo[c] > hi[c]) {
                    admissible = false;
                } else if (c > 0 && hi[c - 1] >= lo[c]) {
                    admissible = false;
                }
            }
            if (!admissible)
                continue;

            double score = silhouette1d(xs, km.labels, k);
            if (score > bestScore) {
                bestScore = score;
                bestK = k;
                bestLabels = km.labels;
            }
        }
    }

    std::vector<Column> columns(static_cast<size_t>(bestK));
    for (auto& col : columns) {
        col.minX = std::numeric_limits<double>::max();
        col.maxX = std::numeric_limits<double>::lowest();
    }
    for (size_t i = 0; i < n; ++i) {
        Column& col = columns[static_cast<size_t>(bestLabels[i])];
        col.minX = std::min(col.minX, words[i].bbox.x0);
        col.maxX = std::max(col.maxX, words[i].bbox.x1);
        col.words.push_back(words[i]);
    }
    std::sort(columns.begin(), columns.end(),
              [](const Column& a, const Column& b) { return a.minX < b.minX; });
    return columns;
}

TextDirection LayoutAnalyzer::detectDirection(const std::vector<PositionedWord>& words) {
    if (words.empty())
        return TextDirection::LeftToRight;
    size_t forward = 0;
    for (const auto& w : words) {
        if (w.bbox.x1 > w.bbox.x0)
            ++forward;
    }
    double ratio = static_cast<double>(forward) / static_cast<double>(words.size());
    if (ratio > 0.9)
        return TextDirection::LeftToRight;
    if (ratio < 0.1)
        return TextDirection::RightToLeft;
    return TextDirection::Mixed;
}

std::vector<ReadingZone> LayoutAnalyzer::buildReadingZones(const std::vector<PositionedWord>& words) const {
    std::vector<PositionedWord> sorted(words);
    std::stable_sort(sorted.begin(), sorted.end(), byTopThenX);

    std::vector<ReadingZone> zones;
    for (const auto& w : sorted) {
        if (zones.empty() || w.Top() - zones.back().bottom > m_config.readingZoneGap) {
            ReadingZone zone;
            zone.top = w.Top();
            zone.bottom = w.Bottom();
            zones.push_back(std::move(zone));
        }
        ReadingZone& zone = zones.back();
        zone.bottom = std::max(zone.bottom, w.Bottom());
        if (!zone.words.empty())
            zone.text += ' ';
        zone.text += w.text;
        zone.words.push_back(w);
    }
    return zones;
}

std::vector<TextBlock> LayoutAnalyzer::buildTextBlocks(const std::vector<PositionedWord>& words) const {
    std::vector<PositionedWord> sorted(words);
    std::stable_sort(sorted.begin(), sorted.end(), byTopThenX);

    std::vector<TextBlock> blocks;
    for (const auto& w : sorted) {
        // Latest block first: a word continues the nearest open block it fits.
        TextBlock* target = nullptr;
        for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
            if (w.Top() - it->bbox.y1 <= m_config.blockVerticalGap &&
                horizontalGap(w.bbox, it->bbox) <= m_config.blockHorizontalGap) {
                target = &*it;
                break;
            }
        }
        if (!target) {
            blocks.emplace_back();
            target = &blocks.back();
            target->bbox = w.bbox;
        }
        target->bbox = target->bbox.Union(w.bbox);
        target->words.push_back(w);
    }

    for (auto& block : blocks) {
        std::map<std::string, size_t> fonts;
        double sizeSum = 0.0;
        for (const auto& w : block.words) {
            sizeSum += w.fontSize;
            fonts[w.fontName]++;
        }
        block.averageFontSize = sizeSum / static_cast<double>(block.words.size());
        size_t bestCount = 0;
        for (const auto& f : fonts) {
            if (f.second > bestCount) {
                bestCount = f.second;
                block.dominantFont = f.first;
            }
        }
    }
    return blocks;
}

FontDistribution LayoutAnalyzer::fontDistribution(const std::vector<PositionedWord>& words) {
    FontDistribution dist;
    if (words.empty())
        return dist;
    std::vector<double> sizes;
    sizes.reserve(words.size());
    double sum = 0.0;
    for (const auto& w : words) {
        sizes.push_back(w.fontSize);
        sum += w.fontSize;
        dist.fontCounts[w.fontName]++;
    }
    std::sort(sizes.begin(), sizes.end());
    dist.minSize = sizes.front();
    dist.maxSize = sizes.back();
    dist.meanSize = sum / static_cast<double>(sizes.size());
    const size_t mid = sizes.size() / 2;
    dist.medianSize = (sizes.size() % 2 == 1) ? sizes[mid] : (sizes[mid - 1] + sizes[mid]) / 2.0;
    return dist;
}

} // namespace layout
} // namespace docredact
