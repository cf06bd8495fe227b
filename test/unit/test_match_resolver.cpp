#include <gtest/gtest.h>
#include "layout/layout_types.hpp"
#include "matching/match_resolver.hpp"

namespace {

using docredact::core::ContextualMatch;
using docredact::core::Rect;
using docredact::core::RedactionKind;
using docredact::core::RedactionRequest;
using docredact::layout::DocumentLayout;
using docredact::layout::PageLayout;
using docredact::layout::PositionedWord;
using docredact::layout::TextBlock;
using docredact::matching::MatchResolver;

PositionedWord word(const std::string& text, double x0, double x1, double top) {
    PositionedWord w;
    w.text = text;
    w.bbox = Rect{x0, top, x1, top + 12.0};
    return w;
}

DocumentLayout singleBlock(const std::vector<PositionedWord>& words, int pageIndex = 0) {
    TextBlock block;
    block.words = words;
    PageLayout page;
    page.pageIndex = pageIndex;
    page.textBlocks.push_back(block);
    DocumentLayout layout;
    layout.pages.push_back(page);
    layout.totalPages = pageIndex + 1;
    return layout;
}

class ScriptedProvider : public docredact::matching::SuggestionProvider {
  public:
    explicit ScriptedProvider(std::vector<ContextualMatch> answer) : m_answer(std::move(answer)) {}

    std::vector<RedactionRequest> Suggest(const std::string&, int) override { return {}; }

    std::vector<ContextualMatch> FindContextual(const std::string&, const std::string&, RedactionKind) override {
        return m_answer;
    }

  private:
    std::vector<ContextualMatch> m_answer;
};

TEST(MatchResolverTest, ResolveFindsNonOverlappingMatches) {
    MatchResolver resolver;
    auto found = resolver.Resolve("aaaa", RedactionRequest{"aa", RedactionKind::Custom, 100, ""});
    ASSERT_EQ(found.size(), (size_t)2);
    EXPECT_EQ(found[0].offset, (size_t)0);
    EXPECT_EQ(found[1].offset, (size_t)2);
    EXPECT_EQ(found[1].End(), (size_t)4);

    EXPECT_TRUE(resolver.Resolve("Secret", RedactionRequest{"secret", RedactionKind::Custom, 100, ""}).empty());
    EXPECT_TRUE(resolver.Resolve("text", RedactionRequest{"", RedactionKind::Custom, 100, ""}).empty());
}

TEST(MatchResolverTest, WordBoundaryContainment) {
    size_t pos = 99;
    EXPECT_TRUE(MatchResolver::ContainsOnWordBoundary("(555)", "555", pos));
    EXPECT_EQ(pos, (size_t)1);
    EXPECT_TRUE(MatchResolver::ContainsOnWordBoundary("John,", "John", pos));
    EXPECT_EQ(pos, (size_t)0);
    EXPECT_FALSE(MatchResolver::ContainsOnWordBoundary("Johnson", "John", pos));
    EXPECT_FALSE(MatchResolver::ContainsOnWordBoundary("word", "", pos));
}

TEST(MatchResolverTest, LocatesTokenInsidePunctuatedWord) {
    MatchResolver resolver;
    DocumentLayout layout = singleBlock({word("Call", 72, 100, 100), word("(555)", 104, 134, 100),
                                         word("now", 138, 160, 100)});
    auto regions = resolver.LocateInLayout(layout, "555");
    ASSERT_EQ(regions.size(), (size_t)1);
    EXPECT_EQ(regions[0].pageIndex, 0);
    EXPECT_NEAR(regions[0].rect.x0, 110.0, 1e-9);
    EXPECT_NEAR(regions[0].rect.x1, 128.0, 1e-9);
    EXPECT_DOUBLE_EQ(regions[0].rect.y0, 100.0);
}

TEST(MatchResolverTest, DoesNotMatchInsideLongerWord) {
    MatchResolver resolver;
    DocumentLayout layout = singleBlock({word("Johnson", 72, 120, 100)});
    EXPECT_TRUE(resolver.LocateInLayout(layout, "John").empty());
}

TEST(MatchResolverTest, MultiWordPhraseYieldsOneRegionPerLine) {
    MatchResolver resolver;
    DocumentLayout sameLine = singleBlock({word("Jane", 72, 100, 100), word("Roe", 104, 125, 100)}, 2);
    auto one = resolver.LocateInLayout(sameLine, "Jane Roe");
    ASSERT_EQ(one.size(), (size_t)1);
    EXPECT_EQ(one[0].pageIndex, 2);
    EXPECT_DOUBLE_EQ(one[0].rect.x0, 72.0);
    EXPECT_DOUBLE_EQ(one[0].rect.x1, 125.0);

    DocumentLayout wrapped = singleBlock({word("Jane", 200, 230, 100), word("Roe", 72, 95, 114)});
    auto two = resolver.LocateInLayout(wrapped, "Jane Roe");
    ASSERT_EQ(two.size(), (size_t)2);
    EXPECT_DOUBLE_EQ(two[0].rect.y0, 100.0);
    EXPECT_DOUBLE_EQ(two[1].rect.y0, 114.0);
}

TEST(MatchResolverTest, ContextualAnswerIsCleaned) {
    ScriptedProvider provider({{"", 50, "empty"},
                               {"Jane Roe", 99, "seed"},
                               {"J. Roe", 80, "initial"},
                               {"J. Roe", 70, "repeat"},
                               {"Ms. Roe", 85, "honorific"}});
    MatchResolver resolver;
    auto matches = resolver.FindContextual(provider, "Jane Roe, J. Roe, Ms. Roe", "Jane Roe", RedactionKind::PII);
    ASSERT_EQ(matches.size(), (size_t)2);
    EXPECT_EQ(matches[0].text, "J. Roe");
    EXPECT_EQ(matches[0].confidence, 80);
    EXPECT_EQ(matches[1].text, "Ms. Roe");

    EXPECT_TRUE(resolver.FindContextual(provider, "text", "", RedactionKind::PII).empty());
}

} // anonymous namespace
