#include <gtest/gtest.h>
#include "matching/pattern_suggestion_provider.hpp"

namespace {

using docredact::core::RedactionKind;
using docredact::matching::PatternSuggestionProvider;

const std::string kSample =
    "Name: Jane Roe\n"
    "SSN: 123-45-6789\n"
    "Email: jane@example.com\n"
    "Phone: (555) 123-4567\n"
    "Card: 4111 1111 1111 1111\n"
    "password=hunter2\n";

TEST(PatternSuggestionProviderTest, FullSensitivityFindsEverything) {
    PatternSuggestionProvider provider;
    auto found = provider.Suggest(kSample, 100);
    ASSERT_EQ(found.size(), (size_t)5);
    EXPECT_EQ(found[0].text, "123-45-6789");
    EXPECT_EQ(found[0].kind, RedactionKind::PII);
    EXPECT_EQ(found[1].text, "jane@example.com");
    EXPECT_EQ(found[2].text, "(555) 123-4567");
    EXPECT_EQ(found[3].text, "4111 1111 1111 1111");
    EXPECT_EQ(found[3].kind, RedactionKind::Financial);
    EXPECT_EQ(found[4].text, "hunter2");
    EXPECT_EQ(found[4].kind, RedactionKind::Credentials);
}

TEST(PatternSuggestionProviderTest, SensitivityRaisesTheBar) {
    PatternSuggestionProvider provider;
    EXPECT_TRUE(provider.Suggest(kSample, 0).empty());

    auto strict = provider.Suggest(kSample, 10);
    ASSERT_EQ(strict.size(), (size_t)3);
    for (const auto& r : strict) {
        EXPECT_GE(r.confidence, 90);
    }
    EXPECT_EQ(provider.Suggest(kSample, 250).size(), (size_t)5);
}

TEST(PatternSuggestionProviderTest, CardNeedsValidChecksum) {
    PatternSuggestionProvider provider;
    auto found = provider.Suggest("Card: 4111 1111 1111 1112", 100);
    EXPECT_TRUE(found.empty());
}

TEST(PatternSuggestionProviderTest, RepeatedValueSuggestedOnce) {
    PatternSuggestionProvider provider;
    auto found = provider.Suggest("123-45-6789 and again 123-45-6789", 100);
    EXPECT_EQ(found.size(), (size_t)1);
}

TEST(PatternSuggestionProviderTest, NameVariantsPresentInDocument) {
    PatternSuggestionProvider provider;
    const std::string doc = "Jane Roe signed. Ms. Roe agreed. J. Roe later. JANE ROE.";
    auto variants = provider.FindContextual(doc, "Jane Roe", RedactionKind::PII);

    std::vector<std::string> texts;
    for (const auto& v : variants) {
        texts.push_back(v.text);
    }
    std::vector<std::string> expected = {"JANE ROE", "Ms. Roe", "J. Roe", "Roe", "Jane"};
    EXPECT_EQ(texts, expected);
}

TEST(PatternSuggestionProviderTest, NumberVariantsPresentInDocument) {
    PatternSuggestionProvider provider;
    const std::string doc = "ID 123-45-6789, also 123456789 and 123 45 6789.";
    auto variants = provider.FindContextual(doc, "123-45-6789", RedactionKind::PII);
    ASSERT_EQ(variants.size(), (size_t)2);
    EXPECT_EQ(variants[0].text, "123456789");
    EXPECT_EQ(variants[1].text, "123 45 6789");
}

} // anonymous namespace
