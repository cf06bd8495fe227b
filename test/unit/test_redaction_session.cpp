#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "engine/redaction_session.hpp"
#include "matching/pattern_suggestion_provider.hpp"

namespace {

using docredact::core::RedactionKind;
using docredact::core::SessionError;
using docredact::engine::RedactionSession;
using docredact::matching::PatternSuggestionProvider;

TEST(RedactionSessionTest, SuggestionsNeedExplicitAccept) {
    RedactionSession session("SSN 123-45-6789, mail jane@example.com");
    PatternSuggestionProvider provider;
    const auto& pending = session.RequestSuggestions(provider, 100);
    ASSERT_EQ(pending.size(), (size_t)2);
    EXPECT_TRUE(session.Accepted().Empty());

    EXPECT_TRUE(session.AcceptSuggestion(1));
    ASSERT_EQ(session.Accepted().Size(), (size_t)1);
    EXPECT_EQ(session.Accepted().At(0).text, "jane@example.com");
    EXPECT_EQ(session.Accepted().At(0).confidence, 90);

    EXPECT_FALSE(session.AcceptSuggestion(1));
    EXPECT_THROW(session.AcceptSuggestion(2), SessionError);
}

TEST(RedactionSessionTest, CustomAndRemove) {
    RedactionSession session("Project Falcon budget");
    EXPECT_TRUE(session.AddCustom("Falcon", RedactionKind::Custom, "codename"));
    EXPECT_FALSE(session.AddCustom("Falcon", RedactionKind::Custom));
    EXPECT_EQ(session.Accepted().At(0).confidence, 100);
    EXPECT_THROW(session.AddCustom("", RedactionKind::Custom), SessionError);

    auto removed = session.Remove(0);
    EXPECT_EQ(removed.text, "Falcon");
    EXPECT_TRUE(session.Accepted().Empty());
    EXPECT_THROW(session.Remove(0), SessionError);
}

TEST(RedactionSessionTest, ContextualMatchesInheritKindAndReason) {
    RedactionSession session("Jane Roe met Ms. Roe and J. Roe.");
    PatternSuggestionProvider provider;

    const auto& proposals = session.ProposeContextual(provider, "Jane Roe", RedactionKind::PII, "client name");
    ASSERT_GE(proposals.size(), (size_t)2);
    EXPECT_EQ(proposals[0].text, "Ms. Roe");
    EXPECT_TRUE(session.Accepted().Empty());

    EXPECT_TRUE(session.AcceptContextual(0));
    const auto& accepted = session.Accepted().At(0);
    EXPECT_EQ(accepted.text, "Ms. Roe");
    EXPECT_EQ(accepted.kind, RedactionKind::PII);
    EXPECT_EQ(accepted.reason, "client name");
    EXPECT_EQ(accepted.confidence, 85);

    EXPECT_THROW(session.AcceptContextual(proposals.size()), SessionError);
}

TEST(RedactionSessionTest, ContextualReasonFallsBackToMatch) {
    RedactionSession session("Jane Roe met J. Roe.");
    PatternSuggestionProvider provider;
    session.ProposeContextual(provider, "Jane Roe", RedactionKind::Custom);
    ASSERT_FALSE(session.PendingContextual().empty());
    EXPECT_TRUE(session.AcceptContextual(0));
    EXPECT_EQ(session.Accepted().At(0).text, "J. Roe");
    EXPECT_EQ(session.Accepted().At(0).kind, RedactionKind::Custom);
    EXPECT_EQ(session.Accepted().At(0).reason, "Initial with surname");
}

TEST(RedactionSessionTest, EmptySeedRejected) {
    RedactionSession session("text");
    PatternSuggestionProvider provider;
    EXPECT_THROW(session.ProposeContextual(provider, "", RedactionKind::PII), SessionError);
}

} // anonymous namespace
