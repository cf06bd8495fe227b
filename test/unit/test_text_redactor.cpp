#include <chrono>
#include <gtest/gtest.h>
#include "core/accepted_redaction_set.hpp"
#include "core/errors.hpp"
#include "redaction/text_redactor.hpp"
#include "test_support.hpp"

namespace {

using docredact::core::AcceptedRedactionSet;
using docredact::core::RedactionKind;
using docredact::redaction::TextRedactor;

TEST(TextRedactorTest, ReplacesSocialSecurityNumber) {
    AcceptedRedactionSet set;
    set.Add({"123-45-6789", RedactionKind::PII, 95, ""});

    TextRedactor redactor;
    std::string out = redactor.Redact("John Doe's SSN is 123-45-6789 and email is john@example.com", set);
    EXPECT_EQ(out, "John Doe's SSN is [REDACTED] and email is john@example.com");
}

TEST(TextRedactorTest, NestedLiteralsProduceOneMarker) {
    AcceptedRedactionSet set;
    set.Add({"Doe", RedactionKind::PII, 60, ""});
    set.Add({"John Doe", RedactionKind::PII, 90, ""});

    TextRedactor redactor;
    EXPECT_EQ(redactor.Redact("Signed: John Doe. Witness: Jane Doe.", set),
              "Signed: [REDACTED]. Witness: Jane [REDACTED].");
}

TEST(TextRedactorTest, PartialOverlapIsMerged) {
    std::vector<TextRedactor::Span> spans = TextRedactor::ClaimSpans("abcdef", {"abcd", "cdef"});
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].begin, (size_t)0);
    EXPECT_EQ(spans[0].end, (size_t)6);
}

TEST(TextRedactorTest, SpansAreSortedAndDisjoint) {
    std::vector<TextRedactor::Span> spans = TextRedactor::ClaimSpans("x aa y aa z", {"aa", "z"});
    ASSERT_EQ(spans.size(), (size_t)3);
    for (size_t i = 1; i < spans.size(); ++i) {
        EXPECT_LE(spans[i - 1].end, spans[i].begin);
    }
}

TEST(TextRedactorTest, CustomMarkerAndNoMatch) {
    AcceptedRedactionSet set;
    set.Add({"absent", RedactionKind::Custom, 100, ""});
    TextRedactor redactor("***");
    const std::vector<uint8_t> input = docredact::test::Bytes("nothing to see here");
    EXPECT_EQ(redactor.Apply(input, set), input);
    EXPECT_EQ(redactor.Marker(), "***");
}

TEST(TextRedactorTest, InvalidUtf8IsApplicationError) {
    AcceptedRedactionSet set;
    set.Add({"x", RedactionKind::Custom, 100, ""});
    std::vector<uint8_t> bad = {'a', 0xC3, 0x28, 'x'};
    EXPECT_THROW(TextRedactor().Apply(bad, set), docredact::core::ApplicationError);
}

TEST(TextRedactorTest, AdjacentSpansStaySeparate) {
    std::vector<TextRedactor::Span> spans = TextRedactor::ClaimSpans("abcd", {"ab", "cd", "b"});
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].end, (size_t)2);
    EXPECT_EQ(spans[1].begin, (size_t)2);
}

TEST(TextRedactorTest, ManyOccurrencesScaleLinearithmically) {
    const size_t repeats = 200000;
    std::string text;
    std::string expected;
    for (size_t i = 0; i < repeats; ++i) {
        text += "id=42; ";
        expected += "id=[REDACTED]; ";
    }
    AcceptedRedactionSet set;
    set.Add({"42", RedactionKind::Custom, 100, ""});

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(TextRedactor::ClaimSpans(text, {"42"}).size(), repeats);
    EXPECT_EQ(TextRedactor().Redact(text, set), expected);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    EXPECT_LT(elapsed.count(), 5000);
}

} // anonymous namespace
