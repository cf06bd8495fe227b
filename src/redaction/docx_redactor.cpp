#include "redaction/docx_redactor.hpp"
#include "core/errors.hpp"
#include "extraction/docx_package.hpp"
#include "extraction/wordml.hpp"
#include "redaction/text_redactor.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"
#include <map>
#include <sstream>

namespace docredact {
namespace redaction {

namespace {

bool containsAny(const std::string& text, const std::vector<std::string>& literals) {
    for (const auto& literal : literals) {
        if (!literal.empty() && text.find(literal) != std::string::npos)
            return true;
    }
    return false;
}

std::string serialize(const pugi::xml_document& doc) {
    std::ostringstream oss;
    // The declaration node was kept at parse time, so it is written back as-is.
    doc.save(oss, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return oss.str();
}

} // namespace

std::vector<uint8_t> DocxRedactor::Apply(const std::vector<uint8_t>& bytes,
                                         const core::AcceptedRedactionSet& accepted) const {
    const std::vector<std::string> literals = accepted.Literals();
    extraction::DocxPackage package(bytes);

    std::map<std::string, std::string> replacements;
    size_t rewritten = 0;
    for (const auto& partName : package.TextPartNames()) {
        pugi::xml_document part;
        extraction::wordml::LoadPart<core::ApplicationError>(part, package.ReadEntry(partName), partName);
        size_t n = RedactPart(part, literals);
        if (n > 0) {
            replacements[partName] = serialize(part);
            rewritten += n;
        }
    }

    if (replacements.empty()) {
        util::logger::info("[DocxRedactor] No paragraph matched; package left unchanged.");
        return bytes;
    }
    util::logger::info("[DocxRedactor] Rewrote " + std::to_string(rewritten) + " paragraph(s) in " +
                       std::to_string(replacements.size()) + " part(s).");
    return extraction::DocxPackage::Rewrite(bytes, replacements);
}

size_t DocxRedactor::RedactPart(pugi::xml_document& part, const std::vector<std::string>& literals) const {
    std::vector<pugi::xml_node> paragraphs = extraction::wordml::Paragraphs(part);
    size_t count = 0;
    // Nested paragraphs follow their container in document order. Walking
    // backwards handles them before a rewrite of the container removes them.
    for (auto it = paragraphs.rbegin(); it != paragraphs.rend(); ++it) {
        pugi::xml_node paragraph = *it;
        const std::string text = extraction::wordml::ParagraphText(paragraph);
        const std::string deleted = extraction::wordml::ParagraphDeletedText(paragraph);
        if (!containsAny(text, literals) && !containsAny(deleted, literals))
            continue;
        rewriteParagraph(paragraph, Mask(text, literals));
        ++count;
    }
    return count;
}

std::string DocxRedactor::Mask(const std::string& text, const std::vector<std::string>& literals) const {
    std::vector<TextRedactor::Span> spans = TextRedactor::ClaimSpans(text, literals);
    return TextRedactor::Substitute(text, spans, [&](const TextRedactor::Span& span) {
        const size_t glyphs = util::utf8::codePointCount(text.substr(span.begin, span.end - span.begin));
        std::string filler;
        filler.reserve(glyphs * m_fillerGlyph.size());
        for (size_t i = 0; i < glyphs; ++i)
            filler += m_fillerGlyph;
        return filler;
    });
}

void DocxRedactor::rewriteParagraph(pugi::xml_node paragraph, const std::string& maskedText) const {
    std::vector<pugi::xml_node> doomed;
    for (pugi::xml_node child : paragraph.children()) {
        if (!extraction::wordml::IsElement(child, "w:pPr"))
            doomed.push_back(child);
    }
    for (auto& node : doomed)
        paragraph.remove_child(node);

    pugi::xml_node run = paragraph.append_child("w:r");
    pugi::xml_node rPr = run.append_child("w:rPr");
    pugi::xml_node fonts = rPr.append_child("w:rFonts");
    fonts.append_attribute("w:ascii") = m_fontName.c_str();
    fonts.append_attribute("w:hAnsi") = m_fontName.c_str();
    fonts.append_attribute("w:cs") = m_fontName.c_str();
    rPr.append_child("w:b");
    rPr.append_child("w:color").append_attribute("w:val") = "000000";
    const std::string halfPoints = std::to_string(m_fontSizePt * 2);
    rPr.append_child("w:sz").append_attribute("w:val") = halfPoints.c_str();
    rPr.append_child("w:szCs").append_attribute("w:val") = halfPoints.c_str();

    // Tabs and breaks become their own elements so the flat text view of the
    // rewritten paragraph keeps its shape.
    std::string pending;
    auto flush = [&]() {
        if (pending.empty())
            return;
        pugi::xml_node t = run.append_child("w:t");
        t.append_attribute("xml:space") = "preserve";
        t.text().set(pending.c_str());
        pending.clear();
    };
    for (char c : maskedText) {
        if (c == '\t') {
            flush();
            run.append_child("w:tab");
        } else if (c == '\n') {
            flush();
            run.append_child("w:br");
        } else {
            pending += c;
        }
    }
    flush();
}

} // namespace redaction
} // namespace docredact
