#ifndef DOCREDACT_EXTRACTION_WORDML_HPP
#define DOCREDACT_EXTRACTION_WORDML_HPP

#include <cstring>
#include <string>
#include <vector>
#include <pugixml.hpp>
#include "core/errors.hpp"

namespace docredact {
namespace extraction {
namespace wordml {

/*
  WordprocessingML helpers shared by the extractor and the DOCX applier.

  Paragraph text rules:
    w:t           -> its character data
    w:tab         -> '\t'
    w:br, w:cr    -> '\n'
  w:pPr and w:rPr subtrees are property blocks and contribute nothing.
  A nested w:p (text box content) owns its own text, so the walk stops there.
*/

constexpr unsigned int kParseFlags =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single;

// Throws the given error type when the part is not well-formed XML.
template <typename ErrorT>
inline void LoadPart(pugi::xml_document& doc, const std::string& xml, const std::string& partName)
{
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), kParseFlags);
    if (!result) {
        throw ErrorT("malformed XML in " + partName + ": " + result.description());
    }
}

inline bool IsElement(const pugi::xml_node& node, const char* name)
{
    return node.type() == pugi::node_element && std::strcmp(node.name(), name) == 0;
}

namespace detail {

inline void appendText(const pugi::xml_node& node, const char* textElement, std::string& out)
{
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (IsElement(child, "w:p") || IsElement(child, "w:pPr") || IsElement(child, "w:rPr")) {
            continue;
        }
        if (IsElement(child, textElement)) {
            out += child.text().get();
        }
        else if (IsElement(child, "w:tab")) {
            out += '\t';
        }
        else if (IsElement(child, "w:br") || IsElement(child, "w:cr")) {
            out += '\n';
        }
        else {
            appendText(child, textElement, out);
        }
    }
}

inline void collectParagraphs(const pugi::xml_node& node, std::vector<pugi::xml_node>& out)
{
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (IsElement(child, "w:p")) {
            out.push_back(child);
        }
        collectParagraphs(child, out);
    }
}

} // namespace detail

// Visible text of one paragraph.
inline std::string ParagraphText(const pugi::xml_node& paragraph)
{
    std::string out;
    detail::appendText(paragraph, "w:t", out);
    return out;
}

// Text inside tracked deletions (w:delText) of one paragraph.
inline std::string ParagraphDeletedText(const pugi::xml_node& paragraph)
{
    std::string out;
    detail::appendText(paragraph, "w:delText", out);
    return out;
}

// Every w:p of the part in document order; an outer paragraph precedes the
// paragraphs nested inside it.
inline std::vector<pugi::xml_node> Paragraphs(const pugi::xml_document& doc)
{
    std::vector<pugi::xml_node> out;
    detail::collectParagraphs(doc, out);
    return out;
}

} // namespace wordml
} // namespace extraction
} // namespace docredact

#endif // DOCREDACT_EXTRACTION_WORDML_HPP
