#ifndef DOCREDACT_CORE_TYPES_HPP
#define DOCREDACT_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <utility>

namespace docredact {
namespace core {

/*
  Shared value types
  --------------------------------
  Plain structs passed between the resolver, extractors, matcher, appliers
  and verifier. None of them own resources.
*/

enum class FormatKind
{
    Pdf,
    Docx,
    Text
};

enum class RedactionKind
{
    PII,
    Credentials,
    Financial,
    Custom
};

inline std::string ToString(FormatKind kind)
{
    switch (kind) {
        case FormatKind::Pdf:  return "pdf";
        case FormatKind::Docx: return "docx";
        case FormatKind::Text: return "txt";
    }
    return "unknown";
}

inline std::string ToString(RedactionKind kind)
{
    switch (kind) {
        case RedactionKind::PII:         return "PII";
        case RedactionKind::Credentials: return "CREDENTIALS";
        case RedactionKind::Financial:   return "FINANCIAL";
        case RedactionKind::Custom:      return "CUSTOM";
    }
    return "UNKNOWN";
}

// -------------------------------------------------------------------------
// Parses "PII", "credentials", ... (case-insensitive). Throws on unknown names.
// -------------------------------------------------------------------------
inline RedactionKind ParseRedactionKind(const std::string& name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "PII") return RedactionKind::PII;
    if (upper == "CREDENTIALS") return RedactionKind::Credentials;
    if (upper == "FINANCIAL") return RedactionKind::Financial;
    if (upper == "CUSTOM") return RedactionKind::Custom;
    throw std::runtime_error("ParseRedactionKind: unknown kind '" + name + "'");
}

// -------------------------------------------------------------------------
// A span the operator wants removed. Equality is on (text, kind) only;
// confidence and reason are metadata.
// -------------------------------------------------------------------------
struct RedactionRequest
{
    std::string text;
    RedactionKind kind = RedactionKind::Custom;
    int confidence = 100;
    std::string reason;

    bool operator==(const RedactionRequest& other) const
    {
        return text == other.text && kind == other.kind;
    }

    bool operator!=(const RedactionRequest& other) const { return !(*this == other); }
};

// -------------------------------------------------------------------------
// A related span proposed from a seed. Never accepted without an explicit
// operator action.
// -------------------------------------------------------------------------
struct ContextualMatch
{
    std::string text;
    int confidence = 0;
    std::string reason;
};

// Byte offset and length of one match in a flat text view.
struct Occurrence
{
    std::string text;
    size_t offset = 0;
    size_t length = 0;

    size_t End() const { return offset + length; }
};

// Axis-aligned rectangle in page space: origin top-left, y grows downward,
// units are PDF points. y0 is the top edge, y1 the bottom edge.
struct Rect
{
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double Width() const { return x1 - x0; }
    double Height() const { return y1 - y0; }

    Rect Union(const Rect& o) const
    {
        return Rect{std::min(x0, o.x0), std::min(y0, o.y0), std::max(x1, o.x1), std::max(y1, o.y1)};
    }

    Rect Expanded(double pad) const
    {
        return Rect{x0 - pad, y0 - pad, x1 + pad, y1 + pad};
    }

    bool Contains(double x, double y) const
    {
        return x >= x0 && x <= x1 && y >= y0 && y <= y1;
    }
};

struct PageRegion
{
    int pageIndex = 0;
    Rect rect;
};

// -------------------------------------------------------------------------
// Verdict of the post-apply gate. Failed carries the literals still present.
// -------------------------------------------------------------------------
struct VerificationResult
{
    bool verified = false;
    std::vector<std::string> surviving;

    static VerificationResult Verified() { return VerificationResult{true, {}}; }

    static VerificationResult Failed(std::vector<std::string> survivors)
    {
        return VerificationResult{false, std::move(survivors)};
    }
};

} // namespace core
} // namespace docredact

#endif // DOCREDACT_CORE_TYPES_HPP
