#include "redaction/pdf_redactor.hpp"
#include "core/errors.hpp"
#include "extraction/poppler_support.hpp"
#include "layout/layout_analyzer.hpp"
#include "matching/match_resolver.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFTokenizer.hh>
#include <qpdf/QPDFWriter.hh>

namespace docredact {
namespace redaction {

namespace {

// Row-vector affine matrix [a b c d e f] as used by PDF operators.
struct Matrix {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    static Matrix Translate(double tx, double ty) { return Matrix{1, 0, 0, 1, tx, ty}; }

    // this x other
    Matrix Times(const Matrix& o) const {
        return Matrix{a * o.a + b * o.c,       a * o.b + b * o.d,       c * o.a + d * o.c,
                      c * o.b + d * o.d,       e * o.a + f * o.c + o.e, e * o.b + f * o.d + o.f};
    }

    void Apply(double x, double y, double& ox, double& oy) const {
        ox = a * x + c * y + e;
        oy = b * x + d * y + f;
    }
};

// Standard 14 advance widths for codes 32..126 (AFM, thousandths of an
// em, StandardEncoding). The oblique faces share their upright widths.
const int kHelveticaWidths[95] = {
    278, 278, 355, 556, 556, 889, 667, 222, 333, 333, 389, 584, 278, 333, 278, 278,  // 32-47
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,  // 48-63
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778, // 64-79
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,  // 80-95
    222, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,  // 96-111
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584        // 112-126
};

const int kHelveticaBoldWidths[95] = {
    278, 333, 474, 556, 556, 889, 722, 278, 333, 333, 389, 584, 278, 333, 278, 278,  // 32-47
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,  // 48-63
    975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,  // 64-79
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,  // 80-95
    278, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,  // 96-111
    611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584        // 112-126
};

const int kTimesRomanWidths[95] = {
    250, 333, 408, 500, 500, 833, 778, 333, 333, 333, 500, 564, 250, 333, 250, 278,  // 32-47
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 278, 278, 564, 564, 564, 444,  // 48-63
    921, 722, 667, 667, 722, 611, 556, 722, 722, 333, 389, 722, 611, 889, 722, 722,  // 64-79
    556, 722, 667, 556, 611, 722, 722, 944, 722, 722, 611, 333, 278, 333, 469, 500,  // 80-95
    333, 444, 500, 444, 500, 444, 333, 500, 500, 278, 278, 500, 278, 778, 500, 500,  // 96-111
    500, 500, 333, 389, 278, 500, 500, 722, 500, 500, 444, 480, 200, 480, 541        // 112-126
};

const int kTimesBoldWidths[95] = {
    250, 333, 555, 500, 500, 1000, 833, 333, 333, 333, 500, 570, 250, 333, 250, 278, // 32-47
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333, 570, 570, 570, 500,  // 48-63
    930, 722, 667, 722, 722, 667, 611, 778, 778, 389, 500, 778, 667, 944, 722, 778,  // 64-79
    611, 778, 722, 556, 667, 722, 722, 1000, 722, 722, 667, 333, 278, 333, 581, 500, // 80-95
    333, 500, 556, 444, 556, 444, 333, 500, 556, 278, 333, 556, 278, 833, 556, 500,  // 96-111
    556, 556, 444, 389, 333, 556, 500, 722, 500, 500, 444, 394, 220, 394, 520        // 112-126
};

const int kTimesItalicWidths[95] = {
    250, 333, 420, 500, 500, 833, 778, 333, 333, 333, 500, 675, 250, 333, 250, 278,  // 32-47
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333, 675, 675, 675, 500,  // 48-63
    920, 611, 611, 667, 722, 611, 611, 722, 722, 333, 444, 667, 556, 833, 667, 722,  // 64-79
    611, 722, 611, 500, 556, 722, 611, 833, 611, 556, 556, 389, 278, 389, 422, 500,  // 80-95
    333, 500, 500, 444, 500, 444, 278, 500, 500, 278, 278, 444, 278, 722, 500, 500,  // 96-111
    500, 500, 389, 389, 278, 500, 444, 667, 444, 444, 389, 400, 275, 400, 541        // 112-126
};

const int kTimesBoldItalicWidths[95] = {
    250, 389, 555, 500, 500, 833, 778, 333, 333, 333, 500, 570, 250, 333, 250, 278,  // 32-47
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333, 570, 570, 570, 500,  // 48-63
    832, 667, 667, 667, 722, 667, 667, 722, 778, 389, 500, 667, 611, 889, 722, 722,  // 64-79
    611, 722, 667, 556, 611, 722, 667, 889, 667, 611, 611, 333, 278, 333, 570, 500,  // 80-95
    333, 500, 500, 444, 500, 444, 333, 500, 556, 278, 278, 500, 278, 778, 556, 500,  // 96-111
    500, 500, 389, 389, 278, 556, 444, 667, 500, 444, 389, 348, 220, 348, 570        // 112-126
};

// Width table for a standard 14 base font name, or nullptr when the
// name is not one whose metrics are known here. `quotesingle` receives
// the width of code 39 under WinAnsiEncoding.
const int* standardWidths(std::string base, int& quotesingle) {
    // Subset fonts are named "ABCDEF+Name".
    const size_t plus = base.find('+');
    if (plus == 7)
        base = base.substr(plus + 1);
    const bool bold = base.find("Bold") != std::string::npos;
    const bool italic = base.find("Italic") != std::string::npos || base.find("Oblique") != std::string::npos;
    if (base.find("Times") != std::string::npos) {
        if (bold && italic) {
            quotesingle = 278;
            return kTimesBoldItalicWidths;
        }
        if (bold) {
            quotesingle = 278;
            return kTimesBoldWidths;
        }
        if (italic) {
            quotesingle = 214;
            return kTimesItalicWidths;
        }
        quotesingle = 180;
        return kTimesRomanWidths;
    }
    if (base.find("Helvetica") != std::string::npos || base.find("Arial") != std::string::npos) {
        quotesingle = bold ? 238 : 191;
        return bold ? kHelveticaBoldWidths : kHelveticaWidths;
    }
    return nullptr;
}

/*
  FontMetrics
  ----
  Just enough of a font to place glyph centres: per-code advance
  widths (text space units), the default width and the vertical
  extent used for the centre line. A code that is neither listed
  nor covered by a default the font itself defines has a guessed
  advance.
*/
struct FontMetrics {
    bool twoByte = false;
    std::map<int, double> widths;
    double defaultWidth = 0.5;
    bool defaultKnown = false;
    double ascent = 0.8;
    double descent = -0.2;

    double Width(int code) const {
        auto it = widths.find(code);
        return it == widths.end() ? defaultWidth : it->second;
    }

    bool Knows(int code) const { return defaultKnown || widths.count(code) > 0; }
};

std::string nameOf(QPDFObjectHandle h) {
    return h.isName() ? h.getName() : std::string();
}

bool numberOf(QPDFObjectHandle h, double& out) {
    if (!h.isNumber())
        return false;
    out = h.getNumericValue();
    return true;
}

void readCidWidths(QPDFObjectHandle w, FontMetrics& m) {
    if (!w.isArray())
        return;
    const int n = w.getArrayNItems();
    int i = 0;
    while (i < n) {
        QPDFObjectHandle first = w.getArrayItem(i);
        if (!first.isInteger() || i + 1 >= n)
            return;
        const int start = static_cast<int>(first.getIntValue());
        QPDFObjectHandle next = w.getArrayItem(i + 1);
        if (next.isArray()) {
            // c [w1 w2 ...]
            for (int k = 0; k < next.getArrayNItems(); ++k) {
                double width = 0;
                if (numberOf(next.getArrayItem(k), width))
                    m.widths[start + k] = width / 1000.0;
            }
            i += 2;
        } else {
            // cfirst clast w
            if (i + 2 >= n || !next.isInteger())
                return;
            double width = 0;
            if (numberOf(w.getArrayItem(i + 2), width)) {
                for (int c = start; c <= static_cast<int>(next.getIntValue()); ++c)
                    m.widths[c] = width / 1000.0;
            }
            i += 3;
        }
    }
}

FontMetrics loadFont(QPDFObjectHandle font) {
    FontMetrics m;
    if (!font.isDictionary())
        return m;

    QPDFObjectHandle descriptor;
    if (nameOf(font.getKey("/Subtype")) == "/Type0") {
        m.twoByte = true;
        m.defaultWidth = 1.0;
        QPDFObjectHandle descendants = font.getKey("/DescendantFonts");
        if (descendants.isArray() && descendants.getArrayNItems() > 0) {
            QPDFObjectHandle cid = descendants.getArrayItem(0);
            if (cid.isDictionary()) {
                // /DW defaults to 1000.
                m.defaultKnown = true;
                double dw = 0;
                if (numberOf(cid.getKey("/DW"), dw))
                    m.defaultWidth = dw / 1000.0;
                readCidWidths(cid.getKey("/W"), m);
                descriptor = cid.getKey("/FontDescriptor");
            }
        }
    } else {
        const std::string subtype = nameOf(font.getKey("/Subtype"));
        const std::string base = nameOf(font.getKey("/BaseFont"));
        int quotesingle = 0;
        if (base.find("Courier") != std::string::npos) {
            m.defaultWidth = 0.6;
            m.defaultKnown = true;
        } else if (const int* table = standardWidths(base, quotesingle)) {
            for (int code = 32; code <= 126; ++code)
                m.widths[code] = table[code - 32] / 1000.0;
            if (nameOf(font.getKey("/Encoding")) == "/WinAnsiEncoding") {
                m.widths[39] = quotesingle / 1000.0;
                m.widths[96] = 0.333;
            }
        }

        // Type3 widths are in glyph space, scaled by the font matrix.
        double scale = 0.001;
        QPDFObjectHandle fontMatrix = font.getKey("/FontMatrix");
        if (subtype == "/Type3" && fontMatrix.isArray() && fontMatrix.getArrayNItems() == 6)
            numberOf(fontMatrix.getArrayItem(0), scale);

        descriptor = font.getKey("/FontDescriptor");
        QPDFObjectHandle widths = font.getKey("/Widths");
        double firstChar = 0;
        if (widths.isArray() && numberOf(font.getKey("/FirstChar"), firstChar)) {
            for (int i = 0; i < widths.getArrayNItems(); ++i) {
                double width = 0;
                if (numberOf(widths.getArrayItem(i), width))
                    m.widths[static_cast<int>(firstChar) + i] = width * scale;
            }
            // Codes outside the array take /MissingWidth, which defaults to 0.
            double missing = 0;
            if (descriptor.isDictionary())
                numberOf(descriptor.getKey("/MissingWidth"), missing);
            m.defaultWidth = missing * scale;
            m.defaultKnown = true;
        }
        if (subtype == "/Type3")
            return m;
    }

    if (descriptor.isDictionary()) {
        double ascent = 0, descent = 0;
        if (numberOf(descriptor.getKey("/Ascent"), ascent) && ascent != 0)
            m.ascent = ascent / 1000.0;
        if (numberOf(descriptor.getKey("/Descent"), descent) && descent != 0)
            m.descent = descent / 1000.0;
    }
    return m;
}

std::string formatNumber(double v) {
    if (std::fabs(v) < 1e-6)
        return "0";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << v;
    std::string s = oss.str();
    while (!s.empty() && s.back() == '0')
        s.pop_back();
    if (!s.empty() && s.back() == '.')
        s.pop_back();
    return s;
}

std::string toHexString(const std::string& bytes) {
    static const char* digits = "0123456789ABCDEF";
    std::string out = "<";
    for (unsigned char c : bytes) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    out += ">";
    return out;
}

double toDouble(const QPDFTokenizer::Token& token) {
    return std::strtod(token.getValue().c_str(), nullptr);
}

bool isNumberToken(const QPDFTokenizer::Token& token) {
    return token.getType() == QPDFTokenizer::tt_integer || token.getType() == QPDFTokenizer::tt_real;
}

/*
  GlyphRemovalFilter
  ----
  Content stream filter that tracks text and graphics state and
  drops glyphs whose centre lands in one of the marks (user
  space). Operators that lose nothing are written back exactly
  as they were read.
*/
class GlyphRemovalFilter : public QPDFObjectHandle::TokenFilter {
  public:
    GlyphRemovalFilter(QPDFObjectHandle fonts, const std::vector<core::Rect>& marks)
        : m_fonts(fonts), m_marks(marks) {}

    void handleToken(QPDFTokenizer::Token const& token) override {
        m_raw += token.getRawValue();
        switch (token.getType()) {
        case QPDFTokenizer::tt_space:
        case QPDFTokenizer::tt_comment:
            return;
        case QPDFTokenizer::tt_word:
            handleOperator(token.getValue());
            m_operands.clear();
            m_raw.clear();
            return;
        default:
            m_operands.push_back(token);
            return;
        }
    }

    void handleEOF() override {
        write(m_raw);
        m_raw.clear();
        // Close whatever the original content left open so the overlay
        // is painted in default user space.
        for (int i = 0; i < m_depth; ++i)
            write("\nQ");
    }

    size_t RemovedGlyphs() const { return m_removed; }

  private:
    struct TextState {
        double charSpacing = 0;
        double wordSpacing = 0;
        double horizontalScale = 1;
        double leading = 0;
        double rise = 0;
        double fontSize = 0;
        const FontMetrics* font = nullptr;
    };

    struct GraphicsState {
        Matrix ctm;
        TextState text;
    };

    // One element of a Tj/TJ operand: a string or a displacement.
    struct ShowItem {
        bool isNumber = false;
        double number = 0;
        std::string bytes;
    };

    double operand(size_t i) const {
        return i < m_operands.size() && isNumberToken(m_operands[i]) ? toDouble(m_operands[i]) : 0.0;
    }

    void handleOperator(const std::string& op) {
        std::string replacement;
        bool replaced = false;

        if (op == "q") {
            m_stack.push_back(m_state);
            ++m_depth;
        } else if (op == "Q") {
            if (!m_stack.empty()) {
                m_state = m_stack.back();
                m_stack.pop_back();
            }
            if (m_depth > 0)
                --m_depth;
        } else if (op == "cm" && m_operands.size() >= 6) {
            Matrix m{operand(0), operand(1), operand(2), operand(3), operand(4), operand(5)};
            m_state.ctm = m.Times(m_state.ctm);
        } else if (op == "BT") {
            m_tm = Matrix();
            m_tlm = Matrix();
            m_drifting = false;
        } else if (op == "Tf" && m_operands.size() >= 2) {
            m_state.text.font = fontFor(m_operands[0].getValue());
            m_state.text.fontSize = operand(1);
        } else if (op == "Tc") {
            m_state.text.charSpacing = operand(0);
        } else if (op == "Tw") {
            m_state.text.wordSpacing = operand(0);
        } else if (op == "Tz") {
            m_state.text.horizontalScale = operand(0) / 100.0;
        } else if (op == "TL") {
            m_state.text.leading = operand(0);
        } else if (op == "Ts") {
            m_state.text.rise = operand(0);
        } else if (op == "Td") {
            moveLine(operand(0), operand(1));
        } else if (op == "TD") {
            m_state.text.leading = -operand(1);
            moveLine(operand(0), operand(1));
        } else if (op == "Tm" && m_operands.size() >= 6) {
            m_tlm = Matrix{operand(0), operand(1), operand(2), operand(3), operand(4), operand(5)};
            m_tm = m_tlm;
            m_drifting = false;
        } else if (op == "T*") {
            moveLine(0, -m_state.text.leading);
        } else if (op == "Tj" || op == "TJ") {
            replaced = show(collectItems(), replacement);
        } else if (op == "'") {
            moveLine(0, -m_state.text.leading);
            replaced = show(collectItems(), replacement);
            if (replaced)
                replacement = "T*\n" + replacement;
        } else if (op == "\"" && m_operands.size() >= 3) {
            m_state.text.wordSpacing = operand(0);
            m_state.text.charSpacing = operand(1);
            moveLine(0, -m_state.text.leading);
            replaced = show(collectItems(), replacement);
            if (replaced) {
                replacement = m_operands[0].getRawValue() + " Tw " + m_operands[1].getRawValue() + " Tc T*\n" +
                              replacement;
            }
        }

        if (replaced) {
            write("\n" + replacement);
        } else {
            write(m_raw);
        }
    }

    void moveLine(double tx, double ty) {
        m_tlm = Matrix::Translate(tx, ty).Times(m_tlm);
        m_tm = m_tlm;
        m_drifting = false;
    }

    const FontMetrics* fontFor(const std::string& resourceName) {
        auto it = m_fontCache.find(resourceName);
        if (it != m_fontCache.end())
            return &it->second;
        QPDFObjectHandle font;
        if (m_fonts.isDictionary() && m_fonts.hasKey(resourceName))
            font = m_fonts.getKey(resourceName);
        return &m_fontCache.emplace(resourceName, loadFont(font)).first->second;
    }

    std::vector<ShowItem> collectItems() const {
        std::vector<ShowItem> items;
        for (const auto& token : m_operands) {
            if (token.getType() == QPDFTokenizer::tt_string) {
                ShowItem item;
                item.bytes = token.getValue();
                items.push_back(item);
            } else if (isNumberToken(token)) {
                ShowItem item;
                item.isNumber = true;
                item.number = toDouble(token);
                items.push_back(item);
            }
        }
        // Tj, ' and " take exactly one string; numbers before it are
        // the " spacing operands.
        if (!m_operands.empty() && m_operands.front().getType() != QPDFTokenizer::tt_array_open) {
            std::vector<ShowItem> strings;
            for (auto& item : items) {
                if (!item.isNumber)
                    strings.push_back(item);
            }
            return strings;
        }
        return items;
    }

    bool insideMark(double x, double y) const {
        for (const auto& mark : m_marks) {
            if (mark.Contains(x, y))
                return true;
        }
        return false;
    }

    bool onMarkLine(double y) const {
        for (const auto& mark : m_marks) {
            if (y >= mark.y0 && y <= mark.y1)
                return true;
        }
        return false;
    }

    // Advances the text matrix over the items. Returns true and fills
    // `replacement` with an equivalent TJ when any glyph was removed.
    bool show(const std::vector<ShowItem>& items, std::string& replacement) {
        static const FontMetrics kFallback{};
        const TextState& ts = m_state.text;
        const FontMetrics& font = ts.font ? *ts.font : kFallback;
        const double th = ts.horizontalScale;
        const double midline = (font.ascent + font.descent) / 2.0;

        std::vector<std::string> elements;
        std::string kept;
        double pending = 0;
        bool anyRemoved = false;

        auto flushKept = [&]() {
            if (!kept.empty()) {
                elements.push_back(toHexString(kept));
                kept.clear();
            }
        };
        auto flushPending = [&]() {
            if (std::fabs(pending) > 1e-9) {
                elements.push_back(formatNumber(pending));
                pending = 0;
            }
        };

        for (const auto& item : items) {
            if (item.isNumber) {
                flushKept();
                pending += item.number;
                m_tm = Matrix::Translate(-item.number / 1000.0 * ts.fontSize * th, 0).Times(m_tm);
                continue;
            }
            const size_t step = font.twoByte ? 2 : 1;
            for (size_t i = 0; i < item.bytes.size(); i += step) {
                int code = static_cast<unsigned char>(item.bytes[i]);
                size_t width = 1;
                if (font.twoByte && i + 1 < item.bytes.size()) {
                    code = (code << 8) | static_cast<unsigned char>(item.bytes[i + 1]);
                    width = 2;
                }
                const double w0 = font.Width(code);
                const bool wordSpace = !font.twoByte && code == 32;

                Matrix trm = m_tm.Times(m_state.ctm);
                double ux = 0, uy = 0;
                trm.Apply(w0 / 2.0 * ts.fontSize * th, midline * ts.fontSize + ts.rise, ux, uy);

                // Past a guessed advance the glyph positions on this line
                // are unreliable; refuse rather than miss a glyph.
                const bool guessed = !font.Knows(code);
                if ((guessed || m_drifting) && onMarkLine(uy)) {
                    throw core::ApplicationError("glyph advances unknown for the font of text on a redacted line");
                }
                if (guessed)
                    m_drifting = true;

                const double advance = w0 * ts.fontSize + ts.charSpacing + (wordSpace ? ts.wordSpacing : 0.0);
                if (insideMark(ux, uy)) {
                    anyRemoved = true;
                    ++m_removed;
                    flushKept();
                    if (ts.fontSize != 0)
                        pending -= advance * 1000.0 / ts.fontSize;
                } else {
                    flushPending();
                    kept.append(item.bytes, i, width);
                }
                m_tm = Matrix::Translate(advance * th, 0).Times(m_tm);
            }
        }

        if (!anyRemoved)
            return false;
        flushKept();
        flushPending();
        std::string array = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i > 0)
                array += " ";
            array += elements[i];
        }
        replacement = array + "] TJ";
        return true;
    }

    QPDFObjectHandle m_fonts;
    const std::vector<core::Rect>& m_marks;
    std::map<std::string, FontMetrics> m_fontCache;

    std::vector<QPDFTokenizer::Token> m_operands;
    std::string m_raw;

    GraphicsState m_state;
    std::vector<GraphicsState> m_stack;
    Matrix m_tm;
    Matrix m_tlm;
    int m_depth = 0;
    size_t m_removed = 0;
    bool m_drifting = false;
};

// Maps a rectangle from poppler's page space (top-left origin, relative
// to the crop box, after /Rotate) to default user space.
core::Rect toUserSpace(const core::Rect& r, const QPDFObjectHandle::Rectangle& crop, int rotate) {
    auto convert = [&](double xd, double yd, double& x, double& y) {
        switch (rotate) {
        case 90:
            x = yd + crop.llx;
            y = xd + crop.lly;
            break;
        case 180:
            x = crop.urx - xd;
            y = yd + crop.lly;
            break;
        case 270:
            x = crop.urx - yd;
            y = crop.ury - xd;
            break;
        default:
            x = xd + crop.llx;
            y = crop.ury - yd;
            break;
        }
    };
    double ax = 0, ay = 0, bx = 0, by = 0;
    convert(r.x0, r.y0, ax, ay);
    convert(r.x1, r.y1, bx, by);
    return core::Rect{std::min(ax, bx), std::min(ay, by), std::max(ax, bx), std::max(ay, by)};
}

int normalizedRotation(QPDFPageObjectHelper& page) {
    QPDFObjectHandle rotate = page.getAttribute("/Rotate", false);
    if (!rotate.isInteger())
        return 0;
    int r = static_cast<int>(rotate.getIntValue()) % 360;
    if (r < 0)
        r += 360;
    return r - r % 90;
}

std::string overlay(const std::vector<core::Rect>& marks) {
    std::string ops = "q\n0 0 0 rg\n";
    for (const auto& m : marks) {
        ops += formatNumber(m.x0) + " " + formatNumber(m.y0) + " " + formatNumber(m.Width()) + " " +
               formatNumber(m.Height()) + " re\n";
    }
    ops += "f\nQ\n";
    return ops;
}

} // namespace

std::vector<uint8_t> PdfRedactor::Apply(const std::vector<uint8_t>& bytes,
                                        const core::AcceptedRedactionSet& accepted) const {
    // Apply is not cancellable, so the analysis it runs has no deadline.
    config::EngineConfig untimed = m_config;
    untimed.analysisTimeoutMs = 0;
    layout::DocumentLayout documentLayout;
    try {
        documentLayout = layout::LayoutAnalyzer(untimed).Analyze(bytes);
    } catch (const core::LayoutAnalysisError& e) {
        // Phrase search alone still locates every hit.
        util::logger::warn(std::string("[PdfRedactor] Layout unavailable, using phrase search only: ") + e.what());
    }
    return Apply(bytes, accepted, documentLayout);
}

std::vector<uint8_t> PdfRedactor::Apply(const std::vector<uint8_t>& bytes,
                                        const core::AcceptedRedactionSet& accepted,
                                        const layout::DocumentLayout& documentLayout) const {
    std::map<int, std::vector<core::Rect>> marks = CollectMarks(bytes, accepted, documentLayout);
    size_t total = 0;
    for (const auto& kv : marks)
        total += kv.second.size();
    if (total == 0) {
        util::logger::info("[PdfRedactor] No text located; document left unchanged.");
        return bytes;
    }
    util::logger::info("[PdfRedactor] " + std::to_string(total) + " mark(s) on " + std::to_string(marks.size()) +
                       " page(s).");
    std::vector<uint8_t> redacted = rewrite(bytes, marks);
    checkMarksClear(redacted, marks);
    return redacted;
}

std::map<int, std::vector<core::Rect>> PdfRedactor::CollectMarks(const std::vector<uint8_t>& bytes,
                                                                 const core::AcceptedRedactionSet& accepted,
                                                                 const layout::DocumentLayout& documentLayout) const {
    static const int kMaxHitsPerSearch = 10000;
    std::map<int, std::vector<core::Rect>> marks;
    const double pad = m_config.pdfRedactionPadding;
    const std::vector<std::string> literals = accepted.Literals();

    std::unique_ptr<poppler::document> doc = extraction::OpenPdf<core::ApplicationError>(bytes);
    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page)
            throw core::ApplicationError("page " + std::to_string(i) + " could not be loaded");
        for (const auto& literal : literals) {
            const poppler::ustring needle = poppler::ustring::from_utf8(literal.c_str());
            poppler::rectf r;
            bool found = page->search(needle, r, poppler::page::search_from_top, poppler::case_sensitive);
            int hits = 0;
            while (found && hits < kMaxHitsPerSearch) {
                core::Rect hit{r.left(), r.top(), r.right(), r.bottom()};
                auto& pageMarks = marks[i];
                const core::Rect padded = hit.Expanded(pad);
                bool repeated = false;
                for (const auto& m : pageMarks) {
                    if (m.x0 == padded.x0 && m.y0 == padded.y0 && m.x1 == padded.x1 && m.y1 == padded.y1) {
                        repeated = true;
                        break;
                    }
                }
                if (repeated)
                    break;
                pageMarks.push_back(padded);
                ++hits;
                found = page->search(needle, r, poppler::page::search_next_result, poppler::case_sensitive);
            }
        }
    }

    matching::MatchResolver resolver;
    for (const auto& literal : literals) {
        for (const auto& region : resolver.LocateInLayout(documentLayout, literal))
            marks[region.pageIndex].push_back(region.rect.Expanded(pad));
    }
    for (auto it = marks.begin(); it != marks.end();) {
        if (it->second.empty())
            it = marks.erase(it);
        else
            ++it;
    }
    return marks;
}

std::vector<uint8_t> PdfRedactor::rewrite(const std::vector<uint8_t>& bytes,
                                          const std::map<int, std::vector<core::Rect>>& marks) const {
    try {
        QPDF pdf;
        pdf.processMemoryFile("input.pdf", reinterpret_cast<const char*>(bytes.data()), bytes.size());

        std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(pdf).getAllPages();
        size_t removed = 0;
        for (const auto& kv : marks) {
            if (kv.first < 0 || static_cast<size_t>(kv.first) >= pages.size())
                throw core::ApplicationError("mark on missing page " + std::to_string(kv.first));
            QPDFPageObjectHelper& page = pages[static_cast<size_t>(kv.first)];

            const QPDFObjectHandle::Rectangle crop = page.getCropBox(false).getArrayAsRectangle();
            const int rotate = normalizedRotation(page);
            std::vector<core::Rect> userMarks;
            for (const auto& m : kv.second)
                userMarks.push_back(toUserSpace(m, crop, rotate));

            QPDFObjectHandle fonts;
            QPDFObjectHandle resources = page.getAttribute("/Resources", false);
            if (resources.isDictionary())
                fonts = resources.getKey("/Font");

            GlyphRemovalFilter filter(fonts, userMarks);
            Pl_Buffer buffer("redacted page");
            page.filterContents(&filter, &buffer);
            std::unique_ptr<Buffer> filtered(buffer.getBuffer());
            removed += filter.RemovedGlyphs();

            std::string content = "q\n";
            content.append(reinterpret_cast<const char*>(filtered->getBuffer()), filtered->getSize());
            content += "\nQ\n" + overlay(userMarks);
            page.getObjectHandle().replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
        }
        util::logger::info("[PdfRedactor] Removed " + std::to_string(removed) + " glyph(s).");

        const std::string owner =
            m_config.pdfOwnerPassword.empty() ? util::hashing::randomHex(16) : m_config.pdfOwnerPassword;
        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setR6EncryptionParameters("", owner.c_str(),
                                         true,   // accessibility
                                         true,   // extract (copy)
                                         false,  // assemble
                                         false,  // annotate and form
                                         false,  // form filling
                                         false,  // modify other
                                         qpdf_r3p_full, true);
        writer.write();
        std::unique_ptr<Buffer> out(writer.getBuffer());
        const uint8_t* data = out->getBuffer();
        return std::vector<uint8_t>(data, data + out->getSize());
    } catch (const core::RedactionError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::ApplicationError(std::string("qpdf: ") + e.what());
    }
}

void PdfRedactor::checkMarksClear(const std::vector<uint8_t>& redacted,
                                  const std::map<int, std::vector<core::Rect>>& marks) const {
    std::unique_ptr<poppler::document> doc = extraction::OpenPdf<core::ApplicationError>(redacted);
    for (const auto& kv : marks) {
        std::unique_ptr<poppler::page> page(doc->create_page(kv.first));
        if (!page)
            throw core::ApplicationError("redacted page " + std::to_string(kv.first + 1) + " could not be reopened");
        for (const auto& box : page->text_list()) {
            const poppler::ustring text = box.text();
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == ' ')
                    continue;
                const poppler::rectf r = box.char_bbox(i);
                if (r.width() <= 0 && r.height() <= 0)
                    continue;
                const double cx = (r.left() + r.right()) / 2.0;
                const double cy = (r.top() + r.bottom()) / 2.0;
                for (const auto& mark : kv.second) {
                    if (mark.Contains(cx, cy)) {
                        throw core::ApplicationError("text remains under a redaction mark on page " +
                                                     std::to_string(kv.first + 1));
                    }
                }
            }
        }
    }
    util::logger::debug("[PdfRedactor] No text left under any mark.");
}

} // namespace redaction
} // namespace docredact
