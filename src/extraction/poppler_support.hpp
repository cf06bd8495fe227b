#ifndef DOCREDACT_EXTRACTION_POPPLER_SUPPORT_HPP
#define DOCREDACT_EXTRACTION_POPPLER_SUPPORT_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>
#include "core/errors.hpp"
#include "util/logger.hpp"

namespace docredact {
namespace extraction {

// Poppler prints its diagnostics to stderr by default; send them to the
// logger at DEBUG instead. Installed once per process.
inline void RoutePopplerDiagnostics()
{
    static std::once_flag once;
    std::call_once(once, [] {
        poppler::set_debug_error_function(
            [](const std::string& msg, void*) { util::logger::debug("[poppler] " + msg); }, nullptr);
    });
}

inline std::string ToUtf8(const poppler::ustring& text)
{
    poppler::byte_array bytes = text.to_utf8();
    return std::string(bytes.begin(), bytes.end());
}

// -------------------------------------------------------------------------
// Opens a PDF held in memory. The bytes must outlive the document. Encrypted
// files open with the empty user password; anything still locked throws
// the given error type.
// -------------------------------------------------------------------------
template <typename ErrorT>
inline std::unique_ptr<poppler::document> OpenPdf(const std::vector<uint8_t>& bytes)
{
    RoutePopplerDiagnostics();
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size())));
    if (!doc) {
        throw ErrorT("poppler could not parse the PDF");
    }
    if (doc->is_locked()) {
        throw ErrorT("PDF is locked by a user password");
    }
    return doc;
}

} // namespace extraction
} // namespace docredact

#endif // DOCREDACT_EXTRACTION_POPPLER_SUPPORT_HPP
