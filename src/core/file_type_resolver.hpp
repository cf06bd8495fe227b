#ifndef DOCREDACT_CORE_FILE_TYPE_RESOLVER_HPP
#define DOCREDACT_CORE_FILE_TYPE_RESOLVER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <sys/stat.h>
#include "core/errors.hpp"
#include "core/types.hpp"
#include "extraction/docx_package.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace docredact {
namespace core {

/*
  FileTypeResolver
  --------------------------------
  Classifies an input as Pdf, Docx or Text. Content is sniffed first; the
  extension is only consulted when the content is inconclusive. Anything
  that cannot be classified is rejected.

  Sniffing:
    "%PDF-" in the first 1024 bytes          -> Pdf
    ZIP with word/document.xml               -> Docx  (other ZIPs rejected)
    OLE2 compound file (legacy .doc)         -> rejected
    "{\rtf"                                  -> Text
    non-empty, NUL-free, valid UTF-8         -> Text
  Extension fallback: .pdf .docx .doc .txt .text .rtf
*/
class FileTypeResolver
{
public:
    explicit FileTypeResolver(uint64_t maxInputBytes = 100ULL * 1024ULL * 1024ULL)
        : m_maxInputBytes(maxInputBytes)
    {}

    // -------------------------------------------------------------------------
    // Checks existence and size, then classifies the file content.
    // -------------------------------------------------------------------------
    FormatKind Resolve(const std::string& path) const
    {
        struct stat st;
        if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            throw InputError(InputErrorCode::NotFound, "no regular file at " + path);
        }
        if (static_cast<uint64_t>(st.st_size) > m_maxInputBytes) {
            throw InputError(InputErrorCode::TooLarge,
                             std::to_string(st.st_size) + " bytes exceeds limit of " +
                             std::to_string(m_maxInputBytes));
        }

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw InputError(InputErrorCode::NotFound, "cannot open " + path);
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return ResolveBytes(bytes, ExtensionOf(path));
    }

    // -------------------------------------------------------------------------
    // Classifies an in-memory buffer. extensionHint is lowercase with the dot
    // (".pdf") or empty.
    // -------------------------------------------------------------------------
    FormatKind ResolveBytes(const std::vector<uint8_t>& bytes, const std::string& extensionHint) const
    {
        if (bytes.size() > m_maxInputBytes) {
            throw InputError(InputErrorCode::TooLarge,
                             std::to_string(bytes.size()) + " bytes exceeds limit of " +
                             std::to_string(m_maxInputBytes));
        }

        // %PDF- may follow a few junk bytes; readers accept it within the first 1 KiB.
        const size_t window = std::min<size_t>(bytes.size(), 1024);
        static const char pdfMagic[] = "%PDF-";
        if (std::search(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(window),
                        pdfMagic, pdfMagic + 5) != bytes.begin() + static_cast<std::ptrdiff_t>(window)) {
            return logResolved(FormatKind::Pdf, "content");
        }

        static const uint8_t zipMagic[] = {0x50, 0x4B, 0x03, 0x04};
        if (startsWith(bytes, zipMagic, sizeof(zipMagic))) {
            if (extraction::DocxPackage::ContainsEntry(bytes, extraction::DocxPackage::kMainDocumentPart)) {
                return logResolved(FormatKind::Docx, "content");
            }
            throw InputError(InputErrorCode::UnsupportedType, "ZIP archive is not a Word document");
        }

        static const uint8_t oleMagic[] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
        if (startsWith(bytes, oleMagic, sizeof(oleMagic))) {
            throw InputError(InputErrorCode::UnsupportedType, "legacy binary Word (.doc) is not supported");
        }

        static const uint8_t rtfMagic[] = {'{', '\\', 'r', 't', 'f'};
        if (startsWith(bytes, rtfMagic, sizeof(rtfMagic))) {
            return logResolved(FormatKind::Text, "content");
        }

        if (!bytes.empty() && util::utf8::isValid(bytes.data(), bytes.size(), false)) {
            return logResolved(FormatKind::Text, "content");
        }

        return byExtension(extensionHint);
    }

    // Lowercased extension including the dot, or "" when there is none.
    static std::string ExtensionOf(const std::string& path)
    {
        auto slash = path.find_last_of('/');
        auto dot = path.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
            return std::string();
        }
        std::string ext = path.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

private:
    static bool startsWith(const std::vector<uint8_t>& bytes, const uint8_t* magic, size_t len)
    {
        return bytes.size() >= len && std::memcmp(bytes.data(), magic, len) == 0;
    }

    static FormatKind logResolved(FormatKind kind, const char* how)
    {
        util::logger::debug("[FileTypeResolver] Resolved " + ToString(kind) + " by " + how);
        return kind;
    }

    FormatKind byExtension(const std::string& ext) const
    {
        if (ext == ".pdf") {
            return logResolved(FormatKind::Pdf, "extension");
        }
        if (ext == ".docx" || ext == ".doc") {
            return logResolved(FormatKind::Docx, "extension");
        }
        if (ext == ".txt" || ext == ".text" || ext == ".rtf") {
            return logResolved(FormatKind::Text, "extension");
        }
        throw InputError(InputErrorCode::UnsupportedType,
                         "cannot classify content" + (ext.empty() ? std::string() : " with extension " + ext));
    }

    uint64_t m_maxInputBytes;
};

} // namespace core
} // namespace docredact

#endif // DOCREDACT_CORE_FILE_TYPE_RESOLVER_HPP
