#ifndef DOCREDACT_EXTRACTION_DOCX_PACKAGE_HPP
#define DOCREDACT_EXTRACTION_DOCX_PACKAGE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <zip.h>

namespace docredact {
namespace extraction {

/*
  DocxPackage
  --------------------------------------------------------
  In-memory view of an OOXML (ZIP) package, backed by libzip.

  The package keeps its own copy of the archive bytes, so the
  caller's buffer may go away. Entries are read on demand;
  Rewrite() produces a new archive in which selected entries
  are replaced and everything else is carried over unchanged.

  Text-bearing WordprocessingML parts, in the order the flat
  text view uses them:
    word/document.xml
    word/header*.xml, word/footer*.xml, word/footnotes.xml,
    word/endnotes.xml, word/comments.xml   (sorted by name)
*/
class DocxPackage {
  public:
    static constexpr const char* kMainDocumentPart = "word/document.xml";

    // Throws core::ExtractionError when the bytes are not a readable ZIP.
    explicit DocxPackage(const std::vector<uint8_t>& bytes);
    ~DocxPackage();

    DocxPackage(const DocxPackage&) = delete;
    DocxPackage& operator=(const DocxPackage&) = delete;

    bool HasEntry(const std::string& name) const;
    std::vector<std::string> EntryNames() const;

    // Throws core::ExtractionError when the entry is missing or unreadable.
    std::string ReadEntry(const std::string& name) const;

    // Main document part first, then the auxiliary parts sorted by name.
    std::vector<std::string> TextPartNames() const;

    // -------------------------------------------------------------------------
    // Builds a new archive from `original` with each named entry replaced.
    // Throws core::ApplicationError on any libzip failure.
    // -------------------------------------------------------------------------
    static std::vector<uint8_t> Rewrite(const std::vector<uint8_t>& original,
                                        const std::map<std::string, std::string>& replacements);

    // Non-throwing check used by the file type resolver.
    static bool ContainsEntry(const std::vector<uint8_t>& bytes, const std::string& name);

  private:
    std::vector<uint8_t> m_bytes;
    zip_t* m_archive;
};

} // namespace extraction
} // namespace docredact

#endif // DOCREDACT_EXTRACTION_DOCX_PACKAGE_HPP
