#ifndef DOCREDACT_CORE_DOCUMENT_HPP
#define DOCREDACT_CORE_DOCUMENT_HPP

#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/types.hpp"

namespace docredact {
namespace core {

/*
  Document
  --------------------------------
  Immutable view of one input: the original bytes, their format and the
  source path. Copies share the same buffer. Appliers work on their own
  copy of Bytes(); nothing writes through a Document.
*/
class Document
{
public:
    Document(std::vector<uint8_t> bytes, FormatKind format, std::string sourcePath = std::string())
        : m_bytes(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
          m_format(format),
          m_sourcePath(std::move(sourcePath))
    {}

    const std::vector<uint8_t>& Bytes() const { return *m_bytes; }
    FormatKind Format() const { return m_format; }
    const std::string& SourcePath() const { return m_sourcePath; }
    size_t Size() const { return m_bytes->size(); }

    // -------------------------------------------------------------------------
    // Returns a private, mutable copy of the bytes for an applier.
    // -------------------------------------------------------------------------
    std::vector<uint8_t> WorkingCopy() const { return *m_bytes; }

    // -------------------------------------------------------------------------
    // Reads a whole file in binary mode. Throws InputError(NotFound) when the
    // file cannot be opened.
    // -------------------------------------------------------------------------
    static std::vector<uint8_t> ReadFileBytes(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw InputError(InputErrorCode::NotFound, "cannot open " + path);
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw InputError(InputErrorCode::NotFound, "read failed for " + path);
        }
        return data;
    }

private:
    std::shared_ptr<const std::vector<uint8_t>> m_bytes;
    FormatKind m_format;
    std::string m_sourcePath;
};

} // namespace core
} // namespace docredact

#endif // DOCREDACT_CORE_DOCUMENT_HPP
