#ifndef DOCREDACT_TEST_TEST_SUPPORT_HPP
#define DOCREDACT_TEST_TEST_SUPPORT_HPP

// Fixture builders shared by the unit and integration tests. PDFs are made
// with qpdf and DOCX packages with libzip, all in memory.

#include <cstdint>
#include <dirent.h>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zip.h>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace docredact {
namespace test {

// One Tj at a baseline position in PDF user space (origin bottom-left).
inline std::string TextAt(double x, double y, const std::string& text, double size = 12)
{
    std::string escaped;
    for (char c : text) {
        if (c == '(' || c == ')' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    std::ostringstream oss;
    oss << "BT /F1 " << size << " Tf " << x << " " << y << " Td (" << escaped << ") Tj ET\n";
    return oss.str();
}

// A PDF with one page per content string, 612x792, font /F1 = the given
// non-embedded Type1 base font.
inline std::vector<uint8_t> MakePdf(const std::vector<std::string>& pageContents,
                                    const std::string& baseFont = "Helvetica")
{
    QPDF pdf;
    pdf.emptyPDF();

    QPDFObjectHandle font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont + " /Encoding /WinAnsiEncoding >>"));
    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    resources.replaceKey("/ProcSet", QPDFObjectHandle::parse("[/PDF /Text]"));

    QPDFPageDocumentHelper pages(pdf);
    for (const auto& content : pageContents) {
        QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page >>"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::parse("[0 0 612 792]"));
        page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
        page.replaceKey("/Resources", resources);
        pages.addPage(QPDFPageObjectHelper(page), false);
    }

    QPDFWriter writer(pdf);
    writer.setOutputMemory();
    writer.write();
    std::unique_ptr<Buffer> out(writer.getBuffer());
    const uint8_t* data = out->getBuffer();
    return std::vector<uint8_t>(data, data + out->getSize());
}

// A ZIP package holding the given entries.
inline std::vector<uint8_t> MakeZip(const std::map<std::string, std::string>& entries)
{
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (!src) {
        zip_error_fini(&error);
        throw std::runtime_error("MakeZip: cannot create buffer source");
    }
    zip_t* archive = zip_open_from_source(src, ZIP_TRUNCATE, &error);
    zip_error_fini(&error);
    if (!archive) {
        zip_source_free(src);
        throw std::runtime_error("MakeZip: cannot open archive");
    }
    zip_source_keep(src);

    for (const auto& entry : entries) {
        zip_source_t* data = zip_source_buffer(archive, entry.second.data(), entry.second.size(), 0);
        if (!data || zip_file_add(archive, entry.first.c_str(), data, ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(data);
            zip_discard(archive);
            zip_source_free(src);
            throw std::runtime_error("MakeZip: cannot add " + entry.first);
        }
    }
    if (zip_close(archive) != 0) {
        zip_discard(archive);
        zip_source_free(src);
        throw std::runtime_error("MakeZip: close failed");
    }

    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_source_open(src) < 0 || zip_source_stat(src, &st) < 0) {
        zip_source_free(src);
        throw std::runtime_error("MakeZip: cannot read archive back");
    }
    std::vector<uint8_t> out(static_cast<size_t>(st.size));
    zip_int64_t n = out.empty() ? 0 : zip_source_read(src, out.data(), out.size());
    zip_source_close(src);
    zip_source_free(src);
    if (n < 0 || static_cast<size_t>(n) != out.size()) {
        throw std::runtime_error("MakeZip: short read");
    }
    return out;
}

// w:p elements, one per string. A paragraph given as several strings
// separated by '|' is split into that many runs.
inline std::string MakeDocumentXml(const std::vector<std::string>& paragraphs)
{
    std::string body;
    for (const auto& p : paragraphs) {
        body += "<w:p><w:pPr><w:jc w:val=\"left\"/></w:pPr>";
        std::string::size_type start = 0;
        while (true) {
            std::string::size_type bar = p.find('|', start);
            std::string run = p.substr(start, bar == std::string::npos ? std::string::npos : bar - start);
            body += "<w:r><w:rPr><w:i/></w:rPr><w:t xml:space=\"preserve\">" + run + "</w:t></w:r>";
            if (bar == std::string::npos) {
                break;
            }
            start = bar + 1;
        }
        body += "</w:p>";
    }
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
           "<w:body>" + body + "</w:body></w:document>";
}

inline std::vector<uint8_t> MakeDocx(const std::vector<std::string>& paragraphs)
{
    std::map<std::string, std::string> entries;
    entries["[Content_Types].xml"] =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/word/document.xml\" ContentType=\"application/"
        "vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/></Types>";
    entries["word/document.xml"] = MakeDocumentXml(paragraphs);
    return MakeZip(entries);
}

inline std::vector<uint8_t> Bytes(const std::string& s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline void WriteFile(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Names in `dir` that start with `prefix`.
inline std::vector<std::string> FilesWithPrefix(const std::string& dir, const std::string& prefix)
{
    std::vector<std::string> found;
    DIR* d = ::opendir(dir.c_str());
    if (!d) {
        return found;
    }
    while (struct dirent* entry = ::readdir(d)) {
        std::string name = entry->d_name;
        if (name.compare(0, prefix.size(), prefix) == 0) {
            found.push_back(name);
        }
    }
    ::closedir(d);
    return found;
}

} // namespace test
} // namespace docredact

#endif // DOCREDACT_TEST_TEST_SUPPORT_HPP
