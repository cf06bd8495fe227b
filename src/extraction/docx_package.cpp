#include "extraction/docx_package.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <algorithm>

namespace docredact {
namespace extraction {

namespace {

bool isAuxiliaryTextPart(const std::string& name) {
    if (name.rfind("word/", 0) != 0 || name.size() < 9)
        return false;
    if (name.compare(name.size() - 4, 4, ".xml") != 0)
        return false;
    // Only top-level parts of word/, not word/_rels/ or word/theme/.
    std::string leaf = name.substr(5);
    if (leaf.find('/') != std::string::npos)
        return false;
    return leaf.rfind("header", 0) == 0 || leaf.rfind("footer", 0) == 0 ||
           leaf == "footnotes.xml" || leaf == "endnotes.xml" || leaf == "comments.xml";
}

std::string zipErrorString(zip_error_t* error) {
    const char* msg = zip_error_strerror(error);
    return msg ? std::string(msg) : std::string("unknown libzip error");
}

} // namespace

DocxPackage::DocxPackage(const std::vector<uint8_t>& bytes) : m_bytes(bytes), m_archive(nullptr) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(m_bytes.data(), m_bytes.size(), 0, &error);
    if (!src) {
        std::string msg = zipErrorString(&error);
        zip_error_fini(&error);
        throw core::ExtractionError("DocxPackage: cannot create zip source: " + msg);
    }

    m_archive = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!m_archive) {
        std::string msg = zipErrorString(&error);
        zip_source_free(src);
        zip_error_fini(&error);
        throw core::ExtractionError("DocxPackage: not a readable ZIP package: " + msg);
    }
    zip_error_fini(&error);
}

DocxPackage::~DocxPackage() {
    if (m_archive) {
        zip_discard(m_archive);
    }
}

bool DocxPackage::HasEntry(const std::string& name) const {
    return zip_name_locate(m_archive, name.c_str(), 0) >= 0;
}

std::vector<std::string> DocxPackage::EntryNames() const {
    std::vector<std::string> names;
    zip_int64_t count = zip_get_num_entries(m_archive, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const char* raw = zip_get_name(m_archive, static_cast<zip_uint64_t>(i), 0);
        if (raw) {
            names.emplace_back(raw);
        }
    }
    return names;
}

std::string DocxPackage::ReadEntry(const std::string& name) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(m_archive, name.c_str(), 0, &st) != 0 || !(st.valid & ZIP_STAT_SIZE)) {
        throw core::ExtractionError("DocxPackage: missing entry " + name);
    }

    zip_file_t* file = zip_fopen(m_archive, name.c_str(), 0);
    if (!file) {
        throw core::ExtractionError("DocxPackage: cannot open entry " + name);
    }

    std::string contents(static_cast<size_t>(st.size), '\0');
    zip_int64_t bytesRead = st.size > 0 ? zip_fread(file, &contents[0], st.size) : 0;
    zip_fclose(file);

    if (bytesRead < 0 || static_cast<zip_uint64_t>(bytesRead) != st.size) {
        throw core::ExtractionError("DocxPackage: short read on entry " + name);
    }
    return contents;
}

std::vector<std::string> DocxPackage::TextPartNames() const {
    std::vector<std::string> aux;
    for (const auto& name : EntryNames()) {
        if (isAuxiliaryTextPart(name)) {
            aux.push_back(name);
        }
    }
    std::sort(aux.begin(), aux.end());

    std::vector<std::string> parts;
    if (HasEntry(kMainDocumentPart)) {
        parts.emplace_back(kMainDocumentPart);
    }
    parts.insert(parts.end(), aux.begin(), aux.end());
    return parts;
}

std::vector<uint8_t> DocxPackage::Rewrite(const std::vector<uint8_t>& original,
                                          const std::map<std::string, std::string>& replacements) {
    if (replacements.empty()) {
        return original;
    }

    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(original.data(), original.size(), 0, &error);
    if (!src) {
        std::string msg = zipErrorString(&error);
        zip_error_fini(&error);
        throw core::ApplicationError("DocxPackage: cannot create zip source: " + msg);
    }
    zip_t* archive = zip_open_from_source(src, 0, &error);
    if (!archive) {
        std::string msg = zipErrorString(&error);
        zip_source_free(src);
        zip_error_fini(&error);
        throw core::ApplicationError("DocxPackage: cannot open package for writing: " + msg);
    }
    zip_error_fini(&error);
    // Keep the source alive after zip_close so the new archive can be read back.
    zip_source_keep(src);

    for (const auto& entry : replacements) {
        zip_source_t* data = zip_source_buffer(archive, entry.second.data(), entry.second.size(), 0);
        if (!data) {
            zip_discard(archive);
            zip_source_free(src);
            throw core::ApplicationError("DocxPackage: cannot stage entry " + entry.first);
        }
        if (zip_file_add(archive, entry.first.c_str(), data, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(data);
            zip_discard(archive);
            zip_source_free(src);
            throw core::ApplicationError("DocxPackage: cannot replace entry " + entry.first);
        }
    }

    if (zip_close(archive) != 0) {
        std::string msg = zip_strerror(archive);
        zip_discard(archive);
        zip_source_free(src);
        throw core::ApplicationError("DocxPackage: writing package failed: " + msg);
    }

    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_source_open(src) < 0) {
        zip_source_free(src);
        throw core::ApplicationError("DocxPackage: cannot reopen rewritten package");
    }
    if (zip_source_stat(src, &st) < 0 || !(st.valid & ZIP_STAT_SIZE)) {
        zip_source_close(src);
        zip_source_free(src);
        throw core::ApplicationError("DocxPackage: cannot stat rewritten package");
    }

    std::vector<uint8_t> out(static_cast<size_t>(st.size));
    zip_int64_t n = out.empty() ? 0 : zip_source_read(src, out.data(), out.size());
    zip_source_close(src);
    zip_source_free(src);
    if (n < 0 || static_cast<zip_uint64_t>(n) != st.size) {
        throw core::ApplicationError("DocxPackage: short read of rewritten package");
    }

    util::logger::debug("[DocxPackage] Rewrote " + std::to_string(replacements.size()) + " part(s).");
    return out;
}

bool DocxPackage::ContainsEntry(const std::vector<uint8_t>& bytes, const std::string& name) {
    zip_error_t error;
    zip_error_init(&error);
    zip_source_t* src = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
    if (!src) {
        zip_error_fini(&error);
        return false;
    }
    zip_t* archive = zip_open_from_source(src, ZIP_RDONLY, &error);
    zip_error_fini(&error);
    if (!archive) {
        zip_source_free(src);
        return false;
    }
    bool found = zip_name_locate(archive, name.c_str(), 0) >= 0;
    zip_discard(archive);
    return found;
}

} // namespace extraction
} // namespace docredact
