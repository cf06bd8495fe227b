#include <cstdio>
#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/file_type_resolver.hpp"
#include "test_support.hpp"

namespace {

using docredact::core::FileTypeResolver;
using docredact::core::FormatKind;
using docredact::core::InputError;
using docredact::core::InputErrorCode;

template <typename F>
InputErrorCode codeOf(F&& call) {
    try {
        call();
    } catch (const InputError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected InputError";
    return InputErrorCode::UnsupportedType;
}

TEST(FileTypeResolverTest, SniffsContentBeforeExtension) {
    FileTypeResolver resolver;
    std::vector<uint8_t> pdf = docredact::test::MakePdf({docredact::test::TextAt(72, 700, "hello")});
    EXPECT_EQ(resolver.ResolveBytes(pdf, ".txt"), FormatKind::Pdf);

    std::vector<uint8_t> docx = docredact::test::MakeDocx({"hello"});
    EXPECT_EQ(resolver.ResolveBytes(docx, ""), FormatKind::Docx);

    EXPECT_EQ(resolver.ResolveBytes(docredact::test::Bytes("plain words"), ".pdf"), FormatKind::Text);
    EXPECT_EQ(resolver.ResolveBytes(docredact::test::Bytes("{\\rtf1 hello}"), ""), FormatKind::Text);
}

TEST(FileTypeResolverTest, PdfMagicAfterLeadingJunk) {
    FileTypeResolver resolver;
    std::vector<uint8_t> bytes = docredact::test::Bytes("\x01\x02junk%PDF-1.4\n");
    EXPECT_EQ(resolver.ResolveBytes(bytes, ""), FormatKind::Pdf);
}

TEST(FileTypeResolverTest, RejectsNonWordZipAndLegacyDoc) {
    FileTypeResolver resolver;
    std::vector<uint8_t> zip = docredact::test::MakeZip({{"readme.txt", "hi"}});
    EXPECT_EQ(codeOf([&] { resolver.ResolveBytes(zip, ".docx"); }), InputErrorCode::UnsupportedType);

    std::vector<uint8_t> ole = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1, 0x00, 0x00};
    EXPECT_EQ(codeOf([&] { resolver.ResolveBytes(ole, ".doc"); }), InputErrorCode::UnsupportedType);
}

TEST(FileTypeResolverTest, BinaryFallsBackToExtension) {
    FileTypeResolver resolver;
    std::vector<uint8_t> binary = {0x00, 0xFF, 0x10, 0x00};
    EXPECT_EQ(resolver.ResolveBytes(binary, ".txt"), FormatKind::Text);
    EXPECT_EQ(codeOf([&] { resolver.ResolveBytes(binary, ".exe"); }), InputErrorCode::UnsupportedType);
    EXPECT_EQ(codeOf([&] { resolver.ResolveBytes(binary, ""); }), InputErrorCode::UnsupportedType);
}

TEST(FileTypeResolverTest, SizeLimitAndMissingFile) {
    FileTypeResolver small(8);
    EXPECT_EQ(codeOf([&] { small.ResolveBytes(docredact::test::Bytes("more than eight bytes"), ""); }),
              InputErrorCode::TooLarge);

    FileTypeResolver resolver;
    EXPECT_EQ(codeOf([&] { resolver.Resolve("no_such_input_file.pdf"); }), InputErrorCode::NotFound);

    const std::string file = "resolver_large.txt";
    docredact::test::WriteFile(file, docredact::test::Bytes("0123456789abcdef"));
    EXPECT_EQ(codeOf([&] { small.Resolve(file); }), InputErrorCode::TooLarge);
    EXPECT_EQ(resolver.Resolve(file), FormatKind::Text);
    std::remove(file.c_str());
}

TEST(FileTypeResolverTest, ExtensionOfLowercases) {
    EXPECT_EQ(FileTypeResolver::ExtensionOf("/tmp/Report.PDF"), ".pdf");
    EXPECT_EQ(FileTypeResolver::ExtensionOf("/tmp.d/noext"), "");
    EXPECT_EQ(FileTypeResolver::ExtensionOf("notes.Text"), ".text");
}

} // anonymous namespace
