#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include "test_support.hpp"
#include "util/secure_temp_file.hpp"

namespace {

using docredact::util::SecureTempFile;

bool exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

TEST(SecureTempFileTest, CommitMovesBytesIntoPlace) {
    const std::string target = "./test_secure_commit.out";
    std::remove(target.c_str());
    std::string tempPath;
    {
        SecureTempFile tmp(target);
        tempPath = tmp.path();
        EXPECT_NE(tempPath.find(".docredact-"), std::string::npos);

        std::vector<uint8_t> data = docredact::test::Bytes("redacted bytes");
        tmp.write(data);
        EXPECT_EQ(tmp.readBack(), data);
        EXPECT_TRUE(tmp.commit(target));
        EXPECT_TRUE(tmp.committed());
    }
    EXPECT_FALSE(exists(tempPath));
    ASSERT_TRUE(exists(target));

    std::ifstream in(target, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "redacted bytes");
    std::remove(target.c_str());
}

TEST(SecureTempFileTest, UncommittedFileIsRemoved) {
    const std::string target = "./test_secure_abandon.out";
    std::string tempPath;
    {
        SecureTempFile tmp(target);
        tempPath = tmp.path();
        tmp.write(docredact::test::Bytes("never published"));
        EXPECT_TRUE(exists(tempPath));
    }
    EXPECT_FALSE(exists(tempPath));
    EXPECT_FALSE(exists(target));
}

TEST(SecureTempFileTest, CommitNeverReplacesExistingFile) {
    const std::string target = "./test_secure_existing.out";
    docredact::test::WriteFile(target, docredact::test::Bytes("someone else's file"));
    std::string tempPath;
    {
        SecureTempFile tmp(target);
        tempPath = tmp.path();
        tmp.write(docredact::test::Bytes("redacted bytes"));
        EXPECT_FALSE(tmp.commit(target));
        EXPECT_FALSE(tmp.committed());
        EXPECT_TRUE(exists(tempPath));
    }
    EXPECT_FALSE(exists(tempPath));

    std::ifstream in(target, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "someone else's file");
    std::remove(target.c_str());
}

TEST(SecureTempFileTest, SecureDeleteOfMissingFileSucceeds) {
    const std::string path = "./test_secure_delete.bin";
    docredact::test::WriteFile(path, docredact::test::Bytes("payload"));
    EXPECT_TRUE(docredact::util::secureDelete(path));
    EXPECT_FALSE(exists(path));
    EXPECT_TRUE(docredact::util::secureDelete(path));
}

TEST(SecureTempFileTest, MissingDirectoryThrows) {
    EXPECT_THROW(SecureTempFile("./no_such_dir_for_docredact/out.pdf"), std::runtime_error);
}

} // anonymous namespace
