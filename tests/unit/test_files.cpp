#include "util/files.hpp"

#include <gtest/gtest.h>

using namespace fm::util;

TEST(FilesTest, BytesToSizeIsHumanReadable) {
    EXPECT_EQ(bytesToSize(0), "0B");
    EXPECT_EQ(bytesToSize(1023), "1023B");
    EXPECT_EQ(bytesToSize(1024), "1KB");
    EXPECT_EQ(bytesToSize(1536), "1.5KB");
    EXPECT_EQ(bytesToSize(20ull * 1024 * 1024), "20MB");
    EXPECT_EQ(bytesToSize(5ull * 1024 * 1024 * 1024 * 1024), "5TB");
}

TEST(FilesTest, RelativeKeyIsSlashSeparated) {
    EXPECT_EQ(relativeKey("/data/src", "/data/src/a/b.txt"), "a/b.txt");
    EXPECT_EQ(relativeKey("/data/src", "/data/src/./a/../c"), "c");
    EXPECT_EQ(relativeKey("/data/src", "/data/src"), "");
}

TEST(FilesTest, TempSiblingsAreRecognized) {
    const auto tmp = tempSiblingFor("/data/dst/photo.jpg");
    EXPECT_EQ(tmp.parent_path(), std::filesystem::path("/data/dst"));
    EXPECT_TRUE(isTempSibling(tmp));
    EXPECT_NE(tmp, tempSiblingFor("/data/dst/photo.jpg"));

    EXPECT_FALSE(isTempSibling("/data/dst/photo.jpg"));
    EXPECT_FALSE(isTempSibling("/data/dst/.hidden"));
}

TEST(FilesTest, TempSiblingMatchIsExact) {
    EXPECT_TRUE(isTempSibling("/d/.x.fmtmp-Ab12Cd34"));
    EXPECT_TRUE(isTempSibling("/d/.cache.json.fmtmp-00000000"));

    EXPECT_FALSE(isTempSibling("/d/.x.fmtmp-abc"));
    EXPECT_FALSE(isTempSibling("/d/.x.fmtmp-Ab12Cd345"));
    EXPECT_FALSE(isTempSibling("/d/.x.fmtmp-Ab12-d34"));
    EXPECT_FALSE(isTempSibling("/d/.x.fmtmp-Ab12Cd34.txt"));
    EXPECT_FALSE(isTempSibling("/d/x.fmtmp-Ab12Cd34"));
    EXPECT_FALSE(isTempSibling("/d/.fmtmp-Ab12Cd34"));
}

TEST(FilesTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain/ascii.txt"));
    EXPECT_TRUE(isValidUtf8("caf\xc3\xa9/\xe2\x82\xac/\xf0\x9f\x98\x80"));

    EXPECT_FALSE(isValidUtf8("bad\xff.txt"));
    EXPECT_FALSE(isValidUtf8("trunc\xc3"));
    EXPECT_FALSE(isValidUtf8("overlong\xc0\xaf"));
    EXPECT_FALSE(isValidUtf8("surrogate\xed\xa0\x80"));
    EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));
}

TEST(FilesTest, RandomSuffixHasRequestedLength) {
    EXPECT_EQ(generate_random_suffix().size(), 8u);
    EXPECT_EQ(generate_random_suffix(20).size(), 20u);
}
