/**
 * @file test_fileinfo.cpp
 * @brief Unit tests for the FileInfo class and the helpers in utils.hpp
 *
 * This file contains Google Test unit tests that verify construction,
 * name and extension accessors, size formatting, hash storage, and the
 * naming helpers used for backup ids and snapshots.
 *
 * @see FileInfo
 */

#include <gtest/gtest.h>
#include "fileinfo.hpp"
#include "utils.hpp"

#include <cctype>
#include <set>

/**
 * @test BasicConstruction
 * @brief Verifies basic FileInfo object construction and getter methods
 *
 * Expected behavior:
 * - Path matches the provided path
 * - File size matches the provided size
 * - Hash is empty until set
 *
 * @see FileInfo::FileInfo()
 */
TEST(FileInfoTest, BasicConstruction) {
    FileInfo info("/media/inbox/Show.S01E01.mkv", 1024);

    EXPECT_EQ(info.getPath(), std::filesystem::path("/media/inbox/Show.S01E01.mkv"));
    EXPECT_EQ(info.getFileSize(), 1024u);
    EXPECT_TRUE(info.getHash().empty());
}

/**
 * @test NameAccessors
 * @brief Verifies file name, stem and extension extraction
 *
 * The extension is reported lower-case with its leading dot so that
 * extension filters can compare it directly.
 */
TEST(FileInfoTest, NameAccessors) {
    FileInfo info("/media/inbox/Movie.Title.2020.MKV", 10);

    EXPECT_EQ(info.getFileName(), "Movie.Title.2020.MKV");
    EXPECT_EQ(info.getStem(), "Movie.Title.2020");
    EXPECT_EQ(info.getExtension(), ".mkv");
}

TEST(FileInfoTest, ExtensionlessFile) {
    FileInfo info("/media/inbox/README", 10);
    EXPECT_EQ(info.getExtension(), "");
}

/**
 * @test SizeFormatting
 * @brief Verifies human-readable size formatting
 *
 * @see formatBytes()
 */
TEST(FileInfoTest, SizeFormatting) {
    FileInfo zero("/tmp/empty.mkv", 0);
    EXPECT_EQ(zero.getSizeFormatted(), "0 B");

    FileInfo kb("/tmp/file.mkv", 1024);
    EXPECT_EQ(kb.getSizeFormatted(), "1.0 KB");

    FileInfo mb("/tmp/large.mkv", 1048576);
    EXPECT_EQ(mb.getSizeFormatted(), "1.0 MB");

    EXPECT_EQ(formatBytes(1536), "1.5 KB");
}

/**
 * @test HashOperations
 * @brief Verifies hash storage
 */
TEST(FileInfoTest, HashOperations) {
    FileInfo info("/tmp/test.mkv", 100);
    info.setHash("ABC123");
    EXPECT_EQ(info.getHash(), "ABC123");
}

TEST(FileInfoTest, ZeroFilesDetection) {
    FileInfo zero("/tmp/empty.mkv", 0);
    FileInfo non_zero("/tmp/file.mkv", 1);

    EXPECT_TRUE(zero.zeroFile());
    EXPECT_FALSE(non_zero.zeroFile());
}

/**
 * @test TimestampFormat
 * @brief Verifies the "YYYYmmdd_HHMMSS" stamp used in backup ids
 */
TEST(UtilsTest, TimestampFormat) {
    std::string stamp = timestampString();

    ASSERT_EQ(stamp.size(), 15u);
    EXPECT_EQ(stamp[8], '_');
    for (std::size_t i = 0; i < stamp.size(); ++i) {
        if (i != 8)
            EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(stamp[i]))) << stamp;
    }
}

TEST(UtilsTest, RandomHexLengthAndAlphabet) {
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        std::string hex = randomHex();
        ASSERT_EQ(hex.size(), 8u);
        EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(hex);
    }
    EXPECT_GT(seen.size(), 1u);

    EXPECT_EQ(randomHex(6).size(), 6u);
}
