#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(docsan::NormalizeArchivePath("./word/document.xml"), "word/document.xml");
    EXPECT_EQ(docsan::NormalizeArchivePath("/word//media///image1.png"), "word/media/image1.png");
    EXPECT_EQ(docsan::NormalizeArchivePath("////././a//b"), "././a/b");
    EXPECT_EQ(docsan::NormalizeArchivePath("[Content_Types].xml"), "[Content_Types].xml");
    EXPECT_EQ(docsan::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(docsan::ContainsIgnoreCase("word/comments.xml", "comments"));
    EXPECT_TRUE(docsan::ContainsIgnoreCase("CommentsExtended.xml", "comments"));
    EXPECT_TRUE(docsan::ContainsIgnoreCase("anything", ""));
    EXPECT_FALSE(docsan::ContainsIgnoreCase("styles.xml", "comments"));
    EXPECT_FALSE(docsan::ContainsIgnoreCase("comm", "comments"));
}

TEST(PathUtilsTest, DefaultOutputPathAppendsSuffixBeforeExtension) {
    EXPECT_EQ(docsan::DefaultOutputPath("/data/report.docx", "_clean").string(), "/data/report_clean.docx");
    EXPECT_EQ(docsan::DefaultOutputPath("/data/v1.2.docx", "_clean").string(), "/data/v1.2_clean.docx");
    EXPECT_EQ(docsan::DefaultOutputPath("/data/noext", "_x").string(), "/data/noext_x");
}
