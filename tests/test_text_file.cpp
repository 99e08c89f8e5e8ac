#include <gtest/gtest.h>

#include "io/text_file.hpp"
#include "testing.hpp"

#include <string>

namespace docsan {
namespace {

TEST(TextFileTest, ReadDropsByteOrderMark) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/bom.xml";
    ASSERT_TRUE(testutil::WriteTextFile(path, "\xEF\xBB\xBF<a/>"));

    std::string text;
    ASSERT_TRUE(ReadTextFile(path, text).is_ok());
    EXPECT_EQ(text, "<a/>");
}

TEST(TextFileTest, WriteReplacesContent) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/doc.xml";
    ASSERT_TRUE(testutil::WriteTextFile(path, "a much longer original body"));

    ASSERT_TRUE(WriteTextFile(path, "<b/>").is_ok());
    EXPECT_EQ(testutil::ReadFile(path), "<b/>");
}

TEST(TextFileTest, ReadMissingFileFails) {
    testutil::TemporaryDirectory tmp;

    std::string text;
    auto res = ReadTextFile(tmp.Path() + "/absent.xml", text);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::TransformFailure);
}

TEST(TextFileTest, WriteIntoMissingDirectoryFails) {
    testutil::TemporaryDirectory tmp;

    auto res = WriteTextFile(tmp.Path() + "/no/such/dir/doc.xml", "<a/>");
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::TransformFailure);
}

} // namespace
} // namespace docsan
