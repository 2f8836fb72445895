#include "io/file_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace patchsync {
namespace {

TEST(FileWriterTest, AppendContinuesAfterExistingContent) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Sub("part.tmp");
    testutil::WriteFile(p, "hello ");

    FileWriter w;
    auto res = FileWriter::Open(p, FileWriter::Mode::Append, w);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(w.Size(), 6u);

    ASSERT_TRUE(w.WriteAll(testutil::Bytes("world")).is_ok());
    EXPECT_EQ(w.Size(), 11u);
    ASSERT_TRUE(w.Close().is_ok());

    EXPECT_EQ(testutil::ReadFile(p), "hello world");
}

TEST(FileWriterTest, TruncateDiscardsExistingContent) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Sub("part.tmp");
    testutil::WriteFile(p, "stale partial data");

    FileWriter w;
    auto res = FileWriter::Open(p, FileWriter::Mode::Truncate, w);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(w.Size(), 0u);

    ASSERT_TRUE(w.WriteAll(testutil::Bytes("fresh")).is_ok());
    ASSERT_TRUE(w.Close().is_ok());
    EXPECT_EQ(testutil::ReadFile(p), "fresh");
}

TEST(FileWriterTest, OpenInMissingDirectoryFails) {
    testutil::TemporaryDirectory tmp;
    FileWriter w;
    auto res = FileWriter::Open(tmp.Sub("no/such/dir/file"), FileWriter::Mode::Truncate, w);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Failed to open output"), std::string::npos);
}

} // namespace
} // namespace patchsync
