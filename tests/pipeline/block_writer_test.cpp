// =============================================================================
// parz - Block Writer Tests
// =============================================================================

#include "parz/pipeline/block_writer.h"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "support/test_sources.h"

namespace parz::pipeline {
namespace {

TEST(BlockWriterTest, WritesChunksInGivenOrder) {
    std::vector<Chunk> chunks;
    chunks.push_back(Chunk{test::toBytes("abc"), 0, 0});
    chunks.push_back(Chunk{test::toBytes("de"), 1, 0});
    chunks.push_back(Chunk{test::toBytes("fghi"), 2, 0});

    std::ostringstream out;
    auto written = writeChunks(chunks, out);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 9u);
    EXPECT_EQ(out.str(), "abcdefghi");
}

TEST(BlockWriterTest, SkipsChunksWithoutData) {
    std::vector<Chunk> chunks;
    chunks.push_back(Chunk{std::nullopt, 0, 0});
    chunks.push_back(Chunk{test::toBytes("xy"), 1, 0});
    chunks.push_back(Chunk{ByteBuffer{}, 2, 0});

    std::ostringstream out;
    auto written = writeChunks(chunks, out);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 2u);
    EXPECT_EQ(out.str(), "xy");
}

TEST(BlockWriterTest, EmptySequenceWritesNothing) {
    std::ostringstream out;
    auto written = writeChunks({}, out);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(BlockWriterTest, StreamFailureIsIOError) {
    std::vector<Chunk> chunks;
    chunks.push_back(Chunk{test::toBytes("abc"), 0, 0});

    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto written = writeChunks(chunks, out);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code(), ErrorCode::kIOError);
}

TEST(BlockWriterTest, CreateOutputFileTruncates) {
    test::TempDir dir;
    auto path = dir.writeFile("out.bin", test::toBytes("previous content"));

    {
        auto output = createOutputFile(path);
        ASSERT_TRUE(output.has_value());
        std::vector<Chunk> chunks;
        chunks.push_back(Chunk{test::toBytes("new"), 0, 0});
        ASSERT_TRUE(writeChunks(chunks, **output).has_value());
    }

    EXPECT_EQ(test::readFile(path), test::toBytes("new"));
}

TEST(BlockWriterTest, CreateOutputFileInMissingDirectoryFails) {
    test::TempDir dir;
    auto output = createOutputFile(dir.path() / "no" / "such" / "out.bin");
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code(), ErrorCode::kFileOpenFailed);
}

}  // namespace
}  // namespace parz::pipeline
