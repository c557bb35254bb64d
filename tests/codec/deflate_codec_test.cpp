// =============================================================================
// parz - Deflate Codec Tests
// =============================================================================
// Encoder push/finalize behavior and decoding of back-to-back raw DEFLATE
// streams.
// =============================================================================

#include "parz/codec/deflate_codec.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "support/test_sources.h"

namespace parz::codec {
namespace {

ByteBuffer compressWhole(const ByteBuffer& input) {
    auto encoder = DeflateEncoder::create();
    EXPECT_TRUE(encoder.has_value());
    EXPECT_TRUE((*encoder)->write(input).has_value());
    auto block = (*encoder)->finish();
    EXPECT_TRUE(block.has_value());
    return *block;
}

// =============================================================================
// DeflateEncoder Tests
// =============================================================================

TEST(DeflateEncoderTest, CreateRejectsInvalidLevel) {
    auto encoder = DeflateEncoder::create(42);
    ASSERT_FALSE(encoder.has_value());
    EXPECT_EQ(encoder.error().code(), ErrorCode::kInvalidArgument);
}

TEST(DeflateEncoderTest, DefaultsToBestCompression) {
    auto encoder = DeflateEncoder::create();
    ASSERT_TRUE(encoder.has_value());
    EXPECT_EQ((*encoder)->level(), kBestCompressionLevel);
    EXPECT_FALSE((*encoder)->finished());
    EXPECT_EQ((*encoder)->bufferedSize(), 0u);
}

TEST(DeflateEncoderTest, EmptyInputProducesMinimalStream) {
    auto block = compressWhole({});

    // A single final fixed-Huffman block holding only end-of-block
    ASSERT_EQ(block.size(), 2u);
    EXPECT_EQ(block[0], 0x03);
    EXPECT_EQ(block[1], 0x00);

    auto decoded = inflateConcatenated(block);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(DeflateEncoderTest, FinishTwiceIsInvalidState) {
    auto encoder = DeflateEncoder::create();
    ASSERT_TRUE(encoder.has_value());
    ASSERT_TRUE((*encoder)->finish().has_value());
    EXPECT_TRUE((*encoder)->finished());

    auto again = (*encoder)->finish();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::kInvalidState);
}

TEST(DeflateEncoderTest, WriteAfterFinishIsInvalidState) {
    auto encoder = DeflateEncoder::create();
    ASSERT_TRUE(encoder.has_value());
    ASSERT_TRUE((*encoder)->finish().has_value());

    auto data = test::toBytes("late");
    auto written = (*encoder)->write(data);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code(), ErrorCode::kInvalidState);
}

TEST(DeflateEncoderTest, BufferedSizeGrowsWithIncompressibleInput) {
    auto encoder = DeflateEncoder::create();
    ASSERT_TRUE(encoder.has_value());

    auto data = test::randomBytes(256 * 1024);
    ASSERT_TRUE((*encoder)->write(data).has_value());

    // zlib keeps far less than 256 KiB of pending input internally
    const auto buffered = (*encoder)->bufferedSize();
    EXPECT_GT(buffered, 0u);

    auto block = (*encoder)->finish();
    ASSERT_TRUE(block.has_value());
    EXPECT_GE(block->size(), buffered);
    EXPECT_GE(block->size(), data.size());
}

TEST(DeflateEncoderTest, FactoryCreatesIndependentEncoders) {
    auto factory = deflateEncoderFactory();
    auto first = factory();
    auto second = factory();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    ASSERT_TRUE((*first)->finish().has_value());
    EXPECT_TRUE((*first)->finished());
    EXPECT_FALSE((*second)->finished());
}

// =============================================================================
// Decoder Tests
// =============================================================================

TEST(InflateStreamsTest, EmptyInputHasNoStreams) {
    auto streams = inflateStreams({});
    ASSERT_TRUE(streams.has_value());
    EXPECT_TRUE(streams->empty());
}

TEST(InflateStreamsTest, SplitsConcatenatedStreams) {
    auto first = test::toBytes("first block of data");
    auto second = test::textBytes(5000);
    auto blockA = compressWhole(first);
    auto blockB = compressWhole(second);

    ByteBuffer joined = blockA;
    joined.insert(joined.end(), blockB.begin(), blockB.end());

    auto streams = inflateStreams(joined);
    ASSERT_TRUE(streams.has_value());
    ASSERT_EQ(streams->size(), 2u);
    EXPECT_EQ((*streams)[0].compressedSize, blockA.size());
    EXPECT_EQ((*streams)[0].data, first);
    EXPECT_EQ((*streams)[1].compressedSize, blockB.size());
    EXPECT_EQ((*streams)[1].data, second);
}

TEST(InflateStreamsTest, TruncatedStreamIsInvalidData) {
    auto block = compressWhole(test::randomBytes(4096));
    block.resize(block.size() / 2);

    auto streams = inflateStreams(block);
    ASSERT_FALSE(streams.has_value());
    EXPECT_EQ(streams.error().code(), ErrorCode::kInvalidData);
}

TEST(InflateStreamsTest, GarbageIsInvalidData) {
    // BTYPE 11 is reserved
    ByteBuffer garbage{0xFF, 0xFF, 0xFF, 0xFF};
    auto streams = inflateStreams(garbage);
    ASSERT_FALSE(streams.has_value());
    EXPECT_EQ(streams.error().code(), ErrorCode::kInvalidData);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(DeflateCodecProperty, ConcatenatedBlocksDecodeInOrder,
              (const std::vector<std::vector<std::uint8_t>>& pieces)) {
    ByteBuffer joined;
    ByteBuffer expected;
    for (const auto& piece : pieces) {
        auto block = compressWhole(piece);
        joined.insert(joined.end(), block.begin(), block.end());
        expected.insert(expected.end(), piece.begin(), piece.end());
    }

    auto decoded = inflateConcatenated(joined);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == expected);
}

}  // namespace
}  // namespace parz::codec
