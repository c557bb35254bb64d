// =============================================================================
// parz - Deflate Codec Adapter
// =============================================================================
// Push/finalize compression of independent blocks, and decoding of files made
// of several such blocks placed back to back.
//
// This module provides:
// - BlockEncoder: streaming encoder interface (write, bufferedSize, finish)
// - DeflateEncoder: raw DEFLATE encoder backed by zlib
// - EncoderFactory: produces a fresh encoder per compressed block
// - inflateStreams / inflateConcatenated: decoder for concatenated streams
//
// Encoded blocks carry no zlib or gzip wrapper. Each block is a complete raw
// DEFLATE stream ending in a final block, padded to a byte boundary.
// =============================================================================

#ifndef PARZ_CODEC_DEFLATE_CODEC_H
#define PARZ_CODEC_DEFLATE_CODEC_H

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "parz/common/error.h"
#include "parz/common/types.h"

namespace parz::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief zlib best-ratio compression level.
inline constexpr int kBestCompressionLevel = 9;

/// @brief Scratch buffer size for zlib output.
inline constexpr std::size_t kCodecScratchSize = 16 * 1024;

// =============================================================================
// BlockEncoder Interface
// =============================================================================

/// @brief Streaming encoder producing one finalized compressed block.
///
/// Bytes are pushed with write(); the compressed output accumulates in an
/// internal buffer whose length is exposed by bufferedSize(). finish() closes
/// the stream and hands over the complete block. A finished encoder rejects
/// further calls; a fresh instance is needed for the next block.
class BlockEncoder {
public:
    virtual ~BlockEncoder() = default;

    /// @brief Push raw bytes into the encoder.
    [[nodiscard]] virtual VoidResult write(ByteSpan data) = 0;

    /// @brief Length of compressed output buffered so far.
    [[nodiscard]] virtual std::size_t bufferedSize() const noexcept = 0;

    /// @brief Finalize and return the complete compressed block.
    [[nodiscard]] virtual Result<ByteBuffer> finish() = 0;

    /// @brief Check whether finish() has been called.
    [[nodiscard]] virtual bool finished() const noexcept = 0;
};

/// @brief Creates independent encoder instances.
using EncoderFactory = std::function<Result<std::unique_ptr<BlockEncoder>>()>;

// =============================================================================
// DeflateEncoder
// =============================================================================

/// @brief Raw DEFLATE encoder (zlib, window bits 15, memLevel 8).
class DeflateEncoder final : public BlockEncoder {
public:
    /// @brief Create an encoder at the given zlib level.
    /// @return Encoder or kCompressionFailed if zlib cannot be initialized.
    [[nodiscard]] static Result<std::unique_ptr<DeflateEncoder>> create(
        int level = kBestCompressionLevel);

    ~DeflateEncoder() override;

    // Non-copyable, non-movable (owns a zlib stream)
    DeflateEncoder(const DeflateEncoder&) = delete;
    DeflateEncoder& operator=(const DeflateEncoder&) = delete;
    DeflateEncoder(DeflateEncoder&&) = delete;
    DeflateEncoder& operator=(DeflateEncoder&&) = delete;

    [[nodiscard]] VoidResult write(ByteSpan data) override;

    [[nodiscard]] std::size_t bufferedSize() const noexcept override { return output_.size(); }

    [[nodiscard]] Result<ByteBuffer> finish() override;

    [[nodiscard]] bool finished() const noexcept override { return finished_; }

    /// @brief Compression level in use.
    [[nodiscard]] int level() const noexcept { return level_; }

private:
    explicit DeflateEncoder(int level);

    /// @brief Run deflate() over input until consumed (or stream end for Z_FINISH).
    VoidResult pump(ByteSpan input, int flush);

    void releaseStream() noexcept;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    ByteBuffer output_;
    int level_;
    bool finished_ = false;
};

/// @brief Factory producing DeflateEncoder instances at the given level.
[[nodiscard]] EncoderFactory deflateEncoderFactory(int level = kBestCompressionLevel);

// =============================================================================
// Decoding
// =============================================================================

/// @brief One decoded raw DEFLATE stream.
struct InflatedStream {
    /// @brief Bytes the stream occupied in the compressed input.
    std::size_t compressedSize = 0;

    /// @brief Decompressed content.
    ByteBuffer data;
};

/// @brief Decode consecutive raw DEFLATE streams.
/// @param input Zero or more streams placed back to back.
/// @return One entry per stream in input order, or kInvalidData if the input
///         is corrupt or ends inside a stream.
[[nodiscard]] Result<std::vector<InflatedStream>> inflateStreams(ByteSpan input);

/// @brief Decode consecutive raw DEFLATE streams into one buffer.
[[nodiscard]] Result<ByteBuffer> inflateConcatenated(ByteSpan input);

}  // namespace parz::codec

#endif  // PARZ_CODEC_DEFLATE_CODEC_H
