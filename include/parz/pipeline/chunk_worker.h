// =============================================================================
// parz - Chunk Worker
// =============================================================================
// Reads from its own input handle, compresses through a private encoder, and
// reports finalized blocks on the result channel.
//
// Loop:
// 1. Read up to chunkSize bytes.
// 2. Zero bytes: finalize the current encoder, send Data, send Done, stop.
// 3. Otherwise feed the bytes to the encoder.
// 4. Once the encoder has buffered chunkSize compressed bytes or more,
//    finalize it, send Data, and continue with a fresh encoder.
// Any failure sends a single Error and stops (no Done).
//
// The close trigger is the compressed size, not the raw size, so block
// boundaries depend on the data.
// =============================================================================

#ifndef PARZ_PIPELINE_CHUNK_WORKER_H
#define PARZ_PIPELINE_CHUNK_WORKER_H

#include <cstddef>
#include <cstdint>
#include <memory>

#include "parz/codec/deflate_codec.h"
#include "parz/common/error.h"
#include "parz/io/byte_source.h"
#include "parz/pipeline/messages.h"
#include "parz/pipeline/result_channel.h"

namespace parz::pipeline {

/// @brief Counters reported by a finished worker.
struct WorkerStats {
    std::uint64_t bytesRead = 0;
    std::uint32_t blocksSent = 0;
    bool failed = false;
};

/// @brief One compression worker.
class ChunkWorker {
public:
    /// @brief Construct a worker.
    /// @param sender Channel to report on.
    /// @param chunkSize Read buffer size and compressed-size threshold.
    /// @param encoderFactory Source of fresh encoders.
    /// @param workerIndex Index used to tag messages.
    ChunkWorker(Sender<CompressionMessage> sender, std::size_t chunkSize,
                codec::EncoderFactory encoderFactory, std::size_t workerIndex);

    // Non-copyable, movable
    ChunkWorker(const ChunkWorker&) = delete;
    ChunkWorker& operator=(const ChunkWorker&) = delete;
    ChunkWorker(ChunkWorker&&) noexcept = default;
    ChunkWorker& operator=(ChunkWorker&&) noexcept = default;

    /// @brief Run to end of input or first failure.
    /// @note Never throws; failures are reported as ErrorMessage.
    /// @note The sender is released before returning.
    WorkerStats run(std::unique_ptr<io::ByteSource> input);

    [[nodiscard]] std::size_t workerIndex() const noexcept { return workerIndex_; }

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    /// @brief Body of run(); returns the failure that ended it, if any.
    VoidResult process(io::ByteSource& input, WorkerStats& stats);

    /// @brief Finalize the encoder and send its block.
    VoidResult emit(codec::BlockEncoder& encoder, WorkerStats& stats);

    /// @brief Create a fresh encoder from the factory.
    Result<std::unique_ptr<codec::BlockEncoder>> freshEncoder();

    void send(CompressionMessage message);

    Sender<CompressionMessage> sender_;
    std::size_t chunkSize_;
    codec::EncoderFactory encoderFactory_;
    std::size_t workerIndex_;
    std::uint32_t nextSequence_ = 0;
};

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_CHUNK_WORKER_H
