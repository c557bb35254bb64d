// =============================================================================
// parz - Collector
// =============================================================================
// Spawns the chunk workers against one input, gathers their blocks from the
// result channel, and decides the order in which blocks are written.
//
// Defaults:
// - ReadMode::kShared: every worker reads a duplicate of the same handle
// - CollectPolicy::kBounded: exactly one receive per worker, stopping early
//   at the first Done
// - ChunkOrder::kLength: ascending compressed length
//
// Usage:
// @code
// CollectorConfig config;
// config.numWorkers = 4;
// Collector collector(config);
// auto chunks = collector.compress(*source);
// @endcode
// =============================================================================

#ifndef PARZ_PIPELINE_COLLECTOR_H
#define PARZ_PIPELINE_COLLECTOR_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "parz/codec/deflate_codec.h"
#include "parz/common/error.h"
#include "parz/common/types.h"
#include "parz/io/byte_source.h"
#include "parz/pipeline/messages.h"

namespace parz::pipeline {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for the collector and its workers.
struct CollectorConfig {
    /// @brief Number of worker threads.
    std::size_t numWorkers = kDefaultWorkerCount;

    /// @brief Read buffer size and compressed-size threshold per block.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Final block order.
    ChunkOrder order = ChunkOrder::kLength;

    /// @brief How workers share the input.
    ReadMode readMode = ReadMode::kShared;

    /// @brief When to stop receiving.
    CollectPolicy collectPolicy = CollectPolicy::kBounded;

    /// @brief Encoder source; a best-level deflate factory when empty.
    codec::EncoderFactory encoderFactory;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Counters collected during one compress() call.
struct CollectorStats {
    /// @brief Workers spawned.
    std::size_t workersSpawned = 0;

    /// @brief Messages taken from the channel.
    std::size_t messagesReceived = 0;

    /// @brief Receives that found the channel disconnected.
    std::size_t receiveFailures = 0;

    /// @brief Raw bytes read by all workers (including uncollected blocks).
    std::uint64_t bytesRead = 0;

    /// @brief Blocks returned to the caller.
    std::size_t chunksCollected = 0;

    /// @brief Total compressed bytes of returned blocks.
    std::uint64_t compressedBytes = 0;
};

// =============================================================================
// Collector
// =============================================================================

/// @brief Runs one parallel compression pass.
class Collector {
public:
    explicit Collector(CollectorConfig config = {});

    /// @brief Compress the input with config().numWorkers workers.
    /// @param input Shared input handle; duplicated or sliced per worker.
    /// @return Ordered non-empty chunks, or the first worker error observed.
    /// @note Workers are always joined before returning.
    [[nodiscard]] Result<std::vector<Chunk>> compress(const io::ByteSource& input);

    [[nodiscard]] const CollectorConfig& config() const noexcept { return config_; }

    /// @brief Statistics of the last compress() call.
    [[nodiscard]] const CollectorStats& stats() const noexcept { return stats_; }

private:
    /// @brief Open one handle per worker according to the read mode.
    Result<std::vector<std::unique_ptr<io::ByteSource>>> openWorkerInputs(
        const io::ByteSource& input) const;

    CollectorConfig config_;
    CollectorStats stats_;
};

// =============================================================================
// Ordering
// =============================================================================

/// @brief Drop chunks without data and sort the rest.
/// @param chunks Chunks in arrival order.
/// @param order kLength: ascending compressed length, ties keep arrival order.
///              kSequence: by (workerIndex, sequence).
[[nodiscard]] std::vector<Chunk> orderChunks(std::vector<Chunk> chunks, ChunkOrder order);

/// @brief Byte ranges assigned to each worker in partitioned mode.
/// @return numWorkers (offset, length) pairs covering [0, totalSize).
[[nodiscard]] std::vector<std::pair<FileOffset, std::uint64_t>> partitionRanges(
    std::uint64_t totalSize, std::size_t numWorkers);

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_COLLECTOR_H
