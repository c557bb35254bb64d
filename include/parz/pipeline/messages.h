// =============================================================================
// parz - Pipeline Messages
// =============================================================================
// Values that travel from chunk workers to the collector.
//
// - DataMessage: one finalized compressed block
// - ErrorMessage: a worker failed and stopped
// - DoneMessage: a worker reached end of input
// - Chunk: a collected block, as handed to the writer
// =============================================================================

#ifndef PARZ_PIPELINE_MESSAGES_H
#define PARZ_PIPELINE_MESSAGES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

#include "parz/common/error.h"
#include "parz/common/types.h"

namespace parz::pipeline {

// =============================================================================
// Compression Messages
// =============================================================================

/// @brief A finalized compressed block.
struct DataMessage {
    /// @brief Compressed bytes (a complete raw DEFLATE stream).
    ByteBuffer data;

    /// @brief Index of the worker that produced the block.
    std::size_t workerIndex = 0;

    /// @brief Position of the block among the worker's emissions (0-based).
    std::uint32_t sequence = 0;
};

/// @brief A worker failure. No further messages follow from that worker.
struct ErrorMessage {
    Error error;

    std::size_t workerIndex = 0;
};

/// @brief End of input for one worker.
struct DoneMessage {
    std::size_t workerIndex = 0;
};

/// @brief Tagged union carried by the result channel.
using CompressionMessage = std::variant<DataMessage, ErrorMessage, DoneMessage>;

// =============================================================================
// Chunk
// =============================================================================

/// @brief One independently finalized compressed block.
struct Chunk {
    /// @brief Compressed bytes; nullopt when the worker produced nothing.
    std::optional<ByteBuffer> compressedData;

    std::size_t workerIndex = 0;

    std::uint32_t sequence = 0;

    /// @brief Compressed length (0 without data).
    [[nodiscard]] std::size_t size() const noexcept {
        return compressedData ? compressedData->size() : 0;
    }

    /// @brief Check whether the chunk carries any bytes.
    [[nodiscard]] bool hasData() const noexcept {
        return compressedData.has_value() && !compressedData->empty();
    }

    /// @brief Build a chunk from a data message.
    [[nodiscard]] static Chunk fromMessage(DataMessage message) {
        return Chunk{std::move(message.data), message.workerIndex, message.sequence};
    }
};

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_MESSAGES_H
