// =============================================================================
// parz - Common Type Definitions
// =============================================================================
// Core type definitions for the parz library.
//
// This module defines:
// - ByteBuffer, ByteSpan: owned and borrowed byte ranges
// - ChunkOrder: how finished chunks are ordered before writing
// - ReadMode: how workers share the input
// - CollectPolicy: when the collector stops receiving
// - Pipeline defaults (worker count, chunk threshold)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef PARZ_COMMON_TYPES_H
#define PARZ_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace parz {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned byte buffer (compressed or raw data).
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Type alias for file offsets.
using FileOffset = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of chunk workers.
inline constexpr std::size_t kDefaultWorkerCount = 4;

/// @brief Default chunk threshold (bytes of buffered compressed output).
/// @note Also the size of each worker's read buffer.
inline constexpr std::size_t kDefaultChunkSize = 1024;

/// @brief Upper bound on the chunk threshold (64MB).
inline constexpr std::size_t kMaxChunkSize = 64 * 1024 * 1024;

/// @brief Upper bound on the worker count.
inline constexpr std::size_t kMaxWorkerCount = 256;

// =============================================================================
// Chunk Ordering
// =============================================================================

/// @brief Order in which finished chunks are written.
enum class ChunkOrder : std::uint8_t {
    /// @brief Ascending compressed length (default).
    kLength = 0,

    /// @brief By (worker index, per-worker sequence number).
    kSequence = 1
};

[[nodiscard]] constexpr std::string_view chunkOrderToString(ChunkOrder order) noexcept {
    switch (order) {
        case ChunkOrder::kLength:
            return "length";
        case ChunkOrder::kSequence:
            return "sequence";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ChunkOrder> parseChunkOrder(std::string_view str) noexcept {
    if (str == "length") {
        return ChunkOrder::kLength;
    }
    if (str == "sequence") {
        return ChunkOrder::kSequence;
    }
    return std::nullopt;
}

// =============================================================================
// Read Mode
// =============================================================================

/// @brief How workers share the input handle.
enum class ReadMode : std::uint8_t {
    /// @brief Every worker reads a duplicate of one handle; the file cursor
    ///        is shared and contended (default).
    kShared = 0,

    /// @brief Each worker reads its own contiguous byte range.
    kPartitioned = 1
};

[[nodiscard]] constexpr std::string_view readModeToString(ReadMode mode) noexcept {
    switch (mode) {
        case ReadMode::kShared:
            return "shared";
        case ReadMode::kPartitioned:
            return "partitioned";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ReadMode> parseReadMode(std::string_view str) noexcept {
    if (str == "shared") {
        return ReadMode::kShared;
    }
    if (str == "partitioned") {
        return ReadMode::kPartitioned;
    }
    return std::nullopt;
}

// =============================================================================
// Collect Policy
// =============================================================================

/// @brief When the collector stops receiving messages.
enum class CollectPolicy : std::uint8_t {
    /// @brief Receive exactly one message per worker, stopping early on the
    ///        first Done (default).
    kBounded = 0,

    /// @brief Receive until every worker has sent Done.
    kUntilAllDone = 1
};

[[nodiscard]] constexpr std::string_view collectPolicyToString(CollectPolicy policy) noexcept {
    switch (policy) {
        case CollectPolicy::kBounded:
            return "bounded";
        case CollectPolicy::kUntilAllDone:
            return "all";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<CollectPolicy> parseCollectPolicy(
    std::string_view str) noexcept {
    if (str == "bounded") {
        return CollectPolicy::kBounded;
    }
    if (str == "all") {
        return CollectPolicy::kUntilAllDone;
    }
    return std::nullopt;
}

// =============================================================================
// Boundary Policy
// =============================================================================

/// @brief Exit status policy for argument and open/create errors.
enum class BoundaryPolicy : std::uint8_t {
    /// @brief Print a diagnostic and exit successfully (default).
    kDiagnoseAndContinue = 0,

    /// @brief Print a diagnostic and exit with the error's code.
    kDiagnoseAndFail = 1
};

}  // namespace parz

#endif  // PARZ_COMMON_TYPES_H
