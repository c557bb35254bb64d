// =============================================================================
// parz - Compress Command
// =============================================================================
// Command handler for chunked parallel compression.
//
// Steps:
// 1. Open the input file, then create the output file.
// 2. Run the collector over the input.
// 3. Write the ordered blocks to the output.
//
// Open/create and argument failures follow the boundary policy. Pipeline
// failures always end with a nonzero exit code.
// =============================================================================

#ifndef PARZ_COMMANDS_COMPRESS_COMMAND_H
#define PARZ_COMMANDS_COMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "parz/common/error.h"
#include "parz/common/types.h"

namespace parz::commands {

// =============================================================================
// Compression Options
// =============================================================================

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input file path.
    std::filesystem::path inputPath;

    /// @brief Output file path (created or truncated).
    std::filesystem::path outputPath;

    /// @brief Number of worker threads.
    std::size_t threads = kDefaultWorkerCount;

    /// @brief Read buffer size and compressed-size threshold.
    std::size_t chunkSize = kDefaultChunkSize;

    ChunkOrder order = ChunkOrder::kLength;

    ReadMode readMode = ReadMode::kShared;

    CollectPolicy collectPolicy = CollectPolicy::kBounded;

    /// @brief Exit status for argument and open/create errors.
    BoundaryPolicy boundaryPolicy = BoundaryPolicy::kDiagnoseAndContinue;
};

// =============================================================================
// Compression Statistics
// =============================================================================

/// @brief Statistics from compression operation.
struct CompressionStats {
    /// @brief Raw bytes read by all workers.
    std::uint64_t inputBytes = 0;

    /// @brief Bytes written to the output.
    std::uint64_t outputBytes = 0;

    /// @brief Number of blocks written.
    std::size_t blocksWritten = 0;

    /// @brief Elapsed time in seconds.
    double elapsedSeconds = 0.0;

    /// @brief Compression ratio (input/output).
    [[nodiscard]] double compressionRatio() const noexcept {
        return outputBytes > 0 ? static_cast<double>(inputBytes) / outputBytes : 0.0;
    }
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for compression.
class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    /// @brief Execute the compression.
    /// @return Exit code (0 = success, or a diagnosed boundary error under
    ///         BoundaryPolicy::kDiagnoseAndContinue).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Report an argument or open/create error.
    [[nodiscard]] int handleBoundaryError(const Error& error) const;

    /// @brief Report a pipeline failure.
    [[nodiscard]] static int handlePipelineError(const Error& error);

    void logSummary() const;

    CompressOptions options_;
    CompressionStats stats_;
};

/// @brief Exit code for a boundary error under the given policy.
[[nodiscard]] int boundaryExitCode(const Error& error, BoundaryPolicy policy) noexcept;

}  // namespace parz::commands

#endif  // PARZ_COMMANDS_COMPRESS_COMMAND_H
