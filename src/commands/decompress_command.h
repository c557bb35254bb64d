// =============================================================================
// parz - Decompress Command
// =============================================================================
// Restores a parz output file: every raw DEFLATE stream in the file is
// inflated and the results are written back to back in file order.
//
// Only a single-worker output (or a partitioned, sequence-ordered output
// collected with the "all" policy) restores the input bytes. Other
// outputs decode to their blocks in written order.
// =============================================================================

#ifndef PARZ_COMMANDS_DECOMPRESS_COMMAND_H
#define PARZ_COMMANDS_DECOMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>

#include "parz/common/error.h"
#include "parz/common/types.h"
#include "parz/io/byte_source.h"

namespace parz::commands {

/// @brief Configuration options for decompression.
struct DecompressOptions {
    /// @brief Compressed input path.
    std::filesystem::path inputPath;

    /// @brief Output file path (created or truncated).
    std::filesystem::path outputPath;

    BoundaryPolicy boundaryPolicy = BoundaryPolicy::kDiagnoseAndContinue;
};

/// @brief Statistics from decompression.
struct DecompressionStats {
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
    std::size_t streamsDecoded = 0;
};

/// @brief Drain a source from its cursor to EOF.
/// @throws IOError carrying the source's error code when a read fails.
[[nodiscard]] ByteBuffer readAll(io::ByteSource& source);

/// @brief Command handler for decompression.
class DecompressCommand {
public:
    explicit DecompressCommand(DecompressOptions options);

    /// @brief Execute the decompression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecompressionStats& stats() const noexcept { return stats_; }

private:
    /// @brief Inflate every stream and write the results in file order.
    /// @throws InvalidDataError on a corrupt stream, IOError on a write failure.
    void restore(const ByteBuffer& compressed, std::ostream& output);

    DecompressOptions options_;
    DecompressionStats stats_;
};

}  // namespace parz::commands

#endif  // PARZ_COMMANDS_DECOMPRESS_COMMAND_H
