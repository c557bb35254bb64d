// =============================================================================
// parz - Block Writer
// =============================================================================
// Writes ordered chunks to the destination as a raw concatenation of
// independently finalized DEFLATE streams. No header, length prefix or
// marker is added.
// =============================================================================

#ifndef PARZ_PIPELINE_BLOCK_WRITER_H
#define PARZ_PIPELINE_BLOCK_WRITER_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>

#include "parz/common/error.h"
#include "parz/pipeline/messages.h"

namespace parz::pipeline {

/// @brief Create or truncate the destination file in binary mode.
/// @return Open stream, or kFileOpenFailed.
[[nodiscard]] Result<std::unique_ptr<std::ofstream>> createOutputFile(
    const std::filesystem::path& path);

/// @brief Write each chunk's bytes in the given order.
/// @param chunks Ordered chunks; chunks without data are skipped.
/// @param output Destination stream.
/// @return Bytes written, or kIOError on the first failed write. Bytes
///         already written stay in place.
[[nodiscard]] Result<std::uint64_t> writeChunks(std::span<const Chunk> chunks,
                                                std::ostream& output);

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_BLOCK_WRITER_H
