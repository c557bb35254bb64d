// =============================================================================
// parz - Block Writer Implementation
// =============================================================================

#include "parz/pipeline/block_writer.h"

#include <cerrno>

#include <fmt/format.h>

#include "parz/common/logger.h"

namespace parz::pipeline {

Result<std::unique_ptr<std::ofstream>> createOutputFile(const std::filesystem::path& path) {
    errno = 0;
    auto stream = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
        if (errno != 0) {
            return std::unexpected(errorFromErrno(ErrorCode::kFileOpenFailed, path.string()));
        }
        return makeError<std::unique_ptr<std::ofstream>>(
            ErrorCode::kFileOpenFailed, fmt::format("{}: cannot create file", path.string()));
    }
    PARZ_LOG_DEBUG("Output opened: {}", path.string());
    return stream;
}

Result<std::uint64_t> writeChunks(std::span<const Chunk> chunks, std::ostream& output) {
    std::uint64_t bytesWritten = 0;
    std::size_t index = 0;

    for (const auto& chunk : chunks) {
        if (!chunk.hasData()) {
            ++index;
            continue;
        }

        const auto& data = *chunk.compressedData;
        output.write(reinterpret_cast<const char*>(data.data()),
                     static_cast<std::streamsize>(data.size()));
        if (!output) {
            return makeError<std::uint64_t>(
                ErrorCode::kIOError,
                fmt::format("Failed to write block {} ({} bytes) after {} bytes", index,
                            data.size(), bytesWritten));
        }
        bytesWritten += data.size();
        ++index;
    }

    output.flush();
    if (!output) {
        return makeError<std::uint64_t>(ErrorCode::kIOError, "Failed to flush output");
    }

    PARZ_LOG_DEBUG("Wrote {} blocks, {} bytes", chunks.size(), bytesWritten);
    return bytesWritten;
}

}  // namespace parz::pipeline
