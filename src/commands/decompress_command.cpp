// =============================================================================
// parz - Decompress Command Implementation
// =============================================================================

#include "decompress_command.h"

#include <exception>
#include <iostream>
#include <utility>

#include "compress_command.h"
#include "parz/codec/deflate_codec.h"
#include "parz/common/logger.h"
#include "parz/pipeline/block_writer.h"

namespace parz::commands {

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

}  // namespace

ByteBuffer readAll(io::ByteSource& source) {
    ByteBuffer content;
    ByteBuffer buffer(kReadBufferSize);
    while (true) {
        auto bytesRead = source.read(buffer);
        if (!bytesRead) {
            throw IOError(Error{bytesRead.error().code(),
                                "Failed to read input file: " + bytesRead.error().message()});
        }
        if (*bytesRead == 0) {
            return content;
        }
        content.insert(content.end(), buffer.begin(),
                       buffer.begin() + static_cast<std::ptrdiff_t>(*bytesRead));
    }
}

DecompressCommand::DecompressCommand(DecompressOptions options)
    : options_(std::move(options)) {}

int DecompressCommand::execute() {
    try {
        auto source = io::FileSource::open(options_.inputPath);
        if (!source) {
            std::cerr << "Failed to open input file: " << source.error().message() << std::endl;
            return boundaryExitCode(source.error(), options_.boundaryPolicy);
        }

        const ByteBuffer compressed = readAll(**source);
        stats_.inputBytes = compressed.size();

        auto output = pipeline::createOutputFile(options_.outputPath);
        if (!output) {
            std::cerr << "Failed to create output file: " << output.error().message()
                      << std::endl;
            return boundaryExitCode(output.error(), options_.boundaryPolicy);
        }

        restore(compressed, **output);

        (*output)->close();
        if ((*output)->fail()) {
            throw IOError("Failed to close output file: " + options_.outputPath.string());
        }

        PARZ_LOG_INFO("Decompressed {} streams: {} bytes -> {} bytes", stats_.streamsDecoded,
                      stats_.inputBytes, stats_.outputBytes);
        return 0;

    } catch (const ParzException& e) {
        std::cerr << e.error().message() << std::endl;
        PARZ_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        PARZ_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void DecompressCommand::restore(const ByteBuffer& compressed, std::ostream& output) {
    auto streams = codec::inflateStreams(compressed);
    if (!streams) {
        if (streams.error().code() == ErrorCode::kInvalidData) {
            throw InvalidDataError("Failed to decompress data: " + streams.error().message());
        }
        throw IOError(streams.error());
    }

    for (const auto& stream : *streams) {
        output.write(reinterpret_cast<const char*>(stream.data.data()),
                     static_cast<std::streamsize>(stream.data.size()));
        if (!output) {
            throw IOError("Failed to write decompressed data to output file");
        }
        stats_.outputBytes += stream.data.size();
        ++stats_.streamsDecoded;
    }
}

}  // namespace parz::commands
