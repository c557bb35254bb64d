// =============================================================================
// parz - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "parz/common/logger.h"
#include "parz/io/byte_source.h"
#include "parz/pipeline/block_writer.h"
#include "parz/pipeline/collector.h"

namespace parz::commands {

int boundaryExitCode(const Error& error, BoundaryPolicy policy) noexcept {
    switch (policy) {
        case BoundaryPolicy::kDiagnoseAndContinue:
            return 0;
        case BoundaryPolicy::kDiagnoseAndFail:
            return error.exitCode();
    }
    return error.exitCode();
}

// =============================================================================
// CompressCommand Implementation
// =============================================================================

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

int CompressCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        pipeline::CollectorConfig config;
        config.numWorkers = options_.threads;
        config.chunkSize = options_.chunkSize;
        config.order = options_.order;
        config.readMode = options_.readMode;
        config.collectPolicy = options_.collectPolicy;

        if (auto valid = config.validate(); !valid) {
            std::cerr << "Invalid options: " << valid.error().message() << std::endl;
            return handleBoundaryError(valid.error());
        }

        PARZ_LOG_DEBUG("Compressing {} -> {} (threads={}, chunk={}, order={}, read={}, "
                       "collect={})",
                       options_.inputPath.string(), options_.outputPath.string(),
                       options_.threads, options_.chunkSize, chunkOrderToString(options_.order),
                       readModeToString(options_.readMode),
                       collectPolicyToString(options_.collectPolicy));

        auto input = io::FileSource::open(options_.inputPath);
        if (!input) {
            std::cerr << "Failed to open input file: " << input.error().message() << std::endl;
            return handleBoundaryError(input.error());
        }

        auto output = pipeline::createOutputFile(options_.outputPath);
        if (!output) {
            std::cerr << "Failed to create output file: " << output.error().message()
                      << std::endl;
            return handleBoundaryError(output.error());
        }

        pipeline::Collector collector(std::move(config));
        auto chunks = collector.compress(**input);
        stats_.inputBytes = collector.stats().bytesRead;
        if (!chunks) {
            std::cerr << "Failed to compress data: " << chunks.error().message() << std::endl;
            return handlePipelineError(chunks.error());
        }

        auto written = pipeline::writeChunks(*chunks, **output);
        if (!written) {
            std::cerr << "Failed to write compressed data to output file: "
                      << written.error().message() << std::endl;
            return handlePipelineError(written.error());
        }

        (*output)->close();
        if ((*output)->fail()) {
            Error error{ErrorCode::kIOError,
                        "Failed to close output file: " + options_.outputPath.string()};
            std::cerr << error.message() << std::endl;
            return handlePipelineError(error);
        }

        stats_.outputBytes = *written;
        stats_.blocksWritten = chunks->size();
        stats_.elapsedSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

        logSummary();
        return 0;

    } catch (const ParzException& e) {
        std::cerr << e.what() << std::endl;
        PARZ_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        PARZ_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

int CompressCommand::handleBoundaryError(const Error& error) const {
    PARZ_LOG_DEBUG("Boundary error: {}", error.describe());
    return boundaryExitCode(error, options_.boundaryPolicy);
}

int CompressCommand::handlePipelineError(const Error& error) {
    PARZ_LOG_ERROR("Compression failed: {}", error.describe());
    const int code = error.exitCode();
    return code != 0 ? code : toExitCode(ErrorCode::kIOError);
}

void CompressCommand::logSummary() const {
    PARZ_LOG_INFO("Compressed {} bytes into {} bytes ({} blocks, ratio {:.2f}x) in {:.3f} s",
                  stats_.inputBytes, stats_.outputBytes, stats_.blocksWritten,
                  stats_.compressionRatio(), stats_.elapsedSeconds);
}

}  // namespace parz::commands
