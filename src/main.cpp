// =============================================================================
// parz - Parallel Chunked Compressor
// =============================================================================
// Main entry point for the parz command-line tool.
//
//   parz [options] <input_file> <output_file>
//
// Compresses the input with several workers and writes the independently
// finalized raw DEFLATE blocks back to back. With -d the input is treated as
// a parz output and inflated instead.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "parz/common/error.h"
#include "parz/common/logger.h"
#include "parz/common/types.h"

#include "commands/compress_command.h"
#include "commands/decompress_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "parz: compress a file with several workers into independently finalized\n"
    "raw DEFLATE blocks, written back to back.";

// =============================================================================
// CLI Options
// =============================================================================

struct CliOptions {
    std::vector<std::string> files;
    std::size_t threads = parz::kDefaultWorkerCount;
    std::size_t chunkSize = parz::kDefaultChunkSize;
    std::string order = "length";
    std::string readMode = "shared";
    std::string collect = "bounded";
    bool decompress = false;
    bool strict = false;
    int verbosity = 0;
    bool quiet = false;
    std::string logFile;
};

void setupOptions(CLI::App& app, CliOptions& opts) {
    app.add_option("files", opts.files, "<input_file> <output_file>");

    app.add_option("-t,--threads", opts.threads, "Number of worker threads")
        ->default_val(parz::kDefaultWorkerCount)
        ->check(CLI::Range(std::size_t{1}, parz::kMaxWorkerCount));

    app.add_option("--chunk-size", opts.chunkSize,
                   "Read size and compressed-size threshold per block (bytes)")
        ->default_val(parz::kDefaultChunkSize)
        ->check(CLI::Range(std::size_t{1}, parz::kMaxChunkSize));

    app.add_option("--order", opts.order, "Block order: length, sequence")
        ->default_val("length")
        ->check(CLI::IsMember({"length", "sequence"}));

    app.add_option("--read-mode", opts.readMode,
                   "Input sharing: shared (one cursor), partitioned (byte ranges)")
        ->default_val("shared")
        ->check(CLI::IsMember({"shared", "partitioned"}));

    app.add_option("--collect", opts.collect,
                   "Collection: bounded (one message per worker), all (until every worker is done)")
        ->default_val("bounded")
        ->check(CLI::IsMember({"bounded", "all"}));

    app.add_flag("-d,--decompress", opts.decompress, "Inflate a parz output instead");

    app.add_flag("--strict", opts.strict,
                 "Exit with the error code on usage and open/create errors");

    app.add_flag("-v,--verbose", opts.verbosity, "Increase verbosity");

    app.add_flag("-q,--quiet", opts.quiet, "Suppress non-error output");

    app.add_option("--log-file", opts.logFile, "Also write log messages to this file");
}

[[nodiscard]] parz::log::Level logLevelFor(const CliOptions& opts) noexcept {
    if (opts.quiet) {
        return parz::log::Level::kError;
    }
    if (opts.verbosity >= 2) {
        return parz::log::Level::kTrace;
    }
    if (opts.verbosity >= 1) {
        return parz::log::Level::kDebug;
    }
    return parz::log::Level::kInfo;
}

// =============================================================================
// Command Dispatch
// =============================================================================

int runCompress(const CliOptions& cli, parz::BoundaryPolicy policy) {
    parz::commands::CompressOptions opts;
    opts.inputPath = cli.files[0];
    opts.outputPath = cli.files[1];
    opts.threads = cli.threads;
    opts.chunkSize = cli.chunkSize;
    opts.order = parz::parseChunkOrder(cli.order).value_or(parz::ChunkOrder::kLength);
    opts.readMode = parz::parseReadMode(cli.readMode).value_or(parz::ReadMode::kShared);
    opts.collectPolicy =
        parz::parseCollectPolicy(cli.collect).value_or(parz::CollectPolicy::kBounded);
    opts.boundaryPolicy = policy;

    parz::commands::CompressCommand command(std::move(opts));
    return command.execute();
}

int runDecompress(const CliOptions& cli, parz::BoundaryPolicy policy) {
    parz::commands::DecompressOptions opts;
    opts.inputPath = cli.files[0];
    opts.outputPath = cli.files[1];
    opts.boundaryPolicy = policy;

    parz::commands::DecompressCommand command(std::move(opts));
    return command.execute();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    CliOptions cli;
    setupOptions(app, cli);

    CLI11_PARSE(app, argc, argv);

    const auto policy = cli.strict ? parz::BoundaryPolicy::kDiagnoseAndFail
                                   : parz::BoundaryPolicy::kDiagnoseAndContinue;

    if (cli.files.size() != 2) {
        const char* program = argc > 0 ? argv[0] : "parz";
        std::cerr << "\nUsage: " << program << " <input_file> <output_file>" << std::endl;
        return policy == parz::BoundaryPolicy::kDiagnoseAndFail
                   ? parz::toExitCode(parz::ErrorCode::kUsageError)
                   : EXIT_SUCCESS;
    }

    try {
        parz::log::Config logConfig;
        logConfig.logFile = cli.logFile;
        logConfig.level = logLevelFor(cli);
        parz::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        exitCode = cli.decompress ? runDecompress(cli, policy) : runCompress(cli, policy);
    } catch (const parz::ParzException& ex) {
        PARZ_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PARZ_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    parz::log::shutdown();
    return exitCode;
}
