// =============================================================================
// parz - Collector Implementation
// =============================================================================

#include "parz/pipeline/collector.h"

#include <algorithm>
#include <chrono>
#include <optional>
#include <system_error>

#include <fmt/format.h>

#include "parz/common/logger.h"
#include "parz/pipeline/chunk_worker.h"
#include "parz/pipeline/result_channel.h"
#include "parz/pipeline/thread_group.h"

namespace parz::pipeline {

// =============================================================================
// CollectorConfig Implementation
// =============================================================================

VoidResult CollectorConfig::validate() const {
    if (numWorkers == 0 || numWorkers > kMaxWorkerCount) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Worker count must be between 1 and {}", kMaxWorkerCount));
    }
    if (chunkSize == 0 || chunkSize > kMaxChunkSize) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Chunk size must be between 1 and {}", kMaxChunkSize));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Ordering
// =============================================================================

std::vector<Chunk> orderChunks(std::vector<Chunk> chunks, ChunkOrder order) {
    chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                                [](const Chunk& chunk) { return !chunk.hasData(); }),
                 chunks.end());

    switch (order) {
        case ChunkOrder::kLength:
            std::stable_sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
                return a.size() < b.size();
            });
            break;
        case ChunkOrder::kSequence:
            std::stable_sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
                if (a.workerIndex != b.workerIndex) {
                    return a.workerIndex < b.workerIndex;
                }
                return a.sequence < b.sequence;
            });
            break;
    }
    return chunks;
}

std::vector<std::pair<FileOffset, std::uint64_t>> partitionRanges(std::uint64_t totalSize,
                                                                  std::size_t numWorkers) {
    std::vector<std::pair<FileOffset, std::uint64_t>> ranges;
    if (numWorkers == 0) {
        return ranges;
    }

    const std::uint64_t perWorker = (totalSize + numWorkers - 1) / numWorkers;
    ranges.reserve(numWorkers);
    for (std::size_t i = 0; i < numWorkers; ++i) {
        const FileOffset offset = std::min<std::uint64_t>(i * perWorker, totalSize);
        const std::uint64_t length = std::min<std::uint64_t>(perWorker, totalSize - offset);
        ranges.emplace_back(offset, length);
    }
    return ranges;
}

// =============================================================================
// Collector Implementation
// =============================================================================

Collector::Collector(CollectorConfig config) : config_(std::move(config)) {
    if (!config_.encoderFactory) {
        config_.encoderFactory = codec::deflateEncoderFactory(codec::kBestCompressionLevel);
    }
}

Result<std::vector<std::unique_ptr<io::ByteSource>>> Collector::openWorkerInputs(
    const io::ByteSource& input) const {
    std::vector<std::unique_ptr<io::ByteSource>> inputs;
    inputs.reserve(config_.numWorkers);

    if (config_.readMode == ReadMode::kPartitioned) {
        auto totalSize = input.size();
        if (!totalSize) {
            return std::unexpected(totalSize.error());
        }
        for (const auto& [offset, length] : partitionRanges(*totalSize, config_.numWorkers)) {
            auto slice = input.slice(offset, length);
            if (!slice) {
                return std::unexpected(slice.error());
            }
            PARZ_LOG_DEBUG("Worker {} assigned bytes [{}, {})", inputs.size(), offset,
                           offset + length);
            inputs.push_back(std::move(*slice));
        }
        return inputs;
    }

    for (std::size_t i = 0; i < config_.numWorkers; ++i) {
        auto handle = input.duplicate();
        if (!handle) {
            return std::unexpected(handle.error());
        }
        inputs.push_back(std::move(*handle));
    }
    return inputs;
}

Result<std::vector<Chunk>> Collector::compress(const io::ByteSource& input) {
    stats_ = CollectorStats{};
    const auto startTime = std::chrono::steady_clock::now();

    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    auto inputs = openWorkerInputs(input);
    if (!inputs) {
        PARZ_LOG_ERROR("Failed to prepare worker inputs: {}", inputs.error().message());
        return std::unexpected(inputs.error());
    }

    auto [sender, receiver] = makeChannel<CompressionMessage>();

    const std::size_t numWorkers = config_.numWorkers;
    std::vector<WorkerStats> workerStats(numWorkers);
    // Declared after the receiver so workers are joined before it is destroyed.
    ThreadGroup threads(numWorkers);

    std::optional<Error> failure;

    try {
        for (std::size_t i = 0; i < numWorkers; ++i) {
            ChunkWorker worker(sender, config_.chunkSize, config_.encoderFactory, i);
            threads.spawn([worker = std::move(worker), source = std::move((*inputs)[i]),
                                  &slot = workerStats[i]]() mutable {
                slot = worker.run(std::move(source));
            });
        }
    } catch (const std::system_error& e) {
        failure = Error{ErrorCode::kInvalidState,
                        fmt::format("Failed to spawn worker thread: {}", e.what())};
    }

    // Only workers hold senders from here on, so a drained channel with no
    // live workers reads as disconnected instead of blocking forever.
    sender.close();
    stats_.workersSpawned = threads.size();

    std::vector<Chunk> chunks;

    auto handleMessage = [&](CompressionMessage& message, std::size_t& doneCount) -> bool {
        ++stats_.messagesReceived;
        if (auto* data = std::get_if<DataMessage>(&message)) {
            chunks.push_back(Chunk::fromMessage(std::move(*data)));
            return true;
        }
        if (auto* error = std::get_if<ErrorMessage>(&message)) {
            PARZ_LOG_ERROR("Failed to compress data (worker {}): {}", error->workerIndex,
                           error->error.describe());
            failure = error->error;
            return false;
        }
        ++doneCount;
        return true;
    };

    if (!failure) {
        std::size_t doneCount = 0;
        if (config_.collectPolicy == CollectPolicy::kBounded) {
            for (std::size_t i = 0; i < numWorkers; ++i) {
                auto message = receiver.receive();
                if (!message) {
                    ++stats_.receiveFailures;
                    PARZ_LOG_WARNING("Failed to receive compressed data: channel disconnected");
                    continue;
                }
                const std::size_t doneBefore = doneCount;
                if (!handleMessage(*message, doneCount) || doneCount != doneBefore) {
                    break;
                }
            }
        } else {
            while (doneCount < numWorkers) {
                auto message = receiver.receive();
                if (!message) {
                    ++stats_.receiveFailures;
                    PARZ_LOG_ERROR("Channel disconnected after {} of {} workers finished",
                                   doneCount, numWorkers);
                    failure = Error{ErrorCode::kInvalidState,
                                    fmt::format("Workers exited without completing ({} of {})",
                                                doneCount, numWorkers)};
                    break;
                }
                if (!handleMessage(*message, doneCount)) {
                    break;
                }
            }
        }
    }

    threads.joinAll();

    for (const auto& worker : workerStats) {
        stats_.bytesRead += worker.bytesRead;
    }

    if (failure) {
        return std::unexpected(std::move(*failure));
    }

    auto ordered = orderChunks(std::move(chunks), config_.order);
    stats_.chunksCollected = ordered.size();
    for (const auto& chunk : ordered) {
        stats_.compressedBytes += chunk.size();
    }

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - startTime)
                               .count();
    PARZ_LOG_DEBUG(
        "Collected {} chunks ({} bytes) from {} workers in {} ms, {} messages received, "
        "order={}",
        stats_.chunksCollected, stats_.compressedBytes, stats_.workersSpawned, elapsedMs,
        stats_.messagesReceived, chunkOrderToString(config_.order));

    return ordered;
}

}  // namespace parz::pipeline
