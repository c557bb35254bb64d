// =============================================================================
// parz - Chunk Worker Implementation
// =============================================================================

#include "parz/pipeline/chunk_worker.h"

#include <exception>
#include <vector>

#include <fmt/format.h>

#include "parz/common/logger.h"

namespace parz::pipeline {

ChunkWorker::ChunkWorker(Sender<CompressionMessage> sender, std::size_t chunkSize,
                         codec::EncoderFactory encoderFactory, std::size_t workerIndex)
    : sender_(std::move(sender)),
      chunkSize_(chunkSize),
      encoderFactory_(std::move(encoderFactory)),
      workerIndex_(workerIndex) {}

WorkerStats ChunkWorker::run(std::unique_ptr<io::ByteSource> input) {
    WorkerStats stats;

    VoidResult result = makeVoidSuccess();
    try {
        if (!input) {
            result = makeVoidError(ErrorCode::kInvalidState, "Worker has no input handle");
        } else {
            result = process(*input, stats);
        }
    } catch (const ParzException& e) {
        result = std::unexpected(e.error());
    } catch (const std::exception& e) {
        result = makeVoidError(ErrorCode::kIOError,
                               fmt::format("Worker {} aborted: {}", workerIndex_, e.what()));
    }

    if (!result) {
        stats.failed = true;
        PARZ_LOG_DEBUG("Worker {} failed: {}", workerIndex_, result.error().message());
        send(ErrorMessage{result.error(), workerIndex_});
    } else {
        send(DoneMessage{workerIndex_});
        PARZ_LOG_DEBUG("Worker {} done: {} bytes read, {} blocks", workerIndex_, stats.bytesRead,
                       stats.blocksSent);
    }

    sender_.close();
    return stats;
}

VoidResult ChunkWorker::process(io::ByteSource& input, WorkerStats& stats) {
    std::vector<std::uint8_t> buffer(chunkSize_);

    auto encoder = freshEncoder();
    if (!encoder) {
        return std::unexpected(encoder.error());
    }

    while (true) {
        auto bytesRead = input.read(buffer);
        if (!bytesRead) {
            return std::unexpected(bytesRead.error());
        }

        if (*bytesRead == 0) {
            // End of input: flush whatever is pending, even below threshold
            return emit(**encoder, stats);
        }

        stats.bytesRead += *bytesRead;

        if (auto written = (*encoder)->write(ByteSpan(buffer.data(), *bytesRead)); !written) {
            return written;
        }

        if ((*encoder)->bufferedSize() >= chunkSize_) {
            if (auto emitted = emit(**encoder, stats); !emitted) {
                return emitted;
            }
            encoder = freshEncoder();
            if (!encoder) {
                return std::unexpected(encoder.error());
            }
        }
    }
}

VoidResult ChunkWorker::emit(codec::BlockEncoder& encoder, WorkerStats& stats) {
    auto block = encoder.finish();
    if (!block) {
        return std::unexpected(block.error());
    }

    PARZ_LOG_TRACE("Worker {} emits block #{} ({} bytes)", workerIndex_, nextSequence_,
                   block->size());
    send(DataMessage{std::move(*block), workerIndex_, nextSequence_});
    ++nextSequence_;
    ++stats.blocksSent;
    return makeVoidSuccess();
}

Result<std::unique_ptr<codec::BlockEncoder>> ChunkWorker::freshEncoder() {
    if (!encoderFactory_) {
        return makeError<std::unique_ptr<codec::BlockEncoder>>(ErrorCode::kInvalidState,
                                                               "No encoder factory configured");
    }
    return encoderFactory_();
}

void ChunkWorker::send(CompressionMessage message) {
    if (!sender_.send(std::move(message))) {
        PARZ_LOG_DEBUG("Worker {}: collector gone, message dropped", workerIndex_);
    }
}

}  // namespace parz::pipeline
