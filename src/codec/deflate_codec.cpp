// =============================================================================
// parz - Deflate Codec Adapter Implementation
// =============================================================================

#include "parz/codec/deflate_codec.h"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <climits>
#include <cstring>

#include <fmt/format.h>

namespace parz::codec {

namespace {

/// @brief Raw DEFLATE (negative window bits: no zlib header or trailer).
constexpr int kRawWindowBits = -MAX_WBITS;

constexpr int kMemLevel = 8;

/// @brief Largest input window handed to zlib in one call.
constexpr std::size_t kMaxZlibInput = 1U << 30;

/// @brief Releases a zlib inflate stream on scope exit.
struct InflateGuard {
    z_stream* stream;
    ~InflateGuard() { inflateEnd(stream); }
};

}  // namespace

// =============================================================================
// DeflateEncoder Implementation
// =============================================================================

DeflateEncoder::DeflateEncoder(int level) : level_(level) {}

DeflateEncoder::~DeflateEncoder() { releaseStream(); }

Result<std::unique_ptr<DeflateEncoder>> DeflateEncoder::create(int level) {
    if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
        return makeError<std::unique_ptr<DeflateEncoder>>(
            ErrorCode::kInvalidArgument,
            fmt::format("Deflate level must be between {} and {}", Z_NO_COMPRESSION,
                        Z_BEST_COMPRESSION));
    }

    std::unique_ptr<DeflateEncoder> encoder(new DeflateEncoder(level));

    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = deflateInit2(stream, level, Z_DEFLATED, kRawWindowBits, kMemLevel,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        delete stream;
        return makeError<std::unique_ptr<DeflateEncoder>>(
            ErrorCode::kCompressionFailed,
            fmt::format("Failed to initialize zlib deflate: {}", zError(ret)));
    }

    encoder->zlibStream_ = stream;
    return encoder;
}

void DeflateEncoder::releaseStream() noexcept {
    if (zlibStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        deflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

VoidResult DeflateEncoder::pump(ByteSpan input, int flush) {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    std::array<std::uint8_t, kCodecScratchSize> scratch;

    // zlib never writes through next_in
    stream->next_in = const_cast<Bytef*>(input.data());
    stream->avail_in = static_cast<uInt>(input.size());

    int ret = Z_OK;
    do {
        stream->next_out = scratch.data();
        stream->avail_out = static_cast<uInt>(scratch.size());

        ret = deflate(stream, flush);
        if (ret == Z_STREAM_ERROR) {
            return makeVoidError(ErrorCode::kCompressionFailed,
                                 fmt::format("zlib deflate failed: {}", zError(ret)));
        }

        const std::size_t produced = scratch.size() - stream->avail_out;
        output_.insert(output_.end(), scratch.data(), scratch.data() + produced);
    } while (stream->avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));

    return makeVoidSuccess();
}

VoidResult DeflateEncoder::write(ByteSpan data) {
    if (finished_) {
        return makeVoidError(ErrorCode::kInvalidState, "Encoder already finished");
    }

    while (!data.empty()) {
        const std::size_t take = std::min(data.size(), kMaxZlibInput);
        if (auto result = pump(data.first(take), Z_NO_FLUSH); !result) {
            return result;
        }
        data = data.subspan(take);
    }
    return makeVoidSuccess();
}

Result<ByteBuffer> DeflateEncoder::finish() {
    if (finished_) {
        return makeError<ByteBuffer>(ErrorCode::kInvalidState, "Encoder already finished");
    }
    finished_ = true;

    auto result = pump({}, Z_FINISH);
    releaseStream();
    if (!result) {
        return std::unexpected(result.error());
    }
    return std::move(output_);
}

EncoderFactory deflateEncoderFactory(int level) {
    return [level]() -> Result<std::unique_ptr<BlockEncoder>> {
        auto encoder = DeflateEncoder::create(level);
        if (!encoder) {
            return std::unexpected(encoder.error());
        }
        return std::unique_ptr<BlockEncoder>(std::move(*encoder));
    };
}

// =============================================================================
// Decoding Implementation
// =============================================================================

Result<std::vector<InflatedStream>> inflateStreams(ByteSpan input) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(z_stream));

    int ret = inflateInit2(&stream, kRawWindowBits);
    if (ret != Z_OK) {
        return makeError<std::vector<InflatedStream>>(
            ErrorCode::kInvalidState,
            fmt::format("Failed to initialize zlib inflate: {}", zError(ret)));
    }
    InflateGuard guard{&stream};

    std::vector<InflatedStream> streams;
    std::array<std::uint8_t, kCodecScratchSize> scratch;

    const std::uint8_t* const base = input.data();
    std::size_t offset = 0;

    while (offset < input.size()) {
        inflateReset(&stream);

        const std::size_t streamStart = offset;
        std::size_t fed = offset;
        stream.avail_in = 0;

        InflatedStream current;
        do {
            if (stream.avail_in == 0 && fed < input.size()) {
                const std::size_t take = std::min(input.size() - fed, kMaxZlibInput);
                stream.next_in = const_cast<Bytef*>(base + fed);
                stream.avail_in = static_cast<uInt>(take);
                fed += take;
            }

            stream.next_out = scratch.data();
            stream.avail_out = static_cast<uInt>(scratch.size());

            ret = inflate(&stream, Z_NO_FLUSH);
            if (ret == Z_DATA_ERROR || ret == Z_NEED_DICT || ret == Z_STREAM_ERROR) {
                return makeError<std::vector<InflatedStream>>(
                    ErrorCode::kInvalidData,
                    fmt::format("Corrupt deflate stream at offset {}: {}", streamStart,
                                stream.msg != nullptr ? stream.msg : zError(ret)));
            }
            if (ret == Z_MEM_ERROR) {
                return makeError<std::vector<InflatedStream>>(ErrorCode::kInvalidState,
                                                              "zlib inflate out of memory");
            }

            const std::size_t produced = scratch.size() - stream.avail_out;
            current.data.insert(current.data.end(), scratch.data(), scratch.data() + produced);

            if (ret == Z_BUF_ERROR && stream.avail_in == 0 && fed == input.size()) {
                return makeError<std::vector<InflatedStream>>(
                    ErrorCode::kInvalidData,
                    fmt::format("Truncated deflate stream starting at offset {}", streamStart));
            }
        } while (ret != Z_STREAM_END);

        offset = static_cast<std::size_t>(stream.next_in - base);
        current.compressedSize = offset - streamStart;
        streams.push_back(std::move(current));
    }

    return streams;
}

Result<ByteBuffer> inflateConcatenated(ByteSpan input) {
    auto streams = inflateStreams(input);
    if (!streams) {
        return std::unexpected(streams.error());
    }

    ByteBuffer output;
    for (auto& stream : *streams) {
        output.insert(output.end(), stream.data.begin(), stream.data.end());
    }
    return output;
}

}  // namespace parz::codec
