// =============================================================================
// parz - Test Sources
// =============================================================================
// In-memory ByteSource implementations and temporary files for tests.
// =============================================================================

#ifndef PARZ_TESTS_SUPPORT_TEST_SOURCES_H
#define PARZ_TESTS_SUPPORT_TEST_SOURCES_H

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "parz/common/error.h"
#include "parz/common/types.h"
#include "parz/io/byte_source.h"

namespace parz::test {

// =============================================================================
// MemorySource
// =============================================================================

/// @brief In-memory source. Duplicates share one cursor, slices own theirs.
class MemorySource final : public io::ByteSource {
public:
    explicit MemorySource(ByteBuffer data)
        : state_(std::make_shared<State>()) {
        state_->data = std::move(data);
    }

    Result<std::size_t> read(std::span<std::uint8_t> buffer) override {
        if (range_) {
            const auto remaining = range_->end - range_->position;
            const auto count = std::min<std::uint64_t>(buffer.size(), remaining);
            std::copy_n(state_->data.begin() + static_cast<std::ptrdiff_t>(range_->position),
                        count, buffer.begin());
            range_->position += count;
            return static_cast<std::size_t>(count);
        }

        std::lock_guard lock(state_->mutex);
        const auto remaining = state_->data.size() - state_->position;
        const auto count = std::min(buffer.size(), remaining);
        std::copy_n(state_->data.begin() + static_cast<std::ptrdiff_t>(state_->position), count,
                    buffer.begin());
        state_->position += count;
        return count;
    }

    Result<std::unique_ptr<io::ByteSource>> duplicate() const override {
        return std::unique_ptr<io::ByteSource>(new MemorySource(state_, range_));
    }

    Result<std::unique_ptr<io::ByteSource>> slice(FileOffset offset,
                                                  std::uint64_t length) const override {
        const std::uint64_t total = state_->data.size();
        const auto begin = std::min<std::uint64_t>(offset, total);
        const auto end = std::min<std::uint64_t>(begin + length, total);
        return std::unique_ptr<io::ByteSource>(new MemorySource(state_, Range{begin, end}));
    }

    Result<std::uint64_t> size() const override { return state_->data.size(); }

private:
    struct State {
        std::mutex mutex;
        ByteBuffer data;
        std::size_t position = 0;
    };

    struct Range {
        std::uint64_t position;
        std::uint64_t end;
    };

    MemorySource(std::shared_ptr<State> state, std::optional<Range> range)
        : state_(std::move(state)), range_(range) {}

    std::shared_ptr<State> state_;
    std::optional<Range> range_;
};

// =============================================================================
// FailingSource
// =============================================================================

/// @brief Source that serves a few reads and then fails every read.
class FailingSource final : public io::ByteSource {
public:
    /// @param successfulReads Reads served (shared by all duplicates) before failing.
    /// @param readSize Bytes returned by each successful read.
    explicit FailingSource(std::size_t successfulReads = 0, std::size_t readSize = 64)
        : remaining_(std::make_shared<std::atomic<std::size_t>>(successfulReads)),
          readSize_(readSize) {}

    Result<std::size_t> read(std::span<std::uint8_t> buffer) override {
        auto left = remaining_->load();
        while (left > 0) {
            if (remaining_->compare_exchange_weak(left, left - 1)) {
                const auto count = std::min(buffer.size(), readSize_);
                std::fill_n(buffer.begin(), count, std::uint8_t{'x'});
                return count;
            }
        }
        return makeError<std::size_t>(ErrorCode::kIOError, "injected read failure");
    }

    Result<std::unique_ptr<io::ByteSource>> duplicate() const override {
        return std::unique_ptr<io::ByteSource>(new FailingSource(remaining_, readSize_));
    }

    Result<std::unique_ptr<io::ByteSource>> slice(FileOffset, std::uint64_t) const override {
        return duplicate();
    }

    Result<std::uint64_t> size() const override { return std::uint64_t{0}; }

private:
    FailingSource(std::shared_ptr<std::atomic<std::size_t>> remaining, std::size_t readSize)
        : remaining_(std::move(remaining)), readSize_(readSize) {}

    std::shared_ptr<std::atomic<std::size_t>> remaining_;
    std::size_t readSize_;
};

// =============================================================================
// Data and File Helpers
// =============================================================================

/// @brief Convert a string to bytes.
[[nodiscard]] inline ByteBuffer toBytes(std::string_view text) {
    return ByteBuffer(text.begin(), text.end());
}

/// @brief Deterministic pseudo-random bytes (poorly compressible).
[[nodiscard]] inline ByteBuffer randomBytes(std::size_t size, std::uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    ByteBuffer data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(rng));
    }
    return data;
}

/// @brief Deterministic text-like bytes (compressible).
[[nodiscard]] inline ByteBuffer textBytes(std::size_t size) {
    static constexpr std::string_view kWords[] = {"alpha ", "beta ", "gamma ", "delta ",
                                                  "epsilon\n"};
    ByteBuffer data;
    data.reserve(size);
    std::size_t i = 0;
    while (data.size() < size) {
        const auto word = kWords[i++ % std::size(kWords)];
        for (char c : word) {
            if (data.size() == size) {
                break;
            }
            data.push_back(static_cast<std::uint8_t>(c));
        }
    }
    return data;
}

/// @brief Temporary directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("parz_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Write a file inside the directory and return its path.
    std::filesystem::path writeFile(const std::string& name, const ByteBuffer& content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

/// @brief Read a whole file.
[[nodiscard]] inline ByteBuffer readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return ByteBuffer(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace parz::test

#endif  // PARZ_TESTS_SUPPORT_TEST_SOURCES_H
