// =============================================================================
// parz - Byte Source
// =============================================================================
// Readable input handles shared by the chunk workers.
//
// This module provides:
// - ByteSource: read / duplicate / slice / size interface
// - FileSource: POSIX file descriptor implementation
//
// duplicate() returns a handle over a dup(2)'d descriptor. Duplicates share
// one file offset, so reads from different duplicates consume disjoint but
// unpredictable parts of the file when used concurrently.
//
// slice() returns an independent handle restricted to a byte range. It reads
// with pread(2) and never touches the shared offset.
// =============================================================================

#ifndef PARZ_IO_BYTE_SOURCE_H
#define PARZ_IO_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>

#include "parz/common/error.h"
#include "parz/common/types.h"

namespace parz::io {

// =============================================================================
// ByteSource Interface
// =============================================================================

/// @brief Input handle that chunk workers read from.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// @brief Read up to buffer.size() bytes.
    /// @return Bytes read; 0 means end of input.
    [[nodiscard]] virtual Result<std::size_t> read(std::span<std::uint8_t> buffer) = 0;

    /// @brief Create a handle sharing this handle's read position.
    [[nodiscard]] virtual Result<std::unique_ptr<ByteSource>> duplicate() const = 0;

    /// @brief Create an independent handle over [offset, offset + length).
    [[nodiscard]] virtual Result<std::unique_ptr<ByteSource>> slice(FileOffset offset,
                                                                    std::uint64_t length) const = 0;

    /// @brief Total size of the underlying input in bytes.
    [[nodiscard]] virtual Result<std::uint64_t> size() const = 0;
};

// =============================================================================
// FileSource
// =============================================================================

/// @brief ByteSource backed by a file descriptor.
class FileSource final : public ByteSource {
public:
    /// @brief Open a file for reading.
    /// @return Source or kFileOpenFailed.
    [[nodiscard]] static Result<std::unique_ptr<FileSource>> open(
        const std::filesystem::path& path);

    /// @brief Closes the descriptor.
    ~FileSource() override;

    // Non-copyable, non-movable (owns a descriptor)
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;
    FileSource(FileSource&&) = delete;
    FileSource& operator=(FileSource&&) = delete;

    [[nodiscard]] Result<std::size_t> read(std::span<std::uint8_t> buffer) override;

    [[nodiscard]] Result<std::unique_ptr<ByteSource>> duplicate() const override;

    [[nodiscard]] Result<std::unique_ptr<ByteSource>> slice(FileOffset offset,
                                                            std::uint64_t length) const override;

    [[nodiscard]] Result<std::uint64_t> size() const override;

    /// @brief Path the source was opened from.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Check whether this handle is restricted to a byte range.
    [[nodiscard]] bool isSlice() const noexcept { return range_.has_value(); }

private:
    /// @brief Read window of a sliced handle.
    struct Range {
        FileOffset position = 0;
        FileOffset end = 0;
    };

    FileSource(int fd, std::filesystem::path path, std::optional<Range> range);

    /// @brief dup(2) the descriptor, retrying on EINTR.
    [[nodiscard]] Result<int> duplicateDescriptor() const;

    int fd_ = -1;
    std::filesystem::path path_;
    std::optional<Range> range_;
};

}  // namespace parz::io

#endif  // PARZ_IO_BYTE_SOURCE_H
