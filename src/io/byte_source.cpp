// =============================================================================
// parz - Byte Source Implementation
// =============================================================================

#include "parz/io/byte_source.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include <fmt/format.h>

#include "parz/common/logger.h"

namespace parz::io {

// =============================================================================
// FileSource Implementation
// =============================================================================

FileSource::FileSource(int fd, std::filesystem::path path, std::optional<Range> range)
    : fd_(fd), path_(std::move(path)), range_(range) {}

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Result<std::unique_ptr<FileSource>> FileSource::open(const std::filesystem::path& path) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(errorFromErrno(ErrorCode::kFileOpenFailed, path.string()));
    }

    struct stat st {};
    if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        ::close(fd);
        return makeError<std::unique_ptr<FileSource>>(
            ErrorCode::kFileOpenFailed, fmt::format("{}: Is a directory", path.string()));
    }

    PARZ_LOG_DEBUG("Opened input {} (fd={})", path.string(), fd);
    return std::unique_ptr<FileSource>(new FileSource(fd, path, std::nullopt));
}

Result<std::size_t> FileSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return std::size_t{0};
    }

    ssize_t n = -1;
    if (range_) {
        if (range_->position >= range_->end) {
            return std::size_t{0};
        }
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), range_->end - range_->position));
        do {
            n = ::pread(fd_, buffer.data(), want, static_cast<off_t>(range_->position));
        } while (n < 0 && errno == EINTR);
        if (n > 0) {
            range_->position += static_cast<FileOffset>(n);
        }
    } else {
        do {
            n = ::read(fd_, buffer.data(), buffer.size());
        } while (n < 0 && errno == EINTR);
    }

    if (n < 0) {
        return std::unexpected(errorFromErrno(
            ErrorCode::kIOError, fmt::format("Failed to read {}", path_.string())));
    }
    return static_cast<std::size_t>(n);
}

Result<int> FileSource::duplicateDescriptor() const {
    int fd = -1;
    do {
        fd = ::fcntl(fd_, F_DUPFD_CLOEXEC, 0);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(errorFromErrno(
            ErrorCode::kIOError, fmt::format("Failed to duplicate handle for {}", path_.string())));
    }
    return fd;
}

Result<std::unique_ptr<ByteSource>> FileSource::duplicate() const {
    auto fd = duplicateDescriptor();
    if (!fd) {
        return std::unexpected(fd.error());
    }
    return std::unique_ptr<ByteSource>(new FileSource(*fd, path_, range_));
}

Result<std::unique_ptr<ByteSource>> FileSource::slice(FileOffset offset,
                                                      std::uint64_t length) const {
    auto fd = duplicateDescriptor();
    if (!fd) {
        return std::unexpected(fd.error());
    }
    return std::unique_ptr<ByteSource>(new FileSource(*fd, path_, Range{offset, offset + length}));
}

Result<std::uint64_t> FileSource::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(
            errorFromErrno(ErrorCode::kIOError, fmt::format("Failed to stat {}", path_.string())));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

}  // namespace parz::io
