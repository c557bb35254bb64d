// =============================================================================
// parz - Error Handling
// =============================================================================
// Every fallible operation returns Result<T>, an std::expected carrying an
// Error. Command handlers may instead throw ParzException subclasses from
// their private steps; execute() catches them and returns the exit code.
//
// Exit codes:
// - 0: Success
// - 1: Usage error (wrong number of positional arguments)
// - 2: I/O error (read, write or close failure)
// - 3: Corrupt or truncated compressed data
// - 6: Invalid option value
// - 9: Input could not be opened or output could not be created
// =============================================================================

#ifndef PARZ_COMMON_ERROR_H
#define PARZ_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace parz {

/// @brief Failure categories. The numeric value is the process exit code.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,
    kIOError = 2,
    kInvalidData = 3,
    kInvalidArgument = 6,
    kFileOpenFailed = 9,

    /// @brief The collector can no longer receive (every sender is gone).
    kInvalidState = 12,

    /// @brief The codec rejected the input or failed to finalize.
    kCompressionFailed = 17
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Short category name used in diagnostics.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kInvalidData:
            return "invalid data";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCompressionFailed:
            return "compression failed";
    }
    return "unknown error";
}

// =============================================================================
// Error Value
// =============================================================================

/// @brief A failure: category plus a human readable message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Render as "[category] message".
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Error whose message is "<what>: <strerror(errno)>".
[[nodiscard]] Error errorFromErrno(ErrorCode code, std::string_view what);

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base of the exceptions thrown inside command steps.
class ParzException : public std::exception {
public:
    explicit ParzException(Error error);

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorCode code() const noexcept { return error_.code(); }
    [[nodiscard]] int exitCode() const noexcept { return error_.exitCode(); }

private:
    Error error_;
    std::string what_;
};

/// @brief Read, write or close failure. Defaults to kIOError.
class IOError : public ParzException {
public:
    explicit IOError(std::string message)
        : ParzException(Error{ErrorCode::kIOError, std::move(message)}) {}

    explicit IOError(Error error) : ParzException(std::move(error)) {}
};

/// @brief Compressed input that does not decode (exit code 3).
class InvalidDataError : public ParzException {
public:
    explicit InvalidDataError(std::string message)
        : ParzException(Error{ErrorCode::kInvalidData, std::move(message)}) {}
};

}  // namespace parz

#endif  // PARZ_COMMON_ERROR_H
